#pragma once

#include "RoomError.h"
#include "document/Document.h"
#include <entt/entt.hpp>
#include <optional>

namespace roommaker {

// Elements the new room geometry depends on
struct ResolvedEntities {
    entt::entity level = entt::null;
    entt::entity wallType = entt::null;
    entt::entity floorType = entt::null;
    bool levelCreated = false;
};

namespace ModelResolver {
    constexpr double LEVEL_ELEVATION_TOLERANCE = 0.001;
    constexpr const char* DEFAULT_LEVEL_NAME = "Level 0";

    // First level with |elevation| < tolerance, if any
    std::optional<entt::entity> findGroundLevel(const Document& doc);

    // First wall type of kind Basic, if any
    std::optional<entt::entity> findBasicWallType(const Document& doc);

    // First floor type of any kind, if any
    std::optional<entt::entity> findFloorType(const Document& doc);

    // Resolves wall type, floor type and ground level, creating the level if
    // needed. Must be called inside an open transaction. Types are checked
    // before the level is created.
    std::optional<ResolvedEntities> resolve(Document& doc, RoomError& outError);
}

} // namespace roommaker
