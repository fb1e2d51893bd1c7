#pragma once

#include "RoomError.h"
#include "RoomSpec.h"
#include "document/Document.h"
#include <entt/entt.hpp>
#include <vector>

namespace roommaker {

// Outcome of one room build. On failure nothing was persisted.
struct RoomBuildResult {
    bool success = false;
    RoomError error;

    entt::entity level = entt::null;
    std::vector<entt::entity> walls;
    entt::entity floor = entt::null;
    bool levelCreated = false;

    RoomDimensions dimensions;
};

namespace RoomBuilder {
    constexpr const char* TRANSACTION_NAME = "Create Room from JSON";

    // Validates the room dimensions, derives the footprint, then resolves dependent
    // elements and creates 4 walls + 1 floor inside a single transaction.
    // Commits only if every step succeeded; otherwise the document is left
    // unchanged.
    RoomBuildResult build(Document& doc, const RoomSpec& spec);
}

} // namespace roommaker
