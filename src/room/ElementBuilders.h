#pragma once

#include "ModelResolver.h"
#include "RoomError.h"
#include "document/Document.h"
#include <entt/entt.hpp>
#include <vector>

namespace roommaker {

namespace WallBuilder {
    // One wall per loop edge, in loop order, on the resolved level with the
    // resolved wall type. Base offset 0, not flipped, not structural.
    // Stops at the first rejected edge.
    bool build(Document& doc, const CurveLoop& loop, const ResolvedEntities& resolved,
               double height, std::vector<entt::entity>& outWalls, RoomError& outError);
}

namespace FloorBuilder {
    // Single floor bounded by the loop
    entt::entity build(Document& doc, const CurveLoop& loop, const ResolvedEntities& resolved,
                       RoomError& outError);
}

} // namespace roommaker
