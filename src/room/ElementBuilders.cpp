#include "ElementBuilders.h"
#include <SDL3/SDL_log.h>
#include <string>

namespace roommaker {

namespace WallBuilder {

bool build(Document& doc, const CurveLoop& loop, const ResolvedEntities& resolved,
           double height, std::vector<entt::entity>& outWalls, RoomError& outError) {
    outWalls.clear();
    outWalls.reserve(loop.size());

    for (size_t i = 0; i < loop.size(); ++i) {
        const Line& edge = loop[i];
        auto wall = doc.createWall(edge, resolved.wallType, resolved.level, height,
                                   0.0,     // base offset
                                   false,   // flipped
                                   false);  // structural
        if (wall == entt::null) {
            outError = RoomError::make(RoomErrorKind::CreationFailure,
                                       "Wall creation rejected for edge " + std::to_string(i));
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "WallBuilder: %s", outError.message.c_str());
            return false;
        }

        SDL_Log("WallBuilder: wall %zu (%.4f, %.4f) -> (%.4f, %.4f), height %.4f ft",
                i, edge.start.x, edge.start.y, edge.end.x, edge.end.y, height);
        outWalls.push_back(wall);
    }
    return true;
}

} // namespace WallBuilder

namespace FloorBuilder {

entt::entity build(Document& doc, const CurveLoop& loop, const ResolvedEntities& resolved,
                   RoomError& outError) {
    auto floor = doc.createFloor({loop}, resolved.floorType, resolved.level);
    if (floor == entt::null) {
        outError = RoomError::make(RoomErrorKind::CreationFailure, "Floor creation rejected");
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "FloorBuilder: %s", outError.message.c_str());
        return entt::null;
    }

    SDL_Log("FloorBuilder: floor bounded by %zu edges", loop.size());
    return floor;
}

} // namespace FloorBuilder

} // namespace roommaker
