#include "ModelResolver.h"
#include <SDL3/SDL_log.h>
#include <cmath>

namespace roommaker {
namespace ModelResolver {

std::optional<entt::entity> findGroundLevel(const Document& doc) {
    for (auto level : doc.levels()) {
        if (std::abs(doc.level(level).elevation) < LEVEL_ELEVATION_TOLERANCE) {
            return level;
        }
    }
    return std::nullopt;
}

std::optional<entt::entity> findBasicWallType(const Document& doc) {
    for (auto wallType : doc.wallTypes()) {
        if (doc.wallType(wallType).kind == WallKind::Basic) {
            return wallType;
        }
    }
    return std::nullopt;
}

std::optional<entt::entity> findFloorType(const Document& doc) {
    auto floorTypes = doc.floorTypes();
    if (floorTypes.empty()) {
        return std::nullopt;
    }
    return floorTypes.front();
}

std::optional<ResolvedEntities> resolve(Document& doc, RoomError& outError) {
    ResolvedEntities resolved;

    auto wallType = findBasicWallType(doc);
    if (!wallType) {
        outError = RoomError::make(RoomErrorKind::MissingHostEntity, "No basic wall type found in document");
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelResolver: %s", outError.message.c_str());
        return std::nullopt;
    }
    resolved.wallType = *wallType;

    auto floorType = findFloorType(doc);
    if (!floorType) {
        outError = RoomError::make(RoomErrorKind::MissingHostEntity, "No floor type found in document");
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelResolver: %s", outError.message.c_str());
        return std::nullopt;
    }
    resolved.floorType = *floorType;

    if (auto level = findGroundLevel(doc)) {
        resolved.level = *level;
        SDL_Log("ModelResolver: using level '%s'", doc.level(*level).name.c_str());
    } else {
        if (!doc.hasOpenTransaction()) {
            outError = RoomError::make(RoomErrorKind::ResolutionFailure,
                                       "Level creation requires an open transaction");
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelResolver: %s", outError.message.c_str());
            return std::nullopt;
        }

        auto created = doc.createLevel(0.0, DEFAULT_LEVEL_NAME);
        if (created == entt::null) {
            outError = RoomError::make(RoomErrorKind::ResolutionFailure,
                                       std::string("Could not create level '") + DEFAULT_LEVEL_NAME + "'");
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ModelResolver: %s", outError.message.c_str());
            return std::nullopt;
        }
        resolved.level = created;
        resolved.levelCreated = true;
        SDL_Log("ModelResolver: created level '%s' at elevation 0", DEFAULT_LEVEL_NAME);
    }

    SDL_Log("ModelResolver: wall type '%s', floor type '%s'",
            doc.wallType(resolved.wallType).name.c_str(),
            doc.floorType(resolved.floorType).name.c_str());
    return resolved;
}

} // namespace ModelResolver
} // namespace roommaker
