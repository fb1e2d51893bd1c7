#include "RoomBuilder.h"
#include "ElementBuilders.h"
#include "ModelResolver.h"
#include "RoomGeometry.h"
#include "document/Transaction.h"
#include <SDL3/SDL_log.h>

namespace roommaker {
namespace RoomBuilder {

namespace {

RoomBuildResult fail(RoomBuildResult result, RoomError error) {
    result.success = false;
    result.error = std::move(error);
    result.level = entt::null;
    result.walls.clear();
    result.floor = entt::null;
    result.levelCreated = false;
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RoomBuilder: %s: %s",
                 roomErrorKindName(result.error.kind), result.error.message.c_str());
    return result;
}

} // anonymous namespace

RoomBuildResult build(Document& doc, const RoomSpec& spec) {
    RoomBuildResult result;

    // Reject bad dimensions before touching the document
    if (auto invalid = validateRoomSpec(spec)) {
        return fail(std::move(result), *invalid);
    }

    result.dimensions = toInternalDimensions(spec);
    const RoomDimensions& dims = result.dimensions;
    SDL_Log("RoomBuilder: %.3f x %.3f x %.3f m -> %.4f x %.4f x %.4f ft",
            spec.lengthM, spec.widthM, spec.heightM, dims.length, dims.width, dims.height);

    RoomError error;
    auto loop = assembleClosedLoop(rectangleCorners(dims.length, dims.width), error);
    if (!loop) {
        return fail(std::move(result), error);
    }

    Transaction tx(doc, TRANSACTION_NAME);
    if (!tx.start()) {
        return fail(std::move(result), RoomError::make(RoomErrorKind::TransactionFailure,
                                                       "Could not start transaction"));
    }

    auto resolved = ModelResolver::resolve(doc, error);
    if (!resolved) {
        return fail(std::move(result), error);
    }

    std::vector<entt::entity> walls;
    if (!WallBuilder::build(doc, *loop, *resolved, dims.height, walls, error)) {
        return fail(std::move(result), error);
    }

    auto floor = FloorBuilder::build(doc, *loop, *resolved, error);
    if (floor == entt::null) {
        return fail(std::move(result), error);
    }

    if (!tx.commit()) {
        return fail(std::move(result), RoomError::make(RoomErrorKind::TransactionFailure,
                                                       "Document rejected the commit"));
    }

    result.success = true;
    result.level = resolved->level;
    result.walls = std::move(walls);
    result.floor = floor;
    result.levelCreated = resolved->levelCreated;

    SDL_Log("RoomBuilder: created %zu walls and 1 floor on level '%s'",
            result.walls.size(), doc.level(result.level).name.c_str());
    return result;
}

} // namespace RoomBuilder
} // namespace roommaker
