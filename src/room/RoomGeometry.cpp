#include "RoomGeometry.h"
#include "document/Document.h"
#include <SDL3/SDL_log.h>
#include <string>

namespace roommaker {

RectangleCorners rectangleCorners(double length, double width) {
    return {
        glm::dvec3(0.0, 0.0, 0.0),
        glm::dvec3(length, 0.0, 0.0),
        glm::dvec3(length, width, 0.0),
        glm::dvec3(0.0, width, 0.0)
    };
}

std::optional<CurveLoop> assembleClosedLoop(const RectangleCorners& corners, RoomError& outError) {
    CurveLoop loop;

    for (size_t i = 0; i < corners.size(); ++i) {
        Line edge{corners[i], corners[(i + 1) % corners.size()]};

        // Negated so a NaN length is rejected too
        if (!(edge.length() >= Document::SHORT_CURVE_TOLERANCE)) {
            outError = RoomError::make(RoomErrorKind::GeometryDegenerate,
                                       "edge " + std::to_string(i) + " has zero length");
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ClosedLoop: edge %zu is degenerate (%.6f ft)",
                         i, edge.length());
            return std::nullopt;
        }

        if (!loop.append(edge)) {
            outError = RoomError::make(RoomErrorKind::GeometryDegenerate,
                                       "edge " + std::to_string(i) + " is not continuous");
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ClosedLoop: edge %zu does not continue the loop", i);
            return std::nullopt;
        }
    }

    if (!loop.isClosed()) {
        outError = RoomError::make(RoomErrorKind::GeometryDegenerate, "boundary loop does not close");
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ClosedLoop: loop does not close");
        return std::nullopt;
    }

    return loop;
}

} // namespace roommaker
