#pragma once

#include "RoomError.h"
#include "document/DocumentComponents.h"
#include <glm/glm.hpp>
#include <array>
#include <optional>

namespace roommaker {

// Footprint corners p1..p4, counter-clockwise on the z = 0 plane
using RectangleCorners = std::array<glm::dvec3, 4>;

// (0,0,0), (L,0,0), (L,W,0), (0,W,0). No validation of L, W.
RectangleCorners rectangleCorners(double length, double width);

// Builds p1->p2, p2->p3, p3->p4, p4->p1 and checks the loop closes.
// Edges shorter than Document::SHORT_CURVE_TOLERANCE are rejected with
// GeometryDegenerate.
std::optional<CurveLoop> assembleClosedLoop(const RectangleCorners& corners, RoomError& outError);

} // namespace roommaker
