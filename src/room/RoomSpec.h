#pragma once

#include "RoomError.h"
#include <optional>

namespace roommaker {

// Room dimensions in meters, as read from room.json
struct RoomSpec {
    double lengthM = 0.0;
    double widthM = 0.0;
    double heightM = 0.0;
};

// Room dimensions converted to document units (feet)
struct RoomDimensions {
    double length = 0.0;
    double width = 0.0;
    double height = 0.0;
};

// Rejects non-finite or non-positive dimensions (GeometryDegenerate)
std::optional<RoomError> validateRoomSpec(const RoomSpec& spec);

RoomDimensions toInternalDimensions(const RoomSpec& spec);

} // namespace roommaker
