#include "RoomSpec.h"
#include "UnitConversion.h"
#include <cmath>
#include <string>

namespace roommaker {

namespace {

bool isPositive(double value) {
    return std::isfinite(value) && value > 0.0;
}

// Finite in meters can still overflow once scaled to feet
bool fitsInternalUnits(double value) {
    return std::isfinite(toInternalLength(value));
}

} // anonymous namespace

std::optional<RoomError> validateRoomSpec(const RoomSpec& spec) {
    const struct {
        const char* name;
        double value;
    } fields[] = {
        {"length_m", spec.lengthM},
        {"width_m", spec.widthM},
        {"height_m", spec.heightM},
    };

    for (const auto& field : fields) {
        if (!isPositive(field.value)) {
            return RoomError::make(RoomErrorKind::GeometryDegenerate,
                                   std::string(field.name) + " must be a positive number, got " +
                                   std::to_string(field.value));
        }
        if (!fitsInternalUnits(field.value)) {
            return RoomError::make(RoomErrorKind::GeometryDegenerate,
                                   std::string(field.name) + " is too large to convert to feet, got " +
                                   std::to_string(field.value));
        }
    }
    return std::nullopt;
}

RoomDimensions toInternalDimensions(const RoomSpec& spec) {
    RoomDimensions dims;
    dims.length = toInternalLength(spec.lengthM);
    dims.width = toInternalLength(spec.widthM);
    dims.height = toInternalLength(spec.heightM);
    return dims;
}

} // namespace roommaker
