#pragma once

namespace roommaker {

// Documents store lengths in feet
constexpr double METERS_TO_FEET = 3.2808399;

constexpr double toInternalLength(double meters) {
    return meters * METERS_TO_FEET;
}

constexpr double fromInternalLength(double feet) {
    return feet / METERS_TO_FEET;
}

} // namespace roommaker
