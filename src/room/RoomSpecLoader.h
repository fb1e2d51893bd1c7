#pragma once

#include "RoomSpec.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace roommaker {

// Reads { "room": { "length_m": n, "width_m": n, "height_m": n } }
// Returns nullopt if the document is malformed or a field is missing.
namespace RoomSpecLoader {
    std::optional<RoomSpec> parse(const nlohmann::json& root);
    std::optional<RoomSpec> loadFromString(const std::string& text);
    std::optional<RoomSpec> loadFromFile(const std::string& path);
}

} // namespace roommaker
