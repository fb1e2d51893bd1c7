#include "RoomSpecLoader.h"
#include <SDL3/SDL_log.h>
#include <fstream>

using json = nlohmann::json;

namespace roommaker {
namespace RoomSpecLoader {

namespace {

bool readNumber(const json& room, const char* key, double& out) {
    auto it = room.find(key);
    if (it == room.end()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RoomSpecLoader: missing field '%s'", key);
        return false;
    }
    if (!it->is_number()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RoomSpecLoader: field '%s' is not a number", key);
        return false;
    }
    out = it->get<double>();
    return true;
}

} // anonymous namespace

std::optional<RoomSpec> parse(const json& root) {
    if (!root.is_object() || !root.contains("room") || !root["room"].is_object()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RoomSpecLoader: missing 'room' object");
        return std::nullopt;
    }

    const json& room = root["room"];
    RoomSpec spec;
    if (!readNumber(room, "length_m", spec.lengthM) ||
        !readNumber(room, "width_m", spec.widthM) ||
        !readNumber(room, "height_m", spec.heightM)) {
        return std::nullopt;
    }
    return spec;
}

std::optional<RoomSpec> loadFromString(const std::string& text) {
    try {
        return parse(json::parse(text));
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RoomSpecLoader: JSON parse error: %s", e.what());
        return std::nullopt;
    }
}

std::optional<RoomSpec> loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RoomSpecLoader: Failed to open %s", path.c_str());
        return std::nullopt;
    }

    try {
        json j;
        file >> j;
        auto spec = parse(j);
        if (spec) {
            SDL_Log("RoomSpecLoader: Loaded room %.3f x %.3f x %.3f m from %s",
                    spec->lengthM, spec->widthM, spec->heightM, path.c_str());
        }
        return spec;
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "RoomSpecLoader: JSON parse error in %s: %s",
                     path.c_str(), e.what());
        return std::nullopt;
    }
}

} // namespace RoomSpecLoader
} // namespace roommaker
