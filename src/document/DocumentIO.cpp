#include "DocumentIO.h"
#include "Transaction.h"
#include <SDL3/SDL_log.h>
#include <fstream>

using json = nlohmann::json;

namespace roommaker {
namespace DocumentIO {

namespace {

json pointJson(const glm::dvec3& p) {
    return json::array({p.x, p.y, p.z});
}

std::string nameOfLevel(const Document& doc, entt::entity level) {
    return doc.isCategory(level, ElementCategory::Level) ? doc.level(level).name : std::string();
}

bool loadElements(const json& root, Document& doc) {
    if (root.contains("levels")) {
        for (const auto& l : root.at("levels")) {
            std::string name = l.at("name").get<std::string>();
            double elevation = l.value("elevation", 0.0);
            if (doc.createLevel(elevation, name) == entt::null) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DocumentIO: rejected level '%s'", name.c_str());
                return false;
            }
        }
    }

    if (root.contains("wall_types")) {
        for (const auto& wt : root.at("wall_types")) {
            std::string name = wt.at("name").get<std::string>();
            std::string kindName = wt.value("kind", std::string("basic"));
            auto kind = parseWallKind(kindName);
            if (!kind) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DocumentIO: unknown wall kind '%s' for '%s'",
                             kindName.c_str(), name.c_str());
                return false;
            }
            if (doc.createWallType(name, *kind) == entt::null) {
                return false;
            }
        }
    }

    if (root.contains("floor_types")) {
        for (const auto& ft : root.at("floor_types")) {
            if (doc.createFloorType(ft.at("name").get<std::string>()) == entt::null) {
                return false;
            }
        }
    }
    return true;
}

} // anonymous namespace

std::optional<WallKind> parseWallKind(const std::string& name) {
    if (name == "basic") return WallKind::Basic;
    if (name == "curtain") return WallKind::Curtain;
    if (name == "stacked") return WallKind::Stacked;
    return std::nullopt;
}

bool loadTemplate(const json& root, Document& doc) {
    if (!root.is_object()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DocumentIO: template root must be an object");
        return false;
    }

    Transaction tx(doc, "Load Template");
    if (!tx.start()) {
        return false;
    }

    try {
        if (!loadElements(root, doc)) {
            return false;
        }
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DocumentIO: malformed template: %s", e.what());
        return false;
    }

    if (!tx.commit()) {
        return false;
    }

    SDL_Log("DocumentIO: template has %zu levels, %zu wall types, %zu floor types",
            doc.levels().size(), doc.wallTypes().size(), doc.floorTypes().size());
    return true;
}

bool loadTemplateFile(const std::string& path, Document& doc) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DocumentIO: Failed to open %s", path.c_str());
        return false;
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DocumentIO: JSON parse error in %s: %s",
                     path.c_str(), e.what());
        return false;
    }
    return loadTemplate(j, doc);
}

json toJson(const Document& doc) {
    json j;
    j["version"] = 1;
    j["title"] = doc.title();
    j["units"] = "feet";

    json levelsJson = json::array();
    for (auto e : doc.levels()) {
        const auto& level = doc.level(e);
        levelsJson.push_back(json{{"id", doc.elementId(e)}, {"name", level.name}, {"elevation", level.elevation}});
    }
    j["levels"] = levelsJson;

    json wallTypesJson = json::array();
    for (auto e : doc.wallTypes()) {
        const auto& wt = doc.wallType(e);
        wallTypesJson.push_back(json{{"id", doc.elementId(e)}, {"name", wt.name}, {"kind", wallKindName(wt.kind)}});
    }
    j["wall_types"] = wallTypesJson;

    json floorTypesJson = json::array();
    for (auto e : doc.floorTypes()) {
        floorTypesJson.push_back(json{{"id", doc.elementId(e)}, {"name", doc.floorType(e).name}});
    }
    j["floor_types"] = floorTypesJson;

    json wallsJson = json::array();
    for (auto e : doc.walls()) {
        const auto& wall = doc.wall(e);
        json wj;
        wj["id"] = doc.elementId(e);
        wj["start"] = pointJson(wall.location.start);
        wj["end"] = pointJson(wall.location.end);
        wj["height"] = wall.height;
        wj["base_offset"] = wall.baseOffset;
        wj["flipped"] = wall.flipped;
        wj["structural"] = wall.structural;
        wj["wall_type"] = doc.elementId(wall.wallType);
        wj["level"] = nameOfLevel(doc, wall.level);
        wallsJson.push_back(wj);
    }
    j["walls"] = wallsJson;

    json floorsJson = json::array();
    for (auto e : doc.floors()) {
        const auto& floor = doc.floor(e);
        json loopsJson = json::array();
        for (const auto& loop : floor.boundary) {
            json pointsJson = json::array();
            for (const auto& line : loop.lines()) {
                pointsJson.push_back(pointJson(line.start));
            }
            loopsJson.push_back(pointsJson);
        }
        floorsJson.push_back(json{{"id", doc.elementId(e)},
                                   {"floor_type", doc.elementId(floor.floorType)},
                                   {"level", nameOfLevel(doc, floor.level)},
                                   {"boundary", loopsJson}});
    }
    j["floors"] = floorsJson;

    return j;
}

bool save(const std::string& path, const Document& doc) {
    std::ofstream file(path);
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DocumentIO: Failed to write %s", path.c_str());
        return false;
    }

    file << toJson(doc).dump(2);
    file.flush();
    if (!file.good()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DocumentIO: Write to %s did not complete", path.c_str());
        return false;
    }
    SDL_Log("DocumentIO: Saved document to %s", path.c_str());
    return true;
}

} // namespace DocumentIO
} // namespace roommaker
