#pragma once

#include "Document.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace roommaker {

// JSON persistence for Documents.
//
// Template input:
//   { "levels":      [{"name": "Level 1", "elevation": 10.0}],
//     "wall_types":  [{"name": "Generic - 200mm", "kind": "basic"}],
//     "floor_types": [{"name": "Generic 300mm"}] }
//
// Saved output additionally lists "walls" and "floors" with their geometry.
namespace DocumentIO {
    std::optional<WallKind> parseWallKind(const std::string& name);

    // Loads template elements into doc inside one transaction.
    // On any error nothing is added and false is returned.
    bool loadTemplate(const nlohmann::json& root, Document& doc);
    bool loadTemplateFile(const std::string& path, Document& doc);

    nlohmann::json toJson(const Document& doc);
    bool save(const std::string& path, const Document& doc);
}

} // namespace roommaker
