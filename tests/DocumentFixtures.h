#pragma once

#include "document/Document.h"
#include <string>

// Shared document setups for the room tests

namespace fixtures {

// One basic wall type, one floor type, no levels
inline void addStandardTypes(roommaker::Document& doc) {
    doc.beginTransaction("Fixture Types");
    doc.createWallType("Generic - 200mm", roommaker::WallKind::Basic);
    doc.createFloorType("Generic 300mm");
    doc.commitTransaction();
}

inline void addLevel(roommaker::Document& doc, double elevation, const std::string& name) {
    doc.beginTransaction("Fixture Level");
    doc.createLevel(elevation, name);
    doc.commitTransaction();
}

} // namespace fixtures
