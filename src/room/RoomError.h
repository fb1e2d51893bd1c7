#pragma once

#include <string>
#include <utility>

namespace roommaker {

// Why a room build (or job) failed
enum class RoomErrorKind {
    None,
    MissingHostEntity,   // No basic wall type / no floor type in the document
    GeometryDegenerate,  // Non-positive dimension or zero-length edge
    ResolutionFailure,   // Level could not be found or created
    CreationFailure,     // Document rejected a wall or the floor
    TransactionFailure,  // Transaction could not start or commit was rejected
    InvalidInput,        // Spec / template file missing or malformed
    PersistenceFailure   // Result document could not be written
};

const char* roomErrorKindName(RoomErrorKind kind);

struct RoomError {
    RoomErrorKind kind = RoomErrorKind::None;
    std::string message;

    bool ok() const { return kind == RoomErrorKind::None; }

    static RoomError make(RoomErrorKind kind, std::string message) {
        return RoomError{kind, std::move(message)};
    }
};

} // namespace roommaker
