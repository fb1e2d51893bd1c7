#include "RoomError.h"

namespace roommaker {

const char* roomErrorKindName(RoomErrorKind kind) {
    switch (kind) {
        case RoomErrorKind::None:               return "None";
        case RoomErrorKind::MissingHostEntity:  return "MissingHostEntity";
        case RoomErrorKind::GeometryDegenerate: return "GeometryDegenerate";
        case RoomErrorKind::ResolutionFailure:  return "ResolutionFailure";
        case RoomErrorKind::CreationFailure:    return "CreationFailure";
        case RoomErrorKind::TransactionFailure: return "TransactionFailure";
        case RoomErrorKind::InvalidInput:       return "InvalidInput";
        case RoomErrorKind::PersistenceFailure: return "PersistenceFailure";
    }
    return "Unknown";
}

} // namespace roommaker
