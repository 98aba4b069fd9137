#include "errors.hpp"

namespace gitstack::core {

std::string errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::DuplicateBranch:         return "DuplicateBranch";
        case ErrorCode::UnknownParent:           return "UnknownParent";
        case ErrorCode::WouldCreateCycle:        return "WouldCreateCycle";
        case ErrorCode::NotFound:                return "NotFound";
        case ErrorCode::DirtyWorkingTree:        return "DirtyWorkingTree";
        case ErrorCode::UnsupportedStateVersion: return "UnsupportedStateVersion";
        case ErrorCode::CorruptState:            return "CorruptState";
        case ErrorCode::RebaseConflict:          return "RebaseConflict";
        case ErrorCode::VcsCommandFailed:        return "VcsCommandFailed";
        case ErrorCode::PersistFailed:           return "PersistFailed";
        case ErrorCode::TrunkProtected:          return "TrunkProtected";
        case ErrorCode::HostingFailed:           return "HostingFailed";
    }
    return "Unknown";
}

StackError::StackError(ErrorCode code, const std::string& message,
                       const std::string& branch, const std::string& hint)
    : std::runtime_error(message), code_(code), branch_(branch), hint_(hint) {}

}
