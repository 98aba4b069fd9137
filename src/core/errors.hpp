#pragma once
#include <stdexcept>
#include <string>

namespace gitstack::core {

enum class ErrorCode {
    DuplicateBranch,
    UnknownParent,
    WouldCreateCycle,
    NotFound,
    DirtyWorkingTree,
    UnsupportedStateVersion,
    CorruptState,
    RebaseConflict,
    VcsCommandFailed,
    PersistFailed,
    TrunkProtected,
    HostingFailed
};

std::string errorCodeName(ErrorCode code);

/**
 * Every failure raised by the graph, the state store, the mutators and the
 * orchestrator. Carries the offending branch (may be empty) and a short
 * corrective hint for the user.
 */
class StackError : public std::runtime_error {
public:
    StackError(ErrorCode code, const std::string& message,
               const std::string& branch = "", const std::string& hint = "");

    ErrorCode code() const { return code_; }
    const std::string& branch() const { return branch_; }
    const std::string& hint() const { return hint_; }

private:
    ErrorCode code_;
    std::string branch_;
    std::string hint_;
};

}
