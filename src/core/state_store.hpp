#pragma once
#include "config.hpp"
#include "stack_graph.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gitstack::core {

// Persisted position of a restack that stopped on a conflict.
struct RestackMarker {
    std::string branch;                  // node whose rebase is stopped
    std::vector<std::string> remaining;  // nodes still to process, in order
    bool push = false;
    std::string returnTo;                // branch checked out when the run started
    std::vector<std::string> rewritten;  // nodes the run already rebased
    std::string originalTip;             // tip of `branch` before its rebase started
};

struct StackState {
    StackGraph graph;
    std::optional<RestackMarker> pausedRestack;
};

/**
 * Loads and saves the stack state of one repository.
 *
 * The file lives at <stateDir>/repos/<sha1 of repo root>.json and carries a
 * schema version and a CRC-32 of its content. Saves go through a temporary
 * file and a rename, so a crash leaves either the old or the new state.
 */
class StateStore {
public:
    static constexpr int kCurrentVersion = 1;

    explicit StateStore(const StackConfig& config);

    /**
     * Read the state for the configured repository. A missing file is an
     * empty graph rooted at the configured trunk.
     * @throws StackError(UnsupportedStateVersion) for a newer schema
     * @throws StackError(CorruptState) for unreadable or inconsistent content
     */
    StackState load() const;

    /**
     * @throws StackError(PersistFailed) if the file could not be replaced
     */
    void save(const StackState& state) const;

    const std::string& statePath() const { return statePath_; }

    static std::string serialize(const StackState& state, const std::string& repository);
    static StackState parse(const std::string& text, const std::string& source);

    static std::string repositoryKey(const std::string& repoRoot);

private:
    StackConfig config_;
    std::string statePath_;
};

}
