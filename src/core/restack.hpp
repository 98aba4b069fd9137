#pragma once
#include "config.hpp"
#include "state_store.hpp"
#include "../vcs/vcs_adapter.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace gitstack::core {

struct RestackOptions {
    bool ancestors = false;   // also restack the target's ancestors
    bool push = false;        // force-push every branch that changed
    bool fetch = false;       // fetch and fast-forward trunk first
};

/**
 * Drives the rebases that bring a branch and its descendants on top of their
 * parents' current tips.
 *
 * Each node moves Pending -> Rebasing -> Succeeded, or stops in
 * ConflictPaused. Progress is saved after every node. A conflict saves a
 * RestackMarker naming the stopped node and the nodes still to do; the
 * in-progress rebase itself stays with git, and the next call resumes from
 * the marker.
 */
class RestackOrchestrator {
public:
    enum class NodeState {
        Pending,
        Rebasing,
        Succeeded,
        ConflictPaused
    };

    struct RestackResult {
        enum class Status {
            Succeeded,
            ConflictPaused
        };

        Status status = Status::Succeeded;
        bool resumed = false;
        std::vector<std::string> rebased;    // branches whose history was rewritten
        std::vector<std::string> skipped;    // already on top of their parent
        std::vector<std::string> pushed;
        std::vector<std::string> warnings;
        std::map<std::string, NodeState> states;
        std::string blockedBranch;
        size_t remaining = 0;

        bool paused() const { return status == Status::ConflictPaused; }
    };

    RestackOrchestrator(StackState& state, StateStore& store, vcs::VcsAdapter& vcs,
                        const StackConfig& config);

    /**
     * The nodes a restack of `target` visits, parents before children.
     * Passing the trunk name plans every tracked branch.
     */
    std::vector<std::string> plan(const std::string& target, bool ancestors) const;

    /**
     * Restack `target` (and its descendants). If an earlier run is paused on
     * a conflict, that run is resumed instead.
     * @throws DirtyWorkingTree, NotFound, VcsCommandFailed before any rebase
     */
    RestackResult restack(const std::string& target, const RestackOptions& options);

    RestackResult resume();

    bool hasPausedRun() const { return state_.pausedRestack.has_value(); }

    /**
     * Fetch the remote and fast-forward the local trunk to the remote trunk.
     * Returns a warning message when trunk cannot be fast-forwarded.
     */
    std::string updateTrunkFromRemote();

private:
    StackState& state_;
    StateStore& store_;
    vcs::VcsAdapter& vcs_;
    StackConfig config_;
    std::string runStamp_;
    std::set<std::string> rewritten_;   // rebased during this run
    std::string blockedTip_;            // pre-rebase tip of the node being rebased

    RestackResult run(const std::vector<std::string>& order, bool push,
                      const std::string& returnTo, RestackResult result);
    NodeState restackNode(const std::string& name, bool push, RestackResult& result);
    void completeNode(const std::string& name, const std::string& base, bool push,
                      RestackResult& result);
    void pushIfChanged(const std::string& name, bool push, RestackResult& result);
    std::string requireTip(const std::string& ref, const std::string& branch);
    void pause(const std::string& name, std::vector<std::string> remaining, bool push,
               const std::string& returnTo, RestackResult& result);
};

}
