#pragma once
#include "config.hpp"
#include "restack.hpp"
#include "state_store.hpp"
#include "../hosting/hosting_client.hpp"
#include "../vcs/vcs_adapter.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gitstack::core {

struct SyncOptions {
    bool restack = false;       // restack every stack after pruning
    bool push = false;          // push restacked branches (implies restack)
    bool dryRun = false;        // print the plan only
    bool deleteLocal = false;   // also delete the git branches of pruned nodes
};

struct SyncPlan {
    struct Prune {
        std::string branch;
        std::string reason;
        std::string newParent;   // where its children end up
    };

    struct Retarget {
        std::uint64_t number;
        std::string branch;
        std::string oldBase;
        std::string newBase;
    };

    struct PrNumberUpdate {
        std::string branch;
        std::uint64_t number;
    };

    std::vector<Prune> prunes;        // children before parents
    std::vector<Retarget> retargets;
    std::vector<PrNumberUpdate> prNumbers;
    std::vector<std::string> warnings;

    bool empty() const { return prunes.empty() && retargets.empty() && prNumbers.empty(); }
};

/**
 * Reconciles the stack with the remote: fetch, find branches that are gone
 * or already merged, prune them through the delete mutator, and optionally
 * restack and push what is left.
 */
class SyncEngine {
public:
    struct SyncResult {
        SyncPlan plan;
        bool applied = false;
        std::vector<std::string> warnings;
        std::optional<RestackOrchestrator::RestackResult> restack;
    };

    /**
     * @param hosting optional; when present, merged pull requests also mark
     *                branches for pruning, open PRs are retargeted onto the
     *                branch's local parent and PR numbers are cached on nodes
     */
    SyncEngine(StackState& state, StateStore& store, vcs::VcsAdapter& vcs,
               const StackConfig& config, hosting::HostingClient* hosting = nullptr);

    /**
     * Work out what a sync would do. Assumes the remote was fetched.
     */
    SyncPlan plan();

    SyncResult sync(const SyncOptions& options);

private:
    StackState& state_;
    StateStore& store_;
    vcs::VcsAdapter& vcs_;
    StackConfig config_;
    hosting::HostingClient* hosting_;
    std::optional<std::string> trunkBeforeSync_;

    bool hasOwnCommits(const BranchNode& node);
    std::optional<std::string> parentTip(const std::string& parent);
};

}
