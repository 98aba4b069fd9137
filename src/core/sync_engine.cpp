#include "sync_engine.hpp"
#include "errors.hpp"
#include "mutators.hpp"
#include "../utils/log.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace gitstack::core {

SyncEngine::SyncEngine(StackState& state, StateStore& store, vcs::VcsAdapter& vcs,
                       const StackConfig& config, hosting::HostingClient* hosting)
    : state_(state), store_(store), vcs_(vcs), config_(config), hosting_(hosting) {}

// Trunk as it was before sync fast-forwarded it.
std::optional<std::string> SyncEngine::parentTip(const std::string& parent) {
    if (trunkBeforeSync_ && state_.graph.isTrunk(parent)) return trunkBeforeSync_;
    return vcs_.tip(parent);
}

// A branch contained in its anchor (or, without one, in its parent) has
// nothing of its own yet, so "already merged" would be trivially true for it.
bool SyncEngine::hasOwnCommits(const BranchNode& node) {
    if (!vcs_.tip(node.name)) return false;
    std::optional<std::string> base;
    if (node.anchor && vcs_.tip(*node.anchor)) {
        base = node.anchor;
    } else {
        base = parentTip(node.parent);
    }
    return !base || !vcs_.isAncestor(node.name, *base);
}

SyncPlan SyncEngine::plan() {
    SyncPlan plan;
    const StackGraph& graph = state_.graph;

    const std::string remoteTrunk = config_.remote + "/" + graph.trunk();
    const std::string mergeTarget = vcs_.tip(remoteTrunk) ? remoteTrunk : graph.trunk();

    std::map<std::string, hosting::PullRequest> openPrs;
    std::map<std::string, hosting::PullRequest> mergedPrs;
    if (hosting_) {
        auto open = hosting_->listPullRequests("open");
        auto closed = hosting_->listPullRequests("closed");
        if (!open.success || !closed.success) {
            plan.warnings.push_back("Could not read pull requests from " +
                                    hosting_->getProviderName() + ": " +
                                    (open.success ? closed.error : open.error));
        } else {
            for (const auto& pr : open.pullRequests) openPrs[pr.head] = pr;
            for (const auto& pr : closed.pullRequests) {
                if (pr.merged) mergedPrs[pr.head] = pr;
            }
        }
    }

    std::vector<std::string> order = graph.topologicalOrder(graph.trunk());
    std::reverse(order.begin(), order.end());

    std::set<std::string> pruned;
    for (const auto& name : order) {
        const BranchNode& node = graph.node(name);
        std::string reason;
        if (!vcs_.branchExists(name)) {
            reason = "branch no longer exists";
        } else if (hasOwnCommits(node) && vcs_.isMergedInto(name, mergeTarget)) {
            reason = "merged into " + mergeTarget;
        } else if (mergedPrs.count(name) && !openPrs.count(name)) {
            reason = "pull request #" + std::to_string(mergedPrs[name].number) + " was merged";
        }
        if (!reason.empty()) {
            pruned.insert(name);
            plan.prunes.push_back(SyncPlan::Prune{name, reason, ""});
        }
    }

    auto survivingParent = [&](std::string parent) {
        while (pruned.count(parent)) parent = graph.node(parent).parent;
        return parent;
    };

    for (auto& prune : plan.prunes) {
        prune.newParent = survivingParent(graph.node(prune.branch).parent);
    }

    for (const auto& [name, node] : graph.nodes()) {
        if (pruned.count(name)) continue;
        auto pr = openPrs.find(name);
        if (pr == openPrs.end()) continue;

        if (node.prNumber != pr->second.number) {
            plan.prNumbers.push_back(SyncPlan::PrNumberUpdate{name, pr->second.number});
        }
        const std::string base = survivingParent(node.parent);
        if (pr->second.base != base) {
            plan.retargets.push_back(SyncPlan::Retarget{pr->second.number, name, pr->second.base, base});
        }
    }
    return plan;
}

SyncEngine::SyncResult SyncEngine::sync(const SyncOptions& options) {
    SyncResult result;
    RestackOrchestrator orchestrator(state_, store_, vcs_, config_);

    trunkBeforeSync_ = vcs_.tip(state_.graph.trunk());
    if (!options.dryRun) {
        if (orchestrator.hasPausedRun()) {
            throw StackError(ErrorCode::RebaseConflict,
                             "A restack is paused on '" + state_.pausedRestack->branch + "'",
                             state_.pausedRestack->branch,
                             "Resolve the conflicts and run `git stack restack` before syncing.");
        }
        if (!vcs_.isClean()) {
            throw StackError(ErrorCode::DirtyWorkingTree,
                             "The working tree has uncommitted changes", "",
                             "Commit or stash your changes first.");
        }
        if (auto warning = orchestrator.updateTrunkFromRemote(); !warning.empty()) {
            result.warnings.push_back(warning);
        }
    } else {
        vcs_.fetch(config_.remote);
    }

    result.plan = plan();
    for (const auto& warning : result.plan.warnings) result.warnings.push_back(warning);
    if (options.dryRun) {
        return result;
    }

    GraphMutators mutators(state_, store_, vcs_);
    for (const auto& prune : result.plan.prunes) {
        log::info("Pruning '{}': {}", prune.branch, prune.reason);
        mutators.remove(prune.branch, options.deleteLocal);
    }

    for (const auto& update : result.plan.prNumbers) {
        log::debug("Caching PR #{} on '{}'", update.number, update.branch);
        state_.graph.node(update.branch).prNumber = update.number;
    }
    if (!result.plan.prNumbers.empty()) {
        store_.save(state_);
    }

    for (const auto& retarget : result.plan.retargets) {
        auto updated = hosting_->updatePullRequestBase(retarget.number, retarget.newBase);
        if (!updated.success) {
            result.warnings.push_back("Could not retarget PR #" + std::to_string(retarget.number) +
                                      " onto '" + retarget.newBase + "': " + updated.error);
        }
    }
    result.applied = true;

    if (options.restack || options.push) {
        RestackOptions restackOptions;
        restackOptions.push = options.push;
        result.restack = orchestrator.restack(state_.graph.trunk(), restackOptions);
    }
    return result;
}

}
