#include "restack.hpp"
#include "errors.hpp"
#include "mutators.hpp"
#include "../utils/log.hpp"

#include <algorithm>

namespace gitstack::core {

RestackOrchestrator::RestackOrchestrator(StackState& state, StateStore& store,
                                         vcs::VcsAdapter& vcs, const StackConfig& config)
    : state_(state), store_(store), vcs_(vcs), config_(config),
      runStamp_(std::to_string(currentTimestamp())) {}

std::vector<std::string> RestackOrchestrator::plan(const std::string& target, bool ancestors) const {
    const StackGraph& graph = state_.graph;
    if (graph.isTrunk(target)) {
        return graph.topologicalOrder(target);
    }

    std::vector<std::string> order;
    if (ancestors) {
        order = graph.ancestors(target);
        std::reverse(order.begin(), order.end());
    }
    for (const auto& name : graph.topologicalOrder(target)) {
        order.push_back(name);
    }
    return order;
}

std::string RestackOrchestrator::requireTip(const std::string& ref, const std::string& branch) {
    auto tip = vcs_.tip(ref);
    if (!tip) {
        throw StackError(ErrorCode::NotFound,
                         "Branch '" + ref + "' does not exist in git", branch,
                         "Run `git stack delete " + ref + "` or recreate the branch.");
    }
    return *tip;
}

std::string RestackOrchestrator::updateTrunkFromRemote() {
    const std::string& trunk = state_.graph.trunk();
    log::info("Fetching {}", config_.remote);
    vcs_.fetch(config_.remote);

    const std::string remoteTrunk = config_.remote + "/" + trunk;
    auto remoteTip = vcs_.tip(remoteTrunk);
    auto localTip = vcs_.tip(trunk);
    if (!remoteTip || !localTip || *remoteTip == *localTip) {
        return "";
    }
    if (!vcs_.isAncestor(trunk, remoteTrunk)) {
        return "Local '" + trunk + "' has diverged from '" + remoteTrunk + "'; not updating it";
    }
    log::info("Fast-forwarding '{}' to {}", trunk, remoteTip->substr(0, 8));
    vcs_.resetBranch(trunk, remoteTrunk);
    return "";
}

RestackOrchestrator::RestackResult RestackOrchestrator::restack(const std::string& target,
                                                               const RestackOptions& options) {
    if (hasPausedRun()) {
        if (state_.pausedRestack->branch != target) {
            log::info("Resuming the paused restack at '{}' instead of starting one for '{}'",
                      state_.pausedRestack->branch, target);
        }
        return resume();
    }

    if (!vcs_.isClean()) {
        throw StackError(ErrorCode::DirtyWorkingTree,
                         "The working tree has uncommitted changes", target,
                         "Commit or stash your changes, then re-run the restack.");
    }
    if (auto inProgress = vcs_.rebaseInProgress()) {
        throw StackError(ErrorCode::VcsCommandFailed,
                         "A rebase of '" + *inProgress + "' not started by git-stack is in progress",
                         *inProgress, "Finish it with `git rebase --continue` or `git rebase --abort`.");
    }

    RestackResult result;
    if (options.fetch) {
        if (auto warning = updateTrunkFromRemote(); !warning.empty()) {
            result.warnings.push_back(warning);
        }
    }

    const std::vector<std::string> order = plan(target, options.ancestors);
    for (const auto& name : order) {
        if (!vcs_.branchExists(name)) {
            throw StackError(ErrorCode::NotFound,
                             "Branch '" + name + "' is tracked but no longer exists in git", name,
                             "Run `git stack delete " + name + "` to drop the stale entry.");
        }
    }
    log::debug("Restack plan for '{}': {} branch(es)", target, order.size());

    return run(order, options.push, vcs_.currentBranch(), result);
}

RestackOrchestrator::RestackResult RestackOrchestrator::resume() {
    const RestackMarker marker = *state_.pausedRestack;
    RestackResult result;
    result.resumed = true;
    rewritten_.insert(marker.rewritten.begin(), marker.rewritten.end());

    if (!state_.graph.contains(marker.branch)) {
        log::warn("Paused branch '{}' is no longer tracked; skipping it", marker.branch);
        return run(marker.remaining, marker.push, marker.returnTo, result);
    }

    if (auto inProgress = vcs_.rebaseInProgress()) {
        if (*inProgress != marker.branch) {
            throw StackError(ErrorCode::VcsCommandFailed,
                             "A rebase of '" + *inProgress + "' not started by git-stack is in progress",
                             *inProgress,
                             "Finish it with `git rebase --continue` or `git rebase --abort`, then "
                             "re-run the restack to resume at '" + marker.branch + "'.");
        }
        log::info("Continuing the rebase of '{}'", marker.branch);
        if (vcs_.continueRebase() == vcs::RebaseOutcome::Conflict) {
            blockedTip_ = marker.originalTip;
            pause(marker.branch, marker.remaining, marker.push, marker.returnTo, result);
            return result;
        }
        const std::string base = requireTip(state_.graph.node(marker.branch).parent, marker.branch);
        completeNode(marker.branch, base, marker.push, result);
    } else {
        if (!vcs_.isClean()) {
            throw StackError(ErrorCode::DirtyWorkingTree,
                             "The working tree has uncommitted changes", marker.branch,
                             "Commit or stash your changes, then re-run the restack.");
        }
        const std::string base = requireTip(state_.graph.node(marker.branch).parent, marker.branch);
        const std::string tip = requireTip(marker.branch, marker.branch);
        // A moved tip means the rebase was finished by hand; otherwise it was aborted.
        if (!marker.originalTip.empty() && tip != marker.originalTip &&
            vcs_.isAncestor(base, marker.branch)) {
            log::info("The rebase of '{}' was completed by hand", marker.branch);
            completeNode(marker.branch, base, marker.push, result);
        } else if (restackNode(marker.branch, marker.push, result) == NodeState::ConflictPaused) {
            pause(marker.branch, marker.remaining, marker.push, marker.returnTo, result);
            return result;
        }
    }

    return run(marker.remaining, marker.push, marker.returnTo, result);
}

RestackOrchestrator::RestackResult RestackOrchestrator::run(const std::vector<std::string>& order,
                                                           bool push, const std::string& returnTo,
                                                           RestackResult result) {
    for (const auto& name : order) {
        result.states.emplace(name, NodeState::Pending);
    }
    for (size_t i = 0; i < order.size(); ++i) {
        const std::string& name = order[i];
        if (!state_.graph.contains(name)) continue;

        if (restackNode(name, push, result) == NodeState::ConflictPaused) {
            pause(name, std::vector<std::string>(order.begin() + i + 1, order.end()), push,
                  returnTo, result);
            return result;
        }
    }

    if (state_.pausedRestack) {
        state_.pausedRestack.reset();
        store_.save(state_);
    }

    if (!returnTo.empty() && vcs_.branchExists(returnTo) && vcs_.currentBranch() != returnTo) {
        log::info("Restoring starting branch '{}'", returnTo);
        vcs_.checkout(returnTo);
    }
    result.status = RestackResult::Status::Succeeded;
    return result;
}

RestackOrchestrator::NodeState RestackOrchestrator::restackNode(const std::string& name, bool push,
                                                               RestackResult& result) {
    const BranchNode node = state_.graph.node(name);
    const std::string base = requireTip(node.parent, name);
    const std::string tip = requireTip(name, name);

    if (vcs_.isAncestor(base, name)) {
        log::info("'{}' is already stacked on '{}'", name, node.parent);
        result.skipped.push_back(name);
        result.states[name] = NodeState::Succeeded;
        if (node.anchor != base) {
            state_.graph.setAnchor(name, base);
            store_.save(state_);
        }
        pushIfChanged(name, push, result);
        return NodeState::Succeeded;
    }

    if (vcs_.isAncestor(name, base)) {
        // Every commit of the branch is already in its parent.
        log::info("'{}' has no commits of its own on top of '{}'", name, node.parent);
        result.skipped.push_back(name);
        result.states[name] = NodeState::Succeeded;
        state_.graph.setAnchor(name, base);
        store_.save(state_);
        return NodeState::Succeeded;
    }

    std::optional<std::string> upstream;
    if (node.anchor && vcs_.tip(*node.anchor)) {
        const bool anchorInBranch = vcs_.isAncestor(*node.anchor, name);
        const bool anchorInParent = vcs_.isAncestor(*node.anchor, base);
        // A parent rebased earlier in this run still has its old tip in our history.
        if (anchorInBranch && (anchorInParent || rewritten_.count(node.parent))) {
            upstream = node.anchor;
        } else if (!anchorInParent) {
            std::string warning = "'" + node.parent + "' was rewritten since '" + name +
                                  "' was last restacked; rebasing all of '" + name +
                                  "' onto its new tip";
            log::warn("{}", warning);
            result.warnings.push_back(warning);
        }
    }

    if (config_.createBackups) {
        const std::string backup = name + "-at-" + runStamp_;
        log::debug("Creating backup branch '{}'", backup);
        vcs_.createBranch(backup, name);
    }

    log::info("Rebasing '{}' onto '{}' ({}){}", name, node.parent, base.substr(0, 8),
              upstream ? " from anchor " + upstream->substr(0, 8) : std::string());
    result.states[name] = NodeState::Rebasing;
    blockedTip_ = tip;
    if (vcs_.rebase(name, base, upstream) == vcs::RebaseOutcome::Conflict) {
        result.states[name] = NodeState::ConflictPaused;
        return NodeState::ConflictPaused;
    }

    completeNode(name, base, push, result);
    return NodeState::Succeeded;
}

void RestackOrchestrator::completeNode(const std::string& name, const std::string& base, bool push,
                                       RestackResult& result) {
    state_.graph.setAnchor(name, base);
    store_.save(state_);
    rewritten_.insert(name);
    result.rebased.push_back(name);
    result.states[name] = NodeState::Succeeded;
    pushIfChanged(name, push, result);
}

void RestackOrchestrator::pushIfChanged(const std::string& name, bool push, RestackResult& result) {
    if (!push) return;
    if (vcs_.tip(config_.remote + "/" + name) == vcs_.tip(name)) return;

    log::info("Force-pushing '{}' to {}", name, config_.remote);
    vcs_.forcePush(config_.remote, name);
    result.pushed.push_back(name);
}

void RestackOrchestrator::pause(const std::string& name, std::vector<std::string> remaining,
                                bool push, const std::string& returnTo, RestackResult& result) {
    result.status = RestackResult::Status::ConflictPaused;
    result.states[name] = NodeState::ConflictPaused;
    result.blockedBranch = name;
    result.remaining = remaining.size();

    state_.pausedRestack = RestackMarker{name, std::move(remaining), push, returnTo,
                                         std::vector<std::string>(rewritten_.begin(), rewritten_.end()),
                                         blockedTip_};
    store_.save(state_);
    log::info("Restack paused on '{}' with {} branch(es) left", name, result.remaining);
}

}
