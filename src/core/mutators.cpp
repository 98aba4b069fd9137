#include "mutators.hpp"
#include "errors.hpp"
#include "../utils/log.hpp"

#include <algorithm>
#include <chrono>

namespace gitstack::core {

std::int64_t currentTimestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

GraphMutators::GraphMutators(StackState& state, StateStore& store, vcs::VcsAdapter& vcs)
    : state_(state), store_(store), vcs_(vcs) {}

void GraphMutators::requireCleanTree(const std::string& branch) {
    if (!vcs_.isClean()) {
        throw StackError(ErrorCode::DirtyWorkingTree,
                         "The working tree has uncommitted changes", branch,
                         "Commit or stash your changes first.");
    }
}

std::string GraphMutators::requireTip(const std::string& ref) {
    auto tip = vcs_.tip(ref);
    if (!tip) {
        throw StackError(ErrorCode::NotFound,
                         "Branch '" + ref + "' does not exist in git", ref,
                         "Run `git stack delete " + ref + "` to drop the stale entry.");
    }
    return *tip;
}

bool GraphMutators::checkout(const std::string& name) {
    StackGraph& graph = state_.graph;
    requireCleanTree(name);

    if (graph.isTrunk(name) || graph.contains(name)) {
        if (!vcs_.branchExists(name)) {
            throw StackError(ErrorCode::NotFound,
                             "Branch '" + name + "' is tracked but no longer exists in git", name,
                             "Run `git stack delete " + name + "` to drop the stale entry.");
        }
        vcs_.checkout(name);
        return false;
    }

    const std::string current = vcs_.currentBranch();
    if (current.empty()) {
        throw StackError(ErrorCode::NotFound, "HEAD is detached; there is no branch to stack on", name,
                         "Check out a tracked branch first.");
    }
    if (!graph.isTrunk(current) && !graph.contains(current)) {
        throw StackError(ErrorCode::UnknownParent,
                         "The current branch '" + current + "' is not tracked", name,
                         "Run `git stack mount <parent>` on '" + current + "' first.");
    }
    if (vcs_.branchExists(name)) {
        throw StackError(ErrorCode::DuplicateBranch,
                         "Branch '" + name + "' already exists in git but is not tracked", name,
                         "Run `git stack mount " + current + " --branch " + name + "` to track it.");
    }

    const std::string anchor = requireTip(current);
    graph.add(name, current, anchor, currentTimestamp());
    try {
        store_.save(state_);
    } catch (const StackError&) {
        graph.remove(name);
        throw;
    }
    vcs_.createBranch(name, current);
    vcs_.checkout(name);

    log::info("Created '{}' on top of '{}' at {}", name, current, anchor.substr(0, 8));
    return true;
}

void GraphMutators::mount(const std::string& branch, const std::string& newParent) {
    StackGraph& graph = state_.graph;
    if (graph.isTrunk(branch)) {
        throw StackError(ErrorCode::TrunkProtected,
                         "The trunk branch '" + branch + "' cannot be mounted", branch);
    }
    if (!vcs_.branchExists(branch)) {
        throw StackError(ErrorCode::NotFound, "Branch '" + branch + "' does not exist in git", branch);
    }
    if (!graph.isTrunk(newParent) && !graph.contains(newParent)) {
        throw StackError(ErrorCode::UnknownParent,
                         "Parent '" + newParent + "' is not tracked", branch,
                         "Mount '" + newParent + "' first, or choose a tracked parent.");
    }
    const std::string anchor = requireTip(newParent);

    if (graph.contains(branch)) {
        graph.reparent(branch, newParent, anchor);
    } else {
        graph.add(branch, newParent, anchor, currentTimestamp());
    }
    store_.save(state_);
    log::info("Mounted '{}' on '{}'", branch, newParent);
}

std::vector<std::string> GraphMutators::remove(const std::string& branch, bool deleteVcsBranch) {
    StackGraph& graph = state_.graph;
    if (graph.isTrunk(branch)) {
        throw StackError(ErrorCode::TrunkProtected,
                         "The trunk branch '" + branch + "' cannot be deleted", branch);
    }
    const std::string parent = graph.node(branch).parent;

    if (state_.pausedRestack) {
        RestackMarker& marker = *state_.pausedRestack;
        if (marker.branch == branch) {
            throw StackError(ErrorCode::RebaseConflict,
                             "A paused restack is stopped on '" + branch + "'", branch,
                             "Finish the restack with `git stack restack` or abort the rebase first.");
        }
        marker.remaining.erase(std::remove(marker.remaining.begin(), marker.remaining.end(), branch),
                               marker.remaining.end());
        if (marker.returnTo == branch) marker.returnTo = parent;
    }

    const bool deleteInGit = deleteVcsBranch && vcs_.branchExists(branch);
    if (deleteInGit && vcs_.currentBranch() == branch) {
        requireCleanTree(branch);
        vcs_.checkout(parent);
    }

    std::vector<std::string> rewired = graph.remove(branch);
    for (const auto& child : rewired) {
        graph.setAnchor(child, std::nullopt);
        log::info("Re-parented '{}' onto '{}'", child, parent);
    }
    store_.save(state_);

    if (deleteInGit) {
        vcs_.deleteBranch(branch);
    }
    return rewired;
}

}
