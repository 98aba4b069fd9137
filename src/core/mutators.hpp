#pragma once
#include "state_store.hpp"
#include "../vcs/vcs_adapter.hpp"
#include <string>
#include <vector>

namespace gitstack::core {

/**
 * The single-step edits of the stack: checkout/create, mount and delete.
 * Each one validates first, edits the graph, persists it, and only then
 * performs any remaining VCS side effect.
 */
class GraphMutators {
public:
    GraphMutators(StackState& state, StateStore& store, vcs::VcsAdapter& vcs);

    /**
     * Switch to `name`, creating it on top of the current branch if it is
     * not tracked yet.
     * @return true if a new branch was created
     * @throws NotFound if the graph lists `name` but git does not have it
     * @throws DuplicateBranch if git has an untracked branch of that name
     * @throws UnknownParent if the current branch is not tracked
     */
    bool checkout(const std::string& name);

    /**
     * Declare `newParent` as the parent of `branch`. History is not touched;
     * the next restack moves the commits.
     */
    void mount(const std::string& branch, const std::string& newParent);

    /**
     * Stop tracking `branch`; its children move onto its parent and lose
     * their anchors.
     * @param deleteVcsBranch also delete the git branch
     * @return the rewired children
     */
    std::vector<std::string> remove(const std::string& branch, bool deleteVcsBranch);

private:
    StackState& state_;
    StateStore& store_;
    vcs::VcsAdapter& vcs_;

    void requireCleanTree(const std::string& branch);
    std::string requireTip(const std::string& ref);
};

std::int64_t currentTimestamp();

}
