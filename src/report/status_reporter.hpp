#pragma once
#include "../core/state_store.hpp"
#include "../vcs/vcs_adapter.hpp"
#include <ostream>
#include <string>

namespace gitstack::report {

/**
 * Read-only views of the stack: the tree, and diff/log of a branch against
 * its parent. Nothing here mutates the graph or the repository.
 */
class StatusReporter {
public:
    StatusReporter(const core::StackState& state, vcs::VcsAdapter& vcs, std::ostream& out);

    void printTree(const std::string& currentBranch);

    // Diff from the anchor (or the parent when no anchor is known) to `branch`.
    bool showDiff(const std::string& branch);

    bool showLog(const std::string& branch);

private:
    const core::StackState& state_;
    vcs::VcsAdapter& vcs_;
    std::ostream& out_;

    void printNode(const core::BranchTree& tree, size_t depth, const std::string& currentBranch);
    std::string describe(const core::BranchNode& node);
};

std::string shortSha(const std::string& sha);

}
