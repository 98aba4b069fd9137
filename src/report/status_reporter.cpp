#include "status_reporter.hpp"

namespace gitstack::report {

std::string shortSha(const std::string& sha) {
    return sha.substr(0, 8);
}

StatusReporter::StatusReporter(const core::StackState& state, vcs::VcsAdapter& vcs,
                               std::ostream& out)
    : state_(state), vcs_(vcs), out_(out) {}

std::string StatusReporter::describe(const core::BranchNode& node) {
    auto tip = vcs_.tip(node.name);
    if (!tip) {
        return node.name + " does not exist!";
    }

    std::string line = node.name + " (" + shortSha(*tip) + ") ";
    if (vcs_.tip(node.parent) && vcs_.isAncestor(node.parent, node.name)) {
        line += "is stacked on " + node.parent;
    } else {
        line += "diverges from " + node.parent;
    }
    if (node.anchor) {
        line += " (anchor " + shortSha(*node.anchor) + ")";
    }
    if (node.prNumber) {
        line += " (PR #" + std::to_string(*node.prNumber) + ")";
    }
    return line;
}

void StatusReporter::printNode(const core::BranchTree& tree, size_t depth,
                               const std::string& currentBranch) {
    out_ << (tree.name == currentBranch ? "> " : "  ");
    for (size_t i = 0; i < depth; ++i) out_ << "  ";

    if (state_.graph.isTrunk(tree.name)) {
        auto tip = vcs_.tip(tree.name);
        out_ << tree.name << (tip ? " (" + shortSha(*tip) + ")" : std::string(" does not exist!"))
             << '\n';
    } else {
        out_ << describe(state_.graph.node(tree.name)) << '\n';
    }

    for (const auto& child : tree.children) {
        printNode(child, depth + 1, currentBranch);
    }
}

void StatusReporter::printTree(const std::string& currentBranch) {
    const core::StackGraph& graph = state_.graph;
    if (graph.empty()) {
        out_ << "No stacked branches yet. Run `git stack checkout <name>` to start one.\n";
    } else {
        printNode(graph.descendants(graph.trunk()), 0, currentBranch);
    }

    if (!currentBranch.empty() && !graph.isTrunk(currentBranch) && !graph.contains(currentBranch)) {
        out_ << "\nThe current branch " << currentBranch << " is not in the stack tree.\n"
             << "Run `git stack mount <parent_branch>` to add it.\n";
    }
    if (state_.pausedRestack) {
        out_ << "\nA restack is paused on " << state_.pausedRestack->branch << " with "
             << state_.pausedRestack->remaining.size() << " branch(es) left.\n"
             << "Resolve the conflicts and run `git stack restack` to continue.\n";
    }
}

bool StatusReporter::showDiff(const std::string& branch) {
    const core::BranchNode& node = state_.graph.node(branch);
    return vcs_.showDiff(node.anchor.value_or(node.parent), branch);
}

bool StatusReporter::showLog(const std::string& branch) {
    const core::BranchNode& node = state_.graph.node(branch);
    return vcs_.showLog(node.parent, branch);
}

}
