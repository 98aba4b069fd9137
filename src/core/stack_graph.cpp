#include "stack_graph.hpp"
#include "errors.hpp"

#include <algorithm>
#include <set>

namespace gitstack::core {

StackGraph::StackGraph(const std::string& trunk) : trunk_(trunk) {}

bool StackGraph::contains(const std::string& name) const {
    return nodes_.count(name) > 0;
}

const BranchNode& StackGraph::node(const std::string& name) const {
    auto it = nodes_.find(name);
    if (it == nodes_.end()) {
        throw StackError(ErrorCode::NotFound,
                         "Branch '" + name + "' is not tracked by git-stack", name,
                         "Run `git stack mount <parent>` on it to start tracking it.");
    }
    return it->second;
}

BranchNode& StackGraph::node(const std::string& name) {
    return const_cast<BranchNode&>(static_cast<const StackGraph&>(*this).node(name));
}

const BranchNode* StackGraph::find(const std::string& name) const {
    auto it = nodes_.find(name);
    return it == nodes_.end() ? nullptr : &it->second;
}

bool StackGraph::isKnownParent(const std::string& name) const {
    return isTrunk(name) || contains(name);
}

void StackGraph::add(const std::string& name, const std::string& parent,
                     const std::optional<std::string>& anchor, std::int64_t createdAt) {
    if (isTrunk(name) || contains(name)) {
        throw StackError(ErrorCode::DuplicateBranch,
                         "Branch '" + name + "' is already part of the stack", name,
                         "Pick a different branch name.");
    }
    if (!isKnownParent(parent)) {
        throw StackError(ErrorCode::UnknownParent,
                         "Parent '" + parent + "' of '" + name + "' is not tracked", name,
                         "Mount '" + parent + "' first, or choose a tracked parent.");
    }

    BranchNode node;
    node.name = name;
    node.parent = parent;
    node.anchor = anchor;
    node.createdAt = createdAt;
    nodes_.emplace(name, node);
}

void StackGraph::insertUnchecked(const BranchNode& node) {
    if (isTrunk(node.name) || !nodes_.emplace(node.name, node).second) {
        throw StackError(ErrorCode::CorruptState,
                         "Branch '" + node.name + "' appears twice in the stack state", node.name);
    }
}

void StackGraph::reparent(const std::string& name, const std::string& newParent,
                          const std::optional<std::string>& anchor) {
    if (isTrunk(name)) {
        throw StackError(ErrorCode::TrunkProtected,
                         "The trunk branch '" + name + "' cannot be mounted", name);
    }
    BranchNode& target = node(name);
    if (!isKnownParent(newParent)) {
        throw StackError(ErrorCode::UnknownParent,
                         "Parent '" + newParent + "' is not tracked", name,
                         "Mount '" + newParent + "' first, or choose a tracked parent.");
    }
    if (newParent == name || isDescendant(newParent, name)) {
        throw StackError(ErrorCode::WouldCreateCycle,
                         "Mounting '" + name + "' on '" + newParent + "' would create a cycle", name,
                         "'" + newParent + "' is stacked on '" + name + "'; choose a different parent.");
    }
    target.parent = newParent;
    target.anchor = anchor;
}

std::vector<std::string> StackGraph::remove(const std::string& name) {
    if (isTrunk(name)) {
        throw StackError(ErrorCode::TrunkProtected,
                         "The trunk branch '" + name + "' cannot be deleted", name);
    }
    const std::string parent = node(name).parent;

    std::vector<std::string> rewired = children(name);
    for (const auto& child : rewired) {
        nodes_[child].parent = parent;
    }
    nodes_.erase(name);
    return rewired;
}

void StackGraph::setAnchor(const std::string& name, const std::optional<std::string>& anchor) {
    node(name).anchor = anchor;
}

std::vector<std::string> StackGraph::children(const std::string& name) const {
    std::vector<std::string> out;
    for (const auto& [branch, n] : nodes_) {
        if (n.parent == name) out.push_back(branch);
    }
    return out;   // std::map keeps these sorted by name
}

std::vector<std::string> StackGraph::ancestors(const std::string& name) const {
    std::vector<std::string> out;
    std::string current = node(name).parent;
    while (!isTrunk(current)) {
        if (out.size() > nodes_.size()) {
            throw StackError(ErrorCode::CorruptState,
                             "Parent chain of '" + name + "' does not reach trunk", name);
        }
        out.push_back(current);
        current = node(current).parent;
    }
    return out;
}

BranchTree StackGraph::descendants(const std::string& name) const {
    if (!isTrunk(name)) node(name);

    BranchTree tree;
    tree.name = name;
    for (const auto& child : children(name)) {
        tree.children.push_back(descendants(child));
    }
    return tree;
}

void StackGraph::appendSubtree(const std::string& name, std::vector<std::string>& out) const {
    out.push_back(name);
    for (const auto& child : children(name)) {
        appendSubtree(child, out);
    }
}

std::vector<std::string> StackGraph::topologicalOrder(const std::string& name) const {
    std::vector<std::string> out;
    if (isTrunk(name)) {
        for (const auto& root : children(trunk_)) appendSubtree(root, out);
        return out;
    }
    node(name);
    appendSubtree(name, out);
    return out;
}

bool StackGraph::isDescendant(const std::string& candidate, const std::string& ancestor) const {
    if (isTrunk(ancestor)) return contains(candidate);
    const BranchNode* current = find(candidate);
    size_t steps = 0;
    while (current && !isTrunk(current->parent) && steps++ <= nodes_.size()) {
        if (current->parent == ancestor) return true;
        current = find(current->parent);
    }
    return false;
}

std::vector<std::string> StackGraph::names() const {
    std::vector<std::string> out;
    out.reserve(nodes_.size());
    for (const auto& entry : nodes_) out.push_back(entry.first);
    return out;
}

std::vector<std::string> StackGraph::repairDanglingParents() {
    std::vector<std::string> repaired;
    for (auto& [name, n] : nodes_) {
        if (!isKnownParent(n.parent)) {
            n.parent = trunk_;
            n.anchor.reset();
            repaired.push_back(name);
        }
    }
    return repaired;
}

void StackGraph::validate() const {
    for (const auto& [name, n] : nodes_) {
        if (!isKnownParent(n.parent)) {
            throw StackError(ErrorCode::CorruptState,
                             "Branch '" + name + "' has unknown parent '" + n.parent + "'", name);
        }
        std::set<std::string> seen{name};
        std::string current = n.parent;
        while (!isTrunk(current)) {
            if (!seen.insert(current).second) {
                throw StackError(ErrorCode::CorruptState,
                                 "Branch '" + name + "' is part of a parent cycle", name);
            }
            auto it = nodes_.find(current);
            if (it == nodes_.end()) {
                throw StackError(ErrorCode::CorruptState,
                                 "Branch '" + current + "' is referenced but not tracked", current);
            }
            current = it->second.parent;
        }
    }
}

}
