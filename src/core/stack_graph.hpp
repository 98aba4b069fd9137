#pragma once
#include "branch_node.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gitstack::core {

/**
 * In-memory branch relationship graph. Nodes are looked up by name; every
 * node has exactly one parent which is either the trunk or another node.
 *
 * All checks here are pure functions over the map. The graph never talks to
 * the VCS: callers query tips and hand anchors in.
 */
class StackGraph {
public:
    explicit StackGraph(const std::string& trunk = "main");

    const std::string& trunk() const { return trunk_; }
    bool isTrunk(const std::string& name) const { return name == trunk_; }

    bool contains(const std::string& name) const;
    bool empty() const { return nodes_.empty(); }
    size_t size() const { return nodes_.size(); }

    /**
     * Look up a node
     * @throws StackError(NotFound) if the branch is not tracked
     */
    const BranchNode& node(const std::string& name) const;
    BranchNode& node(const std::string& name);

    const BranchNode* find(const std::string& name) const;

    /**
     * Track a new branch under `parent`
     * @throws DuplicateBranch, UnknownParent
     */
    void add(const std::string& name, const std::string& parent,
             const std::optional<std::string>& anchor = std::nullopt,
             std::int64_t createdAt = 0);

    /**
     * Insert a node as loaded from disk. Parent validity is not checked here;
     * call validate() once every node has been inserted.
     */
    void insertUnchecked(const BranchNode& node);

    /**
     * Move `name` under `newParent` and set its anchor
     * @throws NotFound, UnknownParent, WouldCreateCycle, TrunkProtected
     */
    void reparent(const std::string& name, const std::string& newParent,
                  const std::optional<std::string>& anchor);

    /**
     * Drop `name`; its children move onto its parent.
     * @return the rewired children, so the caller can invalidate their anchors
     */
    std::vector<std::string> remove(const std::string& name);

    void setAnchor(const std::string& name, const std::optional<std::string>& anchor);

    std::vector<std::string> children(const std::string& name) const;

    // Parent first, up to but excluding trunk.
    std::vector<std::string> ancestors(const std::string& name) const;

    BranchTree descendants(const std::string& name) const;

    // `name` followed by all of its descendants, parents before children.
    // Passing the trunk name yields every tracked branch.
    std::vector<std::string> topologicalOrder(const std::string& name) const;

    // True if `candidate` sits somewhere below `ancestor`.
    bool isDescendant(const std::string& candidate, const std::string& ancestor) const;

    std::vector<std::string> names() const;
    const std::map<std::string, BranchNode>& nodes() const { return nodes_; }

    /**
     * Re-home nodes whose parent is neither trunk nor a tracked branch.
     * @return the repaired branch names
     */
    std::vector<std::string> repairDanglingParents();

    /**
     * Check acyclicity and referential validity
     * @throws StackError(CorruptState)
     */
    void validate() const;

private:
    std::string trunk_;
    std::map<std::string, BranchNode> nodes_;

    bool isKnownParent(const std::string& name) const;
    void appendSubtree(const std::string& name, std::vector<std::string>& out) const;
};

}
