#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gitstack::core {

// One tracked branch. `parent` holds the trunk name for stack roots.
struct BranchNode {
    std::string name;
    std::string parent;
    std::optional<std::string> anchor;   // parent tip at the last successful restack
    std::int64_t createdAt = 0;
    std::optional<std::uint64_t> prNumber;
};

// Descendant view rooted at one branch.
struct BranchTree {
    std::string name;
    std::vector<BranchTree> children;

    size_t size() const {
        size_t total = 1;
        for (const auto& child : children) total += child.size();
        return total;
    }
};

}
