#pragma once

// Reachability Analysis
//
// Depth-first traversal from the entry block following terminator
// successors. Read-only; the caller guarantees the entry block exists.

#include "ir/ir.hpp"

#include <unordered_set>
#include <vector>

namespace sift::ir {

// Block ids reachable from the entry block
class ReachableSet {
public:
    void insert(BlockId id) {
        blocks_.insert(id);
    }

    [[nodiscard]] auto contains(BlockId id) const -> bool {
        return blocks_.count(id) > 0;
    }

    [[nodiscard]] auto size() const -> size_t {
        return blocks_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return blocks_.empty();
    }

private:
    std::unordered_set<BlockId> blocks_;
};

class ReachabilityAnalyzer {
public:
    // O(blocks + edges)
    [[nodiscard]] auto analyze(const Function& func) const -> ReachableSet;
};

// Reachable blocks in reverse post-order, entry first
auto reverse_post_order(const Function& func) -> std::vector<BlockId>;

} // namespace sift::ir
