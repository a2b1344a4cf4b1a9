// Reachability Analysis Implementation
//
// Both traversals use an explicit stack so deep CFGs cannot overflow the
// native stack.

#include "ir/analysis/reachability.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

namespace sift::ir {

namespace {

// Successor lists resolved once per traversal, so each edge is visited once
class SuccessorMap {
public:
    explicit SuccessorMap(const Function& func) : func_(func), index_(func.block_index()) {}

    auto contains(BlockId id) const -> bool {
        return index_.count(id) > 0;
    }

    auto successors(BlockId id) const -> std::vector<BlockId> {
        auto it = index_.find(id);
        if (it == index_.end()) {
            return {};
        }
        const auto& block = func_.blocks[it->second];
        if (!block.terminator) {
            return {};
        }
        std::vector<BlockId> succs;
        for (auto succ : successors_of(*block.terminator)) {
            if (contains(succ)) {
                succs.push_back(succ);
            }
        }
        return succs;
    }

private:
    const Function& func_;
    std::unordered_map<BlockId, size_t> index_;
};

} // namespace

auto ReachabilityAnalyzer::analyze(const Function& func) const -> ReachableSet {
    ReachableSet reachable;
    SuccessorMap graph(func);
    if (!graph.contains(func.entry)) {
        return reachable;
    }

    std::vector<BlockId> worklist;
    worklist.push_back(func.entry);
    reachable.insert(func.entry);

    while (!worklist.empty()) {
        BlockId current = worklist.back();
        worklist.pop_back();

        for (auto succ : graph.successors(current)) {
            if (!reachable.contains(succ)) {
                reachable.insert(succ);
                worklist.push_back(succ);
            }
        }
    }

    return reachable;
}

auto reverse_post_order(const Function& func) -> std::vector<BlockId> {
    std::vector<BlockId> post_order;
    SuccessorMap graph(func);
    if (!graph.contains(func.entry)) {
        return post_order;
    }

    // (block, successors, index of the next successor to visit)
    struct Frame {
        BlockId block;
        std::vector<BlockId> succs;
        size_t next = 0;
    };

    std::unordered_set<BlockId> visited;
    std::vector<Frame> stack;
    visited.insert(func.entry);
    stack.push_back(Frame{func.entry, graph.successors(func.entry)});

    while (!stack.empty()) {
        auto& frame = stack.back();
        if (frame.next < frame.succs.size()) {
            BlockId succ = frame.succs[frame.next++];
            if (visited.insert(succ).second) {
                stack.push_back(Frame{succ, graph.successors(succ)});
            }
            continue;
        }
        post_order.push_back(frame.block);
        stack.pop_back();
    }

    std::reverse(post_order.begin(), post_order.end());
    return post_order;
}

} // namespace sift::ir
