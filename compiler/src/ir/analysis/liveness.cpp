//! # Liveness Analysis Implementation
//!
//! Builds gen/kill/phi_uses once, then sweeps the blocks in post-order until
//! no live-in or live-out set changes or the sweep cap is reached.

#include "ir/analysis/liveness.hpp"

#include "ir/analysis/reachability.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <unordered_set>

namespace sift::ir {

namespace {

struct BlockSets {
    ValueSet gen;
    ValueSet kill;
    ValueSet phi_uses; // Values read by phis in successors, along the edge from this block
};

auto compute_block_sets(const Function& func) -> std::unordered_map<BlockId, BlockSets> {
    std::unordered_map<BlockId, BlockSets> sets;
    for (const auto& block : func.blocks) {
        sets[block.id];
    }

    for (const auto& block : func.blocks) {
        auto& bs = sets[block.id];

        for (const auto& inst : block.instructions) {
            if (const auto* phi = std::get_if<PhiInst>(&inst.inst)) {
                for (const auto& [value, pred] : phi->incoming) {
                    auto it = sets.find(pred);
                    if (it != sets.end()) {
                        it->second.phi_uses.insert(value.id);
                    }
                }
            } else {
                for_each_operand(inst, [&bs](const Value& v) {
                    if (bs.kill.count(v.id) == 0) {
                        bs.gen.insert(v.id);
                    }
                });
            }
            if (inst.has_result()) {
                bs.kill.insert(inst.result);
            }
        }

        if (block.terminator) {
            for_each_operand(*block.terminator, [&bs](const Value& v) {
                if (bs.kill.count(v.id) == 0) {
                    bs.gen.insert(v.id);
                }
            });
        }
    }

    return sets;
}

} // namespace

// ============================================================================
// LivenessInfo
// ============================================================================

auto LivenessInfo::is_live_in(BlockId block, ValueId value) const -> bool {
    return live_in(block).count(value) > 0;
}

auto LivenessInfo::is_live_out(BlockId block, ValueId value) const -> bool {
    return live_out(block).count(value) > 0;
}

auto LivenessInfo::live_in(BlockId block) const -> const ValueSet& {
    static const ValueSet empty;
    auto it = live_in_.find(block);
    return it != live_in_.end() ? it->second : empty;
}

auto LivenessInfo::live_out(BlockId block) const -> const ValueSet& {
    static const ValueSet empty;
    auto it = live_out_.find(block);
    return it != live_out_.end() ? it->second : empty;
}

// ============================================================================
// LivenessAnalyzer
// ============================================================================

LivenessAnalyzer::LivenessAnalyzer(size_t max_iterations)
    : max_iterations_(std::max<size_t>(max_iterations, 1)) {}

auto LivenessAnalyzer::analyze(const Function& func) const -> LivenessInfo {
    LivenessInfo info;
    info.def_use_ = DefUseChains::build(func);

    auto sets = compute_block_sets(func);

    // Post-order of the reachable blocks, then anything unreachable
    auto order = reverse_post_order(func);
    std::reverse(order.begin(), order.end());
    std::unordered_set<BlockId> ordered(order.begin(), order.end());
    for (const auto& block : func.blocks) {
        if (ordered.insert(block.id).second) {
            order.push_back(block.id);
        }
    }
    auto index = func.block_index();

    for (auto id : order) {
        info.live_in_[id];
        info.live_out_[id];
    }

    while (info.iterations_ < max_iterations_) {
        ++info.iterations_;
        bool changed = false;

        for (auto id : order) {
            const auto& block = func.blocks[index.at(id)];
            const auto& bs = sets[id];

            ValueSet out = bs.phi_uses;
            for (auto succ : block.successors) {
                auto it = info.live_in_.find(succ);
                if (it != info.live_in_.end()) {
                    out.insert(it->second.begin(), it->second.end());
                }
            }

            ValueSet in = bs.gen;
            for (auto v : out) {
                if (bs.kill.count(v) == 0) {
                    in.insert(v);
                }
            }

            if (out != info.live_out_[id]) {
                info.live_out_[id] = std::move(out);
                changed = true;
            }
            if (in != info.live_in_[id]) {
                info.live_in_[id] = std::move(in);
                changed = true;
            }
        }

        if (!changed) {
            info.converged_ = true;
            break;
        }
    }

    if (!info.converged_) {
        SIFT_LOG_WARN("liveness", func.name << ": no fixed point after " << info.iterations_
                                            << " iterations");
    } else {
        SIFT_LOG_TRACE("liveness", func.name << ": converged in " << info.iterations_
                                             << " iterations");
    }

    return info;
}

} // namespace sift::ir
