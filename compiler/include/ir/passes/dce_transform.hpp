#pragma once

// Dead Code Elimination Transformer
//
// The only component that mutates the CFG during dead code elimination.
// It works from analysis snapshots taken before the edit and never reads
// them again afterwards; the driver rebuilds them for the next sweep.
//
// An instruction is removed iff
// - it has a result that is not live and it is Pure or MemoryRead, or
// - it is a store to a Local allocation that nothing loads from, or
// - it is an allocation whose result is not live.
// EffectFul instructions are never removed. Phis follow the liveness rule
// and are never collapsed into copies.

#include "ir/analysis/escape.hpp"
#include "ir/analysis/liveness.hpp"
#include "ir/analysis/reachability.hpp"
#include "ir/analysis/side_effects.hpp"
#include "ir/ir.hpp"
#include "ir/passes/dce_stats.hpp"

#include <vector>

namespace sift::ir {

struct InstructionRef {
    BlockId block;
    size_t index;
};

struct RemovalPlan {
    std::vector<InstructionRef> removals; // Layout order
    std::vector<ConservativeDecision> decisions;

    [[nodiscard]] auto empty() const -> bool {
        return removals.empty();
    }
};

class DceTransformer {
public:
    // Deletes every block outside `reachable`, detaches it from surviving
    // neighbours, and drops phi entries that name it. Returns the number of
    // blocks removed.
    auto remove_unreachable_blocks(Function& func, const ReachableSet& reachable) -> size_t;

    [[nodiscard]] auto plan_instruction_removal(const Function& func,
                                                const LivenessInfo& liveness,
                                                const EscapeTable& escapes,
                                                const CallPurity& purity) const -> RemovalPlan;

    // Returns the number of instructions removed
    auto apply(Function& func, const RemovalPlan& plan) -> size_t;
};

} // namespace sift::ir
