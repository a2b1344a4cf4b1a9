//! # Liveness Analysis
//!
//! Backward dataflow over the CFG computing, for every block, the SSA values
//! live on entry and on exit.
//!
//! ## Equations
//!
//! ```text
//! gen[B]      = values used in B before any definition in B
//! kill[B]     = values defined in B (phi results included)
//! live_out[B] = union of live_in[S] for successors S, plus phi_uses[B]
//! live_in[B]  = gen[B] + (live_out[B] - kill[B])
//! ```
//!
//! A phi's incoming value is used at the exit of the matching predecessor,
//! never inside the phi's own block, so it lands in `phi_uses[pred]` and not
//! in `gen` of the phi's block.
//!
//! Blocks are visited in post-order (the reverse of reverse-post-order),
//! which lets a backward problem converge in few sweeps. The number of
//! sweeps is capped; when the cap is hit the sets computed so far are
//! returned with `converged() == false`. They only ever grow, so a stopped
//! run under-approximates the sets but `is_live()` stays exact because it
//! reads the def-use chains.

#pragma once

#include "common.hpp"
#include "ir/analysis/def_use.hpp"
#include "ir/ir.hpp"

#include <unordered_map>
#include <unordered_set>

namespace sift::ir {

using ValueSet = std::unordered_set<ValueId>;

class LivenessInfo {
public:
    /// True if any instruction, terminator, or phi entry still reads `value`.
    [[nodiscard]] auto is_live(ValueId value) const -> bool {
        return def_use_.has_uses(value);
    }

    [[nodiscard]] auto is_live_in(BlockId block, ValueId value) const -> bool;
    [[nodiscard]] auto is_live_out(BlockId block, ValueId value) const -> bool;

    /// Empty set for blocks the analysis never saw.
    [[nodiscard]] auto live_in(BlockId block) const -> const ValueSet&;
    [[nodiscard]] auto live_out(BlockId block) const -> const ValueSet&;

    [[nodiscard]] auto def_use() const -> const DefUseChains& {
        return def_use_;
    }

    [[nodiscard]] auto iterations() const -> size_t {
        return iterations_;
    }

    [[nodiscard]] auto converged() const -> bool {
        return converged_;
    }

private:
    friend class LivenessAnalyzer;

    DefUseChains def_use_;
    std::unordered_map<BlockId, ValueSet> live_in_;
    std::unordered_map<BlockId, ValueSet> live_out_;
    size_t iterations_ = 0;
    bool converged_ = false;
};

class LivenessAnalyzer {
public:
    explicit LivenessAnalyzer(size_t max_iterations = CompilerOptions::max_liveness_iterations);

    [[nodiscard]] auto analyze(const Function& func) const -> LivenessInfo;

    [[nodiscard]] auto max_iterations() const -> size_t {
        return max_iterations_;
    }

private:
    size_t max_iterations_;
};

} // namespace sift::ir
