//! # Dead Code Elimination Statistics
//!
//! Per-function counters, conservative-decision records, and the module
//! report produced by `DeadCodeEliminationPass`.
//!
//! ## Conservative decisions
//!
//! Every time an instruction that looks removable is kept for safety, the
//! pass records which instruction and why:
//!
//! | Reason                | Kept instruction                                   |
//! |-----------------------|----------------------------------------------------|
//! | `MayAlias`            | Store to an address-taken allocation never read    |
//! | `UnknownCallPurity`   | Direct call whose result is unused                 |
//! | `EscapedPointer`      | Store to an escaped allocation never read locally  |
//! | `PotentialSideEffect` | Indirect call whose result is unused               |

#pragma once

#include "ir/ir.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace sift::ir {

// ============================================================================
// Conservative Decisions
// ============================================================================

enum class ConservativeReason {
    MayAlias,
    UnknownCallPurity,
    EscapedPointer,
    PotentialSideEffect,
};

[[nodiscard]] auto reason_name(ConservativeReason reason) -> const char*;

// One-line explanation for reports
[[nodiscard]] auto reason_explanation(ConservativeReason reason) -> const char*;

// One record per retained instruction. Identity is the instruction's
// position in the optimized function, so equal-looking instructions stay
// distinct.
struct ConservativeDecision {
    std::string function;
    std::string block;
    std::string instruction; // Printed form of the retained instruction
    ConservativeReason reason;
    BlockId block_id = INVALID_BLOCK;
    size_t index = 0; // Position within the block

    auto operator==(const ConservativeDecision& other) const -> bool = default;
};

// ============================================================================
// Per-Function Statistics
// ============================================================================

struct OptimizationStats {
    size_t instructions_removed = 0;
    size_t blocks_removed = 0;
    size_t iterations = 0;
    bool converged = true;          // Driver reached a round with no removals
    bool liveness_converged = true; // Every liveness run reached its fixed point
    std::vector<ConservativeDecision> decisions;
    std::vector<std::string> warnings;

    [[nodiscard]] auto had_effect() const -> bool {
        return instructions_removed > 0 || blocks_removed > 0;
    }

    [[nodiscard]] auto total_removed() const -> size_t {
        return instructions_removed + blocks_removed;
    }

    // Appends unless a record for the same instruction is already present
    void add_decision(ConservativeDecision decision);

    [[nodiscard]] auto count_decisions(ConservativeReason reason) const -> size_t;

    // Sums counters and concatenates records (decisions deduplicated)
    void merge(const OptimizationStats& other);

    [[nodiscard]] auto format_report(const std::string& function_name) const -> std::string;
};

// ============================================================================
// Errors
// ============================================================================

enum class PassErrorKind {
    MalformedInput,      // Rejected before optimization
    StructuralViolation, // Verifier failure after optimization
};

[[nodiscard]] auto pass_error_kind_name(PassErrorKind kind) -> const char*;

struct PassError {
    PassErrorKind kind;
    std::string function;
    std::string message;

    [[nodiscard]] auto to_string() const -> std::string;
};

// ============================================================================
// Module Report
// ============================================================================

struct ModuleReport {
    std::vector<std::pair<std::string, OptimizationStats>> functions; // Module order
    std::vector<PassError> failures;

    [[nodiscard]] auto has_failures() const -> bool {
        return !failures.empty();
    }

    [[nodiscard]] auto stats_for(const std::string& name) const -> const OptimizationStats*;
    [[nodiscard]] auto failure_for(const std::string& name) const -> const PassError*;

    [[nodiscard]] auto totals() const -> OptimizationStats;

    [[nodiscard]] auto format() const -> std::string;
};

} // namespace sift::ir
