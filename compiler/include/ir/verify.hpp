//! # IR Structural Verifier
//!
//! Checks the invariants every pass must preserve and reports the first
//! violation it finds. It never repairs anything.
//!
//! ## Checks
//!
//! - The entry block exists and is first in layout order
//! - Block ids are unique and every block has a terminator
//! - Every successor named by a terminator exists
//! - Predecessor and successor lists agree with the terminators
//! - Each value is defined once (parameters included)
//! - Every operand resolves to a parameter or a surviving definition
//! - Each phi has exactly one entry per predecessor of its block

#pragma once

#include "common.hpp"
#include "ir/ir.hpp"

#include <string>
#include <variant>
#include <vector>

namespace sift::ir {

enum class StructuralErrorKind {
    MissingEntry,
    EntryNotFirst,
    DuplicateBlockId,
    MissingTerminator,
    DanglingSuccessor,
    StaleEdges,
    DuplicateDefinition,
    DanglingOperand,
    PhiPredecessorMismatch,
};

[[nodiscard]] auto structural_error_kind_name(StructuralErrorKind kind) -> const char*;

struct StructuralError {
    StructuralErrorKind kind;
    std::string function;
    std::string block; // Empty when the violation is not tied to a block
    std::string message;

    [[nodiscard]] auto to_string() const -> std::string;
};

using VerifyResult = Result<std::monostate, StructuralError>;

[[nodiscard]] auto verify_function(const Function& func) -> VerifyResult;

// Verifies every function with a body; returns all violations, one per
// failing function
[[nodiscard]] auto verify_module(const Module& module) -> std::vector<StructuralError>;

} // namespace sift::ir
