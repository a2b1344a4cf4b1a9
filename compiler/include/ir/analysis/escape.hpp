#pragma once

// Escape Analysis
//
// Classifies every stack allocation of a function by how far its address
// travels:
//
//   Local        - only loaded from or stored to directly
//   AddressTaken - feeds an address computation, cast, phi, select, or
//                  arithmetic, so other pointers may alias it
//   Escaped      - stored as a value, passed to a call, returned, used as an
//                  indirect branch target, or converted to an integer
//
// Statuses only move up that ladder. Allocations are collected before the
// scan, so a use that precedes the allocation in layout order still counts.
// Parameters, loaded pointers, and every other untracked value report
// Escaped.

#include "ir/ir.hpp"

#include <unordered_map>
#include <vector>

namespace sift::ir {

enum class EscapeStatus {
    Local,
    AddressTaken,
    Escaped,
};

[[nodiscard]] auto escape_status_name(EscapeStatus status) -> const char*;

class EscapeTable {
public:
    // Escaped for any value that is not a tracked allocation
    [[nodiscard]] auto status(ValueId value) const -> EscapeStatus;

    [[nodiscard]] auto is_tracked(ValueId value) const -> bool {
        return statuses_.count(value) > 0;
    }

    // Allocation result ids in layout order
    [[nodiscard]] auto allocations() const -> const std::vector<ValueId>& {
        return allocations_;
    }

    void track(ValueId alloc);

    // Raises a tracked allocation to at least `status`; untracked ids are ignored
    void raise(ValueId value, EscapeStatus status);

private:
    std::unordered_map<ValueId, EscapeStatus> statuses_;
    std::vector<ValueId> allocations_;
};

class EscapeAnalyzer {
public:
    [[nodiscard]] auto analyze(const Function& func) const -> EscapeTable;
};

} // namespace sift::ir
