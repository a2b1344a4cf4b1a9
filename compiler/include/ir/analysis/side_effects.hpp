#pragma once

// Side-Effect Classification
//
// Maps one instruction plus the function's escape table to how safe it is
// to delete. Stateless; O(1) per instruction.

#include "ir/analysis/escape.hpp"
#include "ir/ir.hpp"

namespace sift::ir {

enum class SideEffectClass {
    Pure,        // Removable when its result is dead
    MemoryRead,  // Removable when its result is dead
    MemoryWrite, // Writes memory that no other function can observe
    EffectFul,   // Never removed
};

[[nodiscard]] auto side_effect_name(SideEffectClass cls) -> const char*;

// Which direct calls may be treated as pure. With the default-constructed
// value every call is EffectFul.
struct CallPurity {
    const Module* module = nullptr;
    bool trust_pure_attribute = false;

    // A direct call to a function of `module` that has a body and the
    // "pure" attribute
    [[nodiscard]] auto is_known_pure(const CallInst& call) const -> bool;
};

[[nodiscard]] auto classify(const InstructionData& inst, const EscapeTable& escapes,
                            const CallPurity& purity = {}) -> SideEffectClass;

} // namespace sift::ir
