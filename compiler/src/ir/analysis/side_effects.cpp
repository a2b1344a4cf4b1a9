// Side-Effect Classification Implementation
//
// The visitor is exhaustive: adding an instruction kind without a case here
// fails the static_assert.

#include "ir/analysis/side_effects.hpp"

namespace sift::ir {

auto side_effect_name(SideEffectClass cls) -> const char* {
    switch (cls) {
    case SideEffectClass::Pure:
        return "Pure";
    case SideEffectClass::MemoryRead:
        return "MemoryRead";
    case SideEffectClass::MemoryWrite:
        return "MemoryWrite";
    case SideEffectClass::EffectFul:
        return "EffectFul";
    }
    return "Unknown";
}

auto CallPurity::is_known_pure(const CallInst& call) const -> bool {
    if (!trust_pure_attribute || !module || call.is_indirect()) {
        return false;
    }
    const auto* callee = module->get_function(call.func_name);
    return callee && !callee->is_declaration && callee->has_attribute("pure");
}

auto classify(const InstructionData& inst, const EscapeTable& escapes, const CallPurity& purity)
    -> SideEffectClass {
    return std::visit(
        [&](const auto& i) -> SideEffectClass {
            using T = std::decay_t<decltype(i)>;

            if constexpr (std::is_same_v<T, ConstantInst> || std::is_same_v<T, BinaryInst> ||
                          std::is_same_v<T, UnaryInst> || std::is_same_v<T, CastInst> ||
                          std::is_same_v<T, GetElementPtrInst> || std::is_same_v<T, SelectInst> ||
                          std::is_same_v<T, VectorInst> || std::is_same_v<T, PhiInst>) {
                return SideEffectClass::Pure;
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                return SideEffectClass::MemoryRead;
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                return escapes.status(i.ptr.id) == EscapeStatus::Local
                           ? SideEffectClass::MemoryWrite
                           : SideEffectClass::EffectFul;
            } else if constexpr (std::is_same_v<T, AllocaInst>) {
                return SideEffectClass::MemoryWrite;
            } else if constexpr (std::is_same_v<T, CallInst>) {
                return purity.is_known_pure(i) ? SideEffectClass::Pure
                                               : SideEffectClass::EffectFul;
            } else {
                static_assert(sizeof(T) == 0, "classify: unhandled instruction kind");
            }
        },
        inst.inst);
}

} // namespace sift::ir
