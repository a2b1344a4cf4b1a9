// Escape Analysis Implementation

#include "ir/analysis/escape.hpp"

#include "log/log.hpp"

namespace sift::ir {

auto escape_status_name(EscapeStatus status) -> const char* {
    switch (status) {
    case EscapeStatus::Local:
        return "Local";
    case EscapeStatus::AddressTaken:
        return "AddressTaken";
    case EscapeStatus::Escaped:
        return "Escaped";
    }
    return "Unknown";
}

auto EscapeTable::status(ValueId value) const -> EscapeStatus {
    auto it = statuses_.find(value);
    return it != statuses_.end() ? it->second : EscapeStatus::Escaped;
}

void EscapeTable::track(ValueId alloc) {
    if (statuses_.emplace(alloc, EscapeStatus::Local).second) {
        allocations_.push_back(alloc);
    }
}

void EscapeTable::raise(ValueId value, EscapeStatus status) {
    auto it = statuses_.find(value);
    if (it == statuses_.end()) {
        return;
    }
    if (static_cast<int>(status) > static_cast<int>(it->second)) {
        it->second = status;
    }
}

namespace {

void scan_instruction(const InstructionData& inst, EscapeTable& table) {
    auto taken = [&table](const Value& v) { table.raise(v.id, EscapeStatus::AddressTaken); };
    auto escaped = [&table](const Value& v) { table.raise(v.id, EscapeStatus::Escaped); };

    std::visit(
        [&](const auto& i) {
            using T = std::decay_t<decltype(i)>;

            if constexpr (std::is_same_v<T, ConstantInst> || std::is_same_v<T, AllocaInst>) {
                // No operands
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                // Reading through the address does not leak it
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                // Storing *to* the allocation is fine, storing the address is not
                escaped(i.value);
            } else if constexpr (std::is_same_v<T, CallInst>) {
                if (i.callee) {
                    escaped(*i.callee);
                }
                for (const auto& arg : i.args) {
                    escaped(arg);
                }
            } else if constexpr (std::is_same_v<T, CastInst>) {
                if (i.kind == CastKind::PtrToInt) {
                    escaped(i.operand);
                } else {
                    taken(i.operand);
                }
            } else if constexpr (std::is_same_v<T, GetElementPtrInst>) {
                taken(i.base);
                for (const auto& idx : i.indices) {
                    escaped(idx);
                }
            } else if constexpr (std::is_same_v<T, BinaryInst> || std::is_same_v<T, UnaryInst> ||
                                 std::is_same_v<T, SelectInst> || std::is_same_v<T, PhiInst> ||
                                 std::is_same_v<T, VectorInst>) {
                for_each_operand(inst, taken);
            } else {
                static_assert(sizeof(T) == 0, "escape analysis: unhandled instruction kind");
            }
        },
        inst.inst);
}

void scan_terminator(const Terminator& term, EscapeTable& table) {
    std::visit(
        [&table](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, ReturnTerm>) {
                if (t.value) {
                    table.raise(t.value->id, EscapeStatus::Escaped);
                }
            } else if constexpr (std::is_same_v<T, IndirectBranchTerm>) {
                table.raise(t.address.id, EscapeStatus::Escaped);
            } else if constexpr (std::is_same_v<T, CondBranchTerm>) {
                table.raise(t.condition.id, EscapeStatus::AddressTaken);
            } else if constexpr (std::is_same_v<T, SwitchTerm>) {
                table.raise(t.discriminant.id, EscapeStatus::AddressTaken);
            }
        },
        term);
}

} // namespace

auto EscapeAnalyzer::analyze(const Function& func) const -> EscapeTable {
    EscapeTable table;

    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            if (inst.has_result() && std::holds_alternative<AllocaInst>(inst.inst)) {
                table.track(inst.result);
            }
        }
    }

    if (table.allocations().empty()) {
        return table;
    }

    for (const auto& block : func.blocks) {
        for (const auto& inst : block.instructions) {
            scan_instruction(inst, table);
        }
        if (block.terminator) {
            scan_terminator(*block.terminator, table);
        }
    }

    for (auto alloc : table.allocations()) {
        SIFT_LOG_TRACE("escape", func.name << ": %" << alloc << " is "
                                           << escape_status_name(table.status(alloc)));
    }

    return table;
}

} // namespace sift::ir
