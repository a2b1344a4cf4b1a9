// IR Structural Verifier Implementation

#include "ir/verify.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <optional>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace sift::ir {

auto structural_error_kind_name(StructuralErrorKind kind) -> const char* {
    switch (kind) {
    case StructuralErrorKind::MissingEntry:
        return "MissingEntry";
    case StructuralErrorKind::EntryNotFirst:
        return "EntryNotFirst";
    case StructuralErrorKind::DuplicateBlockId:
        return "DuplicateBlockId";
    case StructuralErrorKind::MissingTerminator:
        return "MissingTerminator";
    case StructuralErrorKind::DanglingSuccessor:
        return "DanglingSuccessor";
    case StructuralErrorKind::StaleEdges:
        return "StaleEdges";
    case StructuralErrorKind::DuplicateDefinition:
        return "DuplicateDefinition";
    case StructuralErrorKind::DanglingOperand:
        return "DanglingOperand";
    case StructuralErrorKind::PhiPredecessorMismatch:
        return "PhiPredecessorMismatch";
    }
    return "Unknown";
}

auto StructuralError::to_string() const -> std::string {
    std::string out = std::string(structural_error_kind_name(kind)) + " in " + function;
    if (!block.empty()) {
        out += ", block " + block;
    }
    return out + ": " + message;
}

namespace {

auto sorted(std::vector<BlockId> ids) -> std::vector<BlockId> {
    std::sort(ids.begin(), ids.end());
    return ids;
}

class Verifier {
public:
    explicit Verifier(const Function& func) : func_(func) {}

    auto run() -> VerifyResult {
        if (auto err = check_blocks())
            return *err;
        if (auto err = check_edges())
            return *err;
        if (auto err = check_definitions())
            return *err;
        if (auto err = check_operands())
            return *err;
        if (auto err = check_phis())
            return *err;
        return std::monostate{};
    }

private:
    const Function& func_;
    std::unordered_map<BlockId, std::vector<BlockId>> actual_preds_;
    std::unordered_set<ValueId> defined_;

    auto error(StructuralErrorKind kind, const std::string& block, const std::string& message)
        -> std::optional<StructuralError> {
        return StructuralError{kind, func_.name, block, message};
    }

    auto check_blocks() -> std::optional<StructuralError> {
        if (func_.blocks.empty() || !func_.entry_block()) {
            return error(StructuralErrorKind::MissingEntry, "",
                         "entry block bb" + std::to_string(func_.entry) + " does not exist");
        }
        if (func_.blocks.front().id != func_.entry) {
            return error(StructuralErrorKind::EntryNotFirst, func_.blocks.front().name,
                         "entry block bb" + std::to_string(func_.entry) +
                             " is not first in layout order");
        }

        std::unordered_set<BlockId> seen;
        for (const auto& block : func_.blocks) {
            if (!seen.insert(block.id).second) {
                return error(StructuralErrorKind::DuplicateBlockId, block.name,
                             "block id " + std::to_string(block.id) + " is used twice");
            }
        }

        for (const auto& block : func_.blocks) {
            if (!block.terminator) {
                return error(StructuralErrorKind::MissingTerminator, block.name,
                             "block has no terminator");
            }
            for (auto succ : successors_of(*block.terminator)) {
                if (seen.count(succ) == 0) {
                    return error(StructuralErrorKind::DanglingSuccessor, block.name,
                                 "terminator targets missing block bb" + std::to_string(succ));
                }
                actual_preds_[succ].push_back(block.id);
            }
        }
        return std::nullopt;
    }

    auto check_edges() -> std::optional<StructuralError> {
        for (const auto& block : func_.blocks) {
            if (sorted(block.successors) != sorted(successors_of(*block.terminator))) {
                return error(StructuralErrorKind::StaleEdges, block.name,
                             "successor list does not match the terminator");
            }
            if (sorted(block.predecessors) != sorted(actual_preds_[block.id])) {
                return error(StructuralErrorKind::StaleEdges, block.name,
                             "predecessor list does not match the branches into the block");
            }
        }
        return std::nullopt;
    }

    auto check_definitions() -> std::optional<StructuralError> {
        for (const auto& param : func_.params) {
            if (!defined_.insert(param.value_id).second) {
                return error(StructuralErrorKind::DuplicateDefinition, "",
                             "parameter %" + std::to_string(param.value_id) +
                                 " is defined twice");
            }
        }
        for (const auto& block : func_.blocks) {
            for (const auto& inst : block.instructions) {
                if (inst.has_result() && !defined_.insert(inst.result).second) {
                    return error(StructuralErrorKind::DuplicateDefinition, block.name,
                                 "%" + std::to_string(inst.result) + " is defined twice");
                }
            }
        }
        return std::nullopt;
    }

    auto check_operands() -> std::optional<StructuralError> {
        IrPrinter printer;
        for (const auto& block : func_.blocks) {
            for (const auto& inst : block.instructions) {
                std::optional<ValueId> dangling;
                for_each_operand(inst, [&](const Value& v) {
                    if (!dangling && defined_.count(v.id) == 0) {
                        dangling = v.id;
                    }
                });
                if (dangling) {
                    return error(StructuralErrorKind::DanglingOperand, block.name,
                                 printer.print_instruction(inst) + " uses undefined " +
                                     printer.print_value(Value{*dangling, nullptr}));
                }
            }

            std::optional<ValueId> dangling;
            for_each_operand(*block.terminator, [&](const Value& v) {
                if (!dangling && defined_.count(v.id) == 0) {
                    dangling = v.id;
                }
            });
            if (dangling) {
                return error(StructuralErrorKind::DanglingOperand, block.name,
                             printer.print_terminator(*block.terminator) + " uses undefined " +
                                 printer.print_value(Value{*dangling, nullptr}));
            }
        }
        return std::nullopt;
    }

    auto check_phis() -> std::optional<StructuralError> {
        for (const auto& block : func_.blocks) {
            const auto& preds = actual_preds_[block.id];
            for (const auto& inst : block.instructions) {
                const auto* phi = std::get_if<PhiInst>(&inst.inst);
                if (!phi) {
                    continue;
                }

                std::vector<BlockId> incoming;
                for (const auto& [_, pred] : phi->incoming) {
                    incoming.push_back(pred);
                }

                std::ostringstream msg;
                msg << "phi %" << inst.result << " has " << incoming.size()
                    << " incoming entries for " << preds.size() << " predecessors";

                if (sorted(incoming) != sorted(preds)) {
                    return error(StructuralErrorKind::PhiPredecessorMismatch, block.name,
                                 msg.str());
                }
            }
        }
        return std::nullopt;
    }
};

} // namespace

auto verify_function(const Function& func) -> VerifyResult {
    if (func.is_declaration) {
        return std::monostate{};
    }

    auto result = Verifier(func).run();
    if (is_err(result)) {
        SIFT_LOG_DEBUG("verify", unwrap_err(result).to_string());
    }
    return result;
}

auto verify_module(const Module& module) -> std::vector<StructuralError> {
    std::vector<StructuralError> errors;
    for (const auto& func : module.functions) {
        auto result = verify_function(func);
        if (is_err(result)) {
            errors.push_back(unwrap_err(result));
        }
    }
    return errors;
}

} // namespace sift::ir
