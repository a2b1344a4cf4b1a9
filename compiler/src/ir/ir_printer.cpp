//! # IR Pretty Printer
//!
//! Human-readable IR output for diagnostics and tests. Nothing parses it
//! back.
//!
//! ## Output Format
//!
//! ```text
//! ; IR Module: main
//!
//! func add(%0 a: i32, %1 b: i32) -> i32 {
//! bb0 (entry):
//!     %2 = add %0, %1
//!     return %2
//! }
//! ```
//!
//! Blocks whose label differs from `bb<id>` print the label in parentheses.
//! Branch targets always print as `bb<id>`.

#include "ir/ir.hpp"

#include <sstream>

namespace sift::ir {

namespace {

constexpr const char* COLOR_LABEL = "\033[36m";
constexpr const char* COLOR_RESET = "\033[0m";

} // namespace

IrPrinter::IrPrinter(bool use_colors) : use_colors_(use_colors) {}

auto IrPrinter::print_module(const Module& module) -> std::string {
    std::ostringstream out;
    out << "; IR Module: " << module.name << "\n\n";

    for (const auto& func : module.functions) {
        out << print_function(func) << "\n";
    }

    return out.str();
}

auto IrPrinter::print_function(const Function& func) -> std::string {
    std::ostringstream out;

    out << (func.is_declaration ? "declare " : "func ") << func.name << "(";
    for (size_t i = 0; i < func.params.size(); ++i) {
        if (i > 0)
            out << ", ";
        out << "%" << func.params[i].value_id << " " << func.params[i].name << ": "
            << print_type(func.params[i].type);
    }
    out << ")";
    if (func.return_type && !func.return_type->is_unit()) {
        out << " -> " << print_type(func.return_type);
    }
    for (const auto& attr : func.attributes) {
        out << " @" << attr;
    }

    if (func.is_declaration) {
        out << "\n";
        return out.str();
    }

    out << " {\n";
    for (const auto& block : func.blocks) {
        out << print_block(block);
    }
    out << "}\n";
    return out.str();
}

auto IrPrinter::print_block(const BasicBlock& block) -> std::string {
    std::ostringstream out;

    std::string label = "bb" + std::to_string(block.id);
    if (block.name != label) {
        label += " (" + block.name + ")";
    }
    if (use_colors_) {
        out << COLOR_LABEL << label << COLOR_RESET << ":\n";
    } else {
        out << label << ":\n";
    }

    if (!block.predecessors.empty()) {
        out << "    ; preds: ";
        for (size_t i = 0; i < block.predecessors.size(); ++i) {
            if (i > 0)
                out << ", ";
            out << "bb" << block.predecessors[i];
        }
        out << "\n";
    }

    for (const auto& inst : block.instructions) {
        out << "    " << print_instruction(inst) << "\n";
    }

    if (block.terminator.has_value()) {
        out << "    " << print_terminator(*block.terminator) << "\n";
    } else {
        out << "    ; <no terminator>\n";
    }

    return out.str();
}

auto IrPrinter::print_instruction(const InstructionData& inst) -> std::string {
    std::ostringstream out;

    if (inst.result != INVALID_VALUE) {
        out << "%" << inst.result << " = ";
    }

    std::visit(
        [&out, this](const auto& i) {
            using T = std::decay_t<decltype(i)>;

            if constexpr (std::is_same_v<T, ConstantInst>) {
                std::visit(
                    [&out](const auto& c) {
                        using C = std::decay_t<decltype(c)>;
                        if constexpr (std::is_same_v<C, ConstInt>) {
                            out << "const " << (c.is_signed ? "i" : "u") << c.bit_width << " "
                                << c.value;
                        } else if constexpr (std::is_same_v<C, ConstFloat>) {
                            out << "const " << (c.is_f64 ? "f64" : "f32") << " " << c.value;
                        } else if constexpr (std::is_same_v<C, ConstBool>) {
                            out << "const bool " << (c.value ? "true" : "false");
                        } else if constexpr (std::is_same_v<C, ConstNull>) {
                            out << "const null";
                        } else if constexpr (std::is_same_v<C, ConstUnit>) {
                            out << "const unit";
                        }
                    },
                    i.value);
            } else if constexpr (std::is_same_v<T, BinaryInst>) {
                static const char* op_names[] = {"add", "sub",  "mul", "div",  "mod", "eq",
                                                 "ne",  "lt",   "le",  "gt",   "ge",  "and",
                                                 "or",  "band", "bor", "bxor", "shl", "shr"};
                out << op_names[static_cast<int>(i.op)] << " " << print_value(i.left) << ", "
                    << print_value(i.right);
            } else if constexpr (std::is_same_v<T, UnaryInst>) {
                static const char* op_names[] = {"neg", "not", "bnot"};
                out << op_names[static_cast<int>(i.op)] << " " << print_value(i.operand);
            } else if constexpr (std::is_same_v<T, CastInst>) {
                static const char* cast_names[] = {"bitcast", "trunc", "zext",   "sext",
                                                   "fptrunc", "fpext", "fptosi", "sitofp",
                                                   "ptrtoint", "inttoptr"};
                out << cast_names[static_cast<int>(i.kind)] << " " << print_value(i.operand)
                    << " to " << print_type(i.target_type);
            } else if constexpr (std::is_same_v<T, GetElementPtrInst>) {
                out << "gep " << print_value(i.base);
                for (const auto& idx : i.indices) {
                    out << ", " << print_value(idx);
                }
            } else if constexpr (std::is_same_v<T, SelectInst>) {
                out << "select " << print_value(i.condition) << ", " << print_value(i.true_val)
                    << ", " << print_value(i.false_val);
            } else if constexpr (std::is_same_v<T, VectorInst>) {
                static const char* op_names[] = {"splat", "vbuild", "extractlane", "insertlane"};
                out << op_names[static_cast<int>(i.op)];
                for (size_t j = 0; j < i.operands.size(); ++j) {
                    out << (j == 0 ? " " : ", ") << print_value(i.operands[j]);
                }
            } else if constexpr (std::is_same_v<T, PhiInst>) {
                out << "phi ";
                for (size_t j = 0; j < i.incoming.size(); ++j) {
                    if (j > 0)
                        out << ", ";
                    out << "[" << print_value(i.incoming[j].first) << ", bb" << i.incoming[j].second
                        << "]";
                }
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                out << "load " << print_value(i.ptr);
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                out << "store " << print_value(i.value) << " to " << print_value(i.ptr);
            } else if constexpr (std::is_same_v<T, AllocaInst>) {
                out << "alloca " << print_type(i.alloc_type);
                if (!i.name.empty()) {
                    out << " ; " << i.name;
                }
            } else if constexpr (std::is_same_v<T, CallInst>) {
                out << "call ";
                if (i.callee) {
                    out << "*" << print_value(*i.callee);
                } else {
                    out << i.func_name;
                }
                out << "(";
                for (size_t j = 0; j < i.args.size(); ++j) {
                    if (j > 0)
                        out << ", ";
                    out << print_value(i.args[j]);
                }
                out << ")";
            }
        },
        inst.inst);

    return out.str();
}

auto IrPrinter::print_terminator(const Terminator& term) -> std::string {
    std::ostringstream out;

    std::visit(
        [&out, this](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, ReturnTerm>) {
                out << "return";
                if (t.value.has_value()) {
                    out << " " << print_value(*t.value);
                }
            } else if constexpr (std::is_same_v<T, BranchTerm>) {
                out << "br bb" << t.target;
            } else if constexpr (std::is_same_v<T, CondBranchTerm>) {
                out << "br " << print_value(t.condition) << ", bb" << t.true_block << ", bb"
                    << t.false_block;
            } else if constexpr (std::is_same_v<T, SwitchTerm>) {
                out << "switch " << print_value(t.discriminant) << " [";
                for (const auto& [val, block] : t.cases) {
                    out << val << " -> bb" << block << ", ";
                }
                out << "default -> bb" << t.default_block << "]";
            } else if constexpr (std::is_same_v<T, IndirectBranchTerm>) {
                out << "indirectbr " << print_value(t.address) << " [";
                for (size_t j = 0; j < t.targets.size(); ++j) {
                    if (j > 0)
                        out << ", ";
                    out << "bb" << t.targets[j];
                }
                out << "]";
            } else if constexpr (std::is_same_v<T, UnreachableTerm>) {
                out << "unreachable";
            }
        },
        term);

    return out.str();
}

auto IrPrinter::print_value(const Value& val) -> std::string {
    if (!val.is_valid()) {
        return "<invalid>";
    }
    return "%" + std::to_string(val.id);
}

auto IrPrinter::print_type(const IrTypePtr& type) -> std::string {
    if (!type)
        return "<null>";

    std::ostringstream out;

    std::visit(
        [&out, this](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, IrPrimitiveType>) {
                static const char* names[] = {"()",  "bool", "i8",  "i16", "i32", "i64", "u8",
                                              "u16", "u32",  "u64", "f32", "f64", "ptr"};
                out << names[static_cast<int>(t.kind)];
            } else if constexpr (std::is_same_v<T, IrPointerType>) {
                out << (t.is_mut ? "*mut " : "*") << print_type(t.pointee);
            } else if constexpr (std::is_same_v<T, IrArrayType>) {
                out << "[" << print_type(t.element) << "; " << t.size << "]";
            } else if constexpr (std::is_same_v<T, IrVectorType>) {
                out << "<" << t.lanes << " x " << print_type(t.element) << ">";
            }
        },
        type->kind);

    return out.str();
}

} // namespace sift::ir
