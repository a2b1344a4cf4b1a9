// sift IR - SSA Form Intermediate Representation
//
// The IR that the optimizer consumes and mutates in place. Upstream
// collaborators build it (see ir_builder.hpp); code generation consumes it.
//
// Design goals:
// 1. SSA form - each value defined exactly once
// 2. Explicit control flow with basic blocks
// 3. Blocks live in a per-function arena and refer to each other by id,
//    so loops never form ownership cycles
// 4. Every instruction keeps the source span it was lowered from

#pragma once

#include "common.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace sift::ir {

// Forward declarations
struct BasicBlock;
struct Function;
struct Module;

// ============================================================================
// IR Types
// ============================================================================

// Primitive types known at IR level
enum class PrimitiveType {
    Unit,
    Bool,
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    F32,
    F64,
    Ptr, // Opaque pointer
};

struct IrType;
using IrTypePtr = std::shared_ptr<IrType>;

struct IrPrimitiveType {
    PrimitiveType kind;
};

struct IrPointerType {
    IrTypePtr pointee;
    bool is_mut;
};

struct IrArrayType {
    IrTypePtr element;
    size_t size;
};

struct IrVectorType {
    IrTypePtr element;
    size_t lanes;
};

struct IrType {
    std::variant<IrPrimitiveType, IrPointerType, IrArrayType, IrVectorType> kind;

    [[nodiscard]] auto is_unit() const -> bool {
        if (auto* p = std::get_if<IrPrimitiveType>(&kind)) {
            return p->kind == PrimitiveType::Unit;
        }
        return false;
    }
    [[nodiscard]] auto is_bool() const -> bool {
        if (auto* p = std::get_if<IrPrimitiveType>(&kind)) {
            return p->kind == PrimitiveType::Bool;
        }
        return false;
    }
};

// Type constructors
auto make_unit_type() -> IrTypePtr;
auto make_bool_type() -> IrTypePtr;
auto make_i8_type() -> IrTypePtr;
auto make_i32_type() -> IrTypePtr;
auto make_i64_type() -> IrTypePtr;
auto make_f64_type() -> IrTypePtr;
auto make_ptr_type() -> IrTypePtr;
auto make_pointer_type(IrTypePtr pointee, bool is_mut = false) -> IrTypePtr;
auto make_array_type(IrTypePtr element, size_t size) -> IrTypePtr;
auto make_vector_type(IrTypePtr element, size_t lanes) -> IrTypePtr;

// ============================================================================
// Values
// ============================================================================

using ValueId = uint32_t;
constexpr ValueId INVALID_VALUE = UINT32_MAX;

using BlockId = uint32_t;
constexpr BlockId INVALID_BLOCK = UINT32_MAX;

// Value reference (used in operands)
struct Value {
    ValueId id = INVALID_VALUE;
    IrTypePtr type;

    [[nodiscard]] auto is_valid() const -> bool {
        return id != INVALID_VALUE;
    }
};

// ============================================================================
// Constants
// ============================================================================

struct ConstInt {
    int64_t value;
    bool is_signed;
    int bit_width;
};

struct ConstFloat {
    double value;
    bool is_f64;
};

struct ConstBool {
    bool value;
};

struct ConstNull {};

struct ConstUnit {};

using Constant = std::variant<ConstInt, ConstFloat, ConstBool, ConstNull, ConstUnit>;

// ============================================================================
// Instructions (SSA Form)
// ============================================================================

enum class BinOp {
    // Arithmetic
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    // Comparison
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    // Logical (bool only)
    And,
    Or,
    // Bitwise
    BitAnd,
    BitOr,
    BitXor,
    Shl,
    Shr,
};

enum class UnaryOp {
    Neg,    // Arithmetic negation
    Not,    // Logical not
    BitNot, // Bitwise not
};

// result = left op right
struct BinaryInst {
    BinOp op;
    Value left;
    Value right;
    IrTypePtr result_type;
};

// result = op operand
struct UnaryInst {
    UnaryOp op;
    Value operand;
    IrTypePtr result_type;
};

enum class CastKind {
    Bitcast,  // Reinterpret bits
    Trunc,    // Truncate integer
    ZExt,     // Zero extend
    SExt,     // Sign extend
    FPTrunc,  // Float truncate
    FPExt,    // Float extend
    FPToSI,   // Float to signed int
    SIToFP,   // Signed int to float
    PtrToInt, // Pointer to integer
    IntToPtr, // Integer to pointer
};

// result = cast operand to target_type
struct CastInst {
    CastKind kind;
    Value operand;
    IrTypePtr source_type;
    IrTypePtr target_type;
};

// result = &base[indices...]
struct GetElementPtrInst {
    Value base;
    std::vector<Value> indices;
    IrTypePtr base_type;
    IrTypePtr result_type;
};

// result = cond ? true_val : false_val
struct SelectInst {
    Value condition;
    Value true_val;
    Value false_val;
    IrTypePtr result_type;
};

enum class VectorOp {
    Splat,   // operands: [scalar]
    Build,   // operands: one scalar per lane
    Extract, // operands: [vector, lane]
    Insert,  // operands: [vector, scalar, lane]
};

// SIMD lane operations
struct VectorInst {
    VectorOp op;
    std::vector<Value> operands;
    IrTypePtr result_type;
};

// result = phi [val1, block1], [val2, block2], ...
struct PhiInst {
    std::vector<std::pair<Value, BlockId>> incoming; // (value, predecessor block id)
    IrTypePtr result_type;
};

// result = constant
struct ConstantInst {
    Constant value;
};

// result = *ptr
struct LoadInst {
    Value ptr;
    IrTypePtr result_type;
};

// *ptr = value (no result)
struct StoreInst {
    Value ptr;
    Value value;
    IrTypePtr value_type;
};

// result = alloca alloc_type
struct AllocaInst {
    IrTypePtr alloc_type;
    std::string name; // Original variable name (for debugging)
};

// Direct call by name, or indirect call through `callee` when it is set.
struct CallInst {
    std::string func_name;
    std::optional<Value> callee;
    std::vector<Value> args;
    IrTypePtr return_type;

    [[nodiscard]] auto is_indirect() const -> bool {
        return callee.has_value();
    }
};

using Instruction =
    std::variant<ConstantInst, BinaryInst, UnaryInst, CastInst, GetElementPtrInst, SelectInst,
                 VectorInst, PhiInst, LoadInst, StoreInst, AllocaInst, CallInst>;

// Instruction with result
struct InstructionData {
    ValueId result; // INVALID_VALUE for void instructions (store, void call)
    IrTypePtr type; // Result type
    Instruction inst;
    SourceSpan span; // Preserved verbatim by every optimization

    [[nodiscard]] auto has_result() const -> bool {
        return result != INVALID_VALUE;
    }
};

// ============================================================================
// Terminators (Control Flow)
// ============================================================================

struct ReturnTerm {
    std::optional<Value> value;
};

struct BranchTerm {
    BlockId target;
};

struct CondBranchTerm {
    Value condition;
    BlockId true_block;
    BlockId false_block;
};

struct SwitchTerm {
    Value discriminant;
    std::vector<std::pair<int64_t, BlockId>> cases; // (value, block)
    BlockId default_block;
};

// Jump to a computed address; `targets` lists every block it may reach.
struct IndirectBranchTerm {
    Value address;
    std::vector<BlockId> targets;
};

// Unreachable (after a call that never returns, etc.)
struct UnreachableTerm {};

using Terminator = std::variant<ReturnTerm, BranchTerm, CondBranchTerm, SwitchTerm,
                                IndirectBranchTerm, UnreachableTerm>;

// Successor block ids of a terminator in operand order, duplicates removed.
auto successors_of(const Terminator& term) -> std::vector<BlockId>;

// ============================================================================
// Operand Iteration
// ============================================================================

/// Calls `fn(const Value&)` for every value an instruction reads, in operand
/// order. Phi incoming values are included.
template <typename F> void for_each_operand(const Instruction& inst, F&& fn) {
    std::visit(
        [&fn](const auto& i) {
            using T = std::decay_t<decltype(i)>;

            if constexpr (std::is_same_v<T, ConstantInst> || std::is_same_v<T, AllocaInst>) {
                // No operands
            } else if constexpr (std::is_same_v<T, BinaryInst>) {
                fn(i.left);
                fn(i.right);
            } else if constexpr (std::is_same_v<T, UnaryInst> || std::is_same_v<T, CastInst>) {
                fn(i.operand);
            } else if constexpr (std::is_same_v<T, GetElementPtrInst>) {
                fn(i.base);
                for (const auto& idx : i.indices) {
                    fn(idx);
                }
            } else if constexpr (std::is_same_v<T, SelectInst>) {
                fn(i.condition);
                fn(i.true_val);
                fn(i.false_val);
            } else if constexpr (std::is_same_v<T, VectorInst>) {
                for (const auto& v : i.operands) {
                    fn(v);
                }
            } else if constexpr (std::is_same_v<T, PhiInst>) {
                for (const auto& [v, _] : i.incoming) {
                    fn(v);
                }
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                fn(i.ptr);
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                fn(i.ptr);
                fn(i.value);
            } else if constexpr (std::is_same_v<T, CallInst>) {
                if (i.callee) {
                    fn(*i.callee);
                }
                for (const auto& a : i.args) {
                    fn(a);
                }
            } else {
                static_assert(sizeof(T) == 0, "for_each_operand: unhandled instruction kind");
            }
        },
        inst);
}

template <typename F> void for_each_operand(const InstructionData& inst, F&& fn) {
    for_each_operand(inst.inst, std::forward<F>(fn));
}

/// Calls `fn(const Value&)` for every value a terminator reads.
template <typename F> void for_each_operand(const Terminator& term, F&& fn) {
    std::visit(
        [&fn](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, ReturnTerm>) {
                if (t.value) {
                    fn(*t.value);
                }
            } else if constexpr (std::is_same_v<T, CondBranchTerm>) {
                fn(t.condition);
            } else if constexpr (std::is_same_v<T, SwitchTerm>) {
                fn(t.discriminant);
            } else if constexpr (std::is_same_v<T, IndirectBranchTerm>) {
                fn(t.address);
            }
        },
        term);
}

// ============================================================================
// Basic Block
// ============================================================================

struct BasicBlock {
    BlockId id;
    std::string name; // Label name (for debugging)
    std::vector<InstructionData> instructions;
    std::optional<Terminator> terminator; // Absent only on malformed input

    // Recomputed by Function::compute_edges()
    std::vector<BlockId> predecessors;
    std::vector<BlockId> successors;
};

// ============================================================================
// Function
// ============================================================================

struct FunctionParam {
    std::string name;
    IrTypePtr type;
    ValueId value_id; // SSA value for this parameter
};

struct Function {
    std::string name;
    std::vector<FunctionParam> params;
    IrTypePtr return_type;
    std::vector<BasicBlock> blocks; // Arena; the entry block comes first
    BlockId entry = 0;
    bool is_declaration = false;         // No body, skipped by every pass
    std::vector<std::string> attributes; // "pure", "noinline", etc.

    // Value ID counter for SSA
    ValueId next_value_id = 0;

    // Block ID counter
    BlockId next_block_id = 0;

    auto fresh_value() -> ValueId {
        return next_value_id++;
    }

    auto create_block(const std::string& label = "") -> BlockId;

    // Lookup by id, nullptr if the block does not exist. O(1) while the
    // arena is still in creation order, a linear scan after blocks are removed.
    [[nodiscard]] auto get_block(BlockId id) -> BasicBlock*;
    [[nodiscard]] auto get_block(BlockId id) const -> const BasicBlock*;

    // Block id -> arena position. Invalidated when blocks are added or removed.
    [[nodiscard]] auto block_index() const -> std::unordered_map<BlockId, size_t>;

    [[nodiscard]] auto entry_block() -> BasicBlock* {
        return get_block(entry);
    }
    [[nodiscard]] auto entry_block() const -> const BasicBlock* {
        return get_block(entry);
    }

    [[nodiscard]] auto has_attribute(const std::string& attr) const -> bool;

    // Rebuilds every block's predecessor and successor lists from the
    // terminators. Edges to missing blocks are dropped.
    void compute_edges();

    [[nodiscard]] auto instruction_count() const -> size_t;
};

// ============================================================================
// Module
// ============================================================================

struct Module {
    std::string name;
    std::vector<Function> functions;

    [[nodiscard]] auto get_function(const std::string& name) -> Function*;
    [[nodiscard]] auto get_function(const std::string& name) const -> const Function*;
};

// ============================================================================
// IR Pretty Printer
// ============================================================================

class IrPrinter {
public:
    explicit IrPrinter(bool use_colors = false);

    auto print_module(const Module& module) -> std::string;
    auto print_function(const Function& func) -> std::string;
    auto print_block(const BasicBlock& block) -> std::string;
    auto print_instruction(const InstructionData& inst) -> std::string;
    auto print_terminator(const Terminator& term) -> std::string;
    auto print_value(const Value& val) -> std::string;
    auto print_type(const IrTypePtr& type) -> std::string;

private:
    bool use_colors_;
};

inline auto print_module(const Module& module, bool use_colors = false) -> std::string {
    IrPrinter printer(use_colors);
    return printer.print_module(module);
}

inline auto print_function(const Function& func) -> std::string {
    IrPrinter printer;
    return printer.print_function(func);
}

} // namespace sift::ir
