// IR Builder - programmatic construction of SSA functions
//
// Used by upstream lowering and by the tests. The builder appends to one
// function at a time and keeps an insertion block, mirroring how a lowering
// pass walks the source.
//
//     Function func;
//     func.name = "answer";
//     IrBuilder b(func);
//     auto entry = b.create_block("entry");
//     b.switch_to_block(entry);
//     auto v = b.binary(BinOp::Add, b.const_int(40), b.const_int(2));
//     b.emit_return(v);
//     b.finish();

#pragma once

#include "ir/ir.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sift::ir {

class IrBuilder {
public:
    explicit IrBuilder(Function& func);

    // ============ Function Shape ============

    auto add_param(const std::string& name, IrTypePtr type) -> Value;
    void set_return_type(IrTypePtr type);

    // ============ Block Management ============

    // The first block created becomes the entry block
    auto create_block(const std::string& name = "") -> BlockId;
    void switch_to_block(BlockId block_id);
    [[nodiscard]] auto current_block() const -> BlockId {
        return current_block_;
    }
    [[nodiscard]] auto is_terminated() const -> bool;

    // Span attached to every instruction emitted after this call
    void set_span(SourceSpan span) {
        span_ = span;
    }

    // ============ Instruction Emission ============

    auto emit(Instruction inst, IrTypePtr type) -> Value;
    void emit_void(Instruction inst);

    auto const_int(int64_t value, int bit_width = 32, bool is_signed = true) -> Value;
    auto const_float(double value) -> Value;
    auto const_bool(bool value) -> Value;
    auto const_null() -> Value;

    auto binary(BinOp op, Value left, Value right) -> Value;
    auto unary(UnaryOp op, Value operand) -> Value;
    auto cast(CastKind kind, Value operand, IrTypePtr target_type) -> Value;
    auto select(Value cond, Value true_val, Value false_val) -> Value;
    auto gep(Value base, std::vector<Value> indices) -> Value;
    auto vector(VectorOp op, std::vector<Value> operands, IrTypePtr result_type) -> Value;

    auto alloc_local(IrTypePtr alloc_type, const std::string& name = "") -> Value;
    auto load(Value ptr, IrTypePtr result_type) -> Value;
    void store(Value ptr, Value value);

    // Phi with its incoming list; entries name predecessor block ids
    auto phi(std::vector<std::pair<Value, BlockId>> incoming, IrTypePtr type) -> Value;

    // Direct call. A unit return type produces a void call with no result.
    auto call(const std::string& func_name, std::vector<Value> args, IrTypePtr return_type)
        -> std::optional<Value>;
    auto call_indirect(Value callee, std::vector<Value> args, IrTypePtr return_type)
        -> std::optional<Value>;

    // ============ Terminator Emission ============

    void emit_return(std::optional<Value> value = std::nullopt);
    void emit_branch(BlockId target);
    void emit_cond_branch(Value cond, BlockId true_block, BlockId false_block);
    void emit_switch(Value discriminant, std::vector<std::pair<int64_t, BlockId>> cases,
                     BlockId default_block);
    void emit_indirect_branch(Value address, std::vector<BlockId> targets);
    void emit_unreachable();

    // Computes predecessor and successor lists. Call once the CFG is complete.
    void finish();

private:
    Function& func_;
    BlockId current_block_ = INVALID_BLOCK;
    SourceSpan span_;

    void set_terminator(Terminator term);
};

} // namespace sift::ir
