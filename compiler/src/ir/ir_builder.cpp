// IR Builder Implementation
//
// Block management, instruction and terminator emission, and constants.

#include "ir/ir_builder.hpp"

namespace sift::ir {

IrBuilder::IrBuilder(Function& func) : func_(func) {
    if (!func_.return_type) {
        func_.return_type = make_unit_type();
    }
}

// ============================================================================
// Function Shape
// ============================================================================

auto IrBuilder::add_param(const std::string& name, IrTypePtr type) -> Value {
    auto id = func_.fresh_value();
    func_.params.push_back(FunctionParam{name, type, id});
    return {id, type};
}

void IrBuilder::set_return_type(IrTypePtr type) {
    func_.return_type = std::move(type);
}

// ============================================================================
// Block Management
// ============================================================================

auto IrBuilder::create_block(const std::string& name) -> BlockId {
    bool first = func_.blocks.empty();
    auto id = func_.create_block(name);
    if (first) {
        func_.entry = id;
    }
    return id;
}

void IrBuilder::switch_to_block(BlockId block_id) {
    current_block_ = block_id;
}

auto IrBuilder::is_terminated() const -> bool {
    auto* block = func_.get_block(current_block_);
    return block && block->terminator.has_value();
}

// ============================================================================
// Instruction Emission
// ============================================================================

auto IrBuilder::emit(Instruction inst, IrTypePtr type) -> Value {
    auto* block = func_.get_block(current_block_);
    if (!block)
        return {INVALID_VALUE, type};

    auto id = func_.fresh_value();

    InstructionData data;
    data.result = id;
    data.type = type;
    data.inst = std::move(inst);
    data.span = span_;

    block->instructions.push_back(std::move(data));

    return {id, type};
}

void IrBuilder::emit_void(Instruction inst) {
    auto* block = func_.get_block(current_block_);
    if (!block)
        return;

    InstructionData data;
    data.result = INVALID_VALUE;
    data.type = make_unit_type();
    data.inst = std::move(inst);
    data.span = span_;

    block->instructions.push_back(std::move(data));
}

auto IrBuilder::const_int(int64_t value, int bit_width, bool is_signed) -> Value {
    ConstantInst inst;
    inst.value = ConstInt{value, is_signed, bit_width};
    return emit(std::move(inst), bit_width <= 32 ? make_i32_type() : make_i64_type());
}

auto IrBuilder::const_float(double value) -> Value {
    ConstantInst inst;
    inst.value = ConstFloat{value, true};
    return emit(std::move(inst), make_f64_type());
}

auto IrBuilder::const_bool(bool value) -> Value {
    ConstantInst inst;
    inst.value = ConstBool{value};
    return emit(std::move(inst), make_bool_type());
}

auto IrBuilder::const_null() -> Value {
    ConstantInst inst;
    inst.value = ConstNull{};
    return emit(std::move(inst), make_ptr_type());
}

auto IrBuilder::binary(BinOp op, Value left, Value right) -> Value {
    IrTypePtr type = left.type;
    switch (op) {
    case BinOp::Eq:
    case BinOp::Ne:
    case BinOp::Lt:
    case BinOp::Le:
    case BinOp::Gt:
    case BinOp::Ge:
        type = make_bool_type();
        break;
    default:
        break;
    }
    return emit(BinaryInst{op, std::move(left), std::move(right), type}, type);
}

auto IrBuilder::unary(UnaryOp op, Value operand) -> Value {
    auto type = operand.type;
    return emit(UnaryInst{op, std::move(operand), type}, type);
}

auto IrBuilder::cast(CastKind kind, Value operand, IrTypePtr target_type) -> Value {
    auto source_type = operand.type;
    return emit(CastInst{kind, std::move(operand), source_type, target_type}, target_type);
}

auto IrBuilder::select(Value cond, Value true_val, Value false_val) -> Value {
    auto type = true_val.type;
    return emit(SelectInst{std::move(cond), std::move(true_val), std::move(false_val), type},
                type);
}

auto IrBuilder::gep(Value base, std::vector<Value> indices) -> Value {
    auto type = make_ptr_type();
    auto base_type = base.type;
    return emit(GetElementPtrInst{std::move(base), std::move(indices), base_type, type}, type);
}

auto IrBuilder::vector(VectorOp op, std::vector<Value> operands, IrTypePtr result_type)
    -> Value {
    return emit(VectorInst{op, std::move(operands), result_type}, result_type);
}

auto IrBuilder::alloc_local(IrTypePtr alloc_type, const std::string& name) -> Value {
    return emit(AllocaInst{std::move(alloc_type), name}, make_ptr_type());
}

auto IrBuilder::load(Value ptr, IrTypePtr result_type) -> Value {
    return emit(LoadInst{std::move(ptr), result_type}, result_type);
}

void IrBuilder::store(Value ptr, Value value) {
    auto value_type = value.type;
    emit_void(StoreInst{std::move(ptr), std::move(value), value_type});
}

auto IrBuilder::phi(std::vector<std::pair<Value, BlockId>> incoming, IrTypePtr type) -> Value {
    return emit(PhiInst{std::move(incoming), type}, type);
}

auto IrBuilder::call(const std::string& func_name, std::vector<Value> args,
                     IrTypePtr return_type) -> std::optional<Value> {
    CallInst inst;
    inst.func_name = func_name;
    inst.args = std::move(args);
    inst.return_type = return_type;

    if (!return_type || return_type->is_unit()) {
        emit_void(std::move(inst));
        return std::nullopt;
    }
    return emit(std::move(inst), return_type);
}

auto IrBuilder::call_indirect(Value callee, std::vector<Value> args, IrTypePtr return_type)
    -> std::optional<Value> {
    CallInst inst;
    inst.callee = std::move(callee);
    inst.args = std::move(args);
    inst.return_type = return_type;

    if (!return_type || return_type->is_unit()) {
        emit_void(std::move(inst));
        return std::nullopt;
    }
    return emit(std::move(inst), return_type);
}

// ============================================================================
// Terminator Emission
// ============================================================================

void IrBuilder::set_terminator(Terminator term) {
    auto* block = func_.get_block(current_block_);
    if (!block)
        return;

    block->terminator = std::move(term);
}

void IrBuilder::emit_return(std::optional<Value> value) {
    set_terminator(ReturnTerm{std::move(value)});
}

void IrBuilder::emit_branch(BlockId target) {
    set_terminator(BranchTerm{target});
}

void IrBuilder::emit_cond_branch(Value cond, BlockId true_block, BlockId false_block) {
    set_terminator(CondBranchTerm{std::move(cond), true_block, false_block});
}

void IrBuilder::emit_switch(Value discriminant, std::vector<std::pair<int64_t, BlockId>> cases,
                            BlockId default_block) {
    set_terminator(SwitchTerm{std::move(discriminant), std::move(cases), default_block});
}

void IrBuilder::emit_indirect_branch(Value address, std::vector<BlockId> targets) {
    set_terminator(IndirectBranchTerm{std::move(address), std::move(targets)});
}

void IrBuilder::emit_unreachable() {
    set_terminator(UnreachableTerm{});
}

void IrBuilder::finish() {
    func_.compute_edges();
}

} // namespace sift::ir
