//! # IR Type Implementation
//!
//! The `make_*_type()` factory functions.

#include "ir/ir.hpp"

namespace sift::ir {

namespace {

auto make_primitive(PrimitiveType kind) -> IrTypePtr {
    auto type = std::make_shared<IrType>();
    type->kind = IrPrimitiveType{kind};
    return type;
}

} // namespace

// ============================================================================
// Type Constructors
// ============================================================================

auto make_unit_type() -> IrTypePtr {
    return make_primitive(PrimitiveType::Unit);
}

auto make_bool_type() -> IrTypePtr {
    return make_primitive(PrimitiveType::Bool);
}

auto make_i8_type() -> IrTypePtr {
    return make_primitive(PrimitiveType::I8);
}

auto make_i32_type() -> IrTypePtr {
    return make_primitive(PrimitiveType::I32);
}

auto make_i64_type() -> IrTypePtr {
    return make_primitive(PrimitiveType::I64);
}

auto make_f64_type() -> IrTypePtr {
    return make_primitive(PrimitiveType::F64);
}

auto make_ptr_type() -> IrTypePtr {
    return make_primitive(PrimitiveType::Ptr);
}

auto make_pointer_type(IrTypePtr pointee, bool is_mut) -> IrTypePtr {
    auto type = std::make_shared<IrType>();
    type->kind = IrPointerType{std::move(pointee), is_mut};
    return type;
}

auto make_array_type(IrTypePtr element, size_t size) -> IrTypePtr {
    auto type = std::make_shared<IrType>();
    type->kind = IrArrayType{std::move(element), size};
    return type;
}

auto make_vector_type(IrTypePtr element, size_t lanes) -> IrTypePtr {
    auto type = std::make_shared<IrType>();
    type->kind = IrVectorType{std::move(element), lanes};
    return type;
}

} // namespace sift::ir
