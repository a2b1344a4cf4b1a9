// Side-Effect Classification Tests

#include "ir/analysis/escape.hpp"
#include "ir/analysis/side_effects.hpp"
#include "ir/ir_builder.hpp"

#include <gtest/gtest.h>

using namespace sift::ir;

class SideEffectTest : public ::testing::Test {
protected:
    Function func;
    EscapeTable escapes;

    void SetUp() override {
        func.name = "test";
    }

    auto classify_last(const CallPurity& purity = {}) -> SideEffectClass {
        escapes = EscapeAnalyzer().analyze(func);
        return classify(func.entry_block()->instructions.back(), escapes, purity);
    }
};

TEST_F(SideEffectTest, ArithmeticIsPure) {
    IrBuilder b(func);
    auto x = b.add_param("x", make_i32_type());
    auto c = b.add_param("c", make_bool_type());
    auto v = b.add_param("v", make_vector_type(make_i32_type(), 4));
    b.switch_to_block(b.create_block("entry"));

    b.const_int(1);
    EXPECT_EQ(classify_last(), SideEffectClass::Pure);
    b.binary(BinOp::Div, x, x);
    EXPECT_EQ(classify_last(), SideEffectClass::Pure);
    b.unary(UnaryOp::Neg, x);
    EXPECT_EQ(classify_last(), SideEffectClass::Pure);
    b.cast(CastKind::SExt, x, make_i64_type());
    EXPECT_EQ(classify_last(), SideEffectClass::Pure);
    b.select(c, x, x);
    EXPECT_EQ(classify_last(), SideEffectClass::Pure);
    b.vector(VectorOp::Extract, {v, b.const_int(0)}, make_i32_type());
    EXPECT_EQ(classify_last(), SideEffectClass::Pure);
    b.gep(x, {});
    EXPECT_EQ(classify_last(), SideEffectClass::Pure);
}

TEST_F(SideEffectTest, PhiIsPure) {
    IrBuilder b(func);
    auto x = b.add_param("x", make_i32_type());
    auto entry = b.create_block("entry");
    b.switch_to_block(entry);
    b.phi({{x, entry}}, make_i32_type());

    EXPECT_EQ(classify_last(), SideEffectClass::Pure);
}

TEST_F(SideEffectTest, LoadIsMemoryRead) {
    IrBuilder b(func);
    auto p = b.add_param("p", make_ptr_type());
    b.switch_to_block(b.create_block("entry"));
    b.load(p, make_i32_type());

    EXPECT_EQ(classify_last(), SideEffectClass::MemoryRead);
}

TEST_F(SideEffectTest, AllocationIsMemoryWrite) {
    IrBuilder b(func);
    b.switch_to_block(b.create_block("entry"));
    b.alloc_local(make_i32_type());

    EXPECT_EQ(classify_last(), SideEffectClass::MemoryWrite);
}

TEST_F(SideEffectTest, StoreToLocalIsMemoryWrite) {
    IrBuilder b(func);
    b.switch_to_block(b.create_block("entry"));
    auto p = b.alloc_local(make_i32_type());
    b.store(p, b.const_int(3));

    EXPECT_EQ(classify_last(), SideEffectClass::MemoryWrite);
}

TEST_F(SideEffectTest, StoreToAddressTakenIsEffectFul) {
    IrBuilder b(func);
    b.switch_to_block(b.create_block("entry"));
    auto p = b.alloc_local(make_i32_type());
    b.gep(p, {});
    b.store(p, b.const_int(3));

    EXPECT_EQ(classify_last(), SideEffectClass::EffectFul);
    EXPECT_EQ(escapes.status(p.id), EscapeStatus::AddressTaken);
}

TEST_F(SideEffectTest, StoreThroughParameterIsEffectFul) {
    IrBuilder b(func);
    auto out = b.add_param("out", make_ptr_type());
    b.switch_to_block(b.create_block("entry"));
    b.store(out, b.const_int(3));

    EXPECT_EQ(classify_last(), SideEffectClass::EffectFul);
}

TEST_F(SideEffectTest, CallsAreEffectFulByDefault) {
    IrBuilder b(func);
    auto fp = b.add_param("fp", make_ptr_type());
    b.switch_to_block(b.create_block("entry"));

    b.call("square", {}, make_i32_type());
    EXPECT_EQ(classify_last(), SideEffectClass::EffectFul);
    b.call_indirect(fp, {}, make_i32_type());
    EXPECT_EQ(classify_last(), SideEffectClass::EffectFul);
}

// ============================================================================
// Pure Attribute
// ============================================================================

class CallPurityTest : public ::testing::Test {
protected:
    Module module;

    void SetUp() override {
        module.name = "m";

        Function square;
        square.name = "square";
        square.attributes.push_back("pure");
        IrBuilder b(square);
        auto x = b.add_param("x", make_i32_type());
        b.set_return_type(make_i32_type());
        b.switch_to_block(b.create_block("entry"));
        b.emit_return(b.binary(BinOp::Mul, x, x));
        b.finish();
        module.functions.push_back(std::move(square));

        Function ext;
        ext.name = "ext_pure";
        ext.is_declaration = true;
        ext.attributes.push_back("pure");
        module.functions.push_back(std::move(ext));

        Function plain;
        plain.name = "plain";
        IrBuilder pb(plain);
        pb.switch_to_block(pb.create_block("entry"));
        pb.emit_return();
        pb.finish();
        module.functions.push_back(std::move(plain));
    }

    static auto direct(const std::string& name) -> CallInst {
        CallInst call;
        call.func_name = name;
        call.return_type = make_i32_type();
        return call;
    }
};

TEST_F(CallPurityTest, TrustedPureBody) {
    CallPurity purity{&module, true};
    EXPECT_TRUE(purity.is_known_pure(direct("square")));
}

TEST_F(CallPurityTest, AttributeIgnoredWithoutTrust) {
    CallPurity purity{&module, false};
    EXPECT_FALSE(purity.is_known_pure(direct("square")));
}

TEST_F(CallPurityTest, DeclarationNeverPure) {
    CallPurity purity{&module, true};
    EXPECT_FALSE(purity.is_known_pure(direct("ext_pure")));
}

TEST_F(CallPurityTest, MissingAttributeOrCallee) {
    CallPurity purity{&module, true};
    EXPECT_FALSE(purity.is_known_pure(direct("plain")));
    EXPECT_FALSE(purity.is_known_pure(direct("missing")));
}

TEST_F(CallPurityTest, IndirectNeverPure) {
    CallPurity purity{&module, true};
    auto call = direct("square");
    call.callee = Value{0, make_ptr_type()};
    EXPECT_FALSE(purity.is_known_pure(call));
}

TEST_F(CallPurityTest, NoModule) {
    CallPurity purity{nullptr, true};
    EXPECT_FALSE(purity.is_known_pure(direct("square")));
}

TEST_F(CallPurityTest, ClassifyUsesPurity) {
    InstructionData inst;
    inst.result = 0;
    inst.type = make_i32_type();
    inst.inst = direct("square");

    EscapeTable escapes;
    EXPECT_EQ(classify(inst, escapes, CallPurity{&module, true}), SideEffectClass::Pure);
    EXPECT_EQ(classify(inst, escapes), SideEffectClass::EffectFul);
    EXPECT_STREQ(side_effect_name(SideEffectClass::EffectFul), "EffectFul");
}
