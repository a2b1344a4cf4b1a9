// Dead Code Elimination Transformer Tests
//
// Exercises block removal and single-sweep removal planning directly,
// without the fixed-point driver.

#include "ir/ir_builder.hpp"
#include "ir/passes/dce_transform.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace sift::ir;
using sift::test::count_kind;
using sift::test::find_def;

class DceTransformTest : public ::testing::Test {
protected:
    Function func;
    DceTransformer transformer;

    void SetUp() override {
        func.name = "test";
    }

    auto plan(const CallPurity& purity = {}) -> RemovalPlan {
        auto liveness = LivenessAnalyzer().analyze(func);
        auto escapes = EscapeAnalyzer().analyze(func);
        return transformer.plan_instruction_removal(func, liveness, escapes, purity);
    }

    auto sweep() -> size_t {
        return transformer.apply(func, plan());
    }
};

// ============================================================================
// Block Removal
// ============================================================================

TEST_F(DceTransformTest, RemovesUnreachableBlocksAndEdges) {
    IrBuilder b(func);
    auto entry = b.create_block("entry");
    auto dead = b.create_block("dead");
    auto exit = b.create_block("exit");

    b.switch_to_block(entry);
    b.emit_branch(exit);
    b.switch_to_block(dead);
    b.const_int(1);
    b.emit_branch(exit);
    b.switch_to_block(exit);
    b.emit_return();
    b.finish();

    auto reachable = ReachabilityAnalyzer().analyze(func);
    EXPECT_EQ(transformer.remove_unreachable_blocks(func, reachable), 1u);

    ASSERT_EQ(func.blocks.size(), 2u);
    EXPECT_EQ(func.get_block(dead), nullptr);
    EXPECT_EQ(func.get_block(exit)->predecessors, (std::vector<BlockId>{entry}));
}

TEST_F(DceTransformTest, PhiEntriesMatchedByPredecessorId) {
    IrBuilder b(func);
    auto c = b.add_param("c", make_bool_type());
    auto entry = b.create_block("entry");
    auto left = b.create_block("left");
    auto dead = b.create_block("dead");
    auto merge = b.create_block("merge");

    b.switch_to_block(entry);
    auto e = b.const_int(3);
    b.emit_cond_branch(c, left, merge);
    b.switch_to_block(left);
    auto l = b.const_int(1);
    b.emit_branch(merge);
    b.switch_to_block(dead);
    auto d = b.const_int(2);
    b.emit_branch(merge);
    b.switch_to_block(merge);
    // The removed predecessor sits in the middle of the list
    auto phi = b.phi({{l, left}, {d, dead}, {e, entry}}, make_i32_type());
    b.emit_return(phi);
    b.finish();

    auto reachable = ReachabilityAnalyzer().analyze(func);
    transformer.remove_unreachable_blocks(func, reachable);

    const auto& incoming = std::get<PhiInst>(find_def(func, phi.id)->inst).incoming;
    ASSERT_EQ(incoming.size(), 2u);
    EXPECT_EQ(incoming[0].first.id, l.id);
    EXPECT_EQ(incoming[0].second, left);
    EXPECT_EQ(incoming[1].first.id, e.id);
    EXPECT_EQ(incoming[1].second, entry);
}

TEST_F(DceTransformTest, NothingUnreachable) {
    IrBuilder b(func);
    b.switch_to_block(b.create_block("entry"));
    b.emit_return();
    b.finish();

    auto reachable = ReachabilityAnalyzer().analyze(func);
    EXPECT_EQ(transformer.remove_unreachable_blocks(func, reachable), 0u);
    EXPECT_EQ(func.blocks.size(), 1u);
}

// ============================================================================
// Instruction Removal
// ============================================================================

TEST_F(DceTransformTest, OneSweepRemovesOnlyDirectlyDeadValues) {
    IrBuilder b(func);
    b.switch_to_block(b.create_block("entry"));
    auto a = b.const_int(1);
    auto sum = b.binary(BinOp::Add, a, a);
    b.emit_return();
    b.finish();

    auto p = plan();
    ASSERT_EQ(p.removals.size(), 1u);
    EXPECT_EQ(p.removals[0].index, 1u);

    EXPECT_EQ(sweep(), 1u);
    EXPECT_EQ(find_def(func, sum.id), nullptr);
    EXPECT_NE(find_def(func, a.id), nullptr);

    EXPECT_EQ(sweep(), 1u);
    EXPECT_EQ(sweep(), 0u);
    EXPECT_TRUE(func.entry_block()->instructions.empty());
}

TEST_F(DceTransformTest, UnusedLoadIsRemoved) {
    IrBuilder b(func);
    auto p = b.add_param("p", make_ptr_type());
    b.switch_to_block(b.create_block("entry"));
    b.load(p, make_i32_type());
    b.emit_return();
    b.finish();

    EXPECT_EQ(sweep(), 1u);
}

TEST_F(DceTransformTest, LoadedStoreIsKeptSilently) {
    IrBuilder b(func);
    b.switch_to_block(b.create_block("entry"));
    auto slot = b.alloc_local(make_i32_type());
    b.store(slot, b.const_int(5));
    auto v = b.load(slot, make_i32_type());
    b.emit_return(v);
    b.finish();

    auto p = plan();
    EXPECT_TRUE(p.empty());
    EXPECT_TRUE(p.decisions.empty());
}

TEST_F(DceTransformTest, StoreToAddressTakenRecordsMayAlias) {
    IrBuilder b(func);
    b.switch_to_block(b.create_block("entry"));
    auto slot = b.alloc_local(make_i32_type(), "slot");
    b.gep(slot, {});
    b.store(slot, b.const_int(5));
    b.call("observe", {}, make_unit_type());
    b.emit_return();
    b.finish();

    auto p = plan();

    // Only the unused address computation goes
    ASSERT_EQ(p.removals.size(), 1u);
    EXPECT_EQ(p.removals[0].index, 1u);

    ASSERT_EQ(p.decisions.size(), 1u);
    EXPECT_EQ(p.decisions[0].reason, ConservativeReason::MayAlias);
    EXPECT_EQ(p.decisions[0].function, "test");
    EXPECT_EQ(p.decisions[0].block, "entry");
    EXPECT_EQ(p.decisions[0].instruction, "store %2 to %0");
}

TEST_F(DceTransformTest, UnusedCallsRecordReason) {
    IrBuilder b(func);
    auto fp = b.add_param("fp", make_ptr_type());
    b.switch_to_block(b.create_block("entry"));
    b.call("random", {}, make_i32_type());
    b.call_indirect(fp, {}, make_i32_type());
    b.call("flush", {}, make_unit_type());
    b.emit_return();
    b.finish();

    auto p = plan();
    EXPECT_TRUE(p.empty());
    ASSERT_EQ(p.decisions.size(), 2u);
    EXPECT_EQ(p.decisions[0].reason, ConservativeReason::UnknownCallPurity);
    EXPECT_EQ(p.decisions[1].reason, ConservativeReason::PotentialSideEffect);
}

TEST_F(DceTransformTest, TrustedPureCallIsRemoved) {
    Module module;
    module.name = "m";
    Function square;
    square.name = "square";
    square.attributes.push_back("pure");
    {
        IrBuilder sb(square);
        sb.switch_to_block(sb.create_block("entry"));
        sb.emit_return();
        sb.finish();
    }
    module.functions.push_back(std::move(square));

    IrBuilder b(func);
    b.switch_to_block(b.create_block("entry"));
    b.call("square", {}, make_i32_type());
    b.emit_return();
    b.finish();

    auto p = plan(CallPurity{&module, true});
    EXPECT_EQ(p.removals.size(), 1u);
    EXPECT_TRUE(p.decisions.empty());
}

TEST_F(DceTransformTest, SpansSurviveRemoval) {
    IrBuilder b(func);
    b.switch_to_block(b.create_block("entry"));
    b.set_span({{"a.sf", 1, 1, 0, 3}, {"a.sf", 1, 4, 3, 0}});
    b.const_int(1);
    sift::SourceSpan kept_span{{"a.sf", 2, 1, 10, 3}, {"a.sf", 2, 4, 13, 0}};
    b.set_span(kept_span);
    auto kept = b.const_int(2);
    b.emit_return(kept);
    b.finish();

    EXPECT_EQ(sweep(), 1u);
    ASSERT_EQ(func.entry_block()->instructions.size(), 1u);
    EXPECT_EQ(func.entry_block()->instructions[0].span, kept_span);
    EXPECT_EQ(count_kind<ConstantInst>(func), 1u);
}
