// Reachability Analysis Tests
//
// Tests for ReachabilityAnalyzer and reverse_post_order

#include "ir/analysis/reachability.hpp"
#include "ir/ir_builder.hpp"

#include <algorithm>
#include <chrono>
#include <gtest/gtest.h>

using namespace sift::ir;

namespace {

auto position_of(const std::vector<BlockId>& order, BlockId id) -> size_t {
    return static_cast<size_t>(std::find(order.begin(), order.end(), id) - order.begin());
}

// entry -> bb2 -> ... -> return, with an orphan block at id 1 dropped from
// the arena so block ids no longer match arena positions
void build_shifted_chain(Function& func, int length) {
    IrBuilder b(func);
    std::vector<BlockId> chain;
    chain.push_back(b.create_block("entry"));
    auto orphan = b.create_block("orphan");
    for (int i = 1; i < length; ++i) {
        chain.push_back(b.create_block());
    }

    for (size_t i = 0; i < chain.size(); ++i) {
        b.switch_to_block(chain[i]);
        if (i + 1 < chain.size()) {
            b.emit_branch(chain[i + 1]);
        } else {
            b.emit_return();
        }
    }
    b.switch_to_block(orphan);
    b.emit_return();
    b.finish();

    func.blocks.erase(func.blocks.begin() + 1);
    func.compute_edges();
}

} // namespace

class ReachabilityTest : public ::testing::Test {
protected:
    Function func;
    ReachabilityAnalyzer analyzer;

    void SetUp() override {
        func.name = "test";
    }
};

TEST_F(ReachabilityTest, SingleBlock) {
    IrBuilder b(func);
    b.switch_to_block(b.create_block("entry"));
    b.emit_return();
    b.finish();

    auto reachable = analyzer.analyze(func);
    EXPECT_EQ(reachable.size(), 1u);
    EXPECT_TRUE(reachable.contains(func.entry));
}

TEST_F(ReachabilityTest, CodeAfterReturnIsUnreachable) {
    IrBuilder b(func);
    auto entry = b.create_block("entry");
    auto dead = b.create_block("dead");
    auto exit = b.create_block("exit");

    b.switch_to_block(entry);
    b.emit_return();
    b.switch_to_block(dead);
    b.emit_branch(exit);
    b.switch_to_block(exit);
    b.emit_return();
    b.finish();

    auto reachable = analyzer.analyze(func);
    EXPECT_TRUE(reachable.contains(entry));
    EXPECT_FALSE(reachable.contains(dead));
    // Has a predecessor, but only an unreachable one
    EXPECT_FALSE(reachable.contains(exit));
}

TEST_F(ReachabilityTest, DeadCycleIsUnreachable) {
    IrBuilder b(func);
    auto entry = b.create_block("entry");
    auto a = b.create_block("a");
    auto c = b.create_block("c");

    b.switch_to_block(entry);
    b.emit_return();
    b.switch_to_block(a);
    b.emit_branch(c);
    b.switch_to_block(c);
    b.emit_branch(a);
    b.finish();

    auto reachable = analyzer.analyze(func);
    EXPECT_EQ(reachable.size(), 1u);
    EXPECT_FALSE(reachable.contains(a));
    EXPECT_FALSE(reachable.contains(c));
}

TEST_F(ReachabilityTest, LoopIsReachable) {
    IrBuilder b(func);
    auto cond = b.add_param("cond", make_bool_type());
    auto entry = b.create_block("entry");
    auto header = b.create_block("header");
    auto exit = b.create_block("exit");

    b.switch_to_block(entry);
    b.emit_branch(header);
    b.switch_to_block(header);
    b.emit_cond_branch(cond, header, exit);
    b.switch_to_block(exit);
    b.emit_return();
    b.finish();

    auto reachable = analyzer.analyze(func);
    EXPECT_EQ(reachable.size(), 3u);
}

TEST_F(ReachabilityTest, SwitchAndIndirectTargets) {
    IrBuilder b(func);
    auto d = b.add_param("d", make_i32_type());
    auto addr = b.add_param("addr", make_ptr_type());
    auto entry = b.create_block("entry");
    auto one = b.create_block("one");
    auto other = b.create_block("other");
    auto jump = b.create_block("jump");
    auto never = b.create_block("never");

    b.switch_to_block(entry);
    b.emit_switch(d, {{1, one}}, other);
    b.switch_to_block(one);
    b.emit_indirect_branch(addr, {jump});
    b.switch_to_block(other);
    b.emit_return();
    b.switch_to_block(jump);
    b.emit_unreachable();
    b.switch_to_block(never);
    b.emit_return();
    b.finish();

    auto reachable = analyzer.analyze(func);
    EXPECT_TRUE(reachable.contains(one));
    EXPECT_TRUE(reachable.contains(other));
    EXPECT_TRUE(reachable.contains(jump));
    EXPECT_FALSE(reachable.contains(never));
}

TEST_F(ReachabilityTest, MissingEntryYieldsEmptySet) {
    auto reachable = analyzer.analyze(func);
    EXPECT_TRUE(reachable.empty());
    EXPECT_TRUE(reverse_post_order(func).empty());
}

// ============================================================================
// Reverse Post-Order
// ============================================================================

TEST_F(ReachabilityTest, ReversePostOrderDiamond) {
    IrBuilder b(func);
    auto p = b.add_param("p", make_bool_type());
    auto entry = b.create_block("entry");
    auto then_bb = b.create_block("then");
    auto else_bb = b.create_block("else");
    auto merge = b.create_block("merge");
    auto dead = b.create_block("dead");

    b.switch_to_block(entry);
    b.emit_cond_branch(p, then_bb, else_bb);
    b.switch_to_block(then_bb);
    b.emit_branch(merge);
    b.switch_to_block(else_bb);
    b.emit_branch(merge);
    b.switch_to_block(merge);
    b.emit_return();
    b.switch_to_block(dead);
    b.emit_branch(merge);
    b.finish();

    auto order = reverse_post_order(func);
    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order.front(), entry);
    EXPECT_EQ(order.back(), merge);
    EXPECT_LT(position_of(order, then_bb), position_of(order, merge));
    EXPECT_LT(position_of(order, else_bb), position_of(order, merge));
    EXPECT_EQ(position_of(order, dead), order.size());
}

TEST_F(ReachabilityTest, ReversePostOrderLoop) {
    IrBuilder b(func);
    auto cond = b.add_param("cond", make_bool_type());
    auto entry = b.create_block("entry");
    auto header = b.create_block("header");
    auto body = b.create_block("body");
    auto exit = b.create_block("exit");

    b.switch_to_block(entry);
    b.emit_branch(header);
    b.switch_to_block(header);
    b.emit_cond_branch(cond, body, exit);
    b.switch_to_block(body);
    b.emit_branch(header);
    b.switch_to_block(exit);
    b.emit_return();
    b.finish();

    auto order = reverse_post_order(func);
    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order[0], entry);
    EXPECT_EQ(order[1], header);
    // The back edge does not pull the header after its body
    EXPECT_LT(position_of(order, header), position_of(order, body));
}

// ============================================================================
// Scale
// ============================================================================

TEST(ReachabilityScaleTest, LongChainIsLinear) {
    // Quadratic block lookup takes seconds at this size
    constexpr int BLOCKS = 40000;

    Function func;
    func.name = "chain";
    build_shifted_chain(func, BLOCKS);
    ASSERT_EQ(func.blocks.size(), static_cast<size_t>(BLOCKS));

    auto start = std::chrono::steady_clock::now();
    auto reachable = ReachabilityAnalyzer().analyze(func);
    auto order = reverse_post_order(func);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(reachable.size(), static_cast<size_t>(BLOCKS));
    ASSERT_EQ(order.size(), static_cast<size_t>(BLOCKS));
    for (size_t i = 0; i < order.size(); ++i) {
        ASSERT_EQ(order[i], func.blocks[i].id);
    }
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 1500);
}
