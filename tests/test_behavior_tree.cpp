#include <gtest/gtest.h>
#include "vb/behavior_tree.h"
#include "vb/blackboard.h"
#include "vb/tunables.h"

using namespace vb;

namespace {

struct Fixture {
    Blackboard bb;
    Player self = makePlayer("H-OH1", TeamSide::HOME, Role::OH1, {0.2, 0.6});
    std::vector<Player> players{self};
    Tunables tunables;

    BtContext ctx() const { return {bb, self, players, tunables, nullptr, 0.0}; }
};

BtNode alwaysTrue(const std::string& name) {
    return condition(name, [](const BtContext&) { return true; });
}

BtNode alwaysFalse(const std::string& name) {
    return condition(name, [](const BtContext&) { return false; });
}

BtNode emit(const std::string& name, GoalType goal, BtStatus status = BtStatus::SUCCESS) {
    return action(name, [goal, status](const BtContext& c) {
        ActionOutcome out;
        out.status = status;
        out.intents.push_back(makeGoalIntent(c.self.id, goal, ReasonCode::BASE_RESPONSIBILITY));
        return out;
    });
}

} // anonymous namespace

TEST(BehaviorTree, SequenceStopsAtFailure) {
    Fixture f;
    int calls = 0;
    BtNode tree = sequence("Seq", {
        emit("First", GoalType::CoverTips),
        alwaysFalse("Gate"),
        action("Never", [&calls](const BtContext&) { ++calls; return ActionOutcome{}; }),
    });

    BtResult r = evaluate(tree, f.ctx());
    EXPECT_EQ(r.status, BtStatus::FAILURE);
    EXPECT_TRUE(r.intents.empty());
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(r.trace.children.size(), 2u);
}

TEST(BehaviorTree, SequenceSucceedsWithAllIntents) {
    Fixture f;
    BtNode tree = sequence("Seq", {
        alwaysTrue("Gate"),
        emit("A", GoalType::CoverTips),
        emit("B", GoalType::CoverHitter),
    });
    BtResult r = evaluate(tree, f.ctx());
    EXPECT_EQ(r.status, BtStatus::SUCCESS);
    ASSERT_EQ(r.intents.size(), 2u);
    EXPECT_EQ(r.intents[0].goal, GoalType::CoverTips);
}

TEST(BehaviorTree, SequenceRunningKeepsIntents) {
    Fixture f;
    BtNode tree = sequence("Seq", {
        emit("A", GoalType::ApproachAttackLeft, BtStatus::RUNNING),
        emit("B", GoalType::CoverHitter),
    });
    BtResult r = evaluate(tree, f.ctx());
    EXPECT_EQ(r.status, BtStatus::RUNNING);
    ASSERT_EQ(r.intents.size(), 1u);
    EXPECT_EQ(r.trace.children.size(), 1u);
}

TEST(BehaviorTree, SelectorFirstNonFailureWins) {
    Fixture f;
    BtNode tree = selector("Sel", {
        sequence("No", {alwaysFalse("Gate"), emit("Dropped", GoalType::SetterDump)}),
        emit("Failing", GoalType::BlockMiddle, BtStatus::FAILURE),
        emit("Chosen", GoalType::ReceiveServe),
        emit("Skipped", GoalType::CoverTips),
    });
    BtResult r = evaluate(tree, f.ctx());
    EXPECT_EQ(r.status, BtStatus::SUCCESS);
    ASSERT_EQ(r.intents.size(), 1u);
    EXPECT_EQ(r.intents[0].goal, GoalType::ReceiveServe);
    EXPECT_EQ(r.trace.children.size(), 3u);
}

TEST(BehaviorTree, EmptySelectorFails) {
    Fixture f;
    EXPECT_EQ(evaluate(selector("Empty", {}), f.ctx()).status, BtStatus::FAILURE);
    EXPECT_EQ(evaluate(sequence("Empty", {}), f.ctx()).status, BtStatus::SUCCESS);
}

TEST(BehaviorTree, RequestGoalUsesSelf) {
    Fixture f;
    BtResult r = evaluate(requestGoal(GoalType::PinnedAtNet, ReasonCode::PINNED_AT_NET), f.ctx());
    EXPECT_EQ(r.status, BtStatus::SUCCESS);
    ASSERT_EQ(r.intents.size(), 1u);
    EXPECT_EQ(r.intents[0].actor, "H-OH1");
    EXPECT_EQ(r.intents[0].reason, ReasonCode::PINNED_AT_NET);
    EXPECT_EQ(r.trace.name, "RequestGoal:PinnedAtNet");
}

TEST(BehaviorTree, YieldAlwaysSucceeds) {
    Fixture f;
    BtResult bare = evaluate(yieldToMovement(), f.ctx());
    EXPECT_EQ(bare.status, BtStatus::SUCCESS);
    EXPECT_TRUE(bare.intents.empty());

    BtResult wrapped = evaluate(yieldToMovement(alwaysFalse("Gate")), f.ctx());
    EXPECT_EQ(wrapped.status, BtStatus::SUCCESS);
    EXPECT_EQ(wrapped.trace.children.size(), 1u);
}

TEST(BehaviorTree, Invert) {
    Fixture f;
    EXPECT_EQ(evaluate(invert(alwaysFalse("F")), f.ctx()).status, BtStatus::SUCCESS);
    EXPECT_EQ(evaluate(invert(alwaysTrue("T")), f.ctx()).status, BtStatus::FAILURE);
}

TEST(BehaviorTree, ConditionReadsBlackboard) {
    Fixture f;
    f.bb.phase = RallyPhase::SET_PHASE;
    BtNode cond = condition("IsSetPhase", [](const BtContext& c) {
        return c.bb.phase == RallyPhase::SET_PHASE;
    });
    EXPECT_EQ(evaluate(cond, f.ctx()).status, BtStatus::SUCCESS);
    f.bb.phase = RallyPhase::PRE_SERVE;
    EXPECT_EQ(evaluate(cond, f.ctx()).status, BtStatus::FAILURE);
}

TEST(BehaviorTree, TraceMirrorsTree) {
    Fixture f;
    BtNode tree = selector("Root", {
        sequence("Branch", {alwaysTrue("Gate"), emit("Act", GoalType::CoverTips)}),
    });
    BtResult r = evaluate(tree, f.ctx());
    EXPECT_EQ(r.trace.kind, NodeKind::SELECTOR);
    EXPECT_EQ(r.trace.name, "Root");
    ASSERT_EQ(r.trace.children.size(), 1u);
    const TraceNode& branch = r.trace.children[0];
    EXPECT_EQ(branch.status, BtStatus::SUCCESS);
    ASSERT_EQ(branch.children.size(), 2u);
    EXPECT_EQ(branch.children[1].kind, NodeKind::ACTION);
}
