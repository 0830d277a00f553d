#include "vb/role_trees.h"
#include "vb/conditions.h"

namespace vb {

namespace {

constexpr double OPPOSITE_EMERGENCY_BIAS = -3.0;

BtNode serveReceiveBehavior() {
    auto isReceive = phaseIs(RallyPhase::SERVE_RECEIVE);
    auto noTouch = touchCountIs(0);

    return selector("ServeReceiveBehavior", {
        sequence("PinnedAtNet", {
            isReceive, receivingServe(), noTouch,
            condition("IsPinnedAtNet", [](const BtContext& ctx) {
                return isPinnedAtNet(ctx.bb, ctx.self);
            }),
            goalAction("PinnedAtNetAction", GoalType::PinnedAtNet, ReasonCode::PINNED_AT_NET),
        }),
        sequence("ComeBackToReceive", {
            isReceive, receivingServe(), noTouch,
            condition("ShouldComeBack", [](const BtContext& ctx) {
                return shouldComeBackToReceive(ctx.bb, ctx.self);
            }),
            goalAction("ComeBackToReceiveAction", GoalType::ComeBackToReceive,
                       ReasonCode::COME_BACK_TO_RECEIVE),
        }),
        sequence("BackRowHold", {
            isReceive, receivingServe(), noTouch, backRow(),
            goalAction("BackRowBaseAction", GoalType::MaintainBaseResponsibility,
                       ReasonCode::BACK_ROW_HOLD),
        }),
        sequence("ApproachAfterPass", {
            passIsUp(), frontRow(),
            goalAction("ApproachAfterPassAction", GoalType::ApproachAttackRight,
                       ReasonCode::APPROACH_AFTER_PASS),
        }),
    });
}

BtNode defenseBehavior() {
    return sequence("DefenseBehavior", {
        teamDefending(),
        selector("DefenseSelector", {
            sequence("FrontRowBlockRight", {
                frontRow(),
                condition("AttackFromRight", [](const BtContext& ctx) {
                    return ctx.bb.opponentAttackLane == AttackLane::RIGHT;
                }),
                goalAction("BlockRightAction", GoalType::BlockRightSide,
                           ReasonCode::BLOCK_ASSIGNMENT),
            }),
            sequence("FrontRowCoverTips", {
                frontRow(),
                goalAction("CoverTipsAction", GoalType::CoverTips, ReasonCode::COVER_TIPS),
            }),
            goalAction("BackRowDefenseAction", GoalType::DefendZoneBiasRightBack,
                       ReasonCode::BACK_ROW_DEFENSE),
        }),
    });
}

} // anonymous namespace

BtNode buildOppositeTree() {
    return selector("OppositeTree", {
        handleOverrideGoal(),
        servingBehavior(),
        emergencySetBehavior(OPPOSITE_EMERGENCY_BIAS),
        serveReceiveBehavior(),
        sequence("SetPhaseAttack", {
            phaseIs(RallyPhase::SET_PHASE),
            frontRow(),
            goalAction("ApproachAttackAction", GoalType::ApproachAttackRight,
                       ReasonCode::APPROACH_ATTACK),
        }),
        defenseBehavior(),
        baseFallback(),
    });
}

} // namespace vb
