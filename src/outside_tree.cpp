#include "vb/role_trees.h"
#include "vb/conditions.h"

namespace vb {

namespace {

BtNode serveReceiveBehavior(AttackLane side) {
    auto isReceive = phaseIs(RallyPhase::SERVE_RECEIVE);
    auto noTouch = touchCountIs(0);
    GoalType approach = side == AttackLane::RIGHT ? GoalType::ApproachAttackRight
                                                  : GoalType::ApproachAttackLeft;

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
        sequence("FrontRowStackLeft", {
            isReceive, receivingServe(), noTouch, frontRow(),
            goalAction("StackLeftAction", GoalType::StackLeftReceivePosition,
                       ReasonCode::FRONT_ROW_STACK_LEFT),
        }),
        sequence("ReceiveServe", {
            isReceive, receivingServe(), noTouch, backRow(),
            condition("CanReachFirst", [](const BtContext& ctx) {
                return canReachBallBeforeOthers(ctx, 0.0);
            }),
            goalAction("ReceiveServeAction", GoalType::ReceiveServe, ReasonCode::RECEIVE_SERVE),
        }),
        sequence("BackRowHold", {
            isReceive, receivingServe(), noTouch, backRow(),
            goalAction("BackRowBaseAction", GoalType::MaintainBaseResponsibility,
                       ReasonCode::BACK_ROW_HOLD),
        }),
        sequence("ApproachAfterPass", {
            passIsUp(), frontRow(),
            goalAction("ApproachAfterPassAction", approach, ReasonCode::APPROACH_AFTER_PASS),
        }),
    });
}

BtNode defenseBehavior(AttackLane side) {
    GoalType block = side == AttackLane::RIGHT ? GoalType::BlockRightSide
                                               : GoalType::BlockLeftSide;
    GoalType deep = side == AttackLane::RIGHT ? GoalType::DefendZoneBiasRightBack
                                              : GoalType::DefendZoneBiasLeftBack;
    auto attackOnMySide = condition("AttackOnMySide", [side](const BtContext& ctx) {
        return ctx.bb.opponentAttackLane == side;
    });

    return sequence("DefenseBehavior", {
        teamDefending(),
        selector("DefenseSelector", {
            sequence("FrontRowBlock", {
                frontRow(), attackOnMySide,
                goalAction("BlockAction", block, ReasonCode::BLOCK_ASSIGNMENT),
            }),
            sequence("FrontRowCoverTips", {
                frontRow(),
                goalAction("CoverTipsAction", GoalType::CoverTips, ReasonCode::COVER_TIPS),
            }),
            sequence("LinePlayer", {
                attackOnMySide,
                goalAction("LineTipCoverageAction", GoalType::CoverTips,
                           ReasonCode::LINE_TIP_COVERAGE),
            }),
            goalAction("CrossCourtDigAction", deep, ReasonCode::CROSS_COURT_DIG),
        }),
    });
}

} // anonymous namespace

BtNode buildOutsideTree(AttackLane side) {
    GoalType approach = side == AttackLane::RIGHT ? GoalType::ApproachAttackRight
                                                  : GoalType::ApproachAttackLeft;
    return selector(side == AttackLane::RIGHT ? "OutsideTreeRight" : "OutsideTreeLeft", {
        handleOverrideGoal(),
        servingBehavior(),
        emergencySetBehavior(0.0),
        serveReceiveBehavior(side),
        sequence("SetPhaseAttack", {
            phaseIs(RallyPhase::SET_PHASE),
            frontRow(),
            goalAction("ApproachAttackAction", approach, ReasonCode::APPROACH_ATTACK),
        }),
        sequence("AttackCoverageBehavior", {
            phaseIs(RallyPhase::ATTACK_PHASE),
            ballOnOurSide(),
            condition("ShouldCollapse", [](const BtContext& ctx) {
                return shouldCollapseCoverage(ctx);
            }),
            goalAction("CoverageAction", GoalType::CoverHitter, ReasonCode::HITTER_COVERAGE),
        }),
        defenseBehavior(side),
        baseFallback(),
    });
}

} // namespace vb
