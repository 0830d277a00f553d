#include "vb/role_trees.h"
#include "vb/conditions.h"

namespace vb {

namespace {

BtNode serveReceiveBehavior() {
    auto isReceive = phaseIs(RallyPhase::SERVE_RECEIVE);
    auto noTouch = touchCountIs(0);

    return selector("ServeReceiveBehavior", {
        sequence("FrontRowHide", {
            isReceive, receivingServe(), noTouch, frontRow(),
            goalAction("HideNearStackAction", GoalType::FrontRowMiddleHideReceive,
                       ReasonCode::HIDE_NEAR_STACK),
        }),
        sequence("BackRowHold", {
            isReceive, receivingServe(), noTouch, backRow(),
            goalAction("BackRowBaseAction", GoalType::MaintainBaseResponsibility,
                       ReasonCode::BACK_ROW_HOLD),
        }),
        sequence("ApproachAfterPass", {
            passIsUp(), frontRow(),
            goalAction("QuickApproachAction", GoalType::ApproachAttackMiddle,
                       ReasonCode::APPROACH_AFTER_PASS),
        }),
    });
}

BtNode defenseBehavior() {
    return sequence("DefenseBehavior", {
        teamDefending(),
        selector("DefenseSelector", {
            sequence("ReadBlock", {
                frontRow(),
                selector("BlockChoice", {
                    sequence("BlockLeft", {
                        condition("HeadedLeft", [](const BtContext& ctx) {
                            return isBallHeadedToZone(ctx.bb, AttackLane::LEFT);
                        }),
                        goalAction("BlockLeftAction", GoalType::BlockLeftSide, ReasonCode::READ_BLOCK),
                    }),
                    sequence("BlockRight", {
                        condition("HeadedRight", [](const BtContext& ctx) {
                            return isBallHeadedToZone(ctx.bb, AttackLane::RIGHT);
                        }),
                        goalAction("BlockRightAction", GoalType::BlockRightSide, ReasonCode::READ_BLOCK),
                    }),
                    goalAction("BlockMiddleAction", GoalType::BlockMiddle, ReasonCode::READ_BLOCK),
                }),
            }),
            sequence("TransitionOffNet", {
                ballOnOurSide(),
                condition("TeamHasTouched", [](const BtContext& ctx) {
                    return ctx.bb.touchCount >= 1;
                }),
                goalAction("TransitionOffNetAction", GoalType::MaintainBaseResponsibility,
                           ReasonCode::TRANSITION_OFF_NET),
            }),
            goalAction("BackRowDefenseAction", GoalType::MaintainBaseResponsibility,
                       ReasonCode::BACK_ROW_DEFENSE),
        }),
    });
}

} // anonymous namespace

BtNode buildMiddleTree() {
    return selector("MiddleTree", {
        handleOverrideGoal(),
        servingBehavior(),
        emergencySetBehavior(0.0),
        serveReceiveBehavior(),
        sequence("SetPhaseAttack", {
            phaseIs(RallyPhase::SET_PHASE),
            frontRow(),
            goalAction("QuickApproachAction", GoalType::ApproachAttackMiddle,
                       ReasonCode::APPROACH_ATTACK),
        }),
        defenseBehavior(),
        baseFallback(),
    });
}

} // namespace vb
