#include "vb/role_trees.h"
#include "vb/conditions.h"

namespace vb {

namespace {

constexpr double LIBERO_RECEIVE_BIAS = -2.0;

BtNode serveReceiveBehavior() {
    return sequence("ServeReceiveBehavior", {
        phaseIs(RallyPhase::SERVE_RECEIVE),
        receivingServe(),
        selector("ReceiveChoice", {
            sequence("PrimaryReceive", {
                ballOnOurSide(),
                touchCountIs(0),
                condition("CanReachFirst", [](const BtContext& ctx) {
                    return canReachBallBeforeOthers(ctx, LIBERO_RECEIVE_BIAS);
                }),
                goalAction("ReceiveServeAction", GoalType::ReceiveServe, ReasonCode::RECEIVE_SERVE),
            }),
            requestGoal(GoalType::MaintainBaseResponsibility, ReasonCode::BACK_ROW_HOLD),
        }),
    });
}

BtNode defenseBehavior() {
    return sequence("DefenseBehavior", {
        teamDefending(),
        selector("DefenseSelector", {
            sequence("ShortBallMiddle", {
                invert(condition("IsHighSet", [](const BtContext& ctx) {
                    return isBallHighSet(ctx);
                })),
                goalAction("MiddleBackAction", GoalType::DefendZoneBiasMiddleBack,
                           ReasonCode::DEFEND_BIAS),
            }),
            sequence("LeftBack", {
                condition("AttackLeft", [](const BtContext& ctx) {
                    return ctx.bb.opponentAttackLane == AttackLane::LEFT ||
                           ctx.bb.ballPosition.x < 0.35;
                }),
                goalAction("LeftBackAction", GoalType::DefendZoneBiasLeftBack,
                           ReasonCode::DEFEND_BIAS),
            }),
            sequence("RightBack", {
                condition("AttackRight", [](const BtContext& ctx) {
                    return ctx.bb.opponentAttackLane == AttackLane::RIGHT ||
                           ctx.bb.ballPosition.x > 0.65;
                }),
                goalAction("RightBackAction", GoalType::DefendZoneBiasRightBack,
                           ReasonCode::DEFEND_BIAS),
            }),
            goalAction("MiddleBackAction", GoalType::DefendZoneBiasMiddleBack,
                       ReasonCode::DEFEND_BIAS),
        }),
    });
}

} // anonymous namespace

BtNode buildLiberoTree() {
    return selector("LiberoTree", {
        handleOverrideGoal(),
        serveReceiveBehavior(),
        defenseBehavior(),
        baseFallback(),
    });
}

} // namespace vb
