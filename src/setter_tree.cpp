#include "vb/role_trees.h"
#include "vb/conditions.h"
#include "vb/tunables.h"

namespace vb {

namespace {

BtNode emergencyBallControl() {
    return sequence("EmergencyBallControl", {
        ballOnOurSide(),
        touchCountIs(1),
        condition("CanReachBallFirst", [](const BtContext& ctx) {
            return canReachBallBeforeOthers(ctx, -5.0);
        }),
        selector("EmergencyChoice", {
            sequence("FrontRowDump", {
                frontRow(),
                goalAction("SetterDumpAction", GoalType::SetterDump, ReasonCode::SETTER_DUMP),
            }),
            goalAction("EmergencySetAction", GoalType::EmergencySet, ReasonCode::EMERGENCY_SET),
        }),
    });
}

BtNode preServeBehavior() {
    return sequence("PreServeBehavior", {
        phaseIs(RallyPhase::PRE_SERVE),
        selector("PreServeChoice", {
            sequence("FrontRowStackLeft", {
                receivingServe(),
                frontRow(),
                goalAction("FrontRowStackLeftAction", GoalType::StackLeftReceivePosition,
                           ReasonCode::FRONT_ROW_STACK_LEFT),
            }),
            sequence("BackRowHide", {
                receivingServe(),
                backRow(),
                goalAction("HideAction", GoalType::HideBehindPrimaryPasser,
                           ReasonCode::HIDE_BEHIND_PASSER),
            }),
            goalAction("LegalStackAction", GoalType::ParticipateInLegalStack,
                       ReasonCode::LEGAL_STACK),
        }),
    });
}

// The setter leaves the stack as soon as the serve is struck
BtNode serveReceiveBehavior() {
    return selector("ServeReceiveBehavior", {
        sequence("SetterRelease", {
            phaseIn({RallyPhase::SERVE_IN_AIR, RallyPhase::SERVE_RECEIVE}),
            receivingServe(),
            touchCountIs(0),
            goalAction("SetterReleaseAction", GoalType::MoveTowardSettingZone,
                       ReasonCode::SETTER_RELEASE),
        }),
        sequence("MoveToSettingZone", {
            passIsUp(),
            goalAction("MoveToSettingZoneAction", GoalType::MoveTowardSettingZone,
                       ReasonCode::MOVE_TO_SETTING_ZONE),
        }),
    });
}

BtNode setPhaseBehavior() {
    auto isSetPhase = phaseIs(RallyPhase::SET_PHASE);
    auto twoTouches = touchCountIs(2);
    auto inSystem = condition("IsInSystem", [](const BtContext& ctx) {
        return isInSystem(ctx);
    });

    return selector("SetPhaseBehavior", {
        sequence("FreeBallBail", {
            phaseIn({RallyPhase::TRANSITION_TO_OFFENSE, RallyPhase::SET_PHASE}),
            condition("OneOrTwoTouches", [](const BtContext& ctx) {
                return ctx.bb.touchCount == 1 || ctx.bb.touchCount == 2;
            }),
            condition("ShouldBail", [](const BtContext& ctx) {
                return shouldSetterBail(ctx);
            }),
            goalAction("FreeBallBailAction", GoalType::FreeBallToTarget, ReasonCode::FREEBALL_BAIL),
        }),
        sequence("QuickSetMiddle", {
            isSetPhase,
            twoTouches,
            inSystem,
            condition("MiddleReadyForQuick", [](const BtContext& ctx) {
                return isMiddleReadyForQuick(ctx);
            }),
            goalAction("QuickSetMiddleAction", GoalType::QuickSetMiddle, ReasonCode::QUICK_SET),
        }),
        sequence("BackSetOpposite", {
            isSetPhase,
            twoTouches,
            inSystem,
            condition("OppositeAvailable", [](const BtContext& ctx) {
                return isOppositeAvailable(ctx);
            }),
            condition("WeakBlockRight", [](const BtContext& ctx) {
                return countOpponentBlockers(ctx) <= 1 || isGapInBlock(ctx, AttackLane::RIGHT);
            }),
            goalAction("BackSetOppositeAction", GoalType::SetToOpposite, ReasonCode::BACK_SET),
        }),
        sequence("InSystemOutside", {
            isSetPhase,
            twoTouches,
            inSystem,
            goalAction("InSystemOutsideAction", GoalType::SetToOutside, ReasonCode::HIGH_OUTSIDE_SET),
        }),
        sequence("OutOfSystemSet", {
            isSetPhase,
            twoTouches,
            goalAction("OutOfSystemSetAction", GoalType::HighOutOfSystemSet,
                       ReasonCode::OUT_OF_SYSTEM_SET),
        }),
    });
}

BtNode coverageBehavior() {
    return sequence("SetterCoverageBehavior", {
        phaseIs(RallyPhase::ATTACK_PHASE),
        ballOnOurSide(),
        goalAction("SetterCoverageAction", GoalType::CoverHitter, ReasonCode::HITTER_COVERAGE),
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
                goalAction("BlockRightAction", GoalType::BlockRightSide, ReasonCode::BLOCK_ASSIGNMENT),
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

BtNode buildSetterTree() {
    return selector("SetterTree", {
        handleOverrideGoal(),
        servingBehavior(),
        emergencyBallControl(),
        selector("PhaseSpecificBehavior", {
            preServeBehavior(),
            serveReceiveBehavior(),
            setPhaseBehavior(),
            coverageBehavior(),
            defenseBehavior(),
        }),
        baseFallback(),
    });
}

} // namespace vb
