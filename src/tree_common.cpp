#include "vb/role_trees.h"
#include "vb/conditions.h"
#include <algorithm>
#include <vector>

namespace vb {

// --- Leaves ---

BtNode goalAction(const std::string& name, GoalType goal, ReasonCode reason) {
    return action(name, [goal, reason](const BtContext& ctx) {
        ActionOutcome out;
        out.intents.push_back(makeGoalIntent(ctx.self.id, goal, reason));
        out.note = toString(goal);
        return out;
    });
}

// --- Condition nodes ---

BtNode phaseIs(RallyPhase phase) {
    return condition(std::string("Is_") + toString(phase), [phase](const BtContext& ctx) {
        return ctx.bb.phase == phase;
    });
}

BtNode phaseIn(std::initializer_list<RallyPhase> phases) {
    std::vector<RallyPhase> list(phases);
    std::string name = "PhaseIn";
    for (RallyPhase p : list) name += std::string("_") + toString(p);
    return condition(name, [list](const BtContext& ctx) {
        return std::find(list.begin(), list.end(), ctx.bb.phase) != list.end();
    });
}

BtNode touchCountIs(int n) {
    return condition("TouchCount" + std::to_string(n), [n](const BtContext& ctx) {
        return ctx.bb.touchCount == n;
    });
}

BtNode frontRow() {
    return condition("IsFrontRow", [](const BtContext& ctx) {
        return isFrontRow(ctx.bb, ctx.self);
    });
}

BtNode backRow() {
    return condition("IsBackRow", [](const BtContext& ctx) {
        return isBackRow(ctx.bb, ctx.self);
    });
}

BtNode ballOnOurSide() {
    return condition("BallOnOurSide", [](const BtContext& ctx) {
        return ctx.bb.ballOnOurSide;
    });
}

BtNode receivingServe() {
    return condition("IsReceivingServe", [](const BtContext& ctx) {
        return !ctx.bb.isOurServe;
    });
}

bool isTeamDefending(const Blackboard& bb) {
    switch (bb.phase) {
        case RallyPhase::DEFENSE_PHASE:
            return bb.ballOnOurSide;
        case RallyPhase::SERVE_RECEIVE:
        case RallyPhase::TRANSITION_TO_OFFENSE:
        case RallyPhase::SET_PHASE:
        case RallyPhase::ATTACK_PHASE:
        case RallyPhase::TRANSITION_TO_DEFENSE:
            return !bb.ballOnOurSide;
        default:
            return false;
    }
}

BtNode teamDefending() {
    return condition("IsDefending", [](const BtContext& ctx) {
        return isTeamDefending(ctx.bb);
    });
}

BtNode passIsUp() {
    return condition("PassIsUp", [](const BtContext& ctx) {
        RallyPhase p = ctx.bb.phase;
        return ctx.bb.touchCount == 1 &&
               (p == RallyPhase::SERVE_RECEIVE || p == RallyPhase::TRANSITION_TO_OFFENSE);
    });
}

// --- Shared subtrees ---

BtNode handleOverrideGoal() {
    return sequence("HandleOverrideGoal", {
        condition("HasOverride", [](const BtContext& ctx) {
            return ctx.self.override.active || ctx.bb.override.active;
        }),
        action("ApplyOverrideGoal", [](const BtContext& ctx) {
            const GoalOverride& o = ctx.self.override.active ? ctx.self.override : ctx.bb.override;
            GoalType goal = GoalType::MaintainBaseResponsibility;
            ActionOutcome out;
            if (!parseGoalType(o.goal, goal)) {
                out.note = "Unknown override goal '" + o.goal + "'";
            } else {
                out.note = std::string("Applied override: ") + toString(goal);
            }
            out.intents.push_back(makeGoalIntent(ctx.self.id, goal, ReasonCode::OVERRIDE_APPLIED,
                                                 IntentSource::OVERRIDE));
            return out;
        }),
        yieldToMovement(),
    });
}

BtNode servingBehavior() {
    auto amServer = condition("AmIServer", [](const BtContext& ctx) {
        return ctx.bb.serverId == ctx.self.id;
    });
    auto ourServe = condition("IsOurServe", [](const BtContext& ctx) {
        return ctx.bb.isOurServe;
    });

    return selector("ServingBehavior", {
        sequence("PrepareToServeBehavior", {
            phaseIs(RallyPhase::PRE_SERVE),
            ourServe,
            amServer,
            goalAction("PrepareToServeAction", GoalType::PrepareToServe, ReasonCode::PREPARE_SERVE),
        }),
        sequence("TransitionAfterServeBehavior", {
            phaseIn({RallyPhase::SERVE_IN_AIR, RallyPhase::SERVE_RECEIVE}),
            ourServe,
            amServer,
            goalAction("TransitionFromServeAction", GoalType::TransitionFromServe,
                       ReasonCode::TRANSITION_FROM_SERVE),
        }),
    });
}

BtNode emergencySetBehavior(double priorityBias) {
    return sequence("EmergencyBallControl", {
        ballOnOurSide(),
        touchCountIs(1),
        condition("SetterOutOfPosition", [](const BtContext& ctx) {
            return !isSetterInPosition(ctx);
        }),
        condition("CanReachBallFirst", [priorityBias](const BtContext& ctx) {
            return canReachBallBeforeOthers(ctx, priorityBias);
        }),
        goalAction("EmergencySetAction", GoalType::EmergencySet, ReasonCode::EMERGENCY_SET),
    });
}

BtNode baseFallback() {
    return sequence("MaintainBaseResponsibility", {
        condition("Always", [](const BtContext&) { return true; }),
        goalAction("BaseResponsibilityAction", GoalType::MaintainBaseResponsibility,
                   ReasonCode::BASE_RESPONSIBILITY),
    });
}

// --- Tree selection ---

AttackLane outsideSideFor(const Blackboard& bb, const Player& player) {
    return isFrontRow(bb, player) ? AttackLane::LEFT : AttackLane::RIGHT;
}

const BtNode& treeFor(const Player& player, const Blackboard& bb) {
    static const BtNode setter = buildSetterTree();
    static const BtNode outsideLeft = buildOutsideTree(AttackLane::LEFT);
    static const BtNode outsideRight = buildOutsideTree(AttackLane::RIGHT);
    static const BtNode opposite = buildOppositeTree();
    static const BtNode middle = buildMiddleTree();
    static const BtNode libero = buildLiberoTree();

    switch (player.category) {
        case RoleCategory::SETTER: return setter;
        case RoleCategory::OUTSIDE:
            return outsideSideFor(bb, player) == AttackLane::LEFT ? outsideLeft : outsideRight;
        case RoleCategory::OPPOSITE: return opposite;
        case RoleCategory::MIDDLE: return middle;
        case RoleCategory::LIBERO: return libero;
    }
    return middle;
}

} // namespace vb
