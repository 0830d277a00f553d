#include "vb/rationale.h"
#include "vb/conditions.h"
#include "vb/rotation.h"

namespace vb {

namespace {

const char* const ROLE_DISPLAY_NAMES[] = {
    "setter", "outside hitter", "middle blocker", "opposite", "libero"
};

std::string serveReceiveThought(const std::string& action, const ThoughtContext& ctx) {
    std::string thought = withRolePrefix(ctx.category, action);
    if (ctx.isDiagonalToSetter) {
        thought += " Since I'm diagonal to the setter, I can position freely.";
    }
    return thought;
}

std::string stackThought(const ThoughtContext& ctx) {
    std::string thought = withRolePrefix(ctx.category,
        "forming stack left formation - front-row players stack left of passers.");
    if (ctx.isDiagonalToSetter) {
        thought += " I'm diagonal to the setter, so I have positioning freedom.";
    }
    return thought;
}

std::string pinnedThought(const ThoughtContext& ctx) {
    // Pinned players are held by the adjacent front-row neighbour toward the middle
    int otherZone = ctx.selfZone == 3 ? 2 : 3;
    std::string constraint = constraintDescription(ctx.selfZone, otherZone, "middle");
    if (constraint.empty()) constraint = "I need to maintain my relative position";
    const char* rel = ctx.zoneType == ZoneRelationType::T ? "T" : "L";
    return withRolePrefix(ctx.category, "I'm pinned at the net. I'm in a ") + rel +
           " relationship with the middle - " + constraint + ".";
}

std::string defenseThought(GoalType goal, const ThoughtContext& ctx) {
    switch (goal) {
        case GoalType::DefendZoneBiasLeftBack:
            return withRolePrefix(ctx.category, "positioning in left back for perimeter defense.");
        case GoalType::DefendZoneBiasMiddleBack:
            return withRolePrefix(ctx.category, "anchoring middle back - deepest defender.");
        case GoalType::DefendZoneBiasRightBack:
            return withRolePrefix(ctx.category, "covering right back.");
        default:
            return withRolePrefix(ctx.category, "moving to the net to block.");
    }
}

std::string approachThought(GoalType goal, const ThoughtContext& ctx) {
    switch (goal) {
        case GoalType::ApproachAttackLeft:
            return withRolePrefix(ctx.category, "approaching from the left side.");
        case GoalType::ApproachAttackRight:
            return withRolePrefix(ctx.category, "approaching from the right side.");
        default:
            return withRolePrefix(ctx.category, "approaching for a quick attack in the middle.");
    }
}

} // anonymous namespace

ThoughtContext buildThoughtContext(const Blackboard& bb, const Player& self) {
    ThoughtContext ctx;
    ctx.rotation = bb.rotation;
    ctx.hitterMode = hitterMode(bb.rotation);
    ctx.category = self.category;
    ctx.phase = bb.phase;
    ctx.selfZone = playerZone(bb, self);
    ctx.isDiagonalToSetter = self.category != RoleCategory::SETTER && isDiagonalToSetter(bb, self);
    ctx.zoneType = zoneRelationType(ctx.selfZone);
    return ctx;
}

const char* roleDisplayName(RoleCategory category) {
    return ROLE_DISPLAY_NAMES[static_cast<int>(category)];
}

std::string withRolePrefix(RoleCategory category, const std::string& thought) {
    return std::string("As the ") + roleDisplayName(category) + ", " + thought;
}

std::string addDiagonalExplanation(const std::string& thought, bool isDiagonal,
                                   const std::string& targetRole) {
    if (!isDiagonal) return thought;
    return thought + " Since I'm diagonal to the " + targetRole + ", I can position freely.";
}

std::string addConstraintExplanation(const std::string& thought, int selfZone, int otherZone,
                                     const std::string& otherRoleName) {
    std::string constraint = constraintDescription(selfZone, otherZone, otherRoleName);
    if (constraint.empty()) return thought;
    return thought + " " + constraint + ".";
}

std::string addHitterModeContext(const std::string& thought, int rotation) {
    if (hitterMode(rotation) == HitterMode::THREE_HITTER) {
        return thought + " (3-hitter rotation - all attack options available)";
    }
    return thought + " (2-hitter rotation)";
}

std::string buildSetDecisionThought(SetType type, const ThoughtContext& ctx) {
    const char* desc = "";
    switch (type) {
        case SetType::QUICK: desc = "Running a quick set to the middle."; break;
        case SetType::HIGH_OUTSIDE: desc = "Setting high ball to the outside."; break;
        case SetType::BACK_SET: desc = "Going with a back set to the opposite."; break;
        case SetType::DUMP: desc = "Taking the setter dump - I'm front row."; break;
    }
    return describeHitterMode(ctx.rotation) + ". " + desc;
}

std::string buildComeBackThought(const ThoughtContext& ctx) {
    std::string thought = std::string("As the front-row ") + roleDisplayName(ctx.category) +
                          ", I'm coming back to help receive.";
    if (ctx.isDiagonalToSetter) {
        thought += " Since I'm diagonal to the setter, I can position freely without overlap concerns.";
    }
    return thought;
}

std::string explainIntent(const Intent& intent, const Blackboard& bb, const Player& self) {
    ThoughtContext ctx = buildThoughtContext(bb, self);
    RoleCategory cat = self.category;

    switch (intent.reason) {
        case ReasonCode::OVERRIDE_APPLIED:
            return withRolePrefix(cat, std::string("following the override: ") +
                                       toString(intent.goal) + ".");
        case ReasonCode::PREPARE_SERVE:
            return withRolePrefix(cat, "I'm serving - heading to the service line.");
        case ReasonCode::TRANSITION_FROM_SERVE:
            return withRolePrefix(cat, "the serve is away, I'm moving into the court.");
        case ReasonCode::SETTER_DUMP:
            return buildSetDecisionThought(SetType::DUMP, ctx);
        case ReasonCode::EMERGENCY_SET:
            return withRolePrefix(cat, "the setter can't get there, so I'm taking the second ball.");
        case ReasonCode::LEGAL_STACK:
            return withRolePrefix(cat, "holding a legal position for the serve.");
        case ReasonCode::SETTER_RELEASE:
            return withRolePrefix(cat, "releasing from the stack to the setting zone.");
        case ReasonCode::FRONT_ROW_STACK_LEFT:
            return stackThought(ctx);
        case ReasonCode::HIDE_BEHIND_PASSER:
            return serveReceiveThought("hiding behind the primary passer.", ctx);
        case ReasonCode::MOVE_TO_SETTING_ZONE:
            return withRolePrefix(cat, "the pass is up, getting to the setting zone.");
        case ReasonCode::FREEBALL_BAIL:
            return withRolePrefix(cat, "the pass is too far off, sending a free ball over.");
        case ReasonCode::QUICK_SET:
            return buildSetDecisionThought(SetType::QUICK, ctx);
        case ReasonCode::BACK_SET:
            return buildSetDecisionThought(SetType::BACK_SET, ctx);
        case ReasonCode::HIGH_OUTSIDE_SET:
            return buildSetDecisionThought(SetType::HIGH_OUTSIDE, ctx);
        case ReasonCode::OUT_OF_SYSTEM_SET:
            return addHitterModeContext(
                withRolePrefix(cat, "we're out of system, putting up a high ball."), ctx.rotation);
        case ReasonCode::BLOCK_ASSIGNMENT:
        case ReasonCode::READ_BLOCK:
            return defenseThought(intent.goal, ctx);
        case ReasonCode::COVER_TIPS:
            return withRolePrefix(cat, "not blocking this one, covering tips behind the block.");
        case ReasonCode::LINE_TIP_COVERAGE:
            return withRolePrefix(cat, "playing the line and covering tips.");
        case ReasonCode::CROSS_COURT_DIG:
            return withRolePrefix(cat, "digging the cross-court angle.");
        case ReasonCode::BACK_ROW_DEFENSE:
        case ReasonCode::DEFEND_BIAS:
            return defenseThought(intent.goal, ctx);
        case ReasonCode::HITTER_COVERAGE:
            return withRolePrefix(cat, "covering our hitter in case of a block.");
        case ReasonCode::PINNED_AT_NET:
            return pinnedThought(ctx);
        case ReasonCode::COME_BACK_TO_RECEIVE:
            return buildComeBackThought(ctx);
        case ReasonCode::RECEIVE_SERVE:
            return serveReceiveThought("I'm taking this serve.", ctx);
        case ReasonCode::BACK_ROW_HOLD:
            return serveReceiveThought("holding my receive seam.", ctx);
        case ReasonCode::APPROACH_AFTER_PASS:
        case ReasonCode::APPROACH_ATTACK:
            return addHitterModeContext(approachThought(intent.goal, ctx), ctx.rotation);
        case ReasonCode::HIDE_NEAR_STACK:
            return withRolePrefix(cat, "staying out of the passing lanes near the net.");
        case ReasonCode::TRANSITION_OFF_NET:
            return withRolePrefix(cat, "transitioning off the net to attack.");
        case ReasonCode::EMERGENCY_DIG:
            return withRolePrefix(cat, "diving for the ball.");
        case ReasonCode::BASE_RESPONSIBILITY:
            return withRolePrefix(cat, "holding my base position.");
        case ReasonCode::HUMAN_EDIT:
            return withRolePrefix(cat, std::string("moving as directed: ") +
                                       toString(intent.goal) + ".");
    }
    return withRolePrefix(cat, toString(intent.goal));
}

} // namespace vb
