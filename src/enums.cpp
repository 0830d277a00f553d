#include "vb/enums.h"
#include <cstddef>

namespace vb {

namespace {

const char* const TEAM_NAMES[] = {"HOME", "AWAY"};

const char* const ROLE_NAMES[] = {"S", "OH1", "OH2", "MB1", "MB2", "OPP", "L"};

const char* const CATEGORY_NAMES[] = {"SETTER", "OUTSIDE", "MIDDLE", "OPPOSITE", "LIBERO"};

const char* const PHASE_NAMES[] = {
    "PRE_SERVE", "SERVE_IN_AIR", "SERVE_RECEIVE", "TRANSITION_TO_OFFENSE",
    "SET_PHASE", "ATTACK_PHASE", "TRANSITION_TO_DEFENSE", "DEFENSE_PHASE", "BALL_DEAD"
};

const char* const GOAL_NAMES[] = {
    "MaintainBaseResponsibility",
    "ParticipateInLegalStack",
    "HideBehindPrimaryPasser",
    "MoveTowardSettingZone",
    "SetterDump",
    "EmergencySet",
    "QuickSetMiddle",
    "SetToOutside",
    "SetToOpposite",
    "HighOutOfSystemSet",
    "BlockRightSide",
    "BlockMiddle",
    "BlockLeftSide",
    "BlockOpponentOutside",
    "DefendZoneBiasRightBack",
    "DefendZoneBiasMiddleBack",
    "DefendZoneBiasLeftBack",
    "ReceiveServe",
    "ApproachAttackLeft",
    "ApproachAttackRight",
    "ApproachAttackMiddle",
    "CoverHitter",
    "CoverTips",
    "FreeBallToTarget",
    "PrepareToServe",
    "TransitionFromServe",
    "StackRightReceivePosition",
    "StackMiddleReceivePosition",
    "StackLeftReceivePosition",
    "PinnedAtNet",
    "ComeBackToReceive",
    "FrontRowMiddleHideReceive",
    "ForcedStartingPosition",
    "AlternateStackingStrategy",
    "TemporaryRoleModifier",
    "SubtreeSuppression",
};

static_assert(sizeof(GOAL_NAMES) / sizeof(GOAL_NAMES[0]) == NUM_GOAL_TYPES,
              "GOAL_NAMES must cover every GoalType");

const char* const CONTACT_NAMES[] = {"serve", "pass", "set", "attack", "dig", "block", "freeball"};

const char* const QUALITY_NAMES[] = {"perfect", "good", "poor", "error"};

const char* const END_REASON_NAMES[] = {
    "ace", "kill", "block_kill", "error_net", "error_out", "four_touches", "double_hit", "ball_landed"
};

const char* const LANE_NAMES[] = {"left", "middle", "right"};

template<typename E, size_t N>
bool parseFrom(const char* const (&names)[N], const std::string& s, E& out) {
    for (size_t i = 0; i < N; ++i) {
        if (s == names[i]) {
            out = static_cast<E>(i);
            return true;
        }
    }
    return false;
}

} // anonymous namespace

const char* toString(TeamSide side) { return TEAM_NAMES[static_cast<int>(side)]; }
const char* toString(Role role) { return ROLE_NAMES[static_cast<int>(role)]; }
const char* toString(RoleCategory category) { return CATEGORY_NAMES[static_cast<int>(category)]; }
const char* toString(RallyPhase phase) { return PHASE_NAMES[static_cast<int>(phase)]; }
const char* toString(ContactType type) { return CONTACT_NAMES[static_cast<int>(type)]; }
const char* toString(ContactQuality quality) { return QUALITY_NAMES[static_cast<int>(quality)]; }
const char* toString(RallyEndReason reason) { return END_REASON_NAMES[static_cast<int>(reason)]; }
const char* toString(AttackLane lane) { return LANE_NAMES[static_cast<int>(lane)]; }

const char* toString(GoalType goal) {
    if (!isKnownGoal(goal)) return "Unknown";
    return GOAL_NAMES[static_cast<int>(goal)];
}

bool parseTeamSide(const std::string& s, TeamSide& out) { return parseFrom(TEAM_NAMES, s, out); }
bool parseRole(const std::string& s, Role& out) { return parseFrom(ROLE_NAMES, s, out); }
bool parseRallyPhase(const std::string& s, RallyPhase& out) { return parseFrom(PHASE_NAMES, s, out); }
bool parseGoalType(const std::string& s, GoalType& out) { return parseFrom(GOAL_NAMES, s, out); }
bool parseContactType(const std::string& s, ContactType& out) { return parseFrom(CONTACT_NAMES, s, out); }
bool parseContactQuality(const std::string& s, ContactQuality& out) { return parseFrom(QUALITY_NAMES, s, out); }
bool parseRallyEndReason(const std::string& s, RallyEndReason& out) { return parseFrom(END_REASON_NAMES, s, out); }

} // namespace vb
