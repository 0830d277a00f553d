#pragma once

#include <cstdint>
#include <string>

namespace vb {

// --- TeamSide ---
enum class TeamSide : uint8_t { HOME, AWAY };

inline TeamSide opponent(TeamSide side) {
    return side == TeamSide::HOME ? TeamSide::AWAY : TeamSide::HOME;
}

// --- Role ---
enum class Role : uint8_t { S, OH1, OH2, MB1, MB2, OPP, L };

constexpr int NUM_ROLES = 7;

// --- RoleCategory ---
enum class RoleCategory : uint8_t { SETTER, OUTSIDE, MIDDLE, OPPOSITE, LIBERO };

inline RoleCategory categoryOf(Role role) {
    switch (role) {
        case Role::S: return RoleCategory::SETTER;
        case Role::OH1:
        case Role::OH2: return RoleCategory::OUTSIDE;
        case Role::MB1:
        case Role::MB2: return RoleCategory::MIDDLE;
        case Role::OPP: return RoleCategory::OPPOSITE;
        case Role::L: return RoleCategory::LIBERO;
    }
    return RoleCategory::OUTSIDE;
}

// Lower value wins reach ties
inline int categoryPriority(RoleCategory category) {
    switch (category) {
        case RoleCategory::SETTER: return 1;
        case RoleCategory::LIBERO: return 2;
        case RoleCategory::OUTSIDE: return 3;
        case RoleCategory::OPPOSITE: return 4;
        case RoleCategory::MIDDLE: return 5;
    }
    return 5;
}

inline double defaultMaxSpeed(RoleCategory category) {
    if (category == RoleCategory::MIDDLE) return 0.9;
    if (category == RoleCategory::SETTER) return 1.05;
    return 1.0;
}

// --- RallyPhase ---
// Declaration order is the cyclic rally order.
enum class RallyPhase : uint8_t {
    PRE_SERVE, SERVE_IN_AIR, SERVE_RECEIVE, TRANSITION_TO_OFFENSE,
    SET_PHASE, ATTACK_PHASE, TRANSITION_TO_DEFENSE, DEFENSE_PHASE, BALL_DEAD
};

constexpr int NUM_RALLY_PHASES = 9;

inline bool isServePhase(RallyPhase p) {
    return p == RallyPhase::SERVE_IN_AIR || p == RallyPhase::SERVE_RECEIVE;
}

// --- GoalType ---
// Closed vocabulary shared by trees and human overrides.
enum class GoalType : uint8_t {
    MaintainBaseResponsibility = 0,
    ParticipateInLegalStack,
    HideBehindPrimaryPasser,
    MoveTowardSettingZone,
    SetterDump,
    EmergencySet,
    QuickSetMiddle,
    SetToOutside,
    SetToOpposite,
    HighOutOfSystemSet,
    BlockRightSide,             // 10
    BlockMiddle,
    BlockLeftSide,
    BlockOpponentOutside,
    DefendZoneBiasRightBack,
    DefendZoneBiasMiddleBack,
    DefendZoneBiasLeftBack,
    ReceiveServe,
    ApproachAttackLeft,
    ApproachAttackRight,
    ApproachAttackMiddle,       // 20
    CoverHitter,
    CoverTips,
    FreeBallToTarget,
    PrepareToServe,
    TransitionFromServe,
    StackRightReceivePosition,
    StackMiddleReceivePosition,
    StackLeftReceivePosition,
    PinnedAtNet,
    ComeBackToReceive,          // 30
    FrontRowMiddleHideReceive,
    ForcedStartingPosition,
    AlternateStackingStrategy,
    TemporaryRoleModifier,
    SubtreeSuppression,
};

constexpr int NUM_GOAL_TYPES = 36;

inline bool isKnownGoal(GoalType g) {
    return static_cast<int>(g) < NUM_GOAL_TYPES;
}

inline bool isSetGoal(GoalType g) {
    return g == GoalType::QuickSetMiddle || g == GoalType::SetToOutside ||
           g == GoalType::SetToOpposite || g == GoalType::HighOutOfSystemSet ||
           g == GoalType::EmergencySet || g == GoalType::SetterDump ||
           g == GoalType::FreeBallToTarget;
}

// --- Ball contact ---
enum class ContactType : uint8_t { SERVE, PASS, SET, ATTACK, DIG, BLOCK, FREEBALL };

enum class ContactQuality : uint8_t { PERFECT, GOOD, POOR, ERROR };

enum class RallyEndReason : uint8_t {
    ACE, KILL, BLOCK_KILL, ERROR_NET, ERROR_OUT, FOUR_TOUCHES, DOUBLE_HIT, BALL_LANDED
};

// --- Lanes ---
enum class AttackLane : uint8_t { LEFT, MIDDLE, RIGHT };

enum class HitterMode : uint8_t { TWO_HITTER, THREE_HITTER };

// --- String conversion (serialization, CLI, traces) ---
const char* toString(TeamSide side);
const char* toString(Role role);
const char* toString(RoleCategory category);
const char* toString(RallyPhase phase);
const char* toString(GoalType goal);
const char* toString(ContactType type);
const char* toString(ContactQuality quality);
const char* toString(RallyEndReason reason);
const char* toString(AttackLane lane);

// Parsers return false on unknown labels and leave `out` untouched
bool parseTeamSide(const std::string& s, TeamSide& out);
bool parseRole(const std::string& s, Role& out);
bool parseRallyPhase(const std::string& s, RallyPhase& out);
bool parseGoalType(const std::string& s, GoalType& out);
bool parseContactType(const std::string& s, ContactType& out);
bool parseContactQuality(const std::string& s, ContactQuality& out);
bool parseRallyEndReason(const std::string& s, RallyEndReason& out);

} // namespace vb
