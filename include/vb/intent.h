#pragma once

#include "vb/enums.h"
#include "vb/vec2.h"
#include <string>
#include <vector>

namespace vb {

enum class IntentAction : uint8_t { REQUEST_GOAL, MOVE_TO, STAY_IN_PLACE };

enum class IntentSource : uint8_t { AI, HUMAN, OVERRIDE };

// Structured cause of a decision. Display text is produced separately.
enum class ReasonCode : uint8_t {
    OVERRIDE_APPLIED,
    PREPARE_SERVE,
    TRANSITION_FROM_SERVE,
    SETTER_DUMP,
    EMERGENCY_SET,
    LEGAL_STACK,
    SETTER_RELEASE,
    FRONT_ROW_STACK_LEFT,
    HIDE_BEHIND_PASSER,
    MOVE_TO_SETTING_ZONE,
    FREEBALL_BAIL,
    QUICK_SET,
    BACK_SET,
    HIGH_OUTSIDE_SET,
    OUT_OF_SYSTEM_SET,
    BLOCK_ASSIGNMENT,
    COVER_TIPS,
    BACK_ROW_DEFENSE,
    LINE_TIP_COVERAGE,
    CROSS_COURT_DIG,
    HITTER_COVERAGE,
    PINNED_AT_NET,
    COME_BACK_TO_RECEIVE,
    RECEIVE_SERVE,
    BACK_ROW_HOLD,
    APPROACH_AFTER_PASS,
    APPROACH_ATTACK,
    HIDE_NEAR_STACK,
    READ_BLOCK,
    TRANSITION_OFF_NET,
    DEFEND_BIAS,
    EMERGENCY_DIG,
    BASE_RESPONSIBILITY,
    HUMAN_EDIT,
};

constexpr int NUM_REASON_CODES = 34;

struct Intent {
    std::string id;                 // assigned by the tick pipeline
    std::string actor;
    IntentAction action = IntentAction::REQUEST_GOAL;
    GoalType goal = GoalType::MaintainBaseResponsibility;
    Vec2 target{};                  // MOVE_TO only
    double confidence = 1.0;        // 0-1, ranks alternatives
    ReasonCode reason = ReasonCode::BASE_RESPONSIBILITY;
    std::string rationale;          // display text, filled after evaluation
    IntentSource source = IntentSource::AI;

    bool operator==(const Intent& o) const {
        return id == o.id && actor == o.actor && action == o.action && goal == o.goal &&
               target == o.target && confidence == o.confidence && reason == o.reason &&
               rationale == o.rationale && source == o.source;
    }
};

Intent makeGoalIntent(const std::string& actor, GoalType goal, ReasonCode reason,
                      IntentSource source = IntentSource::AI, double confidence = 1.0);
Intent makeMoveIntent(const std::string& actor, Vec2 target, ReasonCode reason,
                      IntentSource source = IntentSource::AI, double confidence = 1.0);
Intent makeStayIntent(const std::string& actor, ReasonCode reason,
                      IntentSource source = IntentSource::AI);

std::vector<Intent> intentsForActor(const std::vector<Intent>& intents, const std::string& actor);
std::vector<Intent> intentsBySource(const std::vector<Intent>& intents, IntentSource source);

// Highest confidence, first one wins ties. nullptr if the actor has none.
const Intent* bestIntentForActor(const std::vector<Intent>& intents, const std::string& actor);

// Non-AI intents replace every AI intent of the same actor
std::vector<Intent> mergeIntents(const std::vector<Intent>& aiIntents,
                                 const std::vector<Intent>& humanIntents);

const char* toString(IntentAction action);
const char* toString(IntentSource source);
const char* toString(ReasonCode reason);

bool parseIntentAction(const std::string& s, IntentAction& out);
bool parseIntentSource(const std::string& s, IntentSource& out);
bool parseReasonCode(const std::string& s, ReasonCode& out);

} // namespace vb
