#include "vb/intent.h"
#include <algorithm>
#include <iterator>
#include <cstddef>
#include <set>

namespace vb {

Intent makeGoalIntent(const std::string& actor, GoalType goal, ReasonCode reason,
                      IntentSource source, double confidence) {
    Intent i;
    i.actor = actor;
    i.action = IntentAction::REQUEST_GOAL;
    i.goal = goal;
    i.reason = reason;
    i.source = source;
    i.confidence = confidence;
    return i;
}

Intent makeMoveIntent(const std::string& actor, Vec2 target, ReasonCode reason,
                      IntentSource source, double confidence) {
    Intent i;
    i.actor = actor;
    i.action = IntentAction::MOVE_TO;
    i.target = target;
    i.reason = reason;
    i.source = source;
    i.confidence = confidence;
    return i;
}

Intent makeStayIntent(const std::string& actor, ReasonCode reason, IntentSource source) {
    Intent i;
    i.actor = actor;
    i.action = IntentAction::STAY_IN_PLACE;
    i.reason = reason;
    i.source = source;
    return i;
}

std::vector<Intent> intentsForActor(const std::vector<Intent>& intents, const std::string& actor) {
    std::vector<Intent> out;
    std::copy_if(intents.begin(), intents.end(), std::back_inserter(out),
                 [&](const Intent& i) { return i.actor == actor; });
    return out;
}

std::vector<Intent> intentsBySource(const std::vector<Intent>& intents, IntentSource source) {
    std::vector<Intent> out;
    std::copy_if(intents.begin(), intents.end(), std::back_inserter(out),
                 [&](const Intent& i) { return i.source == source; });
    return out;
}

const Intent* bestIntentForActor(const std::vector<Intent>& intents, const std::string& actor) {
    const Intent* best = nullptr;
    for (const auto& i : intents) {
        if (i.actor != actor) continue;
        if (!best || i.confidence > best->confidence) best = &i;
    }
    return best;
}

std::vector<Intent> mergeIntents(const std::vector<Intent>& aiIntents,
                                 const std::vector<Intent>& humanIntents) {
    std::set<std::string> humanActors;
    for (const auto& i : humanIntents) humanActors.insert(i.actor);

    std::vector<Intent> out;
    for (const auto& i : aiIntents) {
        if (!humanActors.count(i.actor)) out.push_back(i);
    }
    out.insert(out.end(), humanIntents.begin(), humanIntents.end());
    return out;
}

// --- Labels ---

namespace {

const char* const ACTION_NAMES[] = {"REQUEST_GOAL", "MOVE_TO", "STAY_IN_PLACE"};

const char* const SOURCE_NAMES[] = {"AI", "HUMAN", "OVERRIDE"};

const char* const REASON_NAMES[] = {
    "OVERRIDE_APPLIED", "PREPARE_SERVE", "TRANSITION_FROM_SERVE", "SETTER_DUMP",
    "EMERGENCY_SET", "LEGAL_STACK", "SETTER_RELEASE", "FRONT_ROW_STACK_LEFT",
    "HIDE_BEHIND_PASSER", "MOVE_TO_SETTING_ZONE", "FREEBALL_BAIL", "QUICK_SET",
    "BACK_SET", "HIGH_OUTSIDE_SET", "OUT_OF_SYSTEM_SET", "BLOCK_ASSIGNMENT",
    "COVER_TIPS", "BACK_ROW_DEFENSE", "LINE_TIP_COVERAGE", "CROSS_COURT_DIG",
    "HITTER_COVERAGE", "PINNED_AT_NET", "COME_BACK_TO_RECEIVE", "RECEIVE_SERVE",
    "BACK_ROW_HOLD", "APPROACH_AFTER_PASS", "APPROACH_ATTACK", "HIDE_NEAR_STACK",
    "READ_BLOCK", "TRANSITION_OFF_NET", "DEFEND_BIAS", "EMERGENCY_DIG",
    "BASE_RESPONSIBILITY", "HUMAN_EDIT",
};

static_assert(sizeof(REASON_NAMES) / sizeof(REASON_NAMES[0]) == NUM_REASON_CODES,
              "reason names out of sync");

template<typename E, size_t N>
bool parseLabel(const std::string& s, const char* const (&names)[N], E& out) {
    for (size_t i = 0; i < N; ++i) {
        if (s == names[i]) {
            out = static_cast<E>(i);
            return true;
        }
    }
    return false;
}

} // anonymous namespace

const char* toString(IntentAction action) { return ACTION_NAMES[static_cast<int>(action)]; }
const char* toString(IntentSource source) { return SOURCE_NAMES[static_cast<int>(source)]; }
const char* toString(ReasonCode reason) { return REASON_NAMES[static_cast<int>(reason)]; }

bool parseIntentAction(const std::string& s, IntentAction& out) { return parseLabel(s, ACTION_NAMES, out); }
bool parseIntentSource(const std::string& s, IntentSource& out) { return parseLabel(s, SOURCE_NAMES, out); }
bool parseReasonCode(const std::string& s, ReasonCode& out) { return parseLabel(s, REASON_NAMES, out); }

} // namespace vb
