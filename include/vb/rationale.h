#pragma once

#include "vb/blackboard.h"
#include "vb/intent.h"
#include "vb/overlap.h"
#include <string>

namespace vb {

// Display text for intents. Applied after evaluation; decision logic never reads it.

struct ThoughtContext {
    int rotation = 1;
    HitterMode hitterMode = HitterMode::THREE_HITTER;
    RoleCategory category = RoleCategory::SETTER;
    RallyPhase phase = RallyPhase::PRE_SERVE;
    int selfZone = 1;
    bool isDiagonalToSetter = false;
    ZoneRelationType zoneType = ZoneRelationType::L;
};

ThoughtContext buildThoughtContext(const Blackboard& bb, const Player& self);

const char* roleDisplayName(RoleCategory category);

// "As the outside hitter, <thought>"
std::string withRolePrefix(RoleCategory category, const std::string& thought);

std::string addDiagonalExplanation(const std::string& thought, bool isDiagonal,
                                   const std::string& targetRole = "setter");
std::string addConstraintExplanation(const std::string& thought, int selfZone, int otherZone,
                                     const std::string& otherRoleName);
std::string addHitterModeContext(const std::string& thought, int rotation);

enum class SetType { QUICK, HIGH_OUTSIDE, BACK_SET, DUMP };

std::string buildSetDecisionThought(SetType type, const ThoughtContext& ctx);
std::string buildComeBackThought(const ThoughtContext& ctx);

// Rationale for a tree-produced intent
std::string explainIntent(const Intent& intent, const Blackboard& bb, const Player& self);

} // namespace vb
