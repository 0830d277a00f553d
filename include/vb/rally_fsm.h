#pragma once

#include "vb/rally_state.h"
#include "vb/vec2.h"

namespace vb {

RallyState createInitialRally(TeamSide serving = TeamSide::HOME,
                              int homeScore = 0, int awayScore = 0);

// Pure reducer. Events that do not apply to the current phase return the
// state unchanged. A point scored on a sideout advances the new server's rotation.
RallyState reduceRally(const RallyState& state, const RallyEvent& event);

inline bool isRallyOver(const RallyState& state) {
    return state.phase == RallyPhase::BALL_DEAD;
}

// Consecutive contacts by `team` at the end of the possession chain
int teamContactCount(const RallyState& state, TeamSide team);

// nullptr if the team has no contact of that type this rally
const ContactRecord* lastContactOfType(const RallyState& state, TeamSide team, ContactType type);

// Contact type inferred from the team's touch count and situation
RallyEvent createTouchEvent(TeamSide team, const std::string& playerId, ContactQuality quality,
                            double timeMs, int touchCount, bool isReceivingServe, bool isDefending);

// --- Contact quality ---

ContactQuality assessPassQuality(Vec2 landing, Vec2 setterPosition, TeamSide team);
ContactQuality assessSetQuality(Vec2 setTarget, Vec2 hitterPosition, bool hitterApproaching);
ContactQuality assessAttackQuality(int blockersPresent, bool inBounds);

// --- Rally termination ---

struct TerminationResult {
    bool terminated = false;
    RallyEndReason reason = RallyEndReason::BALL_LANDED;
    TeamSide winner = TeamSide::HOME;
};

TerminationResult detectRallyTermination(bool ballLanded, Vec2 ballPosition,
                                         const RallyState& state);

// --- Phase flow (manual stepping through the cycle) ---

RallyPhase nextPhaseInFlow(RallyPhase phase);
RallyPhase previousPhaseInFlow(RallyPhase phase);

// True when stepping in the given direction wraps to a new rally
bool wouldLoopToStart(RallyPhase phase, bool forward);

} // namespace vb
