#pragma once

#include "vb/rally_state.h"
#include "vb/world_state.h"
#include <vector>

namespace vb {

class RandomSourceBase;
struct Tunables;

// Set goal the setter would choose with two touches taken
GoalType predictSetGoal(const WorldState& world, const Player& setter,
                        const Tunables& tunables, RandomSourceBase* rng);

// Ball destination for a set goal, on the setting team's side unless it
// is a dump or a freeball over the net
Vec2 setTargetFor(GoalType goal, TeamSide team, const CourtModel& court);

// Launches the serve from PRE_SERVE: serve contact, then a lane draw and an
// in/out draw. Returns the derived events (empty outside PRE_SERVE).
std::vector<RallyEvent> launchServe(WorldState& world, const Tunables& tunables,
                                    RandomSourceBase& rng);

// Advances the ball by dt seconds. Before the serve the ball follows the
// server. In flight it detects the net crossing, the next contact and a
// dead-ball landing, reducing the rally state for each derived event.
std::vector<RallyEvent> stepBall(WorldState& world, const Tunables& tunables,
                                 RandomSourceBase* rng, double dt);

} // namespace vb
