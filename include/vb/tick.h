#pragma once

#include "vb/decision_trace.h"
#include "vb/intent.h"
#include "vb/rally_state.h"
#include "vb/world_state.h"
#include <functional>
#include <vector>

namespace vb {

class RandomSourceBase;
struct Tunables;

struct StepOptions {
    bool commit = true;
    double dt = 1.0 / 60.0;                 // seconds
    std::vector<Intent> humanIntents;       // replace AI intents of the same actor
    GoalOverride homeOverride;              // scripted team-level overrides
    GoalOverride awayOverride;
    const Tunables* tunables = nullptr;     // nullptr uses the defaults
    RandomSourceBase* rng = nullptr;        // nullptr disables random draws
};

struct TickResult {
    WorldState nextWorld;
    std::vector<Intent> intents;
    std::vector<DecisionTrace> traces;
    std::vector<RallyEvent> events;
};

// Evaluates every active player's tree, resolves the intents into movement
// and ball flight, and reduces the derived rally events. The input world is
// never modified. With commit=false the random source is not drawn from.
TickResult stepTick(const WorldState& world, const StepOptions& options = {});

TickResult dryRunTick(const WorldState& world, StepOptions options = {});

using WorldPredicate = std::function<bool(const WorldState&)>;

struct SimulateResult {
    WorldState finalWorld;
    int ticksRun = 0;
    std::vector<DecisionTrace> traces;      // from the last tick run
    std::vector<RallyEvent> events;         // every event over the run
};

// Steps (always committing) until the predicate holds or maxTicks have run.
// A predicate already true on entry returns the world unchanged with ticksRun 0.
SimulateResult simulateUntil(const WorldState& world, const WorldPredicate& predicate,
                             int maxTicks = 1000, StepOptions options = {});

} // namespace vb
