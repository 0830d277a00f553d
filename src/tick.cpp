#include "vb/tick.h"
#include "vb/ball_handler.h"
#include "vb/blackboard.h"
#include "vb/movement.h"
#include "vb/rationale.h"
#include "vb/role_trees.h"
#include "vb/tunables.h"
#include <cmath>
#include <set>

namespace vb {

namespace {

struct Evaluation {
    std::vector<Intent> intents;
    std::vector<DecisionTrace> traces;
};

Evaluation evaluatePlayers(const WorldState& world, const Blackboard& home,
                           const Blackboard& away, const Tunables& tunables,
                           RandomSourceBase* rng) {
    Evaluation out;
    std::vector<Player> active = world.activePlayers();
    int counter = 0;

    for (const auto& self : active) {
        const Blackboard& bb = self.team == TeamSide::HOME ? home : away;
        BtContext ctx{bb, self, active, tunables, rng, world.timeMs};
        BtResult result = evaluate(treeFor(self, bb), ctx);

        for (auto& intent : result.intents) {
            intent.id = "i-" + std::to_string(world.tick) + "-" + std::to_string(counter++);
            intent.rationale = explainIntent(intent, bb, self);
        }
        out.traces.push_back(makeDecisionTrace(self.id, world.tick, world.timeMs, bb.phase, result));
        for (auto& intent : result.intents) out.intents.push_back(std::move(intent));
    }
    return out;
}

// Goal requests feed the movement system; move and stay intents pin the player
std::set<std::string> applyIntents(WorldState& world, const std::vector<Intent>& intents) {
    std::set<std::string> pinned;
    for (auto& p : world.players) p.hasRequestedGoal = false;

    for (auto& p : world.players) {
        if (!p.active) continue;
        const Intent* best = bestIntentForActor(intents, p.id);
        if (!best) continue;
        switch (best->action) {
            case IntentAction::REQUEST_GOAL:
                p.hasRequestedGoal = true;
                p.requestedGoal = best->goal;
                break;
            case IntentAction::MOVE_TO:
                p.position = world.court.clamp(best->target);
                p.velocity = {};
                pinned.insert(p.id);
                break;
            case IntentAction::STAY_IN_PLACE:
                p.velocity = {};
                pinned.insert(p.id);
                break;
        }
    }
    return pinned;
}

} // anonymous namespace

TickResult stepTick(const WorldState& world, const StepOptions& options) {
    Tunables defaults;
    const Tunables& tunables = options.tunables ? *options.tunables : defaults;
    RandomSourceBase* rng = options.commit ? options.rng : nullptr;
    double dt = std::isfinite(options.dt) && options.dt > 0.0 ? options.dt : 1.0 / 60.0;

    TickResult result{world.clone(), {}, {}, {}};
    WorldState& next = result.nextWorld;

    // --- Decide ---
    Blackboard home = buildBlackboard(world, TeamSide::HOME, options.homeOverride);
    Blackboard away = buildBlackboard(world, TeamSide::AWAY, options.awayOverride);
    Evaluation eval = evaluatePlayers(world, home, away, tunables, rng);
    result.traces = std::move(eval.traces);
    result.intents = mergeIntents(eval.intents, options.humanIntents);

    // --- Resolve ---
    std::set<std::string> pinned = applyIntents(next, result.intents);

    std::vector<Player> moved = stepMovement(next.players, home, away, next.court, next.ball, dt);
    for (size_t i = 0; i < moved.size() && i < next.players.size(); ++i) {
        if (pinned.count(next.players[i].id)) continue;
        next.players[i].position = moved[i].position;
        next.players[i].velocity = moved[i].velocity;
    }

    int homeRotation = next.rally.homeRotation;
    int awayRotation = next.rally.awayRotation;
    result.events = stepBall(next, tunables, rng, dt);

    if (next.rally.homeRotation != homeRotation) applyLiberoSubstitution(next, TeamSide::HOME);
    if (next.rally.awayRotation != awayRotation) applyLiberoSubstitution(next, TeamSide::AWAY);

    next.advanceTick(dt * 1000.0);
    return result;
}

TickResult dryRunTick(const WorldState& world, StepOptions options) {
    options.commit = false;
    return stepTick(world, options);
}

SimulateResult simulateUntil(const WorldState& world, const WorldPredicate& predicate,
                             int maxTicks, StepOptions options) {
    options.commit = true;
    SimulateResult out{world.clone(), 0, {}, {}};

    while (out.ticksRun < maxTicks && !predicate(out.finalWorld)) {
        TickResult r = stepTick(out.finalWorld, options);
        out.finalWorld = std::move(r.nextWorld);
        out.traces = std::move(r.traces);
        out.events.insert(out.events.end(), r.events.begin(), r.events.end());
        ++out.ticksRun;
    }
    return out;
}

} // namespace vb
