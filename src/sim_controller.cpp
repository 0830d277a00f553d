#include "vb/sim_controller.h"
#include "vb/ball_handler.h"
#include "vb/rally_fsm.h"
#include "vb/serialization.h"
#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>

namespace vb {

const char* toString(SimEventType type) {
    switch (type) {
        case SimEventType::PAUSE: return "pause";
        case SimEventType::RESUME: return "resume";
        case SimEventType::TICK: return "tick";
        case SimEventType::SERVE: return "serve";
        case SimEventType::SNAPSHOT: return "snapshot";
        case SimEventType::RALLY_END: return "rally_end";
    }
    return "unknown";
}

SimController::SimController(const SimControllerConfig& config)
    : config_(config),
      world_(createWorldState(config.world)),
      tunables_(config.tunables),
      rng_(config.rng) {
    if (!rng_) {
        ownedRng_ = std::make_unique<RandomSource>(config.seed);
        rng_ = ownedRng_.get();
    }
}

void SimController::emit(SimEventType type, const std::string& snapshotId) {
    SimEvent e{type, world_.tick, snapshotId};
    // Listeners may unsubscribe while being notified
    auto listeners = listeners_;
    for (const auto& l : listeners) l.second(e);
}

// --- Run state ---

void SimController::pause() {
    if (paused_) return;
    paused_ = true;
    emit(SimEventType::PAUSE);
}

void SimController::resume() {
    if (!paused_) return;
    paused_ = false;
    emit(SimEventType::RESUME);
}

void SimController::togglePause() {
    if (paused_) resume();
    else pause();
}

// --- Ticking ---

void SimController::fillOptions(StepOptions& options) const {
    if (!options.tunables) options.tunables = &tunables_;
    if (!options.rng) options.rng = rng_;
    if (!options.homeOverride.active) options.homeOverride = homeOverride_;
    if (!options.awayOverride.active) options.awayOverride = awayOverride_;
}

TickResult SimController::step() {
    return step(StepOptions{});
}

TickResult SimController::step(StepOptions options) {
    fillOptions(options);
    bool wasOver = isRallyOver(world_.rally);
    TickResult result = stepTick(world_, options);
    if (!options.commit) return result;

    world_ = result.nextWorld;
    emit(SimEventType::TICK);
    if (!wasOver && isRallyOver(world_.rally)) emit(SimEventType::RALLY_END);
    return result;
}

TickResult SimController::dryRun(StepOptions options) const {
    fillOptions(options);
    return dryRunTick(world_, options);
}

SimulateResult SimController::simulateUntil(const WorldPredicate& predicate, int maxTicks) {
    StepOptions options;
    fillOptions(options);
    bool wasOver = isRallyOver(world_.rally);
    SimulateResult result = vb::simulateUntil(world_, predicate, maxTicks, options);
    if (result.ticksRun == 0) return result;

    world_ = result.finalWorld;
    emit(SimEventType::TICK);
    if (!wasOver && isRallyOver(world_.rally)) emit(SimEventType::RALLY_END);
    return result;
}

// --- Human edits ---

void SimController::movePlayer(const std::string& playerId, Vec2 position) {
    Player& p = world_.getPlayer(playerId);
    p.position = world_.court.clamp(position);
    p.velocity = {};
}

void SimController::setPlayerGoal(const std::string& playerId, GoalType goal) {
    setPlayerGoal(playerId, std::string(toString(goal)));
}

void SimController::setPlayerGoal(const std::string& playerId, const std::string& goalLabel) {
    Player& p = world_.getPlayer(playerId);
    p.override.active = true;
    p.override.goal = goalLabel;
}

void SimController::clearPlayerGoal(const std::string& playerId) {
    Player& p = world_.getPlayer(playerId);
    p.override = GoalOverride{};
    p.hasRequestedGoal = false;
}

void SimController::setBallPosition(Vec2 position) {
    BallState& ball = world_.ball;
    ball.position = world_.court.clamp(position);
    ball.flightOrigin = ball.position;
    ball.velocity = {};
    ball.inFlight = false;
    ball.crossedNet = false;
    ball.side = world_.court.sideOf(ball.position);
}

void SimController::setPhase(RallyPhase phase) {
    world_.rally.phase = phase;
}

void SimController::setRotation(TeamSide team, int rotation) {
    if (!isValidRotation(rotation)) {
        throw std::invalid_argument("rotation must be 1-6, got " + std::to_string(rotation));
    }
    world_.rally.setRotation(team, rotation);
    applyLiberoSubstitution(world_, team);
}

void SimController::applyEdit(const std::function<void(WorldState&)>& edit) {
    edit(world_);
}

void SimController::setTeamOverride(TeamSide team, const std::string& goalLabel) {
    GoalOverride& o = team == TeamSide::HOME ? homeOverride_ : awayOverride_;
    o.active = true;
    o.goal = goalLabel;
}

void SimController::clearTeamOverride(TeamSide team) {
    GoalOverride& o = team == TeamSide::HOME ? homeOverride_ : awayOverride_;
    o = GoalOverride{};
}

// --- Rally control ---

bool SimController::serve() {
    if (world_.rally.phase != RallyPhase::PRE_SERVE) return false;
    launchServe(world_, tunables_, *rng_);
    emit(SimEventType::SERVE);
    return true;
}

void SimController::resetPositions() {
    std::vector<Player> defaults = createDefaultPlayers(
        world_.rally.homeRotation, world_.rally.awayRotation,
        config_.world.layout, config_.world.useLibero);
    for (auto& p : world_.players) {
        p.velocity = {};
        p.hasRequestedGoal = false;
        for (const auto& d : defaults) {
            if (d.id != p.id) continue;
            p.position = d.position;
            p.active = d.active;
        }
    }
}

void SimController::resetRally() {
    resetRally(world_.rally.serving);
}

void SimController::resetRally(TeamSide serving) {
    world_.rally = reduceRally(world_.rally, RallyEvent::startRally(serving));
    world_.ball = BallState::atServe(serving);
    resetPositions();
}

void SimController::reset() {
    world_ = createWorldState(config_.world);
    homeOverride_ = GoalOverride{};
    awayOverride_ = GoalOverride{};
}

// --- Snapshots ---

Snapshot SimController::createSnapshot(const std::string& label) {
    using namespace std::chrono;
    Snapshot snap;
    snap.id = "snap-" + std::to_string(nextSnapshot_++);
    snap.timestamp = static_cast<double>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    snap.label = label.empty() ? "Tick " + std::to_string(world_.tick) : label;
    snap.world = world_.clone();
    snap.rngState = rng_->saveState();
    snapshots_.push_back(snap);
    emit(SimEventType::SNAPSHOT, snap.id);
    return snap;
}

bool SimController::restoreSnapshot(const std::string& id) {
    auto it = std::find_if(snapshots_.begin(), snapshots_.end(),
                           [&id](const Snapshot& s) { return s.id == id; });
    if (it == snapshots_.end()) return false;
    restoreSnapshot(*it);
    return true;
}

void SimController::restoreSnapshot(const Snapshot& snapshot) {
    if (!snapshot.rngState.empty()) rng_->restoreState(snapshot.rngState);
    world_ = snapshot.world.clone();
}

// --- Serialization ---

std::string SimController::exportState() const {
    return serializeWorldState(world_);
}

void SimController::importState(const std::string& text) {
    WorldState imported = deserializeWorldState(text);
    world_ = std::move(imported);
}

// --- Events ---

int SimController::subscribe(SimListener listener) {
    int handle = nextHandle_++;
    listeners_.emplace_back(handle, std::move(listener));
    return handle;
}

bool SimController::unsubscribe(int handle) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [handle](const std::pair<int, SimListener>& l) { return l.first == handle; });
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

} // namespace vb
