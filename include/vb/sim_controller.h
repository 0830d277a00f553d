#pragma once

#include "vb/random_source.h"
#include "vb/tick.h"
#include "vb/tunables.h"
#include "vb/world_state.h"
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace vb {

struct Snapshot {
    std::string id;             // "snap-1", "snap-2", ...
    double timestamp = 0.0;     // wall clock, ms since epoch
    std::string label;
    WorldState world;
    std::string rngState;       // controller random stream at capture
};

enum class SimEventType : uint8_t { PAUSE, RESUME, TICK, SERVE, SNAPSHOT, RALLY_END };

const char* toString(SimEventType type);

struct SimEvent {
    SimEventType type = SimEventType::TICK;
    int tick = 0;
    std::string snapshotId;     // SNAPSHOT only
};

using SimListener = std::function<void(const SimEvent&)>;

struct SimControllerConfig {
    WorldConfig world;
    Tunables tunables;
    uint32_t seed = 0;
    RandomSourceBase* rng = nullptr;    // not owned; a seeded RandomSource is created when null
};

// Owner of the single committed world. Every returned world is a copy.
class SimController {
public:
    explicit SimController(const SimControllerConfig& config = {});

    // --- Run state ---
    void pause();
    void resume();
    void togglePause();
    bool isPaused() const { return paused_; }

    // --- Ticking ---
    // Controller tunables, rng and team overrides fill the options
    TickResult step();
    TickResult step(StepOptions options);
    TickResult dryRun(StepOptions options = {}) const;
    SimulateResult simulateUntil(const WorldPredicate& predicate, int maxTicks = 1000);

    // --- Human edits (bypass the trees). Unknown ids throw std::out_of_range. ---
    void movePlayer(const std::string& playerId, Vec2 position);
    void setPlayerGoal(const std::string& playerId, GoalType goal);
    void setPlayerGoal(const std::string& playerId, const std::string& goalLabel);
    void clearPlayerGoal(const std::string& playerId);
    void setBallPosition(Vec2 position);
    void setPhase(RallyPhase phase);
    void setRotation(TeamSide team, int rotation);     // throws std::invalid_argument
    void applyEdit(const std::function<void(WorldState&)>& edit);

    // Scripted team-level override, re-read every tick
    void setTeamOverride(TeamSide team, const std::string& goalLabel);
    void clearTeamOverride(TeamSide team);

    // --- Rally control ---
    // False (and no change) outside PRE_SERVE
    bool serve();
    void resetRally();
    void resetRally(TeamSide serving);
    void reset();

    // --- Snapshots ---
    Snapshot createSnapshot(const std::string& label = "");
    // Rewinds the random stream along with the world, so replays repeat
    bool restoreSnapshot(const std::string& id);
    void restoreSnapshot(const Snapshot& snapshot);
    const std::vector<Snapshot>& getSnapshots() const { return snapshots_; }
    void clearSnapshots() { snapshots_.clear(); }

    // --- Serialization ---
    std::string exportState() const;
    // Throws StateFormatError and leaves the committed world untouched
    void importState(const std::string& text);

    // --- Events ---
    int subscribe(SimListener listener);
    bool unsubscribe(int handle);

    // --- Queries ---
    const WorldState& getWorld() const { return world_; }
    RallyPhase getPhase() const { return world_.rally.phase; }
    std::pair<int, int> getScore() const { return {world_.rally.homeScore, world_.rally.awayScore}; }
    int getRotation(TeamSide team) const { return world_.rally.rotation(team); }
    const Player& getPlayer(const std::string& id) const { return world_.getPlayer(id); }
    std::vector<Player> getTeamPlayers(TeamSide team) const { return world_.teamPlayers(team); }
    std::vector<Player> getActivePlayers() const { return world_.activePlayers(); }
    Vec2 getBallPosition() const { return world_.ball.position; }
    const Tunables& getTunables() const { return tunables_; }
    void setTunables(const Tunables& tunables) { tunables_ = tunables; }

private:
    SimControllerConfig config_;
    WorldState world_;
    Tunables tunables_;
    std::unique_ptr<RandomSource> ownedRng_;
    RandomSourceBase* rng_;
    bool paused_ = true;

    std::vector<Snapshot> snapshots_;
    int nextSnapshot_ = 1;

    std::vector<std::pair<int, SimListener>> listeners_;
    int nextHandle_ = 1;

    GoalOverride homeOverride_;
    GoalOverride awayOverride_;

    void emit(SimEventType type, const std::string& snapshotId = "");
    void fillOptions(StepOptions& options) const;
    void resetPositions();
};

} // namespace vb
