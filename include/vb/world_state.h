#pragma once

#include "vb/ball_state.h"
#include "vb/court.h"
#include "vb/player.h"
#include "vb/rally_state.h"
#include "vb/rotation.h"
#include <map>
#include <string>
#include <vector>

namespace vb {

constexpr double DEFAULT_TICK_MS = 1000.0 / 60.0;

class WorldState {
public:
    int tick = 0;
    double timeMs = 0.0;
    CourtModel court;
    std::vector<Player> players;    // evaluation order
    BallState ball;
    RallyState rally;

    // Player lookup by id, throws std::out_of_range
    Player& getPlayer(const std::string& id);
    const Player& getPlayer(const std::string& id) const;

    // nullptr if no such player
    Player* findPlayer(const std::string& id);
    const Player* findPlayer(const std::string& id) const;

    std::vector<Player> teamPlayers(TeamSide side) const;
    std::vector<Player> activePlayers() const;

    template<typename F>
    void forEachActive(TeamSide side, F&& func) const {
        for (const auto& p : players) {
            if (p.active && p.team == side) func(p);
        }
    }

    void advanceTick(double dtMs = DEFAULT_TICK_MS) {
        ++tick;
        timeMs += dtMs;
    }

    // Independent deep copy (used for dry runs and snapshots)
    WorldState clone() const { return *this; }

    bool operator==(const WorldState& o) const;
    bool operator!=(const WorldState& o) const { return !(*this == o); }
};

// Custom starting positions keyed by player id
using PlayerLayout = std::map<std::string, Vec2>;

struct WorldConfig {
    CourtModel court;
    int homeRotation = 1;
    int awayRotation = 1;
    TeamSide serving = TeamSide::HOME;
    bool useLibero = true;
    PlayerLayout layout;
    std::vector<Player> players;    // used as-is when non-empty
};

// Seven players per side in serving order plus the libero. Positions are
// zone anchors for the rotation, mirrored for AWAY.
std::vector<Player> createDefaultPlayers(int homeRotation, int awayRotation,
                                         const PlayerLayout& layout = {},
                                         bool useLibero = true);

WorldState createWorldState(const WorldConfig& config = {});

// Benches the team's back-row middle in favour of the libero for the
// current rotation. No-op if the team has no libero.
void applyLiberoSubstitution(WorldState& world, TeamSide team);

// Role -> player id map for one side
std::vector<RoleAssignment> lineupFor(const WorldState& world, TeamSide team);

} // namespace vb
