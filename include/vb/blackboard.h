#pragma once

#include "vb/enums.h"
#include "vb/player.h"
#include "vb/vec2.h"
#include <string>
#include <vector>

namespace vb {

class WorldState;
class RandomSourceBase;
struct Tunables;

// Read-only team view of the world for one tick
struct Blackboard {
    RallyPhase phase = RallyPhase::PRE_SERVE;
    TeamSide team = TeamSide::HOME;
    int touchCount = 0;             // this team's touches on the current possession
    bool ballOnOurSide = false;
    Vec2 ballPosition{};
    Vec2 ballVelocity{};
    Vec2 predictedLanding{};
    bool ballInFlight = false;
    int rotation = 1;
    std::vector<std::string> frontRowPlayers;
    HitterMode hitterMode = HitterMode::THREE_HITTER;
    std::string setterId;
    std::string serverId;
    bool isOurServe = false;
    AttackLane opponentAttackLane = AttackLane::MIDDLE;
    GoalOverride override;          // scripted team-level override
    double netY = 0.5;
};

// Everything a tree node may read
struct BtContext {
    const Blackboard& bb;
    const Player& self;
    const std::vector<Player>& players;     // active players, both teams
    const Tunables& tunables;
    RandomSourceBase* rng;                  // nullptr disables random draws
    double timeMs;
};

Blackboard buildBlackboard(const WorldState& world, TeamSide team,
                           const GoalOverride& teamOverride = {});

// Landing x < 0.4 is LEFT, > 0.6 RIGHT
AttackLane laneForX(double x);

} // namespace vb
