#pragma once

#include "vb/ball_state.h"
#include "vb/blackboard.h"
#include "vb/court.h"
#include <vector>

namespace vb {

struct MovementConfig {
    double collisionRadius = 0.05;
    double separationStrength = 1.2;
    double maxSeparationPerStep = 0.03;
    double velocitySmoothing = 0.18;    // lower is smoother
    double momentum = 0.3;              // share of the current heading kept
    double netBuffer = 0.03;
    double netCloseBuffer = 0.012;
    double arrivalThreshold = 0.025;
    double deadzoneThreshold = 0.006;
    double slowdownZone = 3.5;          // multiple of arrivalThreshold
    double anticipationWeight = 0.4;
    double lookAheadMs = 300.0;
};

struct ApproachPath {
    bool hasApproach = false;
    Vec2 waypoint{};
    Vec2 finalTarget{};
    double angleDeg = 0.0;
};

// Angled run-in behind the attack point for approach goals
ApproachPath approachPathFor(const Player& player, Vec2 target, GoalType goal,
                             const CourtModel& court);

// Waypoint until the player is close to it or to the final target
Vec2 approachTarget(const Player& player, const ApproachPath& path);

// Where the ball will be lookAheadMs from now. False if it is not in flight.
bool predictBallIntercept(const BallState& ball, const MovementConfig& config, Vec2& out);

// Goals that lean toward the predicted ball
bool isAnticipationGoal(GoalType goal);

// Keeps a point on the player's half, off the net by the configured buffer
Vec2 clampToTeamSide(const CourtModel& court, const Player& player, Vec2 point,
                     bool allowNetProximity, const MovementConfig& config);

// Moves every active player toward its current goal over dt seconds.
// Inactive players are left alone. An invalid dt returns the input unchanged.
std::vector<Player> stepMovement(const std::vector<Player>& players,
                                 const Blackboard& home, const Blackboard& away,
                                 const CourtModel& court, const BallState& ball, double dt,
                                 const MovementConfig& config = {});

} // namespace vb
