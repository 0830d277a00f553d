#include "vb/movement.h"
#include "vb/goal_resolver.h"
#include <cmath>
#include <map>
#include <string>

namespace vb {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double APPROACH_DISTANCE = 0.12;

Vec2 arrivalVelocity(Vec2 current, Vec2 target, Vec2 velocity, double maxSpeed,
                     double speedFactor, const MovementConfig& config) {
    Vec2 toTarget = target - current;
    double distance = toTarget.length();
    if (distance < config.deadzoneThreshold) return {};

    Vec2 direction = toTarget.normalized();
    double slowdown = config.arrivalThreshold * config.slowdownZone;
    double factor = 1.0;
    if (distance < slowdown) {
        double t = distance / slowdown;
        factor = std::max(0.15, t * t);
    }
    double speed = maxSpeed * speedFactor * factor;

    if (velocity.length() > 0.001) {
        Vec2 heading = velocity.normalized();
        Vec2 blended = (direction * (1.0 - config.momentum) + heading * config.momentum).normalized();
        return blended * speed;
    }
    return direction * speed;
}

Vec2 collisionAvoidance(const Player& self, const std::vector<Player>& others, Vec2 desired,
                        const MovementConfig& config) {
    Vec2 avoidance{};
    double r = config.collisionRadius;
    for (const auto& other : others) {
        if (other.id == self.id || !other.active || other.team != self.team) continue;

        Vec2 diff = self.position - other.position;
        double dist = diff.length();
        if (dist >= r * 2.5 || dist <= 0.001) continue;

        Vec2 away = diff.normalized();
        if (dist < r) {
            // Lower priority value holds its ground
            double strength = self.priority < other.priority ? 0.3 : 0.7;
            avoidance = avoidance + away * ((r - dist) * strength * 2.0);
            continue;
        }

        double closing = -(desired - other.velocity).dot(away);
        if (closing <= 0.0) continue;
        double ttc = (dist - r) / std::max(0.01, closing);
        if (ttc > 0.5) continue;

        Vec2 perp{-away.y, away.x};
        Vec2 steer = desired.dot(perp) >= 0.0 ? perp : perp * -1.0;
        double urgency = std::min(1.0, closing / 0.3) * std::max(0.0, 1.0 - ttc);
        double priorityFactor = self.priority > other.priority ? 1.2 : 0.6;
        avoidance = avoidance + steer * (urgency * priorityFactor * 0.08);
    }
    return avoidance;
}

} // anonymous namespace

ApproachPath approachPathFor(const Player& player, Vec2 target, GoalType goal,
                             const CourtModel& court) {
    ApproachPath path;
    path.finalTarget = target;
    if (!isApproachGoal(goal)) return path;

    bool home = player.team == TeamSide::HOME;
    double angle;
    if (goal == GoalType::ApproachAttackLeft) angle = home ? 25.0 : -25.0;
    else if (goal == GoalType::ApproachAttackRight) angle = home ? -25.0 : 25.0;
    else angle = player.position.x < 0.5 ? 15.0 : -15.0;

    // Start the run from behind the attack point, away from the net
    double awayFromNet = home ? 1.0 : -1.0;
    Vec2 waypoint{target.x - std::sin(angle * PI / 180.0) * APPROACH_DISTANCE,
                  target.y + awayFromNet * APPROACH_DISTANCE};

    path.hasApproach = true;
    path.waypoint = court.clamp(waypoint);
    path.angleDeg = angle;
    return path;
}

Vec2 approachTarget(const Player& player, const ApproachPath& path) {
    if (!path.hasApproach) return path.finalTarget;
    if (player.position.distanceTo(path.waypoint) < 0.04 ||
        player.position.distanceTo(path.finalTarget) < 0.08) {
        return path.finalTarget;
    }
    return path.waypoint;
}

bool predictBallIntercept(const BallState& ball, const MovementConfig& config, Vec2& out) {
    if (!ball.inFlight) return false;

    double remaining = ball.position.distanceTo(ball.predictedLanding);
    double speed = ball.velocity.length();
    if (speed <= 1e-9 || remaining <= 1e-9) {
        out = ball.predictedLanding;
        return true;
    }
    double timeToLandingMs = remaining / speed * 1000.0;
    double ratio = std::min(1.0, config.lookAheadMs / timeToLandingMs);
    out = lerp(ball.position, ball.predictedLanding, ratio);
    return true;
}

bool isAnticipationGoal(GoalType goal) {
    switch (goal) {
        case GoalType::ReceiveServe:
        case GoalType::DefendZoneBiasRightBack:
        case GoalType::DefendZoneBiasMiddleBack:
        case GoalType::DefendZoneBiasLeftBack:
        case GoalType::CoverHitter:
        case GoalType::BlockMiddle:
        case GoalType::BlockLeftSide:
        case GoalType::BlockRightSide:
            return true;
        default:
            return false;
    }
}

Vec2 clampToTeamSide(const CourtModel& court, const Player& player, Vec2 point,
                     bool allowNetProximity, const MovementConfig& config) {
    double buffer = allowNetProximity ? config.netCloseBuffer : config.netBuffer;
    if (player.team == TeamSide::HOME) {
        return {point.x, std::max(point.y, court.netY + buffer)};
    }
    return {point.x, std::min(point.y, court.netY - buffer)};
}

std::vector<Player> stepMovement(const std::vector<Player>& players,
                                 const Blackboard& home, const Blackboard& away,
                                 const CourtModel& court, const BallState& ball, double dt,
                                 const MovementConfig& config) {
    if (!std::isfinite(dt) || dt <= 0.0 || dt > 1.0) return players;

    std::vector<Player> next = players;
    Vec2 predicted{};
    bool hasPrediction = predictBallIntercept(ball, config, predicted);

    std::map<std::string, Vec2> desired;
    std::map<std::string, bool> allowNet;

    for (const auto& p : next) {
        if (!p.active) continue;
        const Blackboard& bb = p.team == TeamSide::HOME ? home : away;
        GoalType goal = p.currentGoal();
        GoalResolution resolved = resolveGoal(goal, p, bb, court);

        Vec2 target = approachTarget(p, approachPathFor(p, resolved.target, goal, court));
        if (hasPrediction && isAnticipationGoal(goal)) {
            double w = config.anticipationWeight;
            target = target * (1.0 - w) + predicted * w;
        }
        target = clampToTeamSide(court, p, target, resolved.allowNetProximity, config);

        allowNet[p.id] = resolved.allowNetProximity;
        desired[p.id] = arrivalVelocity(p.position, target, p.velocity, p.maxSpeed,
                                        resolved.desiredSpeedFactor, config);
    }

    std::map<std::string, Vec2> avoidance;
    for (const auto& p : next) {
        if (!p.active) continue;
        avoidance[p.id] = collisionAvoidance(p, next, desired[p.id], config);
    }

    for (auto& p : next) {
        if (!p.active) continue;
        Vec2 combined = desired[p.id] + avoidance[p.id] * config.separationStrength;
        Vec2 blended = p.velocity * (1.0 - config.velocitySmoothing) +
                       combined * config.velocitySmoothing;

        double maxAllowed = p.maxSpeed * 1.3;
        if (blended.length() > maxAllowed) blended = blended.normalized() * maxAllowed;
        p.velocity = blended.length() < 0.0008 ? Vec2{} : blended;

        Vec2 moved = p.position + p.velocity * dt;
        p.position = court.clamp(clampToTeamSide(court, p, moved, allowNet[p.id], config));
    }
    return next;
}

} // namespace vb
