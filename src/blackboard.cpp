#include "vb/blackboard.h"
#include "vb/rotation.h"
#include "vb/world_state.h"

namespace vb {

AttackLane laneForX(double x) {
    if (x < 0.4) return AttackLane::LEFT;
    if (x > 0.6) return AttackLane::RIGHT;
    return AttackLane::MIDDLE;
}

Blackboard buildBlackboard(const WorldState& world, TeamSide team,
                           const GoalOverride& teamOverride) {
    Blackboard bb;
    const RallyState& rally = world.rally;
    const BallState& ball = world.ball;

    bb.phase = rally.phase;
    bb.team = team;
    bb.touchCount = rally.touchesFor(team);
    bb.ballOnOurSide = world.court.sideOf(ball.position) == team;
    bb.ballPosition = ball.position;
    bb.ballVelocity = ball.velocity;
    bb.predictedLanding = ball.predictedLanding;
    bb.ballInFlight = ball.inFlight;
    bb.rotation = rally.rotation(team);
    bb.hitterMode = hitterMode(bb.rotation);
    bb.isOurServe = rally.serving == team;
    bb.opponentAttackLane = laneForX(ball.predictedLanding.x);
    bb.override = teamOverride;
    bb.netY = world.court.netY;

    RotationResponsibilities resp = buildRotationResponsibilities(bb.rotation, lineupFor(world, team));
    bb.frontRowPlayers = resp.frontRowPlayers;

    Role server = serverRole(bb.rotation);
    for (const auto& p : world.players) {
        if (p.team != team) continue;
        if (p.role == Role::S) bb.setterId = p.id;
        if (p.role == server) bb.serverId = p.id;
    }
    return bb;
}

} // namespace vb
