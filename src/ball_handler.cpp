#include "vb/ball_handler.h"
#include "vb/conditions.h"
#include "vb/goal_resolver.h"
#include "vb/rally_fsm.h"
#include "vb/random_source.h"
#include "vb/role_trees.h"
#include "vb/rotation.h"
#include "vb/tunables.h"
#include <cmath>
#include <limits>

namespace vb {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double CONTACT_PROGRESS = 0.75;
constexpr double SERVE_DEPTH = 0.36;      // from the net on the receiving side
constexpr double ATTACK_DEPTH = 0.36;
constexpr double TIP_DEPTH = 0.1;
constexpr double OUT_Y = 0.98;

void apply(WorldState& world, const RallyEvent& e, std::vector<RallyEvent>& events) {
    world.rally = reduceRally(world.rally, e);
    events.push_back(e);
}

void launch(BallState& ball, Vec2 target, double seconds) {
    double dist = ball.position.distanceTo(target);
    double speed = dist / std::max(0.05, seconds);
    ball.flightOrigin = ball.position;
    ball.predictedLanding = target;
    ball.velocity = (target - ball.position).normalized() * speed;
    ball.inFlight = true;
    ball.crossedNet = false;
}

void stopBall(BallState& ball) {
    ball.velocity = {};
    ball.inFlight = false;
}

const Player* findActive(const WorldState& world, TeamSide team, RoleCategory category) {
    for (const auto& p : world.players) {
        if (p.active && p.team == team && p.category == category) return &p;
    }
    return nullptr;
}

// Nearest active player of `team` within radius of the ball, excluding the
// player who made the previous contact
const Player* findContactor(const WorldState& world, TeamSide team, double radius) {
    const Player* best = nullptr;
    double bestDist = std::numeric_limits<double>::infinity();
    const RallyState& rally = world.rally;
    for (const auto& p : world.players) {
        if (!p.active || p.team != team) continue;
        if (rally.hasLastContact && rally.lastContact.playerId == p.id) continue;
        double d = p.position.distanceTo(world.ball.position);
        if (d <= radius && d < bestDist) {
            best = &p;
            bestDist = d;
        }
    }
    return best;
}

double flightProgress(const BallState& ball) {
    double total = ball.flightOrigin.distanceTo(ball.predictedLanding);
    if (total < 1e-9) return 1.0;
    return 1.0 - ball.position.distanceTo(ball.predictedLanding) / total;
}

Vec2 keepOnSide(const CourtModel& court, TeamSide team, Vec2 p) {
    double margin = 0.02;
    if (team == TeamSide::HOME) p.y = std::max(p.y, court.netY + margin);
    else p.y = std::min(p.y, court.netY - margin);
    return court.clamp(p);
}

struct ContactPlan {
    Vec2 target{};
    double seconds = 1.0;
    ContactQuality quality = ContactQuality::GOOD;
};

ContactPlan planPass(const WorldState& world, const Player& contactor,
                     const Tunables& tunables, RandomSourceBase* rng) {
    ContactPlan plan;
    TeamSide team = contactor.team;
    Vec2 target = settingZonePoint(world.court, team);

    if (rng) {
        const PassVariance& v = tunables.skills.pass.forSkill(contactor.skills.passing.accuracy);
        if (rng->uniform() > v.withinTarget) {
            double angle = rng->uniform() * 2.0 * PI;
            double miss = v.radius / 60.0;
            target = target + Vec2{std::cos(angle), std::sin(angle)} * miss;
        }
    }
    plan.target = keepOnSide(world.court, team, target);
    plan.seconds = tunables.timing.passToSet.mid();

    const Player* setter = findActive(world, team, RoleCategory::SETTER);
    Vec2 setterPos = setter && setter->id != contactor.id
        ? setter->position : settingZonePoint(world.court, team);
    plan.quality = assessPassQuality(plan.target, setterPos, team);
    return plan;
}

ContactPlan planSet(const WorldState& world, const Player& contactor,
                    const Tunables& tunables, RandomSourceBase* rng) {
    ContactPlan plan;
    TeamSide team = contactor.team;
    GoalType goal = contactor.category == RoleCategory::SETTER
        ? predictSetGoal(world, contactor, tunables, rng)
        : GoalType::HighOutOfSystemSet;
    plan.target = setTargetFor(goal, team, world.court);

    const TimingWindows& t = tunables.timing;
    switch (goal) {
        case GoalType::QuickSetMiddle:
        case GoalType::SetterDump:
            plan.seconds = t.quickSet.mid();
            break;
        case GoalType::FreeBallToTarget:
            plan.seconds = t.passToSet.mid();
            break;
        case GoalType::HighOutOfSystemSet:
        case GoalType::EmergencySet:
            plan.seconds = t.outOfSystemSet.mid();
            break;
        default:
            plan.seconds = t.highSet.mid();
            break;
    }

    // Balls sent over the net are not judged against a hitter
    if (goal == GoalType::SetterDump || goal == GoalType::FreeBallToTarget) {
        plan.quality = ContactQuality::GOOD;
        return plan;
    }

    const Player* hitter = nullptr;
    double best = std::numeric_limits<double>::infinity();
    for (const auto& p : world.players) {
        if (!p.active || p.team != team || p.id == contactor.id) continue;
        if (p.category == RoleCategory::SETTER || p.category == RoleCategory::LIBERO) continue;
        double d = p.position.distanceTo(plan.target);
        if (d < best) {
            best = d;
            hitter = &p;
        }
    }
    plan.quality = hitter
        ? assessSetQuality(plan.target, hitter->position, isApproachGoal(hitter->currentGoal()))
        : ContactQuality::POOR;
    return plan;
}

ContactPlan planAttack(const WorldState& world, const Player& contactor,
                       const Tunables& tunables, RandomSourceBase* rng) {
    ContactPlan plan;
    const CourtModel& court = world.court;
    TeamSide defending = opponent(contactor.team);

    Blackboard bb = buildBlackboard(world, contactor.team);
    std::vector<Player> active = world.activePlayers();
    BtContext ctx{bb, contactor, active, tunables, rng, world.timeMs};

    double x = std::min(std::max(1.0 - world.ball.position.x, 0.2), 0.8);
    if (isGapInBlock(ctx, AttackLane::LEFT)) x = 0.25;
    else if (isGapInBlock(ctx, AttackLane::RIGHT)) x = 0.75;

    double depth = shouldUseTipShot(ctx) ? TIP_DEPTH : ATTACK_DEPTH;
    Vec2 target = court.forTeam(defending, {x, court.netY + depth});

    if (rng) {
        const AttackVariance& v = tunables.skills.attack.forSkill(contactor.skills.attacking.consistency);
        if (rng->chance(v.errorRate)) {
            target = court.forTeam(defending, {x, OUT_Y});
        }
    }

    plan.target = target;
    plan.seconds = tunables.timing.blockReaction.max + tunables.timing.digReaction.max;
    plan.quality = assessAttackQuality(countOpponentBlockers(ctx), CourtModel::isInBounds(target));
    return plan;
}

void makeContact(WorldState& world, const Player& contactor, const Tunables& tunables,
                 RandomSourceBase* rng, std::vector<RallyEvent>& events) {
    const RallyState& rally = world.rally;
    TeamSide team = contactor.team;
    int contactNumber = rally.touchesFor(team) + 1;
    bool receivingServe = rally.phase == RallyPhase::SERVE_RECEIVE;
    bool defending = rally.phase == RallyPhase::DEFENSE_PHASE;

    RallyEvent touch = createTouchEvent(team, contactor.id, ContactQuality::GOOD, world.timeMs,
                                        contactNumber, receivingServe, defending);

    ContactPlan plan;
    switch (touch.contactType) {
        case ContactType::PASS:
        case ContactType::DIG:
        case ContactType::FREEBALL:
            plan = planPass(world, contactor, tunables, rng);
            break;
        case ContactType::SET:
            plan = planSet(world, contactor, tunables, rng);
            break;
        default:
            plan = planAttack(world, contactor, tunables, rng);
            break;
    }
    touch.quality = plan.quality;
    apply(world, touch, events);

    BallState& ball = world.ball;
    ball.hasLastTouch = true;
    ball.lastTouchTeam = team;
    ball.touchCount = world.rally.touchesFor(team);
    ball.side = team;

    if (isRallyOver(world.rally)) {
        stopBall(ball);
        return;
    }
    launch(ball, plan.target, plan.seconds);
}

} // anonymous namespace

GoalType predictSetGoal(const WorldState& world, const Player& setter,
                        const Tunables& tunables, RandomSourceBase* rng) {
    Blackboard bb = buildBlackboard(world, setter.team);
    bb.phase = RallyPhase::SET_PHASE;
    bb.touchCount = 2;
    bb.ballOnOurSide = true;

    std::vector<Player> active = world.activePlayers();
    BtContext ctx{bb, setter, active, tunables, rng, world.timeMs};
    BtResult result = evaluate(buildSetterTree(), ctx);

    for (const auto& intent : result.intents) {
        if (intent.action == IntentAction::REQUEST_GOAL && isSetGoal(intent.goal)) {
            return intent.goal;
        }
    }
    return GoalType::HighOutOfSystemSet;
}

Vec2 setTargetFor(GoalType goal, TeamSide team, const CourtModel& court) {
    switch (goal) {
        case GoalType::QuickSetMiddle:
            return middleApproachPoint(court, team);
        case GoalType::SetToOpposite:
            return rightApproachPoint(court, team);
        case GoalType::SetterDump:
            return court.forTeam(opponent(team), {0.6, court.netY + 0.12});
        case GoalType::FreeBallToTarget:
            return court.forTeam(opponent(team), {0.5, court.netY + 0.3});
        default:
            return leftApproachPoint(court, team);
    }
}

std::vector<RallyEvent> launchServe(WorldState& world, const Tunables& tunables,
                                    RandomSourceBase& rng) {
    std::vector<RallyEvent> events;
    if (world.rally.phase != RallyPhase::PRE_SERVE) return events;

    TeamSide serving = world.rally.serving;
    TeamSide receiving = opponent(serving);
    Role role = serverRole(world.rally.rotation(serving));
    const Player* server = nullptr;
    for (const auto& p : world.players) {
        if (p.team == serving && p.role == role) server = &p;
    }
    std::string serverId = server ? server->id : playerIdFor(serving, role);

    apply(world, RallyEvent::serveContact(serverId, world.timeMs), events);

    double r = rng.uniform();
    double x = r < 0.33 ? 0.25 : (r < 0.66 ? 0.5 : 0.75);
    const CourtModel& court = world.court;
    Vec2 target = court.forTeam(receiving, {x, court.netY + SERVE_DEPTH});

    double accuracy = server ? server->skills.serving.accuracy : 0.5;
    const ServeVariance& v = tunables.skills.serve.forSkill(accuracy);
    if (!rng.chance(v.inRate)) {
        target = court.forTeam(receiving, {x, OUT_Y});
    }

    BallState& ball = world.ball;
    ball.hasLastTouch = true;
    ball.lastTouchTeam = serving;
    ball.touchCount = 0;
    ball.side = serving;
    launch(ball, target, tunables.timing.serveFlight.mid());
    return events;
}

std::vector<RallyEvent> stepBall(WorldState& world, const Tunables& tunables,
                                 RandomSourceBase* rng, double dt) {
    std::vector<RallyEvent> events;
    BallState& ball = world.ball;
    const CourtModel& court = world.court;
    RallyPhase phase = world.rally.phase;

    if (phase == RallyPhase::PRE_SERVE) {
        TeamSide serving = world.rally.serving;
        Role role = serverRole(world.rally.rotation(serving));
        for (const auto& p : world.players) {
            if (p.team != serving || p.role != role) continue;
            double dy = serving == TeamSide::HOME ? 0.02 : -0.02;
            ball.position = {p.position.x - 0.02, p.position.y + dy};
        }
        ball.velocity = {};
        ball.inFlight = false;
        ball.side = serving;
        ball.flightOrigin = ball.position;
        return events;
    }
    if (phase == RallyPhase::BALL_DEAD || !ball.inFlight) return events;

    // Advance along the flight line
    double speed = ball.velocity.length();
    double remaining = ball.position.distanceTo(ball.predictedLanding);
    double step = speed * dt;
    bool landed = remaining <= step;
    if (landed) {
        ball.position = ball.predictedLanding;
    } else {
        ball.position = ball.position + (ball.predictedLanding - ball.position).normalized() * step;
    }

    TeamSide originSide = court.sideOf(ball.flightOrigin);
    TeamSide nowSide = court.sideOf(ball.position);
    if (originSide != nowSide && !ball.crossedNet) {
        ball.crossedNet = true;
        ball.touchCount = 0;
        apply(world, RallyEvent::ballCrossedNet(originSide), events);
    }
    ball.side = nowSide;

    if (flightProgress(ball) >= CONTACT_PROGRESS) {
        const Player* contactor = findContactor(world, nowSide, tunables.thresholds.contactRadius);
        if (contactor) {
            Player who = *contactor;
            makeContact(world, who, tunables, rng, events);
            return events;
        }
    }

    if (landed) {
        TerminationResult end = detectRallyTermination(true, ball.position, world.rally);
        stopBall(ball);
        if (end.terminated) {
            apply(world, RallyEvent::ballDead(end.reason, end.winner), events);
        }
    }
    return events;
}

} // namespace vb
