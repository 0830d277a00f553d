#include <gtest/gtest.h>
#include "vb/ball_handler.h"
#include "vb/conditions.h"
#include "vb/goal_resolver.h"
#include "vb/rally_fsm.h"
#include "vb/random_source.h"
#include "vb/tunables.h"

using namespace vb;

namespace {

constexpr double DT = 1.0 / 60.0;

std::vector<RallyEvent> stepUntilEvent(WorldState& world, const Tunables& tunables,
                                       RandomSourceBase* rng, int maxTicks = 600) {
    for (int i = 0; i < maxTicks; ++i) {
        std::vector<RallyEvent> events = stepBall(world, tunables, rng, DT);
        if (!events.empty()) return events;
    }
    return {};
}

void clearTeam(WorldState& world, TeamSide team, Vec2 spot) {
    for (auto& p : world.players) {
        if (p.team == team) p.position = spot;
    }
}

void expectNear(Vec2 a, Vec2 b, double tol = 1e-9) {
    EXPECT_NEAR(a.x, b.x, tol);
    EXPECT_NEAR(a.y, b.y, tol);
}

// HOME on its second touch, ball set from the setting zone to the left pin
WorldState attackScene() {
    WorldState world = createWorldState();
    world.rally.phase = RallyPhase::SET_PHASE;
    world.rally.hasLastTouch = true;
    world.rally.lastTouchTeam = TeamSide::HOME;
    world.rally.touchCount = 2;
    world.rally.hasLastContact = true;
    world.rally.lastContact.playerId = "H-S";
    world.rally.lastContact.team = TeamSide::HOME;
    world.rally.lastContact.type = ContactType::SET;

    Vec2 pin = leftApproachPoint(world.court, TeamSide::HOME);
    world.getPlayer("H-OH1").position = pin;
    world.getPlayer("H-OPP").position = {0.5, 0.9};

    BallState& ball = world.ball;
    ball.position = settingZonePoint(world.court, TeamSide::HOME);
    ball.flightOrigin = ball.position;
    ball.predictedLanding = pin;
    ball.velocity = (pin - ball.position).normalized() * 0.4;
    ball.inFlight = true;
    ball.side = TeamSide::HOME;
    return world;
}

} // anonymous namespace

TEST(BallHandler, SetTargets) {
    CourtModel court;
    expectNear(setTargetFor(GoalType::QuickSetMiddle, TeamSide::HOME, court), {0.52, 0.55});
    expectNear(setTargetFor(GoalType::SetToOpposite, TeamSide::HOME, court), {0.82, 0.56});
    expectNear(setTargetFor(GoalType::SetToOutside, TeamSide::AWAY, court), {0.22, 0.44});
    expectNear(setTargetFor(GoalType::HighOutOfSystemSet, TeamSide::HOME, court), {0.22, 0.56});
    // Over the net
    expectNear(setTargetFor(GoalType::SetterDump, TeamSide::HOME, court), {0.6, 0.38});
    expectNear(setTargetFor(GoalType::FreeBallToTarget, TeamSide::AWAY, court), {0.5, 0.8});
}

TEST(BallHandler, PredictSetGoal) {
    WorldState world = createWorldState();
    Tunables tunables;
    const Player& setter = world.getPlayer("H-S");

    world.ball.predictedLanding = settingZoneFor(TeamSide::HOME);
    EXPECT_EQ(predictSetGoal(world, setter, tunables, nullptr), GoalType::QuickSetMiddle);

    world.ball.predictedLanding = {0.2, 0.9};
    EXPECT_EQ(predictSetGoal(world, setter, tunables, nullptr), GoalType::FreeBallToTarget);
}

TEST(BallHandler, BallFollowsServer) {
    WorldState world = createWorldState();
    Tunables tunables;
    EXPECT_TRUE(stepBall(world, tunables, nullptr, DT).empty());

    const Player& server = world.getPlayer("H-S");
    expectNear(world.ball.position, {server.position.x - 0.02, server.position.y + 0.02});
    EXPECT_FALSE(world.ball.inFlight);
}

TEST(BallHandler, LaunchServe) {
    WorldState world = createWorldState();
    Tunables tunables;
    FixedRandomSource rng({0.1, 0.0});

    std::vector<RallyEvent> events = launchServe(world, tunables, rng);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, RallyEvent::Type::SERVE_CONTACT);
    EXPECT_EQ(events[0].playerId, "H-S");
    EXPECT_EQ(world.rally.phase, RallyPhase::SERVE_IN_AIR);
    EXPECT_TRUE(world.ball.inFlight);
    expectNear(world.ball.predictedLanding, {0.25, 0.14});
    EXPECT_EQ(rng.remaining(), 0u);
}

TEST(BallHandler, MissedServeGoesLong) {
    WorldState world = createWorldState();
    Tunables tunables;
    FixedRandomSource rng({0.5, 0.99});
    launchServe(world, tunables, rng);
    expectNear(world.ball.predictedLanding, {0.5, 0.02});
}

TEST(BallHandler, ServeOnlyFromPreServe) {
    WorldState world = createWorldState();
    world.rally.phase = RallyPhase::SET_PHASE;
    Tunables tunables;
    FixedRandomSource rng({0.1, 0.0});
    EXPECT_TRUE(launchServe(world, tunables, rng).empty());
    EXPECT_EQ(rng.remaining(), 2u);
    EXPECT_FALSE(world.ball.inFlight);
}

TEST(BallHandler, UntouchedServeIsAnAce) {
    WorldState world = createWorldState();
    Tunables tunables;
    clearTeam(world, TeamSide::AWAY, {0.9, 0.02});
    FixedRandomSource rng({0.1, 0.0});
    launchServe(world, tunables, rng);

    std::vector<RallyEvent> crossed = stepUntilEvent(world, tunables, nullptr);
    ASSERT_EQ(crossed.size(), 1u);
    EXPECT_EQ(crossed[0].type, RallyEvent::Type::BALL_CROSSED_NET);
    EXPECT_EQ(world.rally.phase, RallyPhase::SERVE_RECEIVE);
    EXPECT_EQ(world.ball.side, TeamSide::AWAY);

    std::vector<RallyEvent> dead = stepUntilEvent(world, tunables, nullptr);
    ASSERT_EQ(dead.size(), 1u);
    EXPECT_EQ(dead[0].type, RallyEvent::Type::BALL_DEAD);
    EXPECT_TRUE(isRallyOver(world.rally));
    EXPECT_EQ(world.rally.endReason, RallyEndReason::ACE);
    EXPECT_EQ(world.rally.homeScore, 1);
    EXPECT_FALSE(world.ball.inFlight);
    EXPECT_LT(world.ball.position.y, world.court.netY);

    // Dead ball stays put
    Vec2 rest = world.ball.position;
    EXPECT_TRUE(stepBall(world, tunables, nullptr, DT).empty());
    EXPECT_EQ(world.ball.position, rest);
}

TEST(BallHandler, ReceivePassThenSet) {
    WorldState world = createWorldState();
    Tunables tunables;
    clearTeam(world, TeamSide::AWAY, {0.95, 0.02});
    world.getPlayer("A-S").position = settingZonePoint(world.court, TeamSide::AWAY);
    world.getPlayer("A-OPP").position = rightApproachPoint(world.court, TeamSide::AWAY);

    Vec2 origin = world.ball.position;
    Vec2 landing{0.25, 0.14};
    world.getPlayer("A-L").position = lerp(origin, landing, 0.8);

    FixedRandomSource rng({0.1, 0.0});
    launchServe(world, tunables, rng);
    stepUntilEvent(world, tunables, nullptr);   // crossing

    std::vector<RallyEvent> pass = stepUntilEvent(world, tunables, nullptr);
    ASSERT_EQ(pass.size(), 1u);
    EXPECT_EQ(pass[0].type, RallyEvent::Type::TEAM_TOUCHED_BALL);
    EXPECT_EQ(pass[0].contactType, ContactType::PASS);
    EXPECT_EQ(pass[0].playerId, "A-L");
    EXPECT_EQ(world.rally.phase, RallyPhase::TRANSITION_TO_OFFENSE);
    EXPECT_TRUE(world.rally.inSystem);
    EXPECT_EQ(world.ball.touchCount, 1);
    expectNear(world.ball.predictedLanding, settingZonePoint(world.court, TeamSide::AWAY));

    std::vector<RallyEvent> set = stepUntilEvent(world, tunables, nullptr);
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set[0].contactType, ContactType::SET);
    EXPECT_EQ(set[0].playerId, "A-S");
    EXPECT_EQ(world.rally.phase, RallyPhase::SET_PHASE);
    EXPECT_EQ(world.ball.touchCount, 2);
}

TEST(BallHandler, AttackTowardOpenSide) {
    WorldState world = attackScene();
    Tunables tunables;
    FixedRandomSource rng({0.9, 0.9});

    std::vector<RallyEvent> events = stepUntilEvent(world, tunables, &rng);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].contactType, ContactType::ATTACK);
    EXPECT_EQ(events[0].playerId, "H-OH1");
    EXPECT_EQ(events[0].quality, ContactQuality::PERFECT);
    EXPECT_EQ(world.rally.phase, RallyPhase::ATTACK_PHASE);
    expectNear(world.ball.predictedLanding, {0.25, 0.14});
}

TEST(BallHandler, TipLandsShort) {
    WorldState world = attackScene();
    Tunables tunables;
    FixedRandomSource rng({0.0, 0.9});
    stepUntilEvent(world, tunables, &rng);
    expectNear(world.ball.predictedLanding, {0.25, 0.4});
}

TEST(BallHandler, AttackErrorEndsRally) {
    WorldState world = attackScene();
    Tunables tunables;
    FixedRandomSource rng({0.9, 0.0});

    std::vector<RallyEvent> events = stepUntilEvent(world, tunables, &rng);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].quality, ContactQuality::ERROR);
    EXPECT_TRUE(isRallyOver(world.rally));
    EXPECT_EQ(world.rally.endReason, RallyEndReason::ERROR_OUT);
    EXPECT_EQ(world.rally.winner, TeamSide::AWAY);
    EXPECT_FALSE(world.ball.inFlight);
}

TEST(BallHandler, NoDoubleContact) {
    WorldState world = attackScene();
    world.rally.lastContact.playerId = "H-OH1";
    Tunables tunables;

    std::vector<RallyEvent> events = stepUntilEvent(world, tunables, nullptr);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events[0].type, RallyEvent::Type::BALL_DEAD);
}
