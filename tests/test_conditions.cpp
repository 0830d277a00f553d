#include <gtest/gtest.h>
#include "vb/conditions.h"
#include "vb/random_source.h"
#include "vb/tunables.h"
#include "vb/world_state.h"

using namespace vb;

namespace {

struct Scene {
    WorldState world;
    Tunables tunables;
    Blackboard bb;
    std::vector<Player> players;

    explicit Scene(int rotation = 1) {
        WorldConfig config;
        config.homeRotation = rotation;
        config.awayRotation = rotation;
        world = createWorldState(config);
        refresh();
    }

    void refresh() {
        bb = buildBlackboard(world, TeamSide::HOME);
        players = world.activePlayers();
    }

    void place(const std::string& id, Vec2 p) {
        world.getPlayer(id).position = p;
        refresh();
    }

    BtContext ctx(const std::string& id, RandomSourceBase* rng = nullptr) const {
        return {bb, world.getPlayer(id), players, tunables, rng, 0.0};
    }
};

} // anonymous namespace

TEST(Conditions, Rows) {
    Scene s;
    EXPECT_TRUE(isFrontRow(s.bb, s.world.getPlayer("H-OH1")));
    EXPECT_TRUE(isBackRow(s.bb, s.world.getPlayer("H-S")));
    EXPECT_TRUE(isBackRow(s.bb, s.world.getPlayer("H-L")));
}

TEST(Conditions, ReceiveStack) {
    EXPECT_EQ(receiveStackType(1), StackType::RIGHT);
    EXPECT_EQ(receiveStackType(2), StackType::MIDDLE);
    EXPECT_EQ(receiveStackType(5), StackType::LEFT);
}

TEST(Conditions, PinnedAtNet) {
    Scene r1(1);
    EXPECT_TRUE(isPinnedAtNet(r1.bb, r1.world.getPlayer("H-OH1")));
    EXPECT_FALSE(isPinnedAtNet(r1.bb, r1.world.getPlayer("H-OH2")));
    EXPECT_FALSE(isPinnedAtNet(r1.bb, r1.world.getPlayer("H-OPP")));

    Scene r2(2);
    EXPECT_TRUE(isPinnedAtNet(r2.bb, r2.world.getPlayer("H-OPP")));

    Scene r4(4);
    for (const auto& p : r4.world.teamPlayers(TeamSide::HOME)) {
        EXPECT_FALSE(isPinnedAtNet(r4.bb, p)) << p.id;
    }
}

TEST(Conditions, ComeBackToReceive) {
    Scene r1(1);
    EXPECT_TRUE(shouldComeBackToReceive(r1.bb, r1.world.getPlayer("H-OPP")));
    EXPECT_FALSE(shouldComeBackToReceive(r1.bb, r1.world.getPlayer("H-OH1")));

    Scene r2(2);
    EXPECT_TRUE(shouldComeBackToReceive(r2.bb, r2.world.getPlayer("H-OH2")));

    EXPECT_TRUE(isPrimaryPasser(r1.world.getPlayer("H-L")));
    EXPECT_FALSE(isPrimaryPasser(r1.world.getPlayer("H-MB1")));
}

TEST(Conditions, InSystemAndBail) {
    Scene s;
    s.bb.predictedLanding = settingZoneFor(TeamSide::HOME);
    EXPECT_TRUE(isInSystem(s.ctx("H-S")));
    EXPECT_FALSE(shouldSetterBail(s.ctx("H-S")));

    s.bb.predictedLanding = {0.2, 0.9};
    EXPECT_FALSE(isInSystem(s.ctx("H-S")));
    EXPECT_TRUE(shouldSetterBail(s.ctx("H-S")));
    EXPECT_FALSE(shouldSetterBail(s.ctx("H-OH1")));
}

TEST(Conditions, SettingZone) {
    EXPECT_EQ(settingZoneFor(TeamSide::HOME), (Vec2{0.7, 0.58}));
    EXPECT_EQ(settingZoneFor(TeamSide::AWAY), (Vec2{0.7, 0.42}));
}

TEST(Conditions, SetterInPosition) {
    Scene s;
    EXPECT_FALSE(isSetterInPosition(s.ctx("H-OH1")));
    s.place("H-S", {0.7, 0.6});
    EXPECT_TRUE(isSetterInPosition(s.ctx("H-OH1")));
}

TEST(Conditions, AttackOptions) {
    Scene s;
    // Front-row middle starts in zone 3, within reach of the quick approach
    EXPECT_TRUE(isMiddleReadyForQuick(s.ctx("H-S")));
    EXPECT_EQ(bestAttackOption(s.ctx("H-S"), true), AttackOption::QUICK_MIDDLE);
    EXPECT_EQ(bestAttackOption(s.ctx("H-S"), false), AttackOption::HIGH_OUTSIDE);

    s.place("H-MB1", {0.5, 0.9});
    EXPECT_FALSE(isMiddleReadyForQuick(s.ctx("H-S")));
    EXPECT_EQ(bestAttackOption(s.ctx("H-S"), true), AttackOption::BACK_SET);

    EXPECT_TRUE(isOppositeAvailable(s.ctx("H-S")));
    Scene r4(4);
    EXPECT_FALSE(isOppositeAvailable(r4.ctx("H-S")));
}

TEST(Conditions, OpposingBlock) {
    Scene s;
    EXPECT_EQ(countOpponentBlockers(s.ctx("H-OH1")), 0);
    EXPECT_TRUE(shouldUsePowerAttack(s.ctx("H-OH1")));

    s.place("A-MB1", {0.5, 0.47});
    s.place("A-OH1", {0.8, 0.47});
    EXPECT_EQ(countOpponentBlockers(s.ctx("H-OH1")), 2);
    EXPECT_FALSE(shouldUsePowerAttack(s.ctx("H-OH1")));
    EXPECT_TRUE(isGapInBlock(s.ctx("H-OH1"), AttackLane::LEFT));
    EXPECT_FALSE(isGapInBlock(s.ctx("H-OH1"), AttackLane::RIGHT));
    EXPECT_EQ(bestAttackOption(s.ctx("H-S"), true), AttackOption::QUICK_MIDDLE);
}

TEST(Conditions, TipShotNeedsRandomSource) {
    Scene s;
    EXPECT_FALSE(shouldUseTipShot(s.ctx("H-OH1")));

    FixedRandomSource low({0.05});
    EXPECT_TRUE(shouldUseTipShot(s.ctx("H-OH1", &low)));
    FixedRandomSource high({0.5});
    EXPECT_FALSE(shouldUseTipShot(s.ctx("H-OH1", &high)));
}

TEST(Conditions, ReachTieGoesToListOrder) {
    Scene s;
    for (auto& p : s.world.players) {
        if (p.team == TeamSide::HOME) p.position = {0.9, 0.95};
    }
    s.world.ball.position = {0.5, 0.7};
    s.world.getPlayer("H-OH1").position = {0.4, 0.7};
    s.world.getPlayer("H-OH2").position = {0.6, 0.7};
    s.refresh();

    EXPECT_TRUE(canReachBallBeforeOthers(s.ctx("H-OH1")));
    EXPECT_FALSE(canReachBallBeforeOthers(s.ctx("H-OH2")));
    EXPECT_TRUE(canReachBallBeforeOthers(s.ctx("H-OH2"), -1.0));

    // Stable across repeated evaluation
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(canReachBallBeforeOthers(s.ctx("H-OH1")));
    }
}

TEST(Conditions, BallReading) {
    Blackboard bb;
    bb.team = TeamSide::HOME;
    bb.predictedLanding = {0.5, 0.55};
    EXPECT_TRUE(isBallQuickSet(bb));
    EXPECT_TRUE(isBallHeadedToOurSide(bb));
    EXPECT_TRUE(isBallHeadedToZone(bb, AttackLane::MIDDLE));
    EXPECT_FALSE(isBallHeadedToZone(bb, AttackLane::LEFT));

    bb.predictedLanding = {0.2, 0.3};
    EXPECT_FALSE(isBallQuickSet(bb));
    EXPECT_FALSE(isBallHeadedToOurSide(bb));
    EXPECT_TRUE(isBallHeadedToZone(bb, AttackLane::LEFT));

    bb.team = TeamSide::AWAY;
    EXPECT_TRUE(isBallHeadedToOurSide(bb));
}

TEST(Conditions, Transitions) {
    Blackboard bb;
    bb.ballOnOurSide = true;
    bb.touchCount = 1;
    bb.phase = RallyPhase::TRANSITION_TO_OFFENSE;
    EXPECT_TRUE(shouldTransitionToOffense(bb));
    EXPECT_FALSE(shouldTransitionToDefense(bb));

    bb.phase = RallyPhase::ATTACK_PHASE;
    EXPECT_FALSE(shouldTransitionToOffense(bb));

    bb.ballOnOurSide = false;
    EXPECT_TRUE(shouldTransitionToDefense(bb));
}

TEST(Conditions, EmergencyBall) {
    Scene s;
    s.world.ball.position = {0.5, 0.98};
    for (auto& p : s.world.players) {
        if (p.team == TeamSide::HOME) p.position = {0.5, 0.55};
    }
    s.refresh();
    EXPECT_TRUE(isEmergencyBall(s.ctx("H-L")));

    s.place("H-L", {0.5, 0.95});
    EXPECT_FALSE(isEmergencyBall(s.ctx("H-L")));
}

TEST(Conditions, ZonesAndDiagonals) {
    Scene s;
    EXPECT_EQ(playerZone(s.bb, s.world.getPlayer("H-L")), 6);
    EXPECT_TRUE(isDiagonalToSetter(s.bb, s.world.getPlayer("H-OPP")));
    EXPECT_FALSE(isDiagonalToSetter(s.bb, s.world.getPlayer("H-OH1")));
    EXPECT_TRUE(isDiagonalToRole(s.bb, s.world.getPlayer("H-OH1"), Role::OH2));
    EXPECT_EQ(playerZoneType(s.bb, s.world.getPlayer("H-MB1")), ZoneRelationType::T);
    EXPECT_EQ(playerZoneType(s.bb, s.world.getPlayer("H-OH1")), ZoneRelationType::L);
}
