#include <gtest/gtest.h>
#include "vb/rally_fsm.h"
#include "vb/serialization.h"
#include "vb/sim_controller.h"
#include <stdexcept>

using namespace vb;

namespace {

SimControllerConfig seeded(uint32_t seed) {
    SimControllerConfig config;
    config.seed = seed;
    return config;
}

} // anonymous namespace

TEST(SimController, StartsPausedAtPreServe) {
    SimController sim;
    EXPECT_TRUE(sim.isPaused());
    EXPECT_EQ(sim.getPhase(), RallyPhase::PRE_SERVE);
    EXPECT_EQ(sim.getScore(), std::make_pair(0, 0));
    EXPECT_EQ(sim.getRotation(TeamSide::HOME), 1);
    EXPECT_EQ(sim.getActivePlayers().size(), 12u);
}

TEST(SimController, ServeLaunchesTowardReceiver) {
    SimController sim(seeded(3));
    int serves = 0;
    sim.subscribe([&serves](const SimEvent& e) {
        if (e.type == SimEventType::SERVE) ++serves;
    });

    ASSERT_TRUE(sim.serve());
    EXPECT_EQ(serves, 1);
    EXPECT_EQ(sim.getPhase(), RallyPhase::SERVE_IN_AIR);
    EXPECT_TRUE(sim.getWorld().ball.inFlight);
    EXPECT_LT(sim.getWorld().ball.predictedLanding.y, sim.getWorld().court.netY);

    // Only from PRE_SERVE
    std::string before = sim.exportState();
    EXPECT_FALSE(sim.serve());
    EXPECT_EQ(sim.exportState(), before);
    EXPECT_EQ(serves, 1);
}

TEST(SimController, DryRunLeavesWorldAlone) {
    SimController sim(seeded(5));
    ASSERT_TRUE(sim.serve());
    std::string before = sim.exportState();

    TickResult preview = sim.dryRun();
    EXPECT_EQ(preview.nextWorld.tick, sim.getWorld().tick + 1);
    EXPECT_EQ(sim.exportState(), before);

    StepOptions options;
    options.commit = false;
    sim.step(options);
    EXPECT_EQ(sim.exportState(), before);
}

TEST(SimController, StepCommitsAndNotifies) {
    SimController sim;
    int ticks = 0;
    sim.subscribe([&ticks](const SimEvent& e) {
        if (e.type == SimEventType::TICK) ++ticks;
    });
    TickResult result = sim.step();
    EXPECT_EQ(sim.getWorld().tick, 1);
    EXPECT_EQ(result.nextWorld, sim.getWorld());
    EXPECT_EQ(ticks, 1);
}

TEST(SimController, PauseResumeEvents) {
    SimController sim;
    std::vector<SimEventType> seen;
    sim.subscribe([&seen](const SimEvent& e) { seen.push_back(e.type); });

    sim.pause();                // already paused
    sim.resume();
    sim.resume();
    sim.togglePause();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], SimEventType::RESUME);
    EXPECT_EQ(seen[1], SimEventType::PAUSE);
    EXPECT_TRUE(sim.isPaused());
}

TEST(SimController, Unsubscribe) {
    SimController sim;
    int calls = 0;
    int handle = sim.subscribe([&calls](const SimEvent&) { ++calls; });
    sim.step();
    EXPECT_TRUE(sim.unsubscribe(handle));
    EXPECT_FALSE(sim.unsubscribe(handle));
    sim.step();
    EXPECT_EQ(calls, 1);
}

TEST(SimController, SnapshotRestore) {
    SimController sim(seeded(9));
    std::string eventId;
    sim.subscribe([&eventId](const SimEvent& e) {
        if (e.type == SimEventType::SNAPSHOT) eventId = e.snapshotId;
    });

    Snapshot snap = sim.createSnapshot();
    EXPECT_EQ(snap.id, "snap-1");
    EXPECT_EQ(snap.label, "Tick 0");
    EXPECT_EQ(eventId, "snap-1");
    EXPECT_EQ(sim.createSnapshot("second").id, "snap-2");
    EXPECT_EQ(sim.getSnapshots().size(), 2u);

    sim.serve();
    for (int i = 0; i < 10; ++i) sim.step();
    EXPECT_NE(sim.getWorld(), snap.world);

    EXPECT_TRUE(sim.restoreSnapshot("snap-1"));
    EXPECT_EQ(sim.getWorld(), snap.world);
    EXPECT_FALSE(sim.restoreSnapshot("snap-42"));

    // Snapshots are copies
    sim.movePlayer("H-OH1", {0.3, 0.7});
    EXPECT_NE(sim.getWorld(), sim.getSnapshots()[0].world);

    sim.clearSnapshots();
    EXPECT_TRUE(sim.getSnapshots().empty());
}

TEST(SimController, SnapshotReplayIsExact) {
    SimController sim(seeded(7));
    Snapshot start = sim.createSnapshot("start");
    EXPECT_FALSE(start.rngState.empty());

    auto play = [&sim]() {
        sim.serve();
        for (int i = 0; i < 400; ++i) sim.step();
        return sim.exportState();
    };

    std::string firstRun = play();
    ASSERT_TRUE(sim.restoreSnapshot(start.id));
    EXPECT_EQ(play(), firstRun);

    sim.restoreSnapshot(start);
    EXPECT_EQ(play(), firstRun);
}

TEST(SimController, ImportExport) {
    SimController a(seeded(1));
    a.setRotation(TeamSide::HOME, 3);
    a.movePlayer("H-OPP", {0.4, 0.9});
    std::string text = a.exportState();

    SimController b;
    b.importState(text);
    EXPECT_EQ(b.getWorld(), a.getWorld());
    EXPECT_EQ(b.getRotation(TeamSide::HOME), 3);
}

TEST(SimController, FailedImportKeepsWorld) {
    SimController sim;
    sim.movePlayer("H-S", {0.2, 0.8});
    std::string before = sim.exportState();
    EXPECT_THROW(sim.importState("{\"tick\": 3}"), StateFormatError);
    EXPECT_THROW(sim.importState("garbage"), StateFormatError);
    EXPECT_EQ(sim.exportState(), before);
}

TEST(SimController, Edits) {
    SimController sim;

    sim.movePlayer("H-MB1", {0.5, 1.4});
    EXPECT_DOUBLE_EQ(sim.getPlayer("H-MB1").position.y, 1.05);

    sim.setPlayerGoal("H-OH2", GoalType::CoverTips);
    EXPECT_TRUE(sim.getPlayer("H-OH2").override.active);
    EXPECT_EQ(sim.getPlayer("H-OH2").override.goal, "CoverTips");
    sim.clearPlayerGoal("H-OH2");
    EXPECT_FALSE(sim.getPlayer("H-OH2").override.active);

    sim.setBallPosition({0.3, 0.3});
    EXPECT_EQ(sim.getBallPosition(), (Vec2{0.3, 0.3}));
    EXPECT_FALSE(sim.getWorld().ball.inFlight);
    EXPECT_EQ(sim.getWorld().ball.side, TeamSide::AWAY);

    sim.setPhase(RallyPhase::DEFENSE_PHASE);
    EXPECT_EQ(sim.getPhase(), RallyPhase::DEFENSE_PHASE);

    sim.applyEdit([](WorldState& w) { w.rally.homeScore = 4; });
    EXPECT_EQ(sim.getScore().first, 4);
}

TEST(SimController, UnknownIdsThrow) {
    SimController sim;
    EXPECT_THROW(sim.movePlayer("H-XX", {0.5, 0.8}), std::out_of_range);
    EXPECT_THROW(sim.setPlayerGoal("nobody", GoalType::CoverTips), std::out_of_range);
    EXPECT_THROW(sim.clearPlayerGoal("nobody"), std::out_of_range);
    EXPECT_THROW(sim.getPlayer("nobody"), std::out_of_range);
}

TEST(SimController, SetRotation) {
    SimController sim;
    EXPECT_THROW(sim.setRotation(TeamSide::HOME, 0), std::invalid_argument);
    EXPECT_THROW(sim.setRotation(TeamSide::AWAY, 7), std::invalid_argument);
    EXPECT_EQ(sim.getRotation(TeamSide::HOME), 1);

    sim.setRotation(TeamSide::HOME, 4);
    EXPECT_EQ(sim.getRotation(TeamSide::HOME), 4);
    // R4 puts MB1 in the back row, so the libero takes over
    EXPECT_FALSE(sim.getPlayer("H-MB1").active);
    EXPECT_TRUE(sim.getPlayer("H-MB2").active);
    EXPECT_TRUE(sim.getPlayer("H-L").active);
}

TEST(SimController, TeamOverride) {
    SimController sim;
    sim.setTeamOverride(TeamSide::AWAY, "CoverTips");
    TickResult result = sim.step();
    bool sawOverride = false;
    for (const auto& intent : result.intents) {
        if (intent.actor.rfind("A-", 0) == 0 && intent.goal == GoalType::CoverTips) sawOverride = true;
        if (intent.actor.rfind("H-", 0) == 0) EXPECT_NE(intent.goal, GoalType::CoverTips);
    }
    EXPECT_TRUE(sawOverride);

    sim.clearTeamOverride(TeamSide::AWAY);
    result = sim.step();
    for (const auto& intent : result.intents) {
        EXPECT_NE(intent.goal, GoalType::CoverTips) << intent.actor;
    }
}

TEST(SimController, RallyPlaysOut) {
    SimController sim(seeded(21));
    int ends = 0;
    sim.subscribe([&ends](const SimEvent& e) {
        if (e.type == SimEventType::RALLY_END) ++ends;
    });
    ASSERT_TRUE(sim.serve());
    SimulateResult result = sim.simulateUntil(
        [](const WorldState& w) { return isRallyOver(w.rally); }, 20000);
    EXPECT_GT(result.ticksRun, 0);
    EXPECT_EQ(sim.getPhase(), RallyPhase::BALL_DEAD);
    EXPECT_EQ(sim.getScore().first + sim.getScore().second, 1);
    EXPECT_EQ(ends, 1);
}

TEST(SimController, ResetRallyKeepsScore) {
    SimController sim(seeded(4));
    sim.serve();
    sim.simulateUntil([](const WorldState& w) { return isRallyOver(w.rally); }, 20000);
    ASSERT_EQ(sim.getPhase(), RallyPhase::BALL_DEAD);
    auto score = sim.getScore();
    TeamSide nextServer = sim.getWorld().rally.winner;

    sim.movePlayer("H-S", {0.1, 0.55});
    sim.resetRally(nextServer);
    EXPECT_EQ(sim.getPhase(), RallyPhase::PRE_SERVE);
    EXPECT_EQ(sim.getScore(), score);
    EXPECT_EQ(sim.getWorld().rally.serving, nextServer);
    EXPECT_FALSE(sim.getWorld().ball.inFlight);
    EXPECT_EQ(sim.getWorld().ball.touchCount, 0);
    EXPECT_NE(sim.getPlayer("H-S").position, (Vec2{0.1, 0.55}));
}

TEST(SimController, ResetRestoresConfig) {
    SimControllerConfig config;
    config.world.homeRotation = 2;
    SimController sim(config);
    sim.setRotation(TeamSide::HOME, 5);
    sim.setTeamOverride(TeamSide::HOME, "CoverTips");
    sim.applyEdit([](WorldState& w) { w.rally.awayScore = 9; });

    sim.reset();
    EXPECT_EQ(sim.getRotation(TeamSide::HOME), 2);
    EXPECT_EQ(sim.getScore(), std::make_pair(0, 0));
    for (const auto& intent : sim.step().intents) {
        EXPECT_NE(intent.goal, GoalType::CoverTips);
    }
}

TEST(SimController, EventLabels) {
    EXPECT_STREQ(toString(SimEventType::PAUSE), "pause");
    EXPECT_STREQ(toString(SimEventType::RALLY_END), "rally_end");
}
