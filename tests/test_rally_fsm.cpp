#include <gtest/gtest.h>
#include "vb/rally_fsm.h"

using namespace vb;

namespace {

RallyState servedBy(TeamSide serving) {
    RallyState s = createInitialRally(serving);
    return reduceRally(s, RallyEvent::serveContact(serving == TeamSide::HOME ? "H-S" : "A-S", 0.0));
}

RallyEvent touchBy(TeamSide team, const std::string& id, ContactType type,
                   ContactQuality q = ContactQuality::GOOD) {
    return RallyEvent::touch(team, id, type, q, 0.0);
}

} // anonymous namespace

TEST(RallyFsm, InitialState) {
    RallyState s = createInitialRally(TeamSide::AWAY, 3, 4);
    EXPECT_EQ(s.phase, RallyPhase::PRE_SERVE);
    EXPECT_EQ(s.serving, TeamSide::AWAY);
    EXPECT_EQ(s.homeScore, 3);
    EXPECT_EQ(s.awayScore, 4);
    EXPECT_FALSE(isRallyOver(s));
}

TEST(RallyFsm, ServeContact) {
    RallyState s = servedBy(TeamSide::HOME);
    EXPECT_EQ(s.phase, RallyPhase::SERVE_IN_AIR);
    ASSERT_EQ(s.possessionChain.size(), 1u);
    EXPECT_EQ(s.possessionChain[0].type, ContactType::SERVE);
    EXPECT_TRUE(s.hasLastTouch);
    EXPECT_EQ(s.lastTouchTeam, TeamSide::HOME);
}

TEST(RallyFsm, ServeOutsidePreServeIsNoOp) {
    RallyState s = servedBy(TeamSide::HOME);
    RallyState again = reduceRally(s, RallyEvent::serveContact("H-S"));
    EXPECT_EQ(again, s);
}

TEST(RallyFsm, FullSideoutFlow) {
    RallyState s = servedBy(TeamSide::HOME);
    s = reduceRally(s, RallyEvent::ballCrossedNet(TeamSide::HOME));
    EXPECT_EQ(s.phase, RallyPhase::SERVE_RECEIVE);

    s = reduceRally(s, touchBy(TeamSide::AWAY, "A-L", ContactType::PASS));
    EXPECT_EQ(s.phase, RallyPhase::TRANSITION_TO_OFFENSE);
    EXPECT_TRUE(s.inSystem);
    EXPECT_EQ(s.touchesFor(TeamSide::AWAY), 1);
    EXPECT_EQ(s.touchesFor(TeamSide::HOME), 0);

    s = reduceRally(s, touchBy(TeamSide::AWAY, "A-S", ContactType::SET));
    EXPECT_EQ(s.phase, RallyPhase::SET_PHASE);

    s = reduceRally(s, touchBy(TeamSide::AWAY, "A-OH1", ContactType::ATTACK));
    EXPECT_EQ(s.phase, RallyPhase::ATTACK_PHASE);
    EXPECT_EQ(teamContactCount(s, TeamSide::AWAY), 3);

    s = reduceRally(s, RallyEvent::ballCrossedNet(TeamSide::AWAY));
    EXPECT_EQ(s.phase, RallyPhase::DEFENSE_PHASE);

    TerminationResult end = detectRallyTermination(true, {0.5, 0.7}, s);
    ASSERT_TRUE(end.terminated);
    EXPECT_EQ(end.reason, RallyEndReason::KILL);
    EXPECT_EQ(end.winner, TeamSide::AWAY);

    s = reduceRally(s, RallyEvent::ballDead(end.reason, end.winner));
    EXPECT_TRUE(isRallyOver(s));
    EXPECT_EQ(s.awayScore, 1);
    EXPECT_EQ(s.serving, TeamSide::AWAY);
    // Sideout rotates the new serving team
    EXPECT_EQ(s.awayRotation, 2);
    EXPECT_EQ(s.homeRotation, 1);
}

TEST(RallyFsm, ServingTeamPointKeepsRotation) {
    RallyState s = servedBy(TeamSide::HOME);
    s = reduceRally(s, RallyEvent::ballDead(RallyEndReason::ACE, TeamSide::HOME));
    EXPECT_EQ(s.homeScore, 1);
    EXPECT_EQ(s.homeRotation, 1);
    EXPECT_EQ(s.serving, TeamSide::HOME);
    EXPECT_TRUE(s.hasResult);
    EXPECT_EQ(s.endReason, RallyEndReason::ACE);
}

TEST(RallyFsm, BallDeadTwiceScoresOnce) {
    RallyState s = servedBy(TeamSide::HOME);
    s = reduceRally(s, RallyEvent::ballDead(RallyEndReason::ACE, TeamSide::HOME));
    RallyState again = reduceRally(s, RallyEvent::ballDead(RallyEndReason::ACE, TeamSide::HOME));
    EXPECT_EQ(again, s);
}

TEST(RallyFsm, FourTouchesLosesPoint) {
    RallyState s = servedBy(TeamSide::HOME);
    s = reduceRally(s, RallyEvent::ballCrossedNet(TeamSide::HOME));
    s = reduceRally(s, touchBy(TeamSide::AWAY, "A-L", ContactType::PASS));
    s = reduceRally(s, touchBy(TeamSide::AWAY, "A-S", ContactType::SET));
    s = reduceRally(s, touchBy(TeamSide::AWAY, "A-OH1", ContactType::ATTACK));
    s = reduceRally(s, touchBy(TeamSide::AWAY, "A-MB1", ContactType::ATTACK));

    EXPECT_TRUE(isRallyOver(s));
    EXPECT_EQ(s.endReason, RallyEndReason::FOUR_TOUCHES);
    EXPECT_EQ(s.winner, TeamSide::HOME);
}

TEST(RallyFsm, ErrorContactAwardsPoint) {
    RallyState s = servedBy(TeamSide::HOME);
    s = reduceRally(s, RallyEvent::ballCrossedNet(TeamSide::HOME));
    s = reduceRally(s, touchBy(TeamSide::AWAY, "A-OH2", ContactType::PASS, ContactQuality::ERROR));
    EXPECT_TRUE(isRallyOver(s));
    EXPECT_EQ(s.endReason, RallyEndReason::ERROR_NET);
    EXPECT_EQ(s.winner, TeamSide::HOME);
}

TEST(RallyFsm, PoorPassIsOutOfSystem) {
    RallyState s = servedBy(TeamSide::HOME);
    s = reduceRally(s, RallyEvent::ballCrossedNet(TeamSide::HOME));
    s = reduceRally(s, touchBy(TeamSide::AWAY, "A-OH2", ContactType::PASS, ContactQuality::POOR));
    EXPECT_FALSE(s.inSystem);
}

TEST(RallyFsm, UnhandledEventsAreNoOps) {
    RallyState pre = createInitialRally(TeamSide::HOME);
    EXPECT_EQ(reduceRally(pre, touchBy(TeamSide::HOME, "H-S", ContactType::PASS)), pre);
    EXPECT_EQ(reduceRally(pre, RallyEvent::ballCrossedNet(TeamSide::HOME)), pre);
}

TEST(RallyFsm, Deterministic) {
    RallyState s = servedBy(TeamSide::AWAY);
    RallyEvent e = RallyEvent::ballCrossedNet(TeamSide::AWAY);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(reduceRally(s, e), reduceRally(s, e));
    }
}

TEST(RallyFsm, StartRallyKeepsScoreAndRotation) {
    RallyState s = servedBy(TeamSide::HOME);
    s = reduceRally(s, RallyEvent::ballDead(RallyEndReason::KILL, TeamSide::AWAY));
    RallyState next = reduceRally(s, RallyEvent::startRally(TeamSide::AWAY));
    EXPECT_EQ(next.phase, RallyPhase::PRE_SERVE);
    EXPECT_EQ(next.awayScore, 1);
    EXPECT_EQ(next.awayRotation, 2);
    EXPECT_FALSE(next.hasResult);
    EXPECT_TRUE(next.possessionChain.empty());
}

TEST(RallyFsm, CreateTouchEvent) {
    EXPECT_EQ(createTouchEvent(TeamSide::HOME, "H-L", ContactQuality::GOOD, 0, 1, true, false).contactType,
              ContactType::PASS);
    EXPECT_EQ(createTouchEvent(TeamSide::HOME, "H-L", ContactQuality::GOOD, 0, 1, false, true).contactType,
              ContactType::DIG);
    EXPECT_EQ(createTouchEvent(TeamSide::HOME, "H-S", ContactQuality::GOOD, 0, 2, false, false).contactType,
              ContactType::SET);
    EXPECT_EQ(createTouchEvent(TeamSide::HOME, "H-OH1", ContactQuality::GOOD, 0, 3, false, false).contactType,
              ContactType::ATTACK);
}

TEST(RallyFsm, ContactQueries) {
    RallyState s = servedBy(TeamSide::HOME);
    s = reduceRally(s, RallyEvent::ballCrossedNet(TeamSide::HOME));
    s = reduceRally(s, touchBy(TeamSide::AWAY, "A-L", ContactType::PASS));

    const ContactRecord* pass = lastContactOfType(s, TeamSide::AWAY, ContactType::PASS);
    ASSERT_NE(pass, nullptr);
    EXPECT_EQ(pass->playerId, "A-L");
    EXPECT_EQ(lastContactOfType(s, TeamSide::AWAY, ContactType::SET), nullptr);
    EXPECT_EQ(teamContactCount(s, TeamSide::HOME), 0);
}

TEST(ContactQuality, Pass) {
    Vec2 setter{0.65, 0.55};
    EXPECT_EQ(assessPassQuality({0.65, 0.55}, setter, TeamSide::HOME), ContactQuality::PERFECT);
    EXPECT_EQ(assessPassQuality({0.55, 0.65}, setter, TeamSide::HOME), ContactQuality::GOOD);
    EXPECT_EQ(assessPassQuality({0.2, 0.9}, setter, TeamSide::HOME), ContactQuality::ERROR);
}

TEST(ContactQuality, Set) {
    EXPECT_EQ(assessSetQuality({0.2, 0.55}, {0.22, 0.56}, true), ContactQuality::PERFECT);
    EXPECT_EQ(assessSetQuality({0.2, 0.55}, {0.22, 0.56}, false), ContactQuality::GOOD);
    EXPECT_EQ(assessSetQuality({0.5, 0.7}, {0.5, 0.45}, false), ContactQuality::POOR);
    EXPECT_EQ(assessSetQuality({0.2, 0.55}, {0.9, 0.9}, true), ContactQuality::ERROR);
}

TEST(ContactQuality, Attack) {
    EXPECT_EQ(assessAttackQuality(0, true), ContactQuality::PERFECT);
    EXPECT_EQ(assessAttackQuality(1, true), ContactQuality::GOOD);
    EXPECT_EQ(assessAttackQuality(3, true), ContactQuality::POOR);
    EXPECT_EQ(assessAttackQuality(0, false), ContactQuality::ERROR);
}

TEST(RallyTermination, NotLanded) {
    RallyState s = servedBy(TeamSide::HOME);
    EXPECT_FALSE(detectRallyTermination(false, {0.5, 0.2}, s).terminated);
}

TEST(RallyTermination, AceAndOut) {
    RallyState s = servedBy(TeamSide::HOME);
    s = reduceRally(s, RallyEvent::ballCrossedNet(TeamSide::HOME));

    TerminationResult ace = detectRallyTermination(true, {0.5, 0.2}, s);
    EXPECT_EQ(ace.reason, RallyEndReason::ACE);
    EXPECT_EQ(ace.winner, TeamSide::HOME);

    TerminationResult out = detectRallyTermination(true, {0.5, 0.01}, s);
    EXPECT_EQ(out.reason, RallyEndReason::ERROR_OUT);
    EXPECT_EQ(out.winner, TeamSide::AWAY);
}

TEST(PhaseFlow, NextAndPrevious) {
    EXPECT_EQ(nextPhaseInFlow(RallyPhase::PRE_SERVE), RallyPhase::SERVE_IN_AIR);
    EXPECT_EQ(nextPhaseInFlow(RallyPhase::DEFENSE_PHASE), RallyPhase::PRE_SERVE);
    EXPECT_EQ(previousPhaseInFlow(RallyPhase::PRE_SERVE), RallyPhase::DEFENSE_PHASE);
    EXPECT_EQ(previousPhaseInFlow(RallyPhase::SET_PHASE), RallyPhase::TRANSITION_TO_OFFENSE);

    EXPECT_TRUE(wouldLoopToStart(RallyPhase::DEFENSE_PHASE, true));
    EXPECT_FALSE(wouldLoopToStart(RallyPhase::SET_PHASE, true));
    EXPECT_TRUE(wouldLoopToStart(RallyPhase::PRE_SERVE, false));
}
