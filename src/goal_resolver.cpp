#include "vb/goal_resolver.h"
#include "vb/rotation.h"

namespace vb {

namespace {

double laneBias(AttackLane lane) {
    if (lane == AttackLane::LEFT) return -0.18;
    if (lane == AttackLane::RIGHT) return 0.18;
    return 0.0;
}

double clampX(double x, double lo, double hi) {
    return std::min(std::max(x, lo), hi);
}

GoalResolution at(const CourtModel& court, Vec2 p, bool nearNet, double speed) {
    return {court.clamp(p), nearNet, speed};
}

} // anonymous namespace

Vec2 settingZonePoint(const CourtModel& court, TeamSide team) {
    return court.forTeam(team, court.clamp({0.7, court.netY + 0.08}));
}

Vec2 leftApproachPoint(const CourtModel& court, TeamSide team) {
    return court.forTeam(team, court.clamp({0.22, court.netY + 0.06}));
}

Vec2 rightApproachPoint(const CourtModel& court, TeamSide team) {
    return court.forTeam(team, court.clamp({0.82, court.netY + 0.06}));
}

Vec2 middleApproachPoint(const CourtModel& court, TeamSide team) {
    return court.forTeam(team, court.clamp({0.52, court.netY + 0.05}));
}

bool isApproachGoal(GoalType goal) {
    return goal == GoalType::ApproachAttackLeft || goal == GoalType::ApproachAttackRight ||
           goal == GoalType::ApproachAttackMiddle;
}

GoalResolution resolveGoal(GoalType goal, const Player& self, const Blackboard& bb,
                           const CourtModel& court) {
    TeamSide team = self.team;
    double toBaseline = team == TeamSide::HOME ? 1.0 : -1.0;
    double netY = court.netY;

    Vec2 base = court.forTeam(team, zoneAnchor(zoneForRole(bb.rotation, self.role)));
    Vec2 landing = bb.predictedLanding;
    Vec2 ball = bb.ballPosition;
    double bias = laneBias(bb.opponentAttackLane);
    Vec2 settingZone = settingZonePoint(court, team);

    auto home = [&](double x, double dy) { return court.forTeam(team, {x, netY + dy}); };
    auto blockAt = [&](double x) { return home(x, 0.015); };

    switch (goal) {
        case GoalType::MaintainBaseResponsibility:
        case GoalType::ParticipateInLegalStack:
            return at(court, base, false, 0.85);

        case GoalType::HideBehindPrimaryPasser:
            return at(court, {base.x, base.y + 0.08 * toBaseline}, false, 1.0);

        case GoalType::MoveTowardSettingZone:
            return at(court, settingZone, false, 1.1);

        case GoalType::SetterDump:
            return at(court, {settingZone.x, settingZone.y - 0.03 * toBaseline}, true, 1.25);

        case GoalType::EmergencySet:
            return at(court, settingZone, false, 1.25);

        // The setter holds the setting zone. The ball handler sends the ball to the lane.
        case GoalType::QuickSetMiddle:
        case GoalType::SetToOutside:
        case GoalType::SetToOpposite:
            return at(court, settingZone, true, 1.15);

        case GoalType::HighOutOfSystemSet:
            return at(court, {settingZone.x, settingZone.y + 0.08 * toBaseline}, false, 1.05);

        case GoalType::ReceiveServe:
            return at(court, base * 0.35 + landing * 0.65, false, 1.2);

        case GoalType::ApproachAttackLeft:
            return at(court, leftApproachPoint(court, team), true, 1.25);
        case GoalType::ApproachAttackRight:
            return at(court, rightApproachPoint(court, team), true, 1.25);
        case GoalType::ApproachAttackMiddle:
            return at(court, middleApproachPoint(court, team), true, 1.25);

        case GoalType::BlockRightSide:
            return at(court, blockAt(clampX(landing.x, 0.6, 0.9)), true, 1.2);
        case GoalType::BlockMiddle:
            return at(court, blockAt(clampX(landing.x, 0.2, 0.8)), true, 1.25);
        case GoalType::BlockLeftSide:
            return at(court, blockAt(clampX(landing.x, 0.1, 0.4)), true, 1.2);
        case GoalType::BlockOpponentOutside:
            return at(court, blockAt(clampX(landing.x + bias * 0.5, 0.15, 0.85)), true, 1.2);

        case GoalType::CoverTips: {
            double x = base.x < 0.5 ? 0.3 : 0.7;
            if (bb.opponentAttackLane == AttackLane::LEFT) x = 0.65;
            else if (bb.opponentAttackLane == AttackLane::RIGHT) x = 0.35;
            return at(court, home(x, 0.10), true, 1.1);
        }

        case GoalType::DefendZoneBiasRightBack:
            return at(court, court.forTeam(team, {0.8333, 0.8333}) + Vec2{bias * 0.8, 0.0}, false, 1.0);
        case GoalType::DefendZoneBiasMiddleBack:
            return at(court, court.forTeam(team, {0.5, 0.8333}) + Vec2{bias * 0.6, 0.0}, false, 1.0);
        case GoalType::DefendZoneBiasLeftBack:
            return at(court, court.forTeam(team, {0.1667, 0.8333}) + Vec2{bias * 0.8, 0.0}, false, 1.0);

        case GoalType::CoverHitter:
            return at(court, {ball.x, ball.y + 0.08 * toBaseline}, false, 1.0);

        case GoalType::FreeBallToTarget:
            return at(court, settingZone, false, 0.9);

        // Behind the baseline, outside the playing bounds
        case GoalType::PrepareToServe:
            return {court.forTeam(team, {0.85, 0.98}), false, 1.1};

        case GoalType::TransitionFromServe:
            return at(court, court.forTeam(team, {0.78, 0.82}), false, 1.15);

        case GoalType::PinnedAtNet:
            return at(court, home(0.7, 0.04), true, 0.9);
        case GoalType::ComeBackToReceive:
            return at(court, home(0.35, 0.22), false, 1.1);
        case GoalType::FrontRowMiddleHideReceive:
            return at(court, home(0.55, 0.06), true, 0.8);

        case GoalType::StackRightReceivePosition:
            return at(court, home(0.35, 0.35), false, 1.0);
        case GoalType::StackMiddleReceivePosition:
            return at(court, home(0.5, 0.35), false, 1.0);
        case GoalType::StackLeftReceivePosition:
            return at(court, home(0.25, 0.08), true, 0.9);

        default:
            return at(court, base, false, 0.85);
    }
}

} // namespace vb
