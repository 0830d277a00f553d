#include "vb/conditions.h"
#include "vb/random_source.h"
#include "vb/rotation.h"
#include "vb/tunables.h"
#include <algorithm>
#include <limits>

namespace vb {

// --- Rows and receive formation ---

bool isFrontRow(const Blackboard& bb, const Player& p) {
    return std::find(bb.frontRowPlayers.begin(), bb.frontRowPlayers.end(), p.id) !=
           bb.frontRowPlayers.end();
}

bool isBackRow(const Blackboard& bb, const Player& p) {
    return !isFrontRow(bb, p);
}

StackType receiveStackType(int rotation) {
    if (rotation == 1) return StackType::RIGHT;
    if (rotation == 2) return StackType::MIDDLE;
    return StackType::LEFT;
}

bool isPinnedAtNet(const Blackboard& bb, const Player& self) {
    if (!isFrontRow(bb, self)) return false;
    StackType stack = receiveStackType(bb.rotation);
    if (stack == StackType::RIGHT && self.category == RoleCategory::OUTSIDE) return true;
    if (stack == StackType::MIDDLE && self.category == RoleCategory::OPPOSITE) return true;
    return false;
}

bool shouldComeBackToReceive(const Blackboard& bb, const Player& self) {
    if (!isFrontRow(bb, self)) return false;
    int r = bb.rotation;
    if ((r == 1 || r == 3) && self.category == RoleCategory::OPPOSITE) return true;
    if (r == 2 && self.category == RoleCategory::OUTSIDE) return true;
    return false;
}

bool isPrimaryPasser(const Player& self) {
    return self.category == RoleCategory::OUTSIDE || self.category == RoleCategory::LIBERO;
}

// --- Setting ---

Vec2 settingZoneFor(TeamSide team) {
    return {0.7, team == TeamSide::HOME ? 0.58 : 0.42};
}

namespace {

double landingToSettingZone(const BtContext& ctx) {
    return ctx.bb.predictedLanding.distanceTo(settingZoneFor(ctx.self.team));
}

const Player* findTeammate(const BtContext& ctx, RoleCategory category) {
    for (const auto& p : ctx.players) {
        if (p.team == ctx.self.team && p.category == category) return &p;
    }
    return nullptr;
}

int opponentsNearNet(const BtContext& ctx, double band) {
    TeamSide opp = opponent(ctx.self.team);
    int n = 0;
    for (const auto& p : ctx.players) {
        if (p.team == opp && std::abs(p.position.y - ctx.bb.netY) < band) ++n;
    }
    return n;
}

} // anonymous namespace

bool isInSystem(const BtContext& ctx) {
    return landingToSettingZone(ctx) < ctx.tunables.thresholds.inSystemRadius;
}

bool shouldSetterBail(const BtContext& ctx) {
    if (ctx.self.category != RoleCategory::SETTER) return false;
    return landingToSettingZone(ctx) > ctx.tunables.thresholds.setterBailDistance;
}

bool isSetterInPosition(const BtContext& ctx) {
    const Player* setter = findTeammate(ctx, RoleCategory::SETTER);
    if (!setter) return false;
    return setter->position.distanceTo(settingZoneFor(setter->team)) <
           ctx.tunables.thresholds.approachRadius;
}

bool isHitterInApproach(const BtContext& ctx, const Player& hitter, AttackLane zone) {
    double targetX = 0.5;
    if (zone == AttackLane::LEFT) targetX = 0.22;
    else if (zone == AttackLane::RIGHT) targetX = 0.78;

    double offset = 0.15;
    double approachY = hitter.team == TeamSide::HOME ? ctx.bb.netY + offset : ctx.bb.netY - offset;
    return hitter.position.distanceTo({targetX, approachY}) < ctx.tunables.thresholds.approachRadius;
}

bool isMiddleReadyForQuick(const BtContext& ctx) {
    for (const auto& p : ctx.players) {
        if (p.team != ctx.self.team || p.category != RoleCategory::MIDDLE) continue;
        if (!isFrontRow(ctx.bb, p)) continue;
        return isHitterInApproach(ctx, p, AttackLane::MIDDLE);
    }
    return false;
}

bool isOppositeAvailable(const BtContext& ctx) {
    for (const auto& p : ctx.players) {
        if (p.team == ctx.self.team && p.category == RoleCategory::OPPOSITE &&
            isFrontRow(ctx.bb, p)) {
            return true;
        }
    }
    return false;
}

AttackOption bestAttackOption(const BtContext& ctx, bool inSystem) {
    if (!inSystem) return AttackOption::HIGH_OUTSIDE;
    if (isMiddleReadyForQuick(ctx)) return AttackOption::QUICK_MIDDLE;
    if (countOpponentBlockers(ctx) <= 1) return AttackOption::BACK_SET;
    return AttackOption::HIGH_OUTSIDE;
}

// --- Opposing block ---

int countOpponentBlockers(const BtContext& ctx) {
    return opponentsNearNet(ctx, ctx.tunables.thresholds.blockerBand);
}

bool isGapInBlock(const BtContext& ctx, AttackLane side) {
    TeamSide opp = opponent(ctx.self.team);
    double sideX = side == AttackLane::LEFT ? 0.25 : 0.75;
    const Thresholds& th = ctx.tunables.thresholds;
    for (const auto& p : ctx.players) {
        if (p.team != opp) continue;
        if (std::abs(p.position.y - ctx.bb.netY) >= th.blockerBand) continue;
        if (std::abs(p.position.x - sideX) < th.gapHalfWidth) return false;
    }
    return true;
}

bool isDefenseSetForAttack(const BtContext& ctx) {
    TeamSide opp = opponent(ctx.self.team);
    int front = 0;
    int back = 0;
    for (const auto& p : ctx.players) {
        if (p.team != opp) continue;
        double d = std::abs(p.position.y - ctx.bb.netY);
        if (d < 0.15) ++front;
        else if (d > 0.25) ++back;
    }
    return front >= 2 && back >= 2;
}

bool shouldUsePowerAttack(const BtContext& ctx) {
    return countOpponentBlockers(ctx) <= 1;
}

bool shouldUseTipShot(const BtContext& ctx) {
    if (!ctx.rng) return false;
    int blockers = countOpponentBlockers(ctx);
    const OffSpeedFrequency& f = ctx.tunables.offSpeed;
    double p = f.noBlock;
    if (blockers >= 3) p = f.tripleBlock;
    else if (blockers == 2) p = f.singleDouble;
    return ctx.rng->chance(p);
}

// --- Ball reading ---

bool canReachBallBeforeOthers(const BtContext& ctx, double priorityBias) {
    const Player& self = ctx.self;
    Vec2 ball = ctx.bb.ballPosition;
    double weight = ctx.tunables.thresholds.reachWeight;

    auto score = [&](const Player& p, double bias) {
        return p.position.distanceTo(ball) / std::max(0.001, p.maxSpeed) +
               (p.priority + bias) * weight;
    };

    double selfScore = score(self, priorityBias);
    bool beforeSelf = true;
    for (const auto& p : ctx.players) {
        if (p.id == self.id) {
            beforeSelf = false;
            continue;
        }
        if (p.team != self.team) continue;
        double s = score(p, 0.0);
        if (s < selfScore - 1e-6) return false;
        if (beforeSelf && std::abs(s - selfScore) <= 1e-6) return false;
    }
    return true;
}

bool isBallHighSet(const BtContext& ctx) {
    return ctx.bb.predictedLanding.distanceTo(ctx.bb.ballPosition) >
           ctx.tunables.thresholds.highSetDistance;
}

bool isBallQuickSet(const Blackboard& bb) {
    Vec2 l = bb.predictedLanding;
    return l.x > 0.35 && l.x < 0.65 && std::abs(l.y - bb.netY) < 0.12;
}

bool isBallHeadedToZone(const Blackboard& bb, AttackLane zone) {
    double x = bb.predictedLanding.x;
    if (zone == AttackLane::LEFT) return x < 0.35;
    if (zone == AttackLane::RIGHT) return x > 0.65;
    return x >= 0.35 && x <= 0.65;
}

bool isBallHeadedToOurSide(const Blackboard& bb) {
    double y = bb.predictedLanding.y;
    return bb.team == TeamSide::HOME ? y > bb.netY : y < bb.netY;
}

// --- Coverage and urgency ---

bool shouldSwitchCoverage(const BtContext& ctx) {
    Vec2 landing = ctx.bb.predictedLanding;
    double selfDist = ctx.self.position.distanceTo(landing);
    for (const auto& p : ctx.players) {
        if (p.team != ctx.self.team || p.id == ctx.self.id) continue;
        if (p.position.distanceTo(landing) < selfDist - 0.05) return false;
    }
    return selfDist < 0.2;
}

bool shouldCollapseCoverage(const BtContext& ctx) {
    if (ctx.bb.phase != RallyPhase::ATTACK_PHASE) return false;
    if (!ctx.bb.ballOnOurSide) return false;
    return std::abs(ctx.self.position.x - ctx.bb.predictedLanding.x) > 0.2;
}

bool shouldDive(const BtContext& ctx) {
    double d = ctx.self.position.distanceTo(ctx.bb.ballPosition);
    return ctx.bb.ballOnOurSide && d > 0.1 && d < 0.22 && canReachBallBeforeOthers(ctx, 0.0);
}

bool isEmergencyBall(const BtContext& ctx) {
    if (!ctx.bb.ballOnOurSide) return false;
    double closest = std::numeric_limits<double>::infinity();
    for (const auto& p : ctx.players) {
        if (p.team != ctx.self.team) continue;
        closest = std::min(closest, p.position.distanceTo(ctx.bb.ballPosition));
    }
    return closest > 0.15;
}

bool shouldTransitionToOffense(const Blackboard& bb) {
    return bb.ballOnOurSide && bb.touchCount >= 1 && bb.phase != RallyPhase::ATTACK_PHASE;
}

bool shouldTransitionToDefense(const Blackboard& bb) {
    return !bb.ballOnOurSide;
}

// --- Overlap ---

int playerZone(const Blackboard& bb, const Player& self) {
    return zoneForRole(bb.rotation, self.role);
}

bool isDiagonalToRole(const Blackboard& bb, const Player& self, Role other) {
    return isDiagonalPair(playerZone(bb, self), zoneForRole(bb.rotation, other));
}

bool isDiagonalToSetter(const Blackboard& bb, const Player& self) {
    return isDiagonalToRole(bb, self, Role::S);
}

ZoneRelationType playerZoneType(const Blackboard& bb, const Player& self) {
    return zoneRelationType(playerZone(bb, self));
}

} // namespace vb
