#pragma once

#include "vb/blackboard.h"
#include "vb/overlap.h"

namespace vb {

// Tactical predicates over a tree context. All are deterministic except
// shouldUseTipShot, which draws from ctx.rng.

// --- Rows and receive formation ---

bool isFrontRow(const Blackboard& bb, const Player& p);
bool isBackRow(const Blackboard& bb, const Player& p);

enum class StackType : uint8_t { LEFT, MIDDLE, RIGHT };

// R1 stacks right, R2 middle, the rest left
StackType receiveStackType(int rotation);

// Front-row OH in R1, front-row OPP in R2
bool isPinnedAtNet(const Blackboard& bb, const Player& self);

// Front-row OPP in R1 and R3, front-row OH in R2
bool shouldComeBackToReceive(const Blackboard& bb, const Player& self);

bool isPrimaryPasser(const Player& self);

// --- Setting ---

// Setting zone for a team: (0.7, 0.58) on the HOME side
Vec2 settingZoneFor(TeamSide team);

bool isInSystem(const BtContext& ctx);
bool shouldSetterBail(const BtContext& ctx);
bool isSetterInPosition(const BtContext& ctx);

bool isHitterInApproach(const BtContext& ctx, const Player& hitter, AttackLane zone);
bool isMiddleReadyForQuick(const BtContext& ctx);

// Front-row opposite available for a back set
bool isOppositeAvailable(const BtContext& ctx);

enum class AttackOption : uint8_t { QUICK_MIDDLE, HIGH_OUTSIDE, BACK_SET, BACK_ROW };

AttackOption bestAttackOption(const BtContext& ctx, bool inSystem);

// --- Opposing block ---

int countOpponentBlockers(const BtContext& ctx);
bool isGapInBlock(const BtContext& ctx, AttackLane side);
bool isDefenseSetForAttack(const BtContext& ctx);
bool shouldUsePowerAttack(const BtContext& ctx);

// Off-speed frequency by blocker count. False without a random source.
bool shouldUseTipShot(const BtContext& ctx);

// --- Ball reading ---

// Lower (distance / speed + (priority + bias) * weight) wins; exact ties go
// to the earlier player in list order
bool canReachBallBeforeOthers(const BtContext& ctx, double priorityBias = 0.0);

bool isBallHighSet(const BtContext& ctx);
bool isBallQuickSet(const Blackboard& bb);
bool isBallHeadedToZone(const Blackboard& bb, AttackLane zone);
bool isBallHeadedToOurSide(const Blackboard& bb);

// --- Coverage and urgency ---

bool shouldSwitchCoverage(const BtContext& ctx);
bool shouldCollapseCoverage(const BtContext& ctx);
bool shouldDive(const BtContext& ctx);
bool isEmergencyBall(const BtContext& ctx);
bool shouldTransitionToOffense(const Blackboard& bb);
bool shouldTransitionToDefense(const Blackboard& bb);

// --- Overlap ---

// The libero is placed in the zone of the middle it replaces
int playerZone(const Blackboard& bb, const Player& self);
bool isDiagonalToRole(const Blackboard& bb, const Player& self, Role other);
bool isDiagonalToSetter(const Blackboard& bb, const Player& self);
ZoneRelationType playerZoneType(const Blackboard& bb, const Player& self);

} // namespace vb
