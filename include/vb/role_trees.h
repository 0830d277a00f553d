#pragma once

#include "vb/behavior_tree.h"
#include "vb/blackboard.h"
#include <initializer_list>

namespace vb {

// --- Role trees ---
// Each root is a selector: override, serving, emergency control,
// phase-specific behavior, then an always-succeeding fallback.

BtNode buildSetterTree();
BtNode buildOutsideTree(AttackLane side);
BtNode buildOppositeTree();
BtNode buildMiddleTree();
BtNode buildLiberoTree();

// Front-row outside hitters play the left pin, back-row ones the right
AttackLane outsideSideFor(const Blackboard& bb, const Player& player);

// Shared immutable tree for the player's category
const BtNode& treeFor(const Player& player, const Blackboard& bb);

// --- Shared subtrees and leaves ---

// Action emitting a goal intent for the evaluating player
BtNode goalAction(const std::string& name, GoalType goal, ReasonCode reason);

BtNode handleOverrideGoal();
BtNode servingBehavior();
BtNode baseFallback();

// Non-setter emergency set when the setter is out of position
BtNode emergencySetBehavior(double priorityBias);

// --- Condition nodes ---

BtNode phaseIs(RallyPhase phase);
BtNode phaseIn(std::initializer_list<RallyPhase> phases);
BtNode touchCountIs(int n);
BtNode frontRow();
BtNode backRow();
BtNode ballOnOurSide();
BtNode receivingServe();

// Our team is playing defense: the opponent has the ball, or it just
// arrived on our side from an attack
bool isTeamDefending(const Blackboard& bb);
BtNode teamDefending();

// Touch 1 has been taken in serve receive or transition
BtNode passIsUp();

} // namespace vb
