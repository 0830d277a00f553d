#pragma once

#include "vb/enums.h"
#include "vb/intent.h"
#include <functional>
#include <string>
#include <vector>

namespace vb {

struct BtContext;   // blackboard.h

enum class BtStatus : uint8_t { SUCCESS, FAILURE, RUNNING };

enum class NodeKind : uint8_t { SEQUENCE, SELECTOR, CONDITION, ACTION, DECORATOR };

enum class DecoratorKind : uint8_t {
    YIELD,          // always succeeds, defers to default movement
    REQUEST_GOAL,   // emits a goal intent for the evaluating player
    INVERT,
};

struct ActionOutcome {
    BtStatus status = BtStatus::SUCCESS;
    std::vector<Intent> intents;
    std::string note;
};

using ConditionFn = std::function<bool(const BtContext&)>;
using ActionFn = std::function<ActionOutcome(const BtContext&)>;

// Tagged node. Which fields are meaningful depends on `kind`.
struct BtNode {
    NodeKind kind = NodeKind::ACTION;
    std::string name;
    std::vector<BtNode> children;       // composites and decorators
    ConditionFn check;                  // CONDITION
    ActionFn action;                    // ACTION
    DecoratorKind decorator = DecoratorKind::YIELD;
    GoalType goal = GoalType::MaintainBaseResponsibility;   // REQUEST_GOAL
    ReasonCode reason = ReasonCode::BASE_RESPONSIBILITY;    // REQUEST_GOAL
};

struct TraceNode {
    NodeKind kind = NodeKind::ACTION;
    std::string name;
    BtStatus status = BtStatus::FAILURE;
    std::string note;
    std::vector<TraceNode> children;
};

struct BtResult {
    BtStatus status = BtStatus::FAILURE;
    std::vector<Intent> intents;
    TraceNode trace;
};

// --- Builders ---

BtNode sequence(const std::string& name, std::vector<BtNode> children);
BtNode selector(const std::string& name, std::vector<BtNode> children);
BtNode condition(const std::string& name, ConditionFn fn);
BtNode action(const std::string& name, ActionFn fn);
BtNode yieldToMovement(BtNode child);
BtNode yieldToMovement();
BtNode requestGoal(GoalType goal, ReasonCode reason);
BtNode invert(BtNode child);

// Pure and synchronous. A sequence keeps the intents of its children only
// when it does not fail; a selector drops the intents of failed children.
BtResult evaluate(const BtNode& node, const BtContext& ctx);

const char* toString(BtStatus status);
const char* toString(NodeKind kind);

} // namespace vb
