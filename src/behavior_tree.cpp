#include "vb/behavior_tree.h"
#include "vb/blackboard.h"
#include <iterator>

namespace vb {

// --- Builders ---

BtNode sequence(const std::string& name, std::vector<BtNode> children) {
    BtNode n;
    n.kind = NodeKind::SEQUENCE;
    n.name = name;
    n.children = std::move(children);
    return n;
}

BtNode selector(const std::string& name, std::vector<BtNode> children) {
    BtNode n;
    n.kind = NodeKind::SELECTOR;
    n.name = name;
    n.children = std::move(children);
    return n;
}

BtNode condition(const std::string& name, ConditionFn fn) {
    BtNode n;
    n.kind = NodeKind::CONDITION;
    n.name = name;
    n.check = std::move(fn);
    return n;
}

BtNode action(const std::string& name, ActionFn fn) {
    BtNode n;
    n.kind = NodeKind::ACTION;
    n.name = name;
    n.action = std::move(fn);
    return n;
}

BtNode yieldToMovement(BtNode child) {
    BtNode n;
    n.kind = NodeKind::DECORATOR;
    n.decorator = DecoratorKind::YIELD;
    n.name = "Yield";
    n.children.push_back(std::move(child));
    return n;
}

BtNode yieldToMovement() {
    BtNode n;
    n.kind = NodeKind::DECORATOR;
    n.decorator = DecoratorKind::YIELD;
    n.name = "Yield";
    return n;
}

BtNode requestGoal(GoalType goal, ReasonCode reason) {
    BtNode n;
    n.kind = NodeKind::DECORATOR;
    n.decorator = DecoratorKind::REQUEST_GOAL;
    n.name = std::string("RequestGoal:") + toString(goal);
    n.goal = goal;
    n.reason = reason;
    return n;
}

BtNode invert(BtNode child) {
    BtNode n;
    n.kind = NodeKind::DECORATOR;
    n.decorator = DecoratorKind::INVERT;
    n.name = "Invert";
    n.children.push_back(std::move(child));
    return n;
}

// --- Evaluation ---

namespace {

void append(std::vector<Intent>& dst, std::vector<Intent>& src) {
    dst.insert(dst.end(), std::make_move_iterator(src.begin()),
               std::make_move_iterator(src.end()));
}

BtResult evaluateSequence(const BtNode& node, const BtContext& ctx) {
    BtResult r;
    r.status = BtStatus::SUCCESS;
    std::vector<Intent> collected;
    for (const auto& child : node.children) {
        BtResult c = evaluate(child, ctx);
        r.trace.children.push_back(std::move(c.trace));
        append(collected, c.intents);
        if (c.status != BtStatus::SUCCESS) {
            r.status = c.status;
            break;
        }
    }
    if (r.status != BtStatus::FAILURE) r.intents = std::move(collected);
    return r;
}

BtResult evaluateSelector(const BtNode& node, const BtContext& ctx) {
    BtResult r;
    r.status = BtStatus::FAILURE;
    for (const auto& child : node.children) {
        BtResult c = evaluate(child, ctx);
        r.trace.children.push_back(std::move(c.trace));
        if (c.status != BtStatus::FAILURE) {
            r.status = c.status;
            r.intents = std::move(c.intents);
            break;
        }
    }
    return r;
}

BtResult evaluateDecorator(const BtNode& node, const BtContext& ctx) {
    BtResult r;
    switch (node.decorator) {
        case DecoratorKind::YIELD:
            if (!node.children.empty()) {
                BtResult c = evaluate(node.children.front(), ctx);
                r.trace.children.push_back(std::move(c.trace));
                r.intents = std::move(c.intents);
            }
            r.status = BtStatus::SUCCESS;
            r.trace.note = "yield";
            break;
        case DecoratorKind::REQUEST_GOAL:
            r.status = BtStatus::SUCCESS;
            r.intents.push_back(makeGoalIntent(ctx.self.id, node.goal, node.reason));
            r.trace.note = toString(node.goal);
            break;
        case DecoratorKind::INVERT: {
            r.status = BtStatus::FAILURE;
            if (!node.children.empty()) {
                BtResult c = evaluate(node.children.front(), ctx);
                r.trace.children.push_back(std::move(c.trace));
                if (c.status == BtStatus::FAILURE) r.status = BtStatus::SUCCESS;
                else if (c.status == BtStatus::RUNNING) r.status = BtStatus::RUNNING;
            }
            break;
        }
    }
    return r;
}

} // anonymous namespace

BtResult evaluate(const BtNode& node, const BtContext& ctx) {
    BtResult r;
    switch (node.kind) {
        case NodeKind::SEQUENCE:
            r = evaluateSequence(node, ctx);
            break;
        case NodeKind::SELECTOR:
            r = evaluateSelector(node, ctx);
            break;
        case NodeKind::CONDITION:
            r.status = node.check && node.check(ctx) ? BtStatus::SUCCESS : BtStatus::FAILURE;
            break;
        case NodeKind::ACTION:
            if (node.action) {
                ActionOutcome out = node.action(ctx);
                r.status = out.status;
                r.intents = std::move(out.intents);
                r.trace.note = std::move(out.note);
            }
            break;
        case NodeKind::DECORATOR:
            r = evaluateDecorator(node, ctx);
            break;
    }
    r.trace.kind = node.kind;
    r.trace.name = node.name;
    r.trace.status = r.status;
    return r;
}

const char* toString(BtStatus status) {
    switch (status) {
        case BtStatus::SUCCESS: return "SUCCESS";
        case BtStatus::FAILURE: return "FAILURE";
        case BtStatus::RUNNING: return "RUNNING";
    }
    return "FAILURE";
}

const char* toString(NodeKind kind) {
    switch (kind) {
        case NodeKind::SEQUENCE: return "SEQUENCE";
        case NodeKind::SELECTOR: return "SELECTOR";
        case NodeKind::CONDITION: return "CONDITION";
        case NodeKind::ACTION: return "ACTION";
        case NodeKind::DECORATOR: return "DECORATOR";
    }
    return "ACTION";
}

} // namespace vb
