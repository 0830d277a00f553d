#include "vb/decision_trace.h"
#include <algorithm>

namespace vb {

DecisionTrace makeDecisionTrace(const std::string& playerId, int tick, double timeMs,
                                RallyPhase phase, const BtResult& result) {
    DecisionTrace t;
    t.playerId = playerId;
    t.tick = tick;
    t.timeMs = timeMs;
    t.phase = phase;
    t.root = result.trace;
    if (!result.intents.empty()) {
        t.hasSelectedIntent = true;
        t.selectedIntent = result.intents.front();
        t.alternatives.assign(result.intents.begin() + 1, result.intents.end());
    }
    return t;
}

namespace {

void collect(const TraceNode& node, std::vector<const TraceNode*>& out) {
    out.push_back(&node);
    for (const auto& c : node.children) collect(c, out);
}

template<typename Pred>
std::vector<const TraceNode*> filterTrace(const TraceNode& root, Pred&& pred) {
    std::vector<const TraceNode*> out;
    for (const TraceNode* n : flattenTrace(root)) {
        if (pred(*n)) out.push_back(n);
    }
    return out;
}

} // anonymous namespace

std::vector<const TraceNode*> flattenTrace(const TraceNode& root) {
    std::vector<const TraceNode*> out;
    collect(root, out);
    return out;
}

std::vector<const TraceNode*> findByKind(const TraceNode& root, NodeKind kind) {
    return filterTrace(root, [kind](const TraceNode& n) { return n.kind == kind; });
}

std::vector<const TraceNode*> failedConditions(const TraceNode& root) {
    return filterTrace(root, [](const TraceNode& n) {
        return n.kind == NodeKind::CONDITION && n.status == BtStatus::FAILURE;
    });
}

std::vector<const TraceNode*> successfulActions(const TraceNode& root) {
    return filterTrace(root, [](const TraceNode& n) {
        return n.kind == NodeKind::ACTION && n.status == BtStatus::SUCCESS;
    });
}

int traceDepth(const TraceNode& root) {
    int deepest = 0;
    for (const auto& c : root.children) {
        deepest = std::max(deepest, traceDepth(c));
    }
    return deepest + 1;
}

std::string summarizeTrace(const TraceNode& root) {
    auto actions = successfulActions(root);
    if (actions.empty()) return "No actions taken";

    std::string out;
    for (const TraceNode* a : actions) {
        if (a->name.empty()) continue;
        if (!out.empty()) out += ", ";
        out += a->name;
    }
    if (out.empty()) return std::to_string(actions.size()) + " action(s) executed";
    return out;
}

} // namespace vb
