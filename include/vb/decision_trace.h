#pragma once

#include "vb/behavior_tree.h"
#include "vb/enums.h"
#include "vb/intent.h"
#include <string>
#include <vector>

namespace vb {

// One player's tree evaluation for one tick. Read by explainability
// tooling only, never by the simulation.
struct DecisionTrace {
    std::string playerId;
    int tick = 0;
    double timeMs = 0.0;
    RallyPhase phase = RallyPhase::PRE_SERVE;
    TraceNode root;
    bool hasSelectedIntent = false;
    Intent selectedIntent;
    std::vector<Intent> alternatives;
};

DecisionTrace makeDecisionTrace(const std::string& playerId, int tick, double timeMs,
                                RallyPhase phase, const BtResult& result);

// Pre-order
std::vector<const TraceNode*> flattenTrace(const TraceNode& root);
std::vector<const TraceNode*> findByKind(const TraceNode& root, NodeKind kind);
std::vector<const TraceNode*> failedConditions(const TraceNode& root);
std::vector<const TraceNode*> successfulActions(const TraceNode& root);

int traceDepth(const TraceNode& root);

// Names of the actions that ran, joined with ", "
std::string summarizeTrace(const TraceNode& root);

} // namespace vb
