#pragma once

#include "erlangcore/types.hpp"
#include "erlangcore/service_level_projector.hpp"

#include <optional>

namespace erlangcore {

// Reverse solve: what a fixed headcount can deliver under an occupancy cap.
//
// When A / actual_agents exceeds the cap, the headcount cannot carry the
// load without running agents above the ceiling. The evaluator then
// reports the shortfall against ceil(A / max_occupancy), derives
// effective_agents = actual * penalty with penalty = actual / required,
// and degrades the projected service level and ASA by that penalty.
class AchievableMetricsEvaluator {
public:
    AchievableMetrics evaluate(const QueueModel& model, AgentCount actual_agents,
                               const WorkloadInput& workload,
                               const Constraints& constraints,
                               const Behavior& behavior) const;
};

} // namespace erlangcore
