#include "erlangcore/achievable_metrics.hpp"
#include "erlangcore/shrinkage.hpp"
#include "erlangcore/staffing_search.hpp"
#include "erlangcore/traffic_model.hpp"

#include <algorithm>

namespace erlangcore {

AchievableMetrics AchievableMetricsEvaluator::evaluate(const QueueModel& model,
                                                       AgentCount actual_agents,
                                                       const WorkloadInput& workload,
                                                       const Constraints& constraints,
                                                       const Behavior& behavior) const
{
    double aht = effective_aht(workload.aht, behavior.concurrency);
    double traffic = traffic_intensity(workload.volume, aht, workload.interval_seconds());
    double max_occupancy = normalize_max_occupancy(constraints.max_occupancy);

    AchievableMetrics result;
    result.model = model.variant();
    result.traffic_intensity = traffic;
    result.actual_agents = actual_agents;
    result.effective_agents = static_cast<double>(actual_agents);
    result.total_fte = fte(actual_agents, behavior.shrinkage);

    Projection p = model.project(actual_agents, traffic, aht, constraints.threshold_seconds);
    result.service_level = p.service_level;
    result.asa = p.asa;
    result.occupancy = p.occupancy;
    result.blocking_probability = p.blocking_probability;
    if (p.abandonment_rate) {
        result.abandonment_rate = p.abandonment_rate;
        result.expected_abandonments = std::max(0.0, workload.volume) * *p.abandonment_rate;
    }

    if (traffic <= 0.0) {
        return result;
    }

    AgentCount required = agents_for_occupancy(traffic, max_occupancy);
    result.required_agents_for_max_occupancy = required;

    // Naive occupancy A / actual above the cap <=> actual below ceil(A / cap)
    if (actual_agents >= required || actual_agents <= 0) {
        return result;
    }

    double penalty = std::clamp(static_cast<double>(actual_agents) /
                                static_cast<double>(required), 0.0, 1.0);

    result.occupancy_cap_applied = true;
    result.occupancy_penalty = penalty;
    result.agent_shortfall = required - actual_agents;
    result.effective_agents = static_cast<double>(actual_agents) * penalty;
    result.service_level = std::clamp(result.service_level * penalty, 0.0, 1.0);
    if (!is_unbounded(result.asa) && penalty > 0.0) {
        result.asa = result.asa / penalty;
    }
    return result;
}

} // namespace erlangcore
