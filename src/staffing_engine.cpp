#include "erlangcore/staffing_engine.hpp"
#include "erlangcore/achievable_metrics.hpp"
#include "erlangcore/service_level_projector.hpp"
#include "erlangcore/shrinkage.hpp"
#include "erlangcore/staffing_search.hpp"
#include "erlangcore/traffic_model.hpp"

#include <algorithm>

namespace erlangcore {

namespace {

StaffingMetrics no_load_metrics(ErlangVariant model, double traffic, double volume) {
    StaffingMetrics m;
    m.model = model;
    m.traffic_intensity = traffic;
    m.required_agents = 0;
    m.total_fte = 0.0;
    m.service_level = 1.0;
    m.asa = 0.0;
    m.occupancy = 0.0;
    m.can_achieve_target = true;

    if (model == ErlangVariant::B) {
        m.blocking_probability = 0.0;
    } else if (model == ErlangVariant::A) {
        m.abandonment_rate = 0.0;
        m.expected_abandonments = 0.0;
        m.answered_contacts = std::max(0.0, volume);
    }
    return m;
}

StaffingMetrics infeasible_metrics(ErlangVariant model, double traffic) {
    StaffingMetrics m;
    m.model = model;
    m.traffic_intensity = traffic;
    m.required_agents = 0;
    m.total_fte = 0.0;
    m.service_level = 0.0;
    m.asa = kUnboundedAsa;
    m.occupancy = 0.0;
    m.can_achieve_target = false;
    return m;
}

} // anonymous namespace

// ==================== Forward solve ====================

StaffingMetrics calculate_staffing_metrics(const WorkloadInput& workload,
                                           const Constraints& constraints,
                                           const Behavior& behavior,
                                           const SearchConfig& search) {
    // Erlang C needs no optional parameter, so the result is always present
    auto metrics = calculate_staffing(ErlangVariant::C, workload, constraints, behavior, search);
    return metrics.value_or(infeasible_metrics(ErlangVariant::C, traffic_intensity(workload)));
}

std::optional<StaffingMetrics> calculate_staffing(ErlangVariant model,
                                                  const WorkloadInput& workload,
                                                  const Constraints& constraints,
                                                  const Behavior& behavior,
                                                  const SearchConfig& search) {
    StaffingSearch solver(search);

    auto queue_model = make_queue_model(model, behavior);
    if (!queue_model) {
        return std::nullopt;
    }

    double aht = effective_aht(workload.aht, behavior.concurrency);
    double traffic = traffic_intensity(workload.volume, aht, workload.interval_seconds());

    if (traffic <= 0.0) {
        return no_load_metrics(model, traffic, workload.volume);
    }

    auto agents = solver.solve(*queue_model, traffic, aht,
                               constraints.target_service_level,
                               constraints.threshold_seconds,
                               constraints.max_occupancy);
    if (!agents) {
        return infeasible_metrics(model, traffic);
    }

    Projection p = queue_model->project(*agents, traffic, aht, constraints.threshold_seconds);

    StaffingMetrics m;
    m.model = model;
    m.traffic_intensity = traffic;
    m.required_agents = *agents;
    m.total_fte = fte(*agents, behavior.shrinkage);
    m.service_level = p.service_level;
    m.asa = p.asa;
    m.occupancy = p.occupancy;
    m.can_achieve_target = p.service_level >= constraints.target_service_level;
    m.blocking_probability = p.blocking_probability;

    if (p.abandonment_rate) {
        double expected = workload.volume * *p.abandonment_rate;
        m.abandonment_rate = p.abandonment_rate;
        m.expected_abandonments = expected;
        m.answered_contacts = workload.volume - expected;
    }
    return m;
}

std::optional<StaffingMetrics> calculate_staffing(const std::string& model,
                                                  const WorkloadInput& workload,
                                                  const Constraints& constraints,
                                                  const Behavior& behavior,
                                                  const SearchConfig& search) {
    return calculate_staffing(normalize_model(model), workload, constraints, behavior, search);
}

// ==================== Reverse solve ====================

std::optional<AchievableMetrics> calculate_achievable_metrics(ErlangVariant model,
                                                              AgentCount fixed_agents,
                                                              const WorkloadInput& workload,
                                                              const Constraints& constraints,
                                                              const Behavior& behavior) {
    if (fixed_agents <= 0) {
        return std::nullopt;
    }

    auto queue_model = make_queue_model(model, behavior);
    if (!queue_model) {
        return std::nullopt;
    }

    AchievableMetricsEvaluator evaluator;
    return evaluator.evaluate(*queue_model, fixed_agents, workload, constraints, behavior);
}

std::optional<AchievableMetrics> calculate_achievable_metrics(const std::string& model,
                                                              AgentCount fixed_agents,
                                                              const WorkloadInput& workload,
                                                              const Constraints& constraints,
                                                              const Behavior& behavior) {
    return calculate_achievable_metrics(normalize_model(model), fixed_agents,
                                        workload, constraints, behavior);
}

} // namespace erlangcore
