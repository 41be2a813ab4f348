#pragma once

#include "erlangcore/types.hpp"
#include "erlangcore/config.hpp"

#include <optional>
#include <string>

namespace erlangcore {

// ==================== Forward solve ====================
//
// The forward solvers report an unreachable target through the result.
// The one exception is the search configuration: an invalid `search`
// throws InvalidConfigException before any input is looked at.

// Erlang C staffing. Infeasible targets come back with required_agents = 0,
// can_achieve_target = false and an unbounded ASA.
StaffingMetrics calculate_staffing_metrics(const WorkloadInput& workload,
                                           const Constraints& constraints,
                                           const Behavior& behavior,
                                           const SearchConfig& search = SearchConfig{});

// Staffing under any model. Empty when the model needs a parameter that
// `behavior` does not supply (Erlang A without patience).
//
// can_achieve_target is true only when service_level meets the target.
// Erlang A can return the Erlang C headcount with can_achieve_target = false
// when abandonment keeps the service level under the target at every count
// up to it.
std::optional<StaffingMetrics> calculate_staffing(ErlangVariant model,
                                                  const WorkloadInput& workload,
                                                  const Constraints& constraints,
                                                  const Behavior& behavior,
                                                  const SearchConfig& search = SearchConfig{});

std::optional<StaffingMetrics> calculate_staffing(const std::string& model,
                                                  const WorkloadInput& workload,
                                                  const Constraints& constraints,
                                                  const Behavior& behavior,
                                                  const SearchConfig& search = SearchConfig{});

// ==================== Reverse solve ====================

// Empty when the model needs a missing parameter or fixed_agents <= 0.
// constraints.target_service_level is ignored.
std::optional<AchievableMetrics> calculate_achievable_metrics(ErlangVariant model,
                                                              AgentCount fixed_agents,
                                                              const WorkloadInput& workload,
                                                              const Constraints& constraints,
                                                              const Behavior& behavior);

std::optional<AchievableMetrics> calculate_achievable_metrics(const std::string& model,
                                                              AgentCount fixed_agents,
                                                              const WorkloadInput& workload,
                                                              const Constraints& constraints,
                                                              const Behavior& behavior);

} // namespace erlangcore
