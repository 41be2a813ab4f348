#pragma once

#include "erlangcore/types.hpp"
#include "erlangcore/config.hpp"
#include "erlangcore/service_level_projector.hpp"

#include <optional>

namespace erlangcore {

// Inverts "agents -> service level" by a linear upward scan.
//
// Service level is non-decreasing in the agent count for fixed traffic,
// so the first candidate that meets the target is the minimum. The scan
// starts at ceil(A / max_occupancy) and stops at a ceiling derived from
// SearchConfig. An empty result means the target is out of reach, or the
// traffic needs more agents than AgentCount can represent. Bounds saturate
// at the largest AgentCount.
class StaffingSearch {
public:
    explicit StaffingSearch(SearchConfig config = SearchConfig{});

    // Erlang C forward solve
    std::optional<AgentCount> solve_agents(double traffic, double aht,
                                           double target_service_level,
                                           double threshold_seconds,
                                           double max_occupancy) const;

    // Any model. Erlang A never returns more than the Erlang C solution; when
    // nothing up to that count meets the target, that count is returned and
    // the caller must check the projected service level.
    std::optional<AgentCount> solve(const QueueModel& model, double traffic, double aht,
                                    double target_service_level,
                                    double threshold_seconds,
                                    double max_occupancy) const;

    AgentCount min_agents(double traffic, double max_occupancy) const;
    AgentCount max_agents(double traffic, double max_occupancy) const;

    const SearchConfig& config() const noexcept;

private:
    SearchConfig config_;

    std::optional<AgentCount> scan(const QueueModel& model, double traffic, double aht,
                                   double target_service_level, double threshold_seconds,
                                   AgentCount first, AgentCount last) const;
};

// Occupancy caps outside (0,1] mean "no cap"
double normalize_max_occupancy(double max_occupancy);

// ceil(A / max_occupancy), saturating at the largest AgentCount
AgentCount agents_for_occupancy(double traffic, double max_occupancy);

} // namespace erlangcore
