#include "erlangcore/staffing_search.hpp"
#include "erlangcore/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace erlangcore {

namespace {

constexpr AgentCount kMaxAgentCount = std::numeric_limits<AgentCount>::max();

// ceil(value) as an agent count, saturating at kMaxAgentCount
AgentCount ceil_agents(double value) {
    if (!(value > 0.0)) {
        return 0;
    }
    double up = std::ceil(value);
    if (up >= static_cast<double>(kMaxAgentCount)) {
        return kMaxAgentCount;
    }
    return static_cast<AgentCount>(up);
}

AgentCount saturating_add(AgentCount a, AgentCount b) {
    return (a > kMaxAgentCount - b) ? kMaxAgentCount : a + b;
}

} // anonymous namespace

double normalize_max_occupancy(double max_occupancy) {
    if (!(max_occupancy > 0.0) || max_occupancy > 1.0) {
        return 1.0;
    }
    return max_occupancy;
}

StaffingSearch::StaffingSearch(SearchConfig config)
    : config_(std::move(config))
{
    if (!std::isfinite(config_.traffic_multiplier) || config_.traffic_multiplier <= 0.0) {
        throw InvalidConfigException("Search traffic multiplier must be positive, got " +
                                     std::to_string(config_.traffic_multiplier));
    }
    if (config_.min_headroom < 0 || config_.low_traffic_floor < 0) {
        throw InvalidConfigException("Search headroom and floor must not be negative");
    }
}

const SearchConfig& StaffingSearch::config() const noexcept {
    return config_;
}

AgentCount agents_for_occupancy(double traffic, double max_occupancy) {
    if (traffic <= 0.0) {
        return 0;
    }
    // Fewest agents that keep occupancy under the cap with zero queueing
    return ceil_agents(traffic / normalize_max_occupancy(max_occupancy));
}

AgentCount StaffingSearch::min_agents(double traffic, double max_occupancy) const {
    return agents_for_occupancy(traffic, max_occupancy);
}

AgentCount StaffingSearch::max_agents(double traffic, double max_occupancy) const {
    AgentCount lower = min_agents(traffic, max_occupancy);
    AgentCount scaled = ceil_agents(traffic * config_.traffic_multiplier);
    return std::max({scaled, saturating_add(lower, config_.min_headroom),
                     config_.low_traffic_floor});
}

std::optional<AgentCount> StaffingSearch::solve_agents(double traffic, double aht,
                                                       double target_service_level,
                                                       double threshold_seconds,
                                                       double max_occupancy) const {
    ErlangCModel model;
    return solve(model, traffic, aht, target_service_level, threshold_seconds, max_occupancy);
}

std::optional<AgentCount> StaffingSearch::solve(const QueueModel& model, double traffic,
                                                double aht, double target_service_level,
                                                double threshold_seconds,
                                                double max_occupancy) const {
    if (std::isnan(traffic)) {
        return std::nullopt;
    }
    if (traffic <= 0.0 || aht <= 0.0) {
        return 0;  // No load, no agents
    }

    AgentCount first = min_agents(traffic, max_occupancy);
    if (first > kMaxAgentCount - config_.min_headroom) {
        return std::nullopt;  // Too much traffic for any representable headcount
    }
    AgentCount last = max_agents(traffic, max_occupancy);

    if (model.variant() != ErlangVariant::A) {
        return scan(model, traffic, aht, target_service_level, threshold_seconds, first, last);
    }

    // The Erlang C answer caps the abandonment model. If no count up to the
    // cap meets the target, the cap is returned and its projected service
    // level shows the miss.
    ErlangCModel infinite_patience;
    auto bound = scan(infinite_patience, traffic, aht, target_service_level,
                      threshold_seconds, first, last);
    if (bound) {
        last = *bound;
    }

    auto found = scan(model, traffic, aht, target_service_level, threshold_seconds, first, last);
    if (found) {
        return found;
    }
    return bound;
}

std::optional<AgentCount> StaffingSearch::scan(const QueueModel& model, double traffic,
                                               double aht, double target_service_level,
                                               double threshold_seconds,
                                               AgentCount first, AgentCount last) const {
    for (std::int64_t n = std::max<AgentCount>(first, 1); n <= last; ++n) {
        auto agents = static_cast<AgentCount>(n);
        Projection p = model.project(agents, traffic, aht, threshold_seconds);
        if (p.service_level >= target_service_level) {
            return agents;
        }
    }
    return std::nullopt;
}

} // namespace erlangcore
