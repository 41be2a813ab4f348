#pragma once

#include "erlangcore/types.hpp"

namespace erlangcore {

// Bounds for the forward staffing scan.
// ceiling = max(ceil(A * traffic_multiplier), min_agents + min_headroom, low_traffic_floor)
struct SearchConfig {
    double traffic_multiplier = 5.0;
    AgentCount min_headroom = 50;
    AgentCount low_traffic_floor = 10;
};

// Accepted input ranges for the calculator facade
struct ValidationLimits {
    double volume_min = 0.0;
    double volume_max = 100000.0;
    double aht_min = 1.0;
    double aht_max = 7200.0;               // 2 hours
    double threshold_min = 1.0;
    double threshold_max = 600.0;          // 10 minutes
    double shrinkage_max = 0.99;
    double max_occupancy_min = 0.50;
    double max_occupancy_max = 1.0;
    double patience_min = 10.0;
    double patience_max = 1800.0;          // 30 minutes
    double interval_minutes_min = 1.0;
    double interval_minutes_max = 60.0;
};

struct Config {
    SearchConfig search;

    ValidationLimits limits;

    // Throw InvalidInputException instead of returning the errors in the result
    bool throw_on_invalid_input = false;

    // Evaluate the fixed headcount (when supplied) alongside the forward solve
    bool evaluate_achievable = true;
};

} // namespace erlangcore
