#pragma once

#include "erlangcore/types.hpp"

namespace erlangcore {

// Offered load in Erlangs: volume * aht / interval_seconds.
// Any non-positive input means "no load" and yields 0.
double traffic_intensity(double volume, double aht, double interval_seconds);
double traffic_intensity(const WorkloadInput& workload);

// Handle time seen by one agent working `concurrency` contacts at once
double effective_aht(double aht, std::int32_t concurrency);

// Fraction of time agents are busy, clamped to [0,1]. 0 when agents <= 0.
double occupancy(double traffic, double agents);

} // namespace erlangcore
