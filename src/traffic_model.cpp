#include "erlangcore/traffic_model.hpp"

#include <algorithm>

namespace erlangcore {

double traffic_intensity(double volume, double aht, double interval_seconds) {
    if (volume <= 0.0 || aht <= 0.0 || interval_seconds <= 0.0) {
        return 0.0;
    }
    return (volume * aht) / interval_seconds;
}

double traffic_intensity(const WorkloadInput& workload) {
    return traffic_intensity(workload.volume, workload.aht, workload.interval_seconds());
}

double effective_aht(double aht, std::int32_t concurrency) {
    if (concurrency <= 1) {
        return aht;
    }
    return aht / static_cast<double>(concurrency);
}

double occupancy(double traffic, double agents) {
    if (agents <= 0.0) {
        return 0.0;
    }
    return std::clamp(traffic / agents, 0.0, 1.0);
}

} // namespace erlangcore
