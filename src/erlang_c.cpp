#include "erlangcore/erlang_c.hpp"
#include "erlangcore/erlang_b.hpp"

#include <algorithm>
#include <cmath>

namespace erlangcore {

double erlang_c(AgentCount agents, double traffic) {
    if (traffic <= 0.0) {
        return 0.0;
    }
    // Unstable queue: every contact waits
    if (static_cast<double>(agents) <= traffic) {
        return 1.0;
    }

    double c = static_cast<double>(agents);
    double b = erlang_b(c, traffic);
    double pwait = (b * c) / (c - traffic + traffic * b);

    // Absorb floating-point drift
    return std::clamp(pwait, 0.0, 1.0);
}

double probability_wait_exceeds(AgentCount agents, double traffic,
                                double aht, double threshold_seconds) {
    if (aht <= 0.0 || threshold_seconds < 0.0) {
        return 0.0;
    }
    if (traffic <= 0.0) {
        return 0.0;
    }
    if (static_cast<double>(agents) <= traffic) {
        return 1.0;
    }

    double exponent = -(static_cast<double>(agents) - traffic) * (threshold_seconds / aht);
    double result = erlang_c(agents, traffic) * std::exp(exponent);
    return std::clamp(result, 0.0, 1.0);
}

double service_level(AgentCount agents, double traffic,
                     double aht, double threshold_seconds) {
    if (agents <= 0 || traffic <= 0.0) {
        return 1.0;  // No calls: nothing can miss the threshold
    }
    return 1.0 - probability_wait_exceeds(agents, traffic, aht, threshold_seconds);
}

double average_speed_of_answer(AgentCount agents, double traffic, double aht) {
    if (traffic <= 0.0) {
        return 0.0;
    }
    if (static_cast<double>(agents) <= traffic) {
        return kUnboundedAsa;
    }

    double asa = (erlang_c(agents, traffic) * aht) / (static_cast<double>(agents) - traffic);
    return std::max(0.0, asa);
}

} // namespace erlangcore
