#include "erlangcore/erlang_b.hpp"

#include <algorithm>
#include <cmath>

namespace erlangcore {

double erlang_b(double agents, double traffic) {
    if (agents <= 0.0) {
        return 1.0;
    }
    if (traffic <= 0.0) {
        return 0.0;
    }

    // Truncation, not rounding: 10.9 agents behave as 10
    auto lines = static_cast<long long>(std::floor(agents));

    double b = 1.0;
    for (long long k = 1; k <= lines; ++k) {
        double ab = traffic * b;
        b = ab / (static_cast<double>(k) + ab);
    }
    return std::clamp(b, 0.0, 1.0);
}

AgentCount required_lines(double traffic, double target_blocking, AgentCount max_lines) {
    if (traffic <= 0.0) {
        return 0;
    }
    if (traffic >= static_cast<double>(max_lines)) {
        return max_lines;
    }

    auto lines = static_cast<AgentCount>(std::floor(traffic));
    while (erlang_b(lines, traffic) > target_blocking) {
        if (lines >= max_lines) {
            return max_lines;
        }
        ++lines;
    }
    return lines;
}

} // namespace erlangcore
