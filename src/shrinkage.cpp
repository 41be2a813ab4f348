#include "erlangcore/shrinkage.hpp"

#include <algorithm>
#include <limits>

namespace erlangcore {

double fte(double productive_agents, double shrinkage) {
    if (shrinkage >= 1.0) {
        return std::numeric_limits<double>::infinity();
    }
    if (shrinkage < 0.0) {
        shrinkage = 0.0;
    }
    return productive_agents / (1.0 - shrinkage);
}

double effective_shrinkage(double shrinkage, double productivity_modifier) {
    double productive_share = (1.0 - shrinkage) * productivity_modifier;
    return std::clamp(1.0 - productive_share, 0.0, 1.0);
}

} // namespace erlangcore
