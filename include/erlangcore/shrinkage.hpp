#pragma once

#include "erlangcore/types.hpp"

namespace erlangcore {

// Paid FTE needed to field `productive_agents`: productive / (1 - shrinkage).
// Negative shrinkage counts as 0; shrinkage >= 1 yields +inf.
double fte(double productive_agents, double shrinkage);

// Shrinkage after a productivity modifier scales the productive share:
// 1 - (1 - shrinkage) * modifier, clamped to [0,1].
double effective_shrinkage(double shrinkage, double productivity_modifier);

} // namespace erlangcore
