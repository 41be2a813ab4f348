#pragma once

#include "erlangcore/types.hpp"

namespace erlangcore {

// Blocking probability of a loss system with `agents` servers.
//
// Uses the recurrence B(k) = A*B(k-1) / (k + A*B(k-1)), B(0) = 1, so no
// factorial is ever formed. A fractional agent count is truncated toward
// zero before the recurrence runs.
//
//   agents <= 0  -> 1.0 (every contact blocked)
//   traffic <= 0 -> 0.0 (nothing to block)
double erlang_b(double agents, double traffic);

// Fewest lines whose blocking does not exceed target_blocking.
// Returns max_lines if the target is still missed there.
AgentCount required_lines(double traffic, double target_blocking,
                          AgentCount max_lines = 10000);

} // namespace erlangcore
