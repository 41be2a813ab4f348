#pragma once

#include "erlangcore/types.hpp"

namespace erlangcore {

// Probability an arriving contact has to wait (M/M/c).
// Derived from Erlang B: C = B*c / (c - A + A*B). 1.0 when c <= A.
double erlang_c(AgentCount agents, double traffic);

// P(wait > threshold) = C * exp(-(c - A) * threshold / aht)
double probability_wait_exceeds(AgentCount agents, double traffic,
                                double aht, double threshold_seconds);

// Fraction answered within threshold. 1.0 when there is no load or no agents.
double service_level(AgentCount agents, double traffic,
                     double aht, double threshold_seconds);

// Average speed of answer in seconds; kUnboundedAsa when the queue is unstable.
double average_speed_of_answer(AgentCount agents, double traffic, double aht);

} // namespace erlangcore
