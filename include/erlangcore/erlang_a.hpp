#pragma once

#include "erlangcore/types.hpp"

#include <optional>

namespace erlangcore {

// M/M/c+M (Palm) queue: customers abandon after an exponentially
// distributed patience with mean `average_patience` seconds.
//
// The queue is the birth-death chain whose death rate above c busy agents
// is c/aht + j/patience, so abandonment shortens the queue for everyone
// behind. Contacts that abandon are counted as not answered within the
// threshold. For c <= A the queue is reported unstable, as for Erlang C.

struct ErlangAResult {
    double wait_probability{0.0};
    double service_level{1.0};
    double asa{0.0};
    double abandonment_probability{0.0};
    double patience_ratio{0.0};  // theta = patience / aht
};

// theta = patience / aht; the model's abandonment parameter
double patience_ratio(double average_patience, double aht);

// Probability that an arrival finds every agent busy. Erlang B at
// theta <= 0, Erlang C at infinite theta.
double wait_probability_with_abandonment(AgentCount agents, double traffic, double theta);

// Abandonment flow E[queue length] / patience over the arrival flow.
// 1.0 for an unstable queue, Erlang B at theta <= 0, 0.0 for infinite patience.
double abandonment_probability(AgentCount agents, double traffic, double theta);

double service_level_with_abandonment(AgentCount agents, double traffic, double aht,
                                      double threshold_seconds, double average_patience);

// Mean time in queue over all arrivals, abandoners included (Little's law).
// kUnboundedAsa when unstable.
double asa_with_abandonment(AgentCount agents, double traffic, double aht,
                            double average_patience);

double expected_abandonments(double volume, AgentCount agents, double traffic,
                             double theta);

// All of the above at once. Empty when patience is missing or not positive.
std::optional<ErlangAResult> erlang_a(AgentCount agents, double traffic, double aht,
                                      double threshold_seconds,
                                      std::optional<double> average_patience);

} // namespace erlangcore
