#include "erlangcore/erlang_a.hpp"
#include "erlangcore/erlang_b.hpp"
#include "erlangcore/erlang_c.hpp"

#include <algorithm>
#include <cmath>

namespace erlangcore {

namespace {

constexpr double kSeriesTolerance = 1e-16;
constexpr int kMaxSeriesTerms = 1000000;

// Weights w_0 = 1, w_j = w_{j-1} * load / (agents + (j + shift) * r).
// mass = sum w_j, first_moment = sum j * w_j. Requires load < agents.
struct Series {
    double mass{1.0};
    double first_moment{0.0};
};

Series birth_death_series(double load, double agents, double r, int shift) {
    Series s;
    double weight = 1.0;
    int j = 0;
    while (j < kMaxSeriesTerms) {
        ++j;
        weight *= load / (agents + (j + shift) * r);
        s.mass += weight;
        s.first_moment += j * weight;
        if (weight <= kSeriesTolerance * s.mass &&
            j * weight <= kSeriesTolerance * s.first_moment) {
            return s;
        }
    }
    // Ratios only shrink from here on; close with the geometric bound
    double q = load / (agents + (j + 1 + shift) * r);
    double rest = 1.0 - q;
    s.mass += weight * q / rest;
    s.first_moment += weight * ((j + 1) * q - j * q * q) / (rest * rest);
    return s;
}

// Stationary M/M/c+M queue seen by an arrival. r = aht / patience.
struct QueueState {
    double wait_probability{0.0};
    double mean_queue_length{0.0};
    double tail_mass{1.0};  // waiting states relative to the all-busy state
};

QueueState queue_state(AgentCount agents, double traffic, double r) {
    double c = static_cast<double>(agents);
    double blocking = erlang_b(c, traffic);
    Series tail = birth_death_series(traffic, c, r, 0);

    QueueState q;
    q.tail_mass = tail.mass;
    q.wait_probability = std::clamp(blocking * tail.mass /
                                    (1.0 - blocking + blocking * tail.mass), 0.0, 1.0);
    q.mean_queue_length = q.wait_probability * tail.first_moment / tail.mass;
    return q;
}

// P(answered within tau | waits), tau in units of aht.
//
// An arrival with j contacts ahead is answered when its patience outlasts
// j + 1 exits at rates c + i*r. Summed over the waiting states this is
// (U(A) - F * U(A e^{-r tau})) / mass with F the discount over the threshold.
double answered_within_given_wait(AgentCount agents, double traffic, double r,
                                  double tau, double tail_mass) {
    if (tau <= 0.0) {
        return 0.0;
    }
    double c = static_cast<double>(agents);
    double decay = std::exp(-r * tau);
    Series late = birth_death_series(traffic * decay, c, r, 1);

    double eventually = c * (tail_mass - 1.0) / traffic;
    double within_late = c / (c + r) * late.mass;
    double discount = std::exp(-tau * (c + r) - traffic * std::expm1(-r * tau) / r);

    return std::clamp((eventually - discount * within_late) / tail_mass, 0.0, 1.0);
}

bool unstable(AgentCount agents, double traffic) {
    return static_cast<double>(agents) <= traffic;
}

} // anonymous namespace

double patience_ratio(double average_patience, double aht) {
    if (aht <= 0.0 || average_patience <= 0.0) {
        return 0.0;
    }
    return average_patience / aht;
}

double wait_probability_with_abandonment(AgentCount agents, double traffic, double theta) {
    if (traffic <= 0.0) {
        return 0.0;
    }
    if (agents <= 0 || unstable(agents, traffic)) {
        return 1.0;
    }
    if (theta <= 0.0) {
        return erlang_b(static_cast<double>(agents), traffic);
    }
    if (std::isinf(theta)) {
        return erlang_c(agents, traffic);
    }
    return queue_state(agents, traffic, 1.0 / theta).wait_probability;
}

double abandonment_probability(AgentCount agents, double traffic, double theta) {
    if (traffic <= 0.0) {
        return 0.0;
    }
    if (agents <= 0 || unstable(agents, traffic)) {
        return 1.0;
    }
    if (theta <= 0.0) {
        return erlang_b(static_cast<double>(agents), traffic);  // every waiter leaves
    }
    if (std::isinf(theta)) {
        return 0.0;
    }

    // Abandonment flow E[Lq] / patience over the arrival flow
    double r = 1.0 / theta;
    QueueState q = queue_state(agents, traffic, r);
    return std::clamp(r * q.mean_queue_length / traffic, 0.0, 1.0);
}

double service_level_with_abandonment(AgentCount agents, double traffic, double aht,
                                      double threshold_seconds, double average_patience) {
    if (agents <= 0 || traffic <= 0.0 || aht <= 0.0) {
        return 1.0;
    }
    if (unstable(agents, traffic)) {
        return 0.0;
    }
    if (average_patience <= 0.0) {
        // Only contacts answered immediately count
        return 1.0 - erlang_b(static_cast<double>(agents), traffic);
    }
    if (std::isinf(average_patience)) {
        return service_level(agents, traffic, aht, threshold_seconds);
    }

    double r = aht / average_patience;
    QueueState q = queue_state(agents, traffic, r);
    double within = answered_within_given_wait(agents, traffic, r,
                                               threshold_seconds / aht, q.tail_mass);

    double sl = (1.0 - q.wait_probability) + q.wait_probability * within;
    return std::clamp(sl, 0.0, 1.0);
}

double asa_with_abandonment(AgentCount agents, double traffic, double aht,
                            double average_patience) {
    if (traffic <= 0.0) {
        return 0.0;
    }
    if (unstable(agents, traffic)) {
        return kUnboundedAsa;
    }
    if (average_patience <= 0.0) {
        return 0.0;
    }
    if (std::isinf(average_patience)) {
        return average_speed_of_answer(agents, traffic, aht);
    }

    // Little's law over the queue
    QueueState q = queue_state(agents, traffic, aht / average_patience);
    return std::max(0.0, aht * q.mean_queue_length / traffic);
}

double expected_abandonments(double volume, AgentCount agents, double traffic,
                             double theta) {
    if (volume <= 0.0) {
        return 0.0;
    }
    return volume * abandonment_probability(agents, traffic, theta);
}

std::optional<ErlangAResult> erlang_a(AgentCount agents, double traffic, double aht,
                                      double threshold_seconds,
                                      std::optional<double> average_patience) {
    if (!average_patience.has_value() || !(*average_patience > 0.0)) {
        return std::nullopt;
    }

    double patience = *average_patience;
    double theta = patience_ratio(patience, aht);

    ErlangAResult result;
    result.patience_ratio = theta;
    result.wait_probability = wait_probability_with_abandonment(agents, traffic, theta);
    result.service_level = service_level_with_abandonment(agents, traffic, aht,
                                                          threshold_seconds, patience);
    result.asa = asa_with_abandonment(agents, traffic, aht, patience);
    result.abandonment_probability = abandonment_probability(agents, traffic, theta);
    return result;
}

} // namespace erlangcore
