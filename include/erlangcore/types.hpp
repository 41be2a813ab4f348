#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace erlangcore {

// Time types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Agent counts are whole people; traffic and FTE are continuous
using AgentCount = std::int32_t;

constexpr double kSecondsPerMinute = 60.0;
constexpr double kUnboundedAsa = std::numeric_limits<double>::infinity();

// Queueing discipline
enum class ErlangVariant {
    B,  // Loss system, no queue
    C,  // Infinite patience queue
    A   // Queue with abandonment
};

// Raw workload for one interval
struct WorkloadInput {
    double volume{0.0};           // contacts offered in the interval
    double aht{0.0};              // average handle time, seconds
    double interval_minutes{30.0};

    double interval_seconds() const { return interval_minutes * kSecondsPerMinute; }
};

// Service objectives
struct Constraints {
    double target_service_level{0.80};  // fraction [0,1]
    double threshold_seconds{20.0};
    double max_occupancy{0.90};         // fraction (0,1]
};

// Customer and workforce behaviour
struct Behavior {
    double shrinkage{0.0};                        // fraction [0,1)
    std::optional<double> average_patience_seconds;
    std::int32_t concurrency{1};                  // simultaneous contacts per agent
};

// Forward-mode result
struct StaffingMetrics {
    ErlangVariant model{ErlangVariant::C};
    double traffic_intensity{0.0};
    AgentCount required_agents{0};
    double total_fte{0.0};
    double service_level{1.0};
    double asa{0.0};
    double occupancy{0.0};
    bool can_achieve_target{true};

    std::optional<double> blocking_probability;   // Erlang B
    std::optional<double> abandonment_rate;       // Erlang A
    std::optional<double> expected_abandonments;  // Erlang A
    std::optional<double> answered_contacts;      // Erlang A
};

// Reverse-mode result for a fixed headcount
struct AchievableMetrics {
    ErlangVariant model{ErlangVariant::C};
    double traffic_intensity{0.0};
    double service_level{1.0};
    double asa{0.0};
    double occupancy{0.0};
    double effective_agents{0.0};
    AgentCount actual_agents{0};
    double total_fte{0.0};
    bool occupancy_cap_applied{false};
    std::optional<double> occupancy_penalty;
    std::optional<AgentCount> required_agents_for_max_occupancy;
    AgentCount agent_shortfall{0};

    std::optional<double> blocking_probability;
    std::optional<double> abandonment_rate;
    std::optional<double> expected_abandonments;
};

// One rejected input field
struct ValidationError {
    std::string field;
    std::string message;
};

// ASA of an unstable queue is +inf; never average or sum it
inline bool is_unbounded(double value) {
    return value == kUnboundedAsa;
}

inline const char* to_string(ErlangVariant v) {
    switch (v) {
        case ErlangVariant::B: return "B";
        case ErlangVariant::C: return "C";
        case ErlangVariant::A: return "A";
    }
    return "Unknown";
}

// Accepts "B"/"C"/"A" in any case and the "erlangX" spellings.
// "X" maps to A; anything unrecognised maps to C.
ErlangVariant normalize_model(const std::string& name);

} // namespace erlangcore
