#pragma once

#include "erlangcore/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace erlangcore {

enum class EventType {
    CalculationRequested,
    InputsRejected,
    StaffingSolved,
    TargetInfeasible,
    ModelParameterMissing,
    AchievableEvaluated,
    OccupancyCapApplied,
    UnstableStaffing
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<ErlangVariant> model;
    std::optional<double> traffic_intensity;
    std::optional<AgentCount> agents;
    std::optional<double> service_level;
    std::optional<double> occupancy;

    // Solve duration in microseconds
    std::optional<double> duration_us;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t total_calculations{0};
        std::uint64_t solved{0};
        std::uint64_t infeasible{0};
        std::uint64_t rejected_inputs{0};
        std::uint64_t missing_parameters{0};
        std::uint64_t achievable_evaluations{0};
        std::uint64_t occupancy_cap_applications{0};
        std::uint64_t unstable_staffing{0};
        double average_solve_duration_us{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;

    // Fires when a solved or evaluated occupancy exceeds `threshold` (fraction)
    void set_occupancy_alert_threshold(double threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    double occupancy_threshold_{1.1};  // > 1.0 means disabled
    AlertCallback occupancy_cb_;

    std::uint64_t duration_sample_count_{0};
    double duration_sum_us_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace erlangcore
