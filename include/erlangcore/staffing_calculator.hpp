#pragma once

#include "erlangcore/types.hpp"
#include "erlangcore/config.hpp"
#include "erlangcore/input_validation.hpp"
#include "erlangcore/monitor.hpp"
#include "erlangcore/staffing_search.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace erlangcore {

struct CalculationResult {
    std::optional<StaffingMetrics> staffing;      // what the workload requires
    std::optional<AchievableMetrics> achievable;  // what fixed_agents can deliver
    ValidationResult validation;
};

// Request-level facade over the engine.
//
// Validates inputs, folds the productivity modifier into shrinkage, runs
// the forward solve and, when a headcount is supplied, the reverse solve.
// Each step is reported to the attached monitor. Safe to call from
// several threads at once.
class StaffingCalculator {
public:
    explicit StaffingCalculator(Config config = Config{});

    StaffingCalculator(const StaffingCalculator&) = delete;
    StaffingCalculator& operator=(const StaffingCalculator&) = delete;

    CalculationResult calculate(const CalculationInputs& inputs) const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

    const Config& config() const noexcept;

private:
    Config config_;
    StaffingSearch search_;

    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    std::shared_ptr<Monitor> current_monitor() const;
    void emit_event(const std::shared_ptr<Monitor>& monitor, EventType type,
                    const std::string& message,
                    std::optional<ErlangVariant> model = std::nullopt,
                    std::optional<double> traffic_intensity = std::nullopt,
                    std::optional<AgentCount> agents = std::nullopt,
                    std::optional<double> service_level = std::nullopt,
                    std::optional<double> occupancy = std::nullopt,
                    std::optional<double> duration_us = std::nullopt) const;
};

} // namespace erlangcore
