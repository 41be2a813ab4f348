#include "erlangcore/staffing_calculator.hpp"
#include "erlangcore/exceptions.hpp"
#include "erlangcore/shrinkage.hpp"
#include "erlangcore/staffing_engine.hpp"

#include <chrono>

namespace erlangcore {

StaffingCalculator::StaffingCalculator(Config config)
    : config_(std::move(config))
    , search_(config_.search)
{}

const Config& StaffingCalculator::config() const noexcept {
    return config_;
}

void StaffingCalculator::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

std::shared_ptr<Monitor> StaffingCalculator::current_monitor() const {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    return monitor_;
}

CalculationResult StaffingCalculator::calculate(const CalculationInputs& inputs) const {
    auto monitor = current_monitor();
    emit_event(monitor, EventType::CalculationRequested, "", inputs.model);

    CalculationResult result;
    result.validation = validate_calculation_inputs(inputs, config_.limits);

    if (!result.validation.valid) {
        const auto& first = result.validation.errors.front();
        emit_event(monitor, EventType::InputsRejected,
                   first.field + ": " + first.message, inputs.model);
        if (config_.throw_on_invalid_input) {
            throw InvalidInputException(result.validation.errors);
        }
        return result;
    }

    Behavior behavior = inputs.behavior;
    behavior.shrinkage = effective_shrinkage(inputs.behavior.shrinkage,
                                             inputs.productivity_modifier);

    // ---- Forward solve: what the workload requires ----
    auto start = Clock::now();
    result.staffing = calculate_staffing(inputs.model, inputs.workload, inputs.constraints,
                                         behavior, search_.config());
    double duration_us = std::chrono::duration<double, std::micro>(Clock::now() - start).count();

    if (!result.staffing) {
        emit_event(monitor, EventType::ModelParameterMissing,
                   "Erlang A requires an average patience", inputs.model);
    } else if (!result.staffing->can_achieve_target) {
        const auto& missed = *result.staffing;
        if (missed.required_agents > 0) {
            emit_event(monitor, EventType::TargetInfeasible,
                       "Service level stays under the target up to the Erlang C headcount",
                       inputs.model, missed.traffic_intensity, missed.required_agents,
                       missed.service_level, missed.occupancy, duration_us);
        } else {
            emit_event(monitor, EventType::TargetInfeasible,
                       "No agent count within the search ceiling meets the target",
                       inputs.model, missed.traffic_intensity,
                       std::nullopt, std::nullopt, std::nullopt, duration_us);
        }
    } else {
        emit_event(monitor, EventType::StaffingSolved, "", inputs.model,
                   result.staffing->traffic_intensity, result.staffing->required_agents,
                   result.staffing->service_level, result.staffing->occupancy, duration_us);
    }

    // ---- Reverse solve: what the real headcount can deliver ----
    bool has_headcount = inputs.fixed_agents.has_value() && *inputs.fixed_agents > 0;
    if (!config_.evaluate_achievable || !has_headcount || inputs.workload.volume <= 0.0) {
        return result;
    }

    result.achievable = calculate_achievable_metrics(inputs.model, *inputs.fixed_agents,
                                                     inputs.workload, inputs.constraints,
                                                     behavior);
    if (!result.achievable) {
        return result;
    }

    const auto& a = *result.achievable;
    emit_event(monitor, EventType::AchievableEvaluated, "", inputs.model,
               a.traffic_intensity, a.actual_agents, a.service_level, a.occupancy);

    if (a.occupancy_cap_applied) {
        emit_event(monitor, EventType::OccupancyCapApplied,
                   "Short " + std::to_string(a.agent_shortfall) +
                   " agents for the occupancy cap",
                   inputs.model, a.traffic_intensity, a.actual_agents,
                   a.service_level, a.occupancy);
    }
    if (is_unbounded(a.asa)) {
        emit_event(monitor, EventType::UnstableStaffing,
                   "Headcount does not exceed the offered load",
                   inputs.model, a.traffic_intensity, a.actual_agents);
    }

    return result;
}

void StaffingCalculator::emit_event(const std::shared_ptr<Monitor>& monitor, EventType type,
                                    const std::string& message,
                                    std::optional<ErlangVariant> model,
                                    std::optional<double> traffic_intensity,
                                    std::optional<AgentCount> agents,
                                    std::optional<double> service_level,
                                    std::optional<double> occupancy,
                                    std::optional<double> duration_us) const {
    if (!monitor) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.model = model;
    event.traffic_intensity = traffic_intensity;
    event.agents = agents;
    event.service_level = service_level;
    event.occupancy = occupancy;
    event.duration_us = duration_us;

    monitor->on_event(event);
}

} // namespace erlangcore
