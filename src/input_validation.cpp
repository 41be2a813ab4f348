#include "erlangcore/input_validation.hpp"

#include <cmath>
#include <sstream>

namespace erlangcore {

namespace {

std::string format_number(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // anonymous namespace

ValidationResult validate_calculation_inputs(const CalculationInputs& inputs,
                                             const ValidationLimits& limits) {
    ValidationResult result;
    auto reject = [&result](const char* field, std::string message) {
        result.errors.push_back(ValidationError{field, std::move(message)});
    };

    const auto& w = inputs.workload;
    const auto& c = inputs.constraints;
    const auto& b = inputs.behavior;

    // Volume
    if (!std::isfinite(w.volume) || w.volume < limits.volume_min) {
        reject("volume", "Volume cannot be negative");
    } else if (w.volume > limits.volume_max) {
        reject("volume", "Volume cannot exceed " + format_number(limits.volume_max));
    }

    // Handle time
    if (!std::isfinite(w.aht) || w.aht < limits.aht_min) {
        reject("aht", "AHT must be at least " + format_number(limits.aht_min) + " seconds");
    } else if (w.aht > limits.aht_max) {
        reject("aht", "AHT cannot exceed " + format_number(limits.aht_max) + " seconds");
    }

    // Interval
    if (!(w.interval_minutes > 0.0)) {
        reject("interval_minutes", "Interval must be positive");
    } else if (w.interval_minutes < limits.interval_minutes_min) {
        reject("interval_minutes",
               "Interval must be at least " + format_number(limits.interval_minutes_min) + " min");
    } else if (w.interval_minutes > limits.interval_minutes_max) {
        reject("interval_minutes",
               "Interval cannot exceed " + format_number(limits.interval_minutes_max) + " minutes");
    }

    // Service objectives
    if (!(c.target_service_level >= 0.0)) {
        reject("target_service_level", "Service level cannot be negative");
    } else if (c.target_service_level > 1.0) {
        reject("target_service_level", "Service level cannot exceed 100%");
    }

    if (!(c.threshold_seconds >= limits.threshold_min)) {
        reject("threshold_seconds",
               "Threshold must be at least " + format_number(limits.threshold_min) + " seconds");
    } else if (c.threshold_seconds > limits.threshold_max) {
        reject("threshold_seconds",
               "Threshold cannot exceed " + format_number(limits.threshold_max) + " seconds");
    }

    if (!(c.max_occupancy >= limits.max_occupancy_min)) {
        reject("max_occupancy",
               "Max occupancy must be at least " + format_number(limits.max_occupancy_min * 100.0) + "%");
    } else if (c.max_occupancy > limits.max_occupancy_max) {
        reject("max_occupancy", "Max occupancy cannot exceed 100%");
    }

    // Behaviour
    if (!(b.shrinkage >= 0.0)) {
        reject("shrinkage", "Shrinkage cannot be negative");
    } else if (b.shrinkage >= 1.0) {
        reject("shrinkage", "Shrinkage cannot be 100% (infinite FTE required)");
    } else if (b.shrinkage > limits.shrinkage_max) {
        reject("shrinkage",
               "Shrinkage cannot exceed " + format_number(limits.shrinkage_max * 100.0) + "%");
    }

    if (inputs.model != ErlangVariant::C && b.average_patience_seconds.has_value()) {
        double patience = *b.average_patience_seconds;
        if (!(patience >= limits.patience_min)) {
            reject("average_patience_seconds",
                   "Average patience must be at least " + format_number(limits.patience_min) + " seconds");
        } else if (patience > limits.patience_max) {
            reject("average_patience_seconds",
                   "Average patience cannot exceed " + format_number(limits.patience_max) + " seconds");
        }
    }

    if (b.concurrency < 1) {
        reject("concurrency", "Concurrency must be at least 1");
    }

    // Headcount for the reverse solve
    if (inputs.fixed_agents.has_value() && *inputs.fixed_agents < 0) {
        reject("fixed_agents", "Fixed agent count cannot be negative");
    }

    if (!(inputs.productivity_modifier > 0.0) || !std::isfinite(inputs.productivity_modifier)) {
        reject("productivity_modifier", "Productivity modifier must be positive");
    }

    result.valid = result.errors.empty();
    return result;
}

std::optional<std::string> field_error(const ValidationResult& result,
                                       const std::string& field) {
    for (auto& e : result.errors) {
        if (e.field == field) {
            return e.message;
        }
    }
    return std::nullopt;
}

} // namespace erlangcore
