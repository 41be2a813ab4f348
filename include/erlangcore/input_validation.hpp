#pragma once

#include "erlangcore/types.hpp"
#include "erlangcore/config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace erlangcore {

// Everything the calculator facade needs for one request
struct CalculationInputs {
    ErlangVariant model{ErlangVariant::C};
    WorkloadInput workload;
    Constraints constraints;
    Behavior behavior;

    // Real headcount of productive agents; enables the reverse solve
    std::optional<AgentCount> fixed_agents;

    // Scales the productive share of paid time (1.0 = as planned)
    double productivity_modifier{1.0};
};

struct ValidationResult {
    bool valid{true};
    std::vector<ValidationError> errors;
};

ValidationResult validate_calculation_inputs(const CalculationInputs& inputs,
                                             const ValidationLimits& limits = ValidationLimits{});

// First error message recorded for `field`, if any
std::optional<std::string> field_error(const ValidationResult& result,
                                       const std::string& field);

} // namespace erlangcore
