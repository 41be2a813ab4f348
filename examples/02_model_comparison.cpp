// 02_model_comparison.cpp
//
// Compares Erlang B, C and A on the same workload.
//
//   - Erlang B treats every call that finds all agents busy as lost and
//     targets the blocking probability.
//   - Erlang C assumes callers wait forever.
//   - Erlang A lets callers hang up after an exponentially distributed
//     patience, which shortens the queue for everyone else.
//
// The calculator facade validates the request and reports each step to
// a console monitor.

#include <erlangcore/erlangcore.hpp>

#include <iomanip>
#include <iostream>
#include <memory>

using namespace erlangcore;

namespace {

void print_row(const char* label, const CalculationResult& result) {
    std::cout << std::left << std::setw(22) << label << std::right;
    if (!result.staffing) {
        std::cout << "missing model parameter\n";
        return;
    }

    const auto& m = *result.staffing;
    std::cout << std::setw(7) << m.required_agents
              << std::setw(9) << std::fixed << std::setprecision(1) << m.total_fte
              << std::setw(9) << m.service_level * 100.0 << "%"
              << std::setw(9) << m.asa;
    if (m.abandonment_rate) {
        std::cout << std::setw(9) << *m.abandonment_rate * 100.0 << "%";
    }
    if (m.blocking_probability) {
        std::cout << std::setw(9) << *m.blocking_probability * 100.0 << "% blocked";
    }
    std::cout << "\n";
}

} // namespace

int main() {
    std::cout << "=== erlangcore: Model Comparison Example ===\n\n";

    StaffingCalculator calculator;
    calculator.set_monitor(
        std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    CalculationInputs inputs;
    inputs.workload = WorkloadInput{150.0, 240.0, 30.0};
    inputs.constraints.target_service_level = 0.80;
    inputs.constraints.threshold_seconds = 20.0;
    inputs.constraints.max_occupancy = 0.90;
    inputs.behavior.shrinkage = 0.30;

    // ----------------------------------------------------------------
    // 1. One request per model.
    // ----------------------------------------------------------------
    inputs.model = ErlangVariant::B;
    auto loss = calculator.calculate(inputs);

    inputs.model = ErlangVariant::C;
    auto queue = calculator.calculate(inputs);

    inputs.model = ErlangVariant::A;
    inputs.behavior.average_patience_seconds = 60.0;
    auto impatient = calculator.calculate(inputs);

    inputs.behavior.average_patience_seconds = 300.0;
    auto patient = calculator.calculate(inputs);

    // Erlang A without patience cannot be solved
    inputs.behavior.average_patience_seconds.reset();
    auto incomplete = calculator.calculate(inputs);

    // ----------------------------------------------------------------
    // 2. Summary table.
    // ----------------------------------------------------------------
    std::cout << "\nModel                  Agents      FTE       SL      ASA  Abandon\n";
    print_row("Erlang B", loss);
    print_row("Erlang C", queue);
    print_row("Erlang A (60 s)", impatient);
    print_row("Erlang A (300 s)", patient);
    print_row("Erlang A (no patience)", incomplete);

    // ----------------------------------------------------------------
    // 3. A request the validator refuses.
    // ----------------------------------------------------------------
    inputs.model = ErlangVariant::C;
    inputs.behavior.shrinkage = 1.0;
    auto rejected = calculator.calculate(inputs);
    for (auto& e : rejected.validation.errors) {
        std::cout << "\nRejected " << e.field << ": " << e.message << "\n";
    }

    std::cout << "\n=== Done ===\n";
    return 0;
}
