// 03_fixed_headcount.cpp
//
// Reverse solve: what does the team we actually have deliver?
//
// Scenario:
//   - 200 calls in 30 minutes at 240 seconds each (26.7 Erlangs).
//   - 30 agents are scheduled.
//   - The occupancy cap is tightened from 90% to 70%.
//
// Once the cap demands more agents than are scheduled, the evaluator
// reports the shortfall and degrades service level and ASA by the ratio
// of scheduled to required agents. A metrics monitor counts how often
// that happens and raises an alert when occupancy runs hot.

#include <erlangcore/erlangcore.hpp>

#include <iomanip>
#include <iostream>
#include <memory>

using namespace erlangcore;

int main() {
    std::cout << "=== erlangcore: Fixed Headcount Example ===\n\n";

    Config config;
    config.evaluate_achievable = true;
    StaffingCalculator calculator(config);

    auto metrics = std::make_shared<MetricsMonitor>();
    metrics->set_occupancy_alert_threshold(0.85, [](const std::string& msg) {
        std::cout << "  [ALERT] " << msg << "\n";
    });

    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(metrics);
    composite->add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));
    calculator.set_monitor(composite);

    CalculationInputs inputs;
    inputs.workload = WorkloadInput{200.0, 240.0, 30.0};
    inputs.constraints.target_service_level = 0.80;
    inputs.constraints.threshold_seconds = 20.0;
    inputs.behavior.shrinkage = 0.25;
    inputs.fixed_agents = 30;

    std::cout << std::fixed << std::setprecision(1);

    // ----------------------------------------------------------------
    // 1. Sweep the occupancy cap.
    // ----------------------------------------------------------------
    for (double cap : {0.90, 0.85, 0.80, 0.75, 0.70}) {
        inputs.constraints.max_occupancy = cap;
        auto result = calculator.calculate(inputs);
        if (!result.achievable) continue;

        const auto& a = *result.achievable;
        std::cout << "Cap " << cap * 100.0 << "%: "
                  << "SL " << a.service_level * 100.0 << "%, "
                  << "ASA " << a.asa << " s, "
                  << "effective agents " << a.effective_agents;
        if (a.occupancy_cap_applied) {
            std::cout << " (short " << a.agent_shortfall << ")";
        }
        std::cout << "\n";

        if (result.staffing && result.staffing->can_achieve_target) {
            std::cout << "         target needs " << result.staffing->required_agents
                      << " agents / " << result.staffing->total_fte << " FTE\n";
        }
    }

    // ----------------------------------------------------------------
    // 2. Understaffed below the offered load.
    // ----------------------------------------------------------------
    std::cout << "\nScheduling 25 agents against 26.7 Erlangs:\n";
    inputs.constraints.max_occupancy = 0.90;
    inputs.fixed_agents = 25;
    auto overloaded = calculator.calculate(inputs);
    if (overloaded.achievable && is_unbounded(overloaded.achievable->asa)) {
        std::cout << "  Queue grows without bound.\n";
    }

    // ----------------------------------------------------------------
    // 3. Metrics.
    // ----------------------------------------------------------------
    auto m = metrics->get_metrics();
    std::cout << "\n--- Metrics ---\n";
    std::cout << "  Calculations:            " << m.total_calculations << "\n";
    std::cout << "  Achievable evaluations:  " << m.achievable_evaluations << "\n";
    std::cout << "  Occupancy cap applied:   " << m.occupancy_cap_applications << "\n";
    std::cout << "  Unstable headcounts:     " << m.unstable_staffing << "\n";
    std::cout << "  Average solve time:      " << m.average_solve_duration_us << " us\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
