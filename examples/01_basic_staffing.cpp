// 01_basic_staffing.cpp
//
// Minimal erlangcore example: size one half-hour interval.
//
// Scenario:
//   - 100 calls arrive in 30 minutes, each handled in 240 seconds.
//   - The target is 80% of calls answered within 20 seconds.
//   - Agents may be busy at most 90% of the time.
//   - 30% of paid time is lost to breaks, training and absence.
//
// The engine converts the workload into Erlangs, finds the fewest agents
// that meet the target under the Erlang C model, and grosses the result
// up to paid FTE.

#include <erlangcore/erlangcore.hpp>

#include <iomanip>
#include <iostream>

using namespace erlangcore;

int main() {
    std::cout << "=== erlangcore: Basic Staffing Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Describe the interval.
    // ----------------------------------------------------------------
    WorkloadInput workload;
    workload.volume = 100.0;
    workload.aht = 240.0;
    workload.interval_minutes = 30.0;

    Constraints constraints;
    constraints.target_service_level = 0.80;
    constraints.threshold_seconds = 20.0;
    constraints.max_occupancy = 0.90;

    Behavior behavior;
    behavior.shrinkage = 0.30;

    std::cout << "Offered load: " << std::fixed << std::setprecision(2)
              << traffic_intensity(workload) << " Erlangs\n\n";

    // ----------------------------------------------------------------
    // 2. Solve for the required headcount.
    // ----------------------------------------------------------------
    StaffingMetrics m = calculate_staffing_metrics(workload, constraints, behavior);

    if (!m.can_achieve_target) {
        std::cout << "Target cannot be met within the search range.\n";
        return 1;
    }

    std::cout << "Required agents:   " << m.required_agents << "\n";
    std::cout << "Paid FTE:          " << std::setprecision(1) << m.total_fte << "\n";
    std::cout << "Service level:     " << m.service_level * 100.0 << "%\n";
    std::cout << "Average speed:     " << m.asa << " s\n";
    std::cout << "Occupancy:         " << m.occupancy * 100.0 << "%\n\n";

    // ----------------------------------------------------------------
    // 3. Show how service level moves around the answer.
    // ----------------------------------------------------------------
    std::cout << "Agents  Service level  ASA (s)\n";
    for (AgentCount agents = m.required_agents - 2; agents <= m.required_agents + 2; ++agents) {
        auto p = project(ErlangVariant::C, agents, workload, constraints, behavior);
        if (!p) continue;

        std::cout << std::setw(6) << agents << "  "
                  << std::setw(12) << p->service_level * 100.0 << "%  ";
        if (is_unbounded(p->asa)) {
            std::cout << "unbounded\n";
        } else {
            std::cout << p->asa << "\n";
        }
    }

    std::cout << "\n=== Done ===\n";
    return 0;
}
