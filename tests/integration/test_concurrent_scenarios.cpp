#include <gtest/gtest.h>
#include <erlangcore/erlangcore.hpp>

#include <atomic>
#include <random>
#include <thread>
#include <vector>

using namespace erlangcore;

// ===========================================================================
// Parallel what-if scenarios against one calculator
// ===========================================================================

TEST(ConcurrentScenariosTest, ParallelRequestsMatchSequentialResults) {
    constexpr int NUM_THREADS = 8;
    constexpr int REQUESTS_PER_THREAD = 25;

    StaffingCalculator calculator;
    auto metrics = std::make_shared<MetricsMonitor>();
    calculator.set_monitor(metrics);

    // Reference answers computed up front on one thread
    std::vector<CalculationInputs> scenarios;
    for (int i = 0; i < 10; ++i) {
        CalculationInputs in;
        in.model = (i % 3 == 0) ? ErlangVariant::A
                 : (i % 3 == 1) ? ErlangVariant::B
                                : ErlangVariant::C;
        in.workload = WorkloadInput{50.0 + 25.0 * i, 180.0 + 10.0 * i, 30.0};
        in.behavior.shrinkage = 0.25;
        in.behavior.average_patience_seconds = 60.0 + 20.0 * i;
        in.fixed_agents = 10 + 2 * i;
        scenarios.push_back(in);
    }

    StaffingCalculator reference_calculator;
    std::vector<AgentCount> expected;
    for (auto& s : scenarios) {
        auto r = reference_calculator.calculate(s);
        ASSERT_TRUE(r.staffing.has_value());
        expected.push_back(r.staffing->required_agents);
    }

    std::atomic<int> mismatches{0};
    std::atomic<int> errors{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            std::mt19937 rng(static_cast<unsigned>(t * 31 + 5));
            std::uniform_int_distribution<std::size_t> pick(0, scenarios.size() - 1);

            for (int op = 0; op < REQUESTS_PER_THREAD; ++op) {
                std::size_t idx = pick(rng);
                try {
                    auto r = calculator.calculate(scenarios[idx]);
                    if (!r.staffing || r.staffing->required_agents != expected[idx]) {
                        mismatches.fetch_add(1);
                    }
                } catch (const ErlangCoreException&) {
                    errors.fetch_add(1);
                }
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(errors.load(), 0);

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.total_calculations,
              static_cast<std::uint64_t>(NUM_THREADS * REQUESTS_PER_THREAD));
    EXPECT_EQ(m.solved, static_cast<std::uint64_t>(NUM_THREADS * REQUESTS_PER_THREAD));
    EXPECT_EQ(m.achievable_evaluations,
              static_cast<std::uint64_t>(NUM_THREADS * REQUESTS_PER_THREAD));
}

TEST(ConcurrentScenariosTest, MonitorSwapDuringCalculations) {
    constexpr int NUM_WORKERS = 4;
    constexpr int REQUESTS_PER_WORKER = 50;

    StaffingCalculator calculator;
    auto first = std::make_shared<MetricsMonitor>();
    auto second = std::make_shared<MetricsMonitor>();
    calculator.set_monitor(first);

    CalculationInputs in;
    in.workload = WorkloadInput{120.0, 240.0, 30.0};

    std::atomic<bool> done{false};
    std::thread swapper([&]() {
        bool use_first = false;
        while (!done.load()) {
            calculator.set_monitor(use_first ? first : second);
            use_first = !use_first;
            std::this_thread::yield();
        }
    });

    std::vector<std::thread> workers;
    for (int w = 0; w < NUM_WORKERS; ++w) {
        workers.emplace_back([&]() {
            for (int i = 0; i < REQUESTS_PER_WORKER; ++i) {
                calculator.calculate(in);
            }
        });
    }
    for (auto& th : workers) {
        th.join();
    }
    done.store(true);
    swapper.join();

    // Each request reports to the monitor that was attached when it started
    auto a = first->get_metrics();
    auto b = second->get_metrics();
    EXPECT_EQ(a.total_calculations + b.total_calculations,
              static_cast<std::uint64_t>(NUM_WORKERS * REQUESTS_PER_WORKER));
    EXPECT_EQ(a.solved + b.solved,
              static_cast<std::uint64_t>(NUM_WORKERS * REQUESTS_PER_WORKER));
}

TEST(ConcurrentScenariosTest, IndependentEngineCallsAreThreadSafe) {
    constexpr int NUM_THREADS = 6;

    Constraints constraints;
    Behavior behavior;
    behavior.average_patience_seconds = 120.0;

    std::vector<AgentCount> results(NUM_THREADS, -1);
    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            WorkloadInput workload{100.0, 240.0, 30.0};
            auto m = calculate_staffing(ErlangVariant::A, workload, constraints, behavior);
            results[t] = m ? m->required_agents : 0;
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    for (int t = 1; t < NUM_THREADS; ++t) {
        EXPECT_EQ(results[t], results[0]);
    }
    EXPECT_GT(results[0], 0);
}
