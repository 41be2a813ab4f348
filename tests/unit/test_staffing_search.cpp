#include <gtest/gtest.h>
#include <erlangcore/erlangcore.hpp>

#include <limits>

using namespace erlangcore;

class StaffingSearchTest : public ::testing::Test {
protected:
    StaffingSearch search;
    ErlangBModel erlang_b_model;
    ErlangCModel erlang_c_model;

    // Minimality: the returned count meets the target, one fewer does not
    void expect_minimal(const QueueModel& model, AgentCount agents, double traffic,
                        double aht, double target, double threshold,
                        double max_occupancy) {
        auto at = model.project(agents, traffic, aht, threshold);
        EXPECT_GE(at.service_level, target);
        if (agents - 1 >= search.min_agents(traffic, max_occupancy) && agents > 1) {
            auto below = model.project(agents - 1, traffic, aht, threshold);
            EXPECT_LT(below.service_level, target);
        }
    }
};

// ===========================================================================
// Search range
// ===========================================================================

TEST_F(StaffingSearchTest, RangeStartsAtOccupancyFloor) {
    EXPECT_EQ(search.min_agents(10.0, 0.9), 12);
    EXPECT_EQ(search.min_agents(10.0, 1.0), 10);
    EXPECT_EQ(search.min_agents(0.0, 0.9), 0);
}

TEST_F(StaffingSearchTest, RangeCeilingUsesConfig) {
    EXPECT_EQ(search.max_agents(10.0, 0.9), 62);    // 12 + 50 headroom
    EXPECT_EQ(search.max_agents(20.0, 1.0), 100);   // 5x traffic
    EXPECT_EQ(search.max_agents(0.2, 0.9), 51);     // 1 + 50 headroom
}

TEST_F(StaffingSearchTest, OccupancyOutsideUnitIntervalMeansNoCap) {
    EXPECT_DOUBLE_EQ(normalize_max_occupancy(0.0), 1.0);
    EXPECT_DOUBLE_EQ(normalize_max_occupancy(-0.5), 1.0);
    EXPECT_DOUBLE_EQ(normalize_max_occupancy(1.5), 1.0);
    EXPECT_DOUBLE_EQ(normalize_max_occupancy(0.85), 0.85);
    EXPECT_EQ(search.min_agents(10.0, 0.0), 10);
}

TEST_F(StaffingSearchTest, RejectsInvalidConfig) {
    EXPECT_THROW(StaffingSearch(SearchConfig{0.0, 50, 10}), InvalidConfigException);
    EXPECT_THROW(StaffingSearch(SearchConfig{-1.0, 50, 10}), InvalidConfigException);
    EXPECT_THROW(StaffingSearch(SearchConfig{5.0, -1, 10}), InvalidConfigException);
    EXPECT_THROW(StaffingSearch(SearchConfig{5.0, 50, -3}), InvalidConfigException);
}

// ===========================================================================
// Erlang C solve
// ===========================================================================

TEST_F(StaffingSearchTest, SolvesStandardErlangCCase) {
    auto agents = search.solve_agents(10.0, 180.0, 0.80, 20.0, 0.90);
    ASSERT_TRUE(agents.has_value());
    EXPECT_EQ(*agents, 14);
}

TEST_F(StaffingSearchTest, NoLoadNeedsNoAgents) {
    auto agents = search.solve_agents(0.0, 180.0, 0.80, 20.0, 0.90);
    ASSERT_TRUE(agents.has_value());
    EXPECT_EQ(*agents, 0);
}

TEST_F(StaffingSearchTest, HighTargetNeedsMoreAgents) {
    auto agents = search.solve_agents(10.0, 180.0, 0.999, 5.0, 0.90);
    ASSERT_TRUE(agents.has_value());
    EXPECT_EQ(*agents, 22);
}

TEST_F(StaffingSearchTest, LowTrafficNeedsOneAgent) {
    auto agents = search.solve_agents(0.2, 240.0, 0.80, 20.0, 0.90);
    ASSERT_TRUE(agents.has_value());
    EXPECT_EQ(*agents, 1);
}

TEST_F(StaffingSearchTest, TightCeilingMakesTargetInfeasible) {
    StaffingSearch narrow(SearchConfig{1.2, 0, 0});
    EXPECT_FALSE(narrow.solve_agents(10.0, 180.0, 0.80, 20.0, 0.90).has_value());
}

TEST_F(StaffingSearchTest, ResultIsMinimalAcrossGrid) {
    for (double traffic : {0.5, 3.8, 10.0, 13.33, 26.67, 55.0}) {
        for (double target : {0.6, 0.8, 0.9, 0.95}) {
            for (double threshold : {10.0, 20.0, 60.0}) {
                auto agents = search.solve(erlang_c_model, traffic, 240.0, target, threshold, 0.9);
                ASSERT_TRUE(agents.has_value());
                EXPECT_GE(*agents, search.min_agents(traffic, 0.9));
                expect_minimal(erlang_c_model, *agents, traffic, 240.0, target, threshold, 0.9);
            }
        }
    }
}

TEST_F(StaffingSearchTest, HigherTargetNeverNeedsFewerAgents) {
    AgentCount previous = 0;
    for (double target = 0.5; target <= 0.99; target += 0.01) {
        auto agents = search.solve_agents(26.67, 240.0, target, 20.0, 1.0);
        ASSERT_TRUE(agents.has_value());
        EXPECT_GE(*agents, previous);
        previous = *agents;
    }
}

// ===========================================================================
// Erlang B solve
// ===========================================================================

TEST_F(StaffingSearchTest, ErlangBSolvesForBlockingTarget) {
    auto agents = search.solve(erlang_b_model, 10.0, 180.0, 0.99, 20.0, 1.0);
    ASSERT_TRUE(agents.has_value());
    EXPECT_EQ(*agents, 18);
}

TEST_F(StaffingSearchTest, ErlangBRespectsOccupancyFloor) {
    auto agents = search.solve(erlang_b_model, 10.0, 180.0, 0.80, 20.0, 0.9);
    ASSERT_TRUE(agents.has_value());
    EXPECT_EQ(*agents, 12);
}

// ===========================================================================
// Erlang A solve
// ===========================================================================

TEST_F(StaffingSearchTest, ErlangASolve) {
    const double traffic = 100.0 * 240.0 / 1800.0;
    ErlangAModel model(180.0);
    auto agents = search.solve(model, traffic, 240.0, 0.80, 20.0, 0.9);
    ASSERT_TRUE(agents.has_value());
    EXPECT_EQ(*agents, 16);
    expect_minimal(model, *agents, traffic, 240.0, 0.80, 20.0, 0.9);
}

TEST_F(StaffingSearchTest, ErlangANeverExceedsErlangC) {
    for (double traffic : {1.5, 3.8, 10.0, 13.33, 20.0, 40.0}) {
        for (double patience : {15.0, 30.0, 60.0, 180.0, 600.0}) {
            ErlangAModel model(patience);
            auto c = search.solve(erlang_c_model, traffic, 180.0, 0.8, 20.0, 0.9);
            auto a = search.solve(model, traffic, 180.0, 0.8, 20.0, 0.9);
            ASSERT_TRUE(c.has_value());
            ASSERT_TRUE(a.has_value());
            EXPECT_LE(*a, *c) << "traffic=" << traffic << " patience=" << patience;
        }
    }
}

TEST_F(StaffingSearchTest, AbandonmentLowersStaffing) {
    // 38 contacts, 180 s, 30 min
    const double traffic = 38.0 * 180.0 / 1800.0;
    ErlangAModel impatient(30.0);

    auto c = search.solve(erlang_c_model, traffic, 180.0, 0.8, 20.0, 0.9);
    auto a = search.solve(impatient, traffic, 180.0, 0.8, 20.0, 0.9);
    ASSERT_TRUE(c.has_value());
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*c, 6);
    EXPECT_EQ(*a, 5);
    EXPECT_GE(impatient.project(*a, traffic, 180.0, 20.0).service_level, 0.8);
}

TEST_F(StaffingSearchTest, ErlangAMissAtCapReturnsErlangCCount) {
    // 10 contacts, 240 s, 30 min, 80% in 600 s with 10 s patience: callers
    // leave long before the threshold, so no count up to Erlang C's 2 is enough
    const double traffic = 10.0 * 240.0 / 1800.0;
    ErlangAModel impatient(10.0);

    auto c = search.solve(erlang_c_model, traffic, 240.0, 0.8, 600.0, 0.9);
    auto a = search.solve(impatient, traffic, 240.0, 0.8, 600.0, 0.9);
    ASSERT_TRUE(c.has_value());
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*c, 2);
    EXPECT_EQ(*a, 2);
    EXPECT_LT(impatient.project(*a, traffic, 240.0, 600.0).service_level, 0.8);
}

TEST_F(StaffingSearchTest, ImpatientCallersNeedNoFewerAgentsAtReferenceLoad) {
    // 150 contacts, 240 s, 30 min, 80/20
    const double traffic = 150.0 * 240.0 / 1800.0;
    ErlangAModel patient(180.0);
    ErlangAModel impatient(60.0);

    auto p = search.solve(patient, traffic, 240.0, 0.8, 20.0, 0.9);
    auto i = search.solve(impatient, traffic, 240.0, 0.8, 20.0, 0.9);
    ASSERT_TRUE(p.has_value());
    ASSERT_TRUE(i.has_value());
    EXPECT_GE(*i, *p);
    EXPECT_EQ(*p, 23);
}

TEST_F(StaffingSearchTest, MorePatienceApproachesErlangCStaffing) {
    const double traffic = 20.0;
    auto c = search.solve(erlang_c_model, traffic, 240.0, 0.8, 20.0, 0.9);
    ASSERT_TRUE(c.has_value());

    AgentCount previous = 0;
    for (double patience : {30.0, 60.0, 90.0, 180.0, 300.0, 600.0, 1.0e7}) {
        ErlangAModel model(patience);
        auto agents = search.solve(model, traffic, 240.0, 0.8, 20.0, 0.9);
        ASSERT_TRUE(agents.has_value());
        EXPECT_GE(*agents, previous) << "patience=" << patience;
        EXPECT_LE(*agents, *c) << "patience=" << patience;
        previous = *agents;
    }
    EXPECT_EQ(previous, *c);
}

// ===========================================================================
// Representable bounds
// ===========================================================================

TEST_F(StaffingSearchTest, BoundsSaturateForHugeTraffic) {
    const AgentCount largest = std::numeric_limits<AgentCount>::max();
    EXPECT_EQ(search.min_agents(1.0e12, 0.9), largest);
    EXPECT_EQ(search.max_agents(1.0e12, 0.9), largest);
    EXPECT_EQ(search.max_agents(1.0e9, 1.0), largest);   // 5x traffic
    EXPECT_EQ(agents_for_occupancy(std::numeric_limits<double>::infinity(), 0.9), largest);
}

TEST_F(StaffingSearchTest, UnrepresentableHeadcountIsInfeasible) {
    // 100000 contacts of 7200 s in 0.0001 minutes
    const double traffic = 100000.0 * 7200.0 / 0.006;
    EXPECT_FALSE(search.solve_agents(traffic, 7200.0, 0.8, 20.0, 0.9).has_value());

    ErlangAModel model(120.0);
    EXPECT_FALSE(search.solve(model, traffic, 7200.0, 0.8, 20.0, 0.9).has_value());
    EXPECT_FALSE(search.solve_agents(std::numeric_limits<double>::quiet_NaN(),
                                     240.0, 0.8, 20.0, 0.9).has_value());
}
