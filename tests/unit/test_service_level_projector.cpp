#include <gtest/gtest.h>
#include <erlangcore/erlangcore.hpp>

#include <cmath>

using namespace erlangcore;

// ===========================================================================
// Model construction
// ===========================================================================

TEST(QueueModelTest, FactoryBuildsEachVariant) {
    Behavior behavior;
    behavior.average_patience_seconds = 120.0;

    auto b = make_queue_model(ErlangVariant::B, behavior);
    auto c = make_queue_model(ErlangVariant::C, behavior);
    auto a = make_queue_model(ErlangVariant::A, behavior);

    ASSERT_NE(b, nullptr);
    ASSERT_NE(c, nullptr);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(b->variant(), ErlangVariant::B);
    EXPECT_EQ(c->variant(), ErlangVariant::C);
    EXPECT_EQ(a->variant(), ErlangVariant::A);
    EXPECT_EQ(a->name(), "Erlang A");
}

TEST(QueueModelTest, ErlangANeedsPatience) {
    Behavior behavior;
    EXPECT_EQ(make_queue_model(ErlangVariant::A, behavior), nullptr);

    behavior.average_patience_seconds = 0.0;
    EXPECT_EQ(make_queue_model(ErlangVariant::A, behavior), nullptr);
}

TEST(QueueModelTest, ErlangAModelRejectsNonPositivePatience) {
    EXPECT_THROW(ErlangAModel(0.0), InvalidConfigException);
    EXPECT_THROW(ErlangAModel(-5.0), InvalidConfigException);
    EXPECT_NO_THROW(ErlangAModel(60.0));
}

// ===========================================================================
// Erlang B projection
// ===========================================================================

TEST(QueueModelTest, ErlangBProjectsSuccessRate) {
    ErlangBModel model;
    auto p = model.project(10, 10.0, 180.0, 20.0);

    ASSERT_TRUE(p.blocking_probability.has_value());
    EXPECT_NEAR(*p.blocking_probability, 0.2146, 1e-4);
    EXPECT_NEAR(p.service_level, 1.0 - *p.blocking_probability, 1e-12);
    EXPECT_DOUBLE_EQ(p.asa, 0.0);
    EXPECT_FALSE(p.abandonment_rate.has_value());
}

TEST(QueueModelTest, ErlangBOccupancyCountsCarriedTraffic) {
    ErlangBModel model;
    auto p = model.project(10, 10.0, 180.0, 20.0);
    EXPECT_NEAR(p.occupancy, 10.0 * (1.0 - *p.blocking_probability) / 10.0, 1e-12);
    EXPECT_LT(p.occupancy, 1.0);
}

// ===========================================================================
// Erlang C projection
// ===========================================================================

TEST(QueueModelTest, ErlangCProjectsQueueMetrics) {
    ErlangCModel model;
    auto p = model.project(14, 10.0, 180.0, 20.0);

    EXPECT_NEAR(p.service_level, 0.8884, 1e-4);
    EXPECT_NEAR(p.asa, 7.84, 0.01);
    EXPECT_NEAR(p.occupancy, 10.0 / 14.0, 1e-12);
    EXPECT_FALSE(p.blocking_probability.has_value());
    EXPECT_FALSE(p.abandonment_rate.has_value());
}

TEST(QueueModelTest, ErlangCUnstableProjection) {
    ErlangCModel model;
    auto p = model.project(10, 10.0, 180.0, 20.0);

    EXPECT_DOUBLE_EQ(p.service_level, 0.0);
    EXPECT_TRUE(is_unbounded(p.asa));
    EXPECT_DOUBLE_EQ(p.occupancy, 1.0);
}

// ===========================================================================
// Erlang A projection
// ===========================================================================

TEST(QueueModelTest, ErlangAProjectsAbandonment) {
    const double traffic = 100.0 * 240.0 / 1800.0;
    ErlangAModel model(180.0);
    auto p = model.project(17, traffic, 240.0, 20.0);

    ASSERT_TRUE(p.abandonment_rate.has_value());
    EXPECT_NEAR(*p.abandonment_rate, 0.028676, 1e-6);
    EXPECT_NEAR(p.wait_probability, 0.17987, 1e-5);
    EXPECT_NEAR(p.service_level, 0.88988, 1e-5);
    EXPECT_NEAR(p.asa, 5.1617, 1e-4);
}

TEST(QueueModelTest, AbandonmentRelievesTheQueue) {
    const double traffic = 100.0 * 240.0 / 1800.0;
    ErlangCModel c_model;
    ErlangAModel a_model(90.0);

    for (AgentCount agents = 14; agents <= 40; ++agents) {
        auto c = c_model.project(agents, traffic, 240.0, 20.0);
        auto a = a_model.project(agents, traffic, 240.0, 20.0);
        EXPECT_LT(a.wait_probability, c.wait_probability) << "agents=" << agents;
        EXPECT_LT(a.asa, c.asa) << "agents=" << agents;
        if (agents <= 25) {
            EXPECT_GT(a.service_level, c.service_level) << "agents=" << agents;
        }
    }
}

// ===========================================================================
// Workload projection
// ===========================================================================

TEST(QueueModelTest, ProjectFromWorkloadDerivesTraffic) {
    WorkloadInput workload{100.0, 180.0, 30.0};
    Constraints constraints;
    Behavior behavior;

    auto p = project(ErlangVariant::C, 14, workload, constraints, behavior);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->service_level, 0.8884, 1e-4);
}

TEST(QueueModelTest, ProjectFromWorkloadAppliesConcurrency) {
    WorkloadInput workload{100.0, 360.0, 30.0};
    Constraints constraints;
    Behavior behavior;
    behavior.concurrency = 2;

    auto p = project(ErlangVariant::C, 14, workload, constraints, behavior);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->occupancy, 10.0 / 14.0, 1e-12);
}

TEST(QueueModelTest, ProjectFromWorkloadWithoutPatienceIsEmpty) {
    WorkloadInput workload{100.0, 180.0, 30.0};
    EXPECT_FALSE(project(ErlangVariant::A, 14, workload, Constraints{}, Behavior{}).has_value());
}
