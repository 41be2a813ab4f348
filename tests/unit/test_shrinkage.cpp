#include <gtest/gtest.h>
#include <erlangcore/erlangcore.hpp>

#include <cmath>

using namespace erlangcore;

TEST(ShrinkageTest, FteGrossesUpProductiveAgents) {
    EXPECT_NEAR(fte(14, 0.30), 20.0, 1e-12);
    EXPECT_NEAR(fte(17, 0.15), 20.0, 1e-12);
    EXPECT_NEAR(fte(30, 0.25), 40.0, 1e-12);
}

TEST(ShrinkageTest, NoShrinkageMeansFteEqualsAgents) {
    EXPECT_DOUBLE_EQ(fte(14, 0.0), 14.0);
    EXPECT_DOUBLE_EQ(fte(0, 0.3), 0.0);
}

TEST(ShrinkageTest, NegativeShrinkageTreatedAsZero) {
    EXPECT_DOUBLE_EQ(fte(14, -0.2), 14.0);
}

TEST(ShrinkageTest, TotalShrinkageIsUnbounded) {
    EXPECT_TRUE(std::isinf(fte(14, 1.0)));
    EXPECT_TRUE(std::isinf(fte(14, 1.5)));
}

TEST(ShrinkageTest, FteNeverBelowProductiveAgents) {
    for (double s = 0.0; s < 0.95; s += 0.05) {
        EXPECT_GE(fte(25, s), 25.0);
    }
}

// ===========================================================================
// Productivity modifier
// ===========================================================================

TEST(ShrinkageTest, NeutralModifierKeepsShrinkage) {
    EXPECT_NEAR(effective_shrinkage(0.30, 1.0), 0.30, 1e-12);
}

TEST(ShrinkageTest, LowerProductivityRaisesShrinkage) {
    // 70% productive, then 90% of that
    EXPECT_NEAR(effective_shrinkage(0.30, 0.9), 0.37, 1e-12);
    EXPECT_NEAR(fte(14, effective_shrinkage(0.30, 0.9)), 14.0 / 0.63, 1e-9);
}

TEST(ShrinkageTest, HigherProductivityLowersShrinkage) {
    EXPECT_NEAR(effective_shrinkage(0.30, 1.2), 0.16, 1e-12);
}

TEST(ShrinkageTest, EffectiveShrinkageClamped) {
    EXPECT_DOUBLE_EQ(effective_shrinkage(0.30, 2.0), 0.0);
    EXPECT_DOUBLE_EQ(effective_shrinkage(0.30, 0.0), 1.0);
}
