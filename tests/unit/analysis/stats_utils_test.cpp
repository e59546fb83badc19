/// @file stats_utils_test.cpp
/// @brief Tests for the statistics primitives

#include <gtest/gtest.h>

#include <cmath>

#include "analysis/stats_utils.h"

namespace rootscope::analysis {
namespace {

TEST(StatsUtilsTest, MeanAndPopulationStdDev) {
    EXPECT_DOUBLE_EQ(Mean({1.0, 2.0, 3.0, 4.0}), 2.5);
    EXPECT_DOUBLE_EQ(Mean({}), 0.0);
    EXPECT_DOUBLE_EQ(PopulationStdDev({2, 4, 4, 4, 5, 5, 7, 9}), 2.0);
    EXPECT_DOUBLE_EQ(PopulationStdDev({5.0, 5.0, 5.0}), 0.0);
}

TEST(StatsUtilsTest, SampleSkewness) {
    EXPECT_NEAR(SampleSkewness({1.0, 2.0, 3.0}), 0.0, 1e-12);
    EXPECT_NEAR(SampleSkewness({1.0, 2.0, 3.0, 10.0}), 1.763632, 1e-4);
    EXPECT_NEAR(SampleSkewness({-10.0, 1.0, 2.0, 3.0}), -1.891657, 1e-4);

    // Undefined cases report zero
    EXPECT_DOUBLE_EQ(SampleSkewness({1.0, 2.0}), 0.0);
    EXPECT_DOUBLE_EQ(SampleSkewness({4.0, 4.0, 4.0, 4.0}), 0.0);
}

TEST(StatsUtilsTest, QuantileInterpolatesLinearly) {
    const std::vector<double> sorted = {1.0, 2.0, 3.0, 4.0};
    EXPECT_DOUBLE_EQ(Quantile(sorted, 0.25), 1.75);
    EXPECT_DOUBLE_EQ(Quantile(sorted, 0.5), 2.5);
    EXPECT_DOUBLE_EQ(Quantile(sorted, 0.75), 3.25);
    EXPECT_DOUBLE_EQ(Quantile(sorted, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(Quantile(sorted, 1.0), 4.0);
    EXPECT_DOUBLE_EQ(Quantile({7.0}, 0.75), 7.0);
}

TEST(StatsUtilsTest, AverageRanksSplitTies) {
    auto ranks = AverageRanks({10.0, 20.0, 20.0, 30.0, 5.0});
    EXPECT_EQ(ranks, (std::vector<double>{2.0, 3.5, 3.5, 5.0, 1.0}));
}

TEST(StatsUtilsTest, PearsonCorrelation) {
    EXPECT_NEAR(PearsonCorrelation({1, 2, 3, 4}, {2, 4, 6, 8}), 1.0, 1e-12);
    EXPECT_NEAR(PearsonCorrelation({1, 2, 3, 4}, {8, 6, 4, 2}), -1.0, 1e-12);
    EXPECT_NEAR(PearsonCorrelation({1, 2, 3, 4, 5}, {2, 1, 4, 3, 5}), 0.8, 1e-12);

    // Degenerate input
    EXPECT_DOUBLE_EQ(PearsonCorrelation({1, 1, 1}, {1, 2, 3}), 0.0);
    EXPECT_DOUBLE_EQ(PearsonCorrelation({1}, {2}), 0.0);
    EXPECT_DOUBLE_EQ(PearsonCorrelation({1, 2}, {1, 2, 3}), 0.0);
}

TEST(StatsUtilsTest, SpearmanIsRankBased) {
    // Monotonic but not linear
    EXPECT_NEAR(SpearmanCorrelation({1, 2, 3, 4, 5}, {1, 4, 9, 16, 25}), 1.0, 1e-12);
    EXPECT_LT(PearsonCorrelation({1, 2, 3, 4, 5}, {1, 10, 100, 1000, 10000}), 0.9);
    EXPECT_NEAR(SpearmanCorrelation({1, 2, 3, 4, 5}, {1, 10, 100, 1000, 10000}), 1.0, 1e-12);
}

TEST(StatsUtilsTest, RegularizedIncompleteBeta) {
    EXPECT_NEAR(RegularizedIncompleteBeta(1.0, 1.0, 0.3), 0.3, 1e-12);
    EXPECT_NEAR(RegularizedIncompleteBeta(2.0, 3.0, 0.4), 0.5248, 1e-10);
    EXPECT_DOUBLE_EQ(RegularizedIncompleteBeta(2.0, 3.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(RegularizedIncompleteBeta(2.0, 3.0, 1.0), 1.0);
}

TEST(StatsUtilsTest, PValueFromT) {
    // One degree of freedom is the Cauchy distribution
    EXPECT_NEAR(PValueFromT(1.0, 1), 0.5, 1e-10);
    EXPECT_NEAR(PValueFromT(0.0, 10), 1.0, 1e-12);
    EXPECT_NEAR(PValueFromT(1.96, 100000), 0.05, 1e-3);
    EXPECT_DOUBLE_EQ(PValueFromT(2.0, 0), 1.0);
    EXPECT_DOUBLE_EQ(PValueFromT(INFINITY, 5), 0.0);
}

TEST(StatsUtilsTest, CorrelationPValue) {
    EXPECT_DOUBLE_EQ(CorrelationPValue(0.9, 2), 1.0);
    EXPECT_DOUBLE_EQ(CorrelationPValue(1.0, 10), 0.0);
    EXPECT_DOUBLE_EQ(CorrelationPValue(-1.0, 10), 0.0);
    EXPECT_NEAR(CorrelationPValue(0.0, 10), 1.0, 1e-12);
    EXPECT_NEAR(CorrelationPValue(0.5, 10), 0.1411, 1e-3);

    // Symmetric in the sign of r
    EXPECT_NEAR(CorrelationPValue(0.5, 10), CorrelationPValue(-0.5, 10), 1e-15);
}

}  // namespace
}  // namespace rootscope::analysis
