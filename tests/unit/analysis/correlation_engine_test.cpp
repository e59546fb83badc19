/// @file correlation_engine_test.cpp
/// @brief Tests for the correlation engine

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "analysis/correlation_engine.h"
#include "common/error.h"

namespace rootscope::analysis {
namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

std::vector<double> Sequence(size_t n, double scale = 1.0, double offset = 0.0) {
    std::vector<double> values;
    for (size_t i = 0; i < n; ++i) {
        values.push_back(offset + scale * static_cast<double>(i));
    }
    return values;
}

const CorrelationRecord* FindRecord(const std::vector<CorrelationRecord>& records,
                                    const std::string& name) {
    for (const auto& record : records) {
        if (record.driver_name == name) return &record;
    }
    return nullptr;
}

class CorrelationEngineTest : public ::testing::Test {
protected:
    CorrelationEngine engine_;
};

TEST_F(CorrelationEngineTest, LinearDriverIsPerfectlyCorrelated) {
    store::Table table;
    ASSERT_TRUE(table.AddNumericColumn("KPI", Sequence(20)).ok());
    ASSERT_TRUE(table.AddNumericColumn("value_speed", Sequence(20, 2.0, 5.0)).ok());
    ASSERT_TRUE(table.AddNumericColumn("value_inverse", Sequence(20, -0.5, 3.0)).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_TRUE(records.ok()) << records.status().message();
    ASSERT_EQ(records->size(), 2u);

    const auto* speed = FindRecord(*records, "value_speed");
    ASSERT_NE(speed, nullptr);
    EXPECT_EQ(speed->method, CorrelationMethod::kPearson);
    EXPECT_NEAR(speed->r, 1.0, 1e-12);
    EXPECT_NEAR(speed->p_value, 0.0, 1e-12);

    const auto* inverse = FindRecord(*records, "value_inverse");
    ASSERT_NE(inverse, nullptr);
    EXPECT_NEAR(inverse->r, -1.0, 1e-12);
}

TEST_F(CorrelationEngineTest, ExcludesKpiAndTextColumns) {
    store::Table table;
    ASSERT_TRUE(table.AddNumericColumn("KPI", Sequence(5)).ok());
    ASSERT_TRUE(table.AddTextColumn("shift", {"a", "b", "a", "b", "a"}).ok());
    ASSERT_TRUE(table.AddNumericColumn("driver", {1, 3, 2, 5, 4}).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_TRUE(records.ok());
    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].driver_name, "driver");
}

TEST_F(CorrelationEngineTest, OrderedByAscendingPValue) {
    store::Table table;
    ASSERT_TRUE(table.AddNumericColumn("KPI", Sequence(30)).ok());
    std::vector<double> noise;
    for (int i = 0; i < 30; ++i) noise.push_back(i % 2 == 0 ? 1.0 : -1.0);
    ASSERT_TRUE(table.AddNumericColumn("noise", noise).ok());
    ASSERT_TRUE(table.AddNumericColumn("signal", Sequence(30, 3.0)).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_TRUE(records.ok());
    ASSERT_EQ(records->size(), 2u);
    EXPECT_EQ((*records)[0].driver_name, "signal");
    EXPECT_EQ((*records)[1].driver_name, "noise");
    EXPECT_LE((*records)[0].p_value, (*records)[1].p_value);
}

TEST_F(CorrelationEngineTest, PairwiseDeletionKeepsOtherRows) {
    store::Table table;
    ASSERT_TRUE(table.AddNumericColumn("KPI", {1, 2, 3, 4, 5, 6}).ok());
    ASSERT_TRUE(table.AddNumericColumn("gappy", {2, kNaN, 6, kNaN, 10, 12}).ok());
    ASSERT_TRUE(table.AddNumericColumn("full", {6, 5, 4, 3, 2, 1}).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_TRUE(records.ok());

    const auto* gappy = FindRecord(*records, "gappy");
    ASSERT_NE(gappy, nullptr);
    EXPECT_NEAR(gappy->r, 1.0, 1e-12);

    const auto* full = FindRecord(*records, "full");
    ASSERT_NE(full, nullptr);
    EXPECT_NEAR(full->r, -1.0, 1e-12);
}

TEST_F(CorrelationEngineTest, DegenerateDriversGetNeutralRecord) {
    store::Table table;
    ASSERT_TRUE(table.AddNumericColumn("KPI", {1, 2, 3, 4, 5}).ok());
    ASSERT_TRUE(table.AddNumericColumn("single", {kNaN, kNaN, 7, kNaN, kNaN}).ok());
    ASSERT_TRUE(table.AddNumericColumn("empty", {kNaN, kNaN, kNaN, kNaN, kNaN}).ok());
    ASSERT_TRUE(table.AddNumericColumn("constant", {4, 4, 4, 4, 4}).ok());
    ASSERT_TRUE(table.AddNumericColumn("good", {2, 4, 6, 8, 11}).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_TRUE(records.ok());
    ASSERT_EQ(records->size(), 4u);

    for (const std::string name : {"single", "empty", "constant"}) {
        const auto* record = FindRecord(*records, name);
        ASSERT_NE(record, nullptr) << name;
        EXPECT_DOUBLE_EQ(record->r, 0.0) << name;
        EXPECT_DOUBLE_EQ(record->p_value, 1.0) << name;
    }

    // One bad driver never blocks the others
    const auto* good = FindRecord(*records, "good");
    ASSERT_NE(good, nullptr);
    EXPECT_GT(good->r, 0.9);
}

TEST_F(CorrelationEngineTest, TwoPairsUseLinearMethod) {
    store::Table table;
    ASSERT_TRUE(table.AddNumericColumn("KPI", {1, 2, kNaN}).ok());
    ASSERT_TRUE(table.AddNumericColumn("d", {5, 9, 1}).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_TRUE(records.ok());
    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ((*records)[0].method, CorrelationMethod::kPearson);
    EXPECT_NEAR((*records)[0].r, 1.0, 1e-12);
    // No degrees of freedom left for a test
    EXPECT_DOUBLE_EQ((*records)[0].p_value, 1.0);
}

TEST_F(CorrelationEngineTest, SkewedSideSelectsSpearman) {
    std::vector<double> kpi = Sequence(10);
    std::vector<double> symmetric = Sequence(10, 2.0);
    std::vector<double> skewed;
    for (int i = 0; i < 10; ++i) skewed.push_back(std::exp(static_cast<double>(i)));

    EXPECT_EQ(engine_.SelectMethod(symmetric, kpi), CorrelationMethod::kPearson);
    EXPECT_EQ(engine_.SelectMethod(skewed, kpi), CorrelationMethod::kSpearman);
    EXPECT_EQ(engine_.SelectMethod(kpi, skewed), CorrelationMethod::kSpearman);

    // Monotonic relationship is perfect under ranks
    auto record = engine_.ComputePair("exp", skewed, kpi);
    EXPECT_EQ(record.method, CorrelationMethod::kSpearman);
    EXPECT_NEAR(record.r, 1.0, 1e-12);
}

TEST_F(CorrelationEngineTest, ValuesStayInRange) {
    store::Table table;
    std::vector<double> kpi;
    std::vector<double> a;
    std::vector<double> b;
    for (int i = 0; i < 40; ++i) {
        kpi.push_back(std::sin(i * 0.7) * 10.0 + i);
        a.push_back(std::cos(i * 1.3) * 5.0);
        b.push_back((i * 37) % 11);
    }
    ASSERT_TRUE(table.AddNumericColumn("KPI", kpi).ok());
    ASSERT_TRUE(table.AddNumericColumn("a", a).ok());
    ASSERT_TRUE(table.AddNumericColumn("b", b).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_TRUE(records.ok());
    for (const auto& record : *records) {
        EXPECT_GE(record.r, -1.0);
        EXPECT_LE(record.r, 1.0);
        EXPECT_GE(record.p_value, 0.0);
        EXPECT_LE(record.p_value, 1.0);
    }
}

TEST_F(CorrelationEngineTest, MissingKpiIsBatchError) {
    store::Table table;
    ASSERT_TRUE(table.AddNumericColumn("a", {1, 2, 3}).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_FALSE(records.ok());
    EXPECT_EQ(GetErrorCode(records.status()), ErrorCode::kMissingKey);
}

TEST_F(CorrelationEngineTest, TextKpiIsTypeError) {
    store::Table table;
    ASSERT_TRUE(table.AddTextColumn("KPI", {"x", "y", "z"}).ok());
    ASSERT_TRUE(table.AddNumericColumn("a", {1, 2, 3}).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_FALSE(records.ok());
    EXPECT_EQ(GetErrorCode(records.status()), ErrorCode::kTypeMismatch);
}

TEST_F(CorrelationEngineTest, NoRowsIsValueError) {
    store::Table table;
    ASSERT_TRUE(table.AddNumericColumn("KPI", {}).ok());
    ASSERT_TRUE(table.AddNumericColumn("a", {}).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_FALSE(records.ok());
    EXPECT_EQ(GetErrorCode(records.status()), ErrorCode::kInvalidArgument);
}

TEST_F(CorrelationEngineTest, AllMissingKpiIsNumericError) {
    store::Table table;
    ASSERT_TRUE(table.AddNumericColumn("KPI", {kNaN, kNaN, kNaN, kNaN}).ok());
    ASSERT_TRUE(table.AddNumericColumn("a", {1, 2, 3, 4}).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_FALSE(records.ok());
    EXPECT_EQ(GetErrorCode(records.status()), ErrorCode::kNumericError);
}

TEST_F(CorrelationEngineTest, SingleKpiValueIsNumericError) {
    store::Table table;
    ASSERT_TRUE(table.AddNumericColumn("KPI", {kNaN, 5, kNaN}).ok());
    ASSERT_TRUE(table.AddNumericColumn("a", {1, 2, 3}).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_FALSE(records.ok());
    EXPECT_EQ(GetErrorCode(records.status()), ErrorCode::kNumericError);
}

TEST_F(CorrelationEngineTest, ConstantKpiIsNumericError) {
    store::Table table;
    ASSERT_TRUE(table.AddNumericColumn("KPI", {4, 4, kNaN, 4, 4}).ok());
    ASSERT_TRUE(table.AddNumericColumn("a", {1, 2, 3, 4, 5}).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_FALSE(records.ok());
    EXPECT_EQ(GetErrorCode(records.status()), ErrorCode::kNumericError);
}

TEST_F(CorrelationEngineTest, NoDriversIsEmptyBatch) {
    store::Table table;
    ASSERT_TRUE(table.AddNumericColumn("KPI", {1, 2, 3}).ok());

    auto records = engine_.Compute(table, "KPI");
    ASSERT_TRUE(records.ok());
    EXPECT_TRUE(records->empty());
}

}  // namespace
}  // namespace rootscope::analysis
