/// @file impact_ranker_test.cpp
/// @brief Tests for the impact ranker

#include <gtest/gtest.h>

#include <cmath>

#include "analysis/impact_ranker.h"

namespace rootscope::analysis {
namespace {

using json = nlohmann::json;

CorrelationRecord Record(std::string name, double r, double p) {
    return CorrelationRecord{.driver_name = std::move(name),
                             .method = CorrelationMethod::kPearson,
                             .r = r,
                             .p_value = p};
}

class ImpactRankerTest : public ::testing::Test {
protected:
    ImpactRanker ranker_;
};

TEST_F(ImpactRankerTest, EmptyBatchGivesEmptyRanking) {
    EXPECT_TRUE(ranker_.Rank({}).empty());
}

TEST_F(ImpactRankerTest, SingleRecordSkipsNormalization) {
    auto ranking = ranker_.Rank({Record("only", 0.5, 0.01)});
    ASSERT_EQ(ranking.size(), 1u);
    EXPECT_NEAR(ranking[0].score, 0.5 * 2.0, 1e-12);
}

TEST_F(ImpactRankerTest, CompositeScoreFormula) {
    auto ranking = ranker_.Rank({
        Record("weak", 0.1, 0.5),
        Record("medium", -0.3, 0.04),
        Record("strong", 0.9, 1e-20),
    });
    ASSERT_EQ(ranking.size(), 3u);

    EXPECT_EQ(ranking[0].driver_name, "strong");
    EXPECT_EQ(ranking[1].driver_name, "medium");
    EXPECT_EQ(ranking[2].driver_name, "weak");

    const double range = 0.8 + 1e-9;
    // p-value floored at 1e-12
    EXPECT_NEAR(ranking[0].score, (0.8 / range) * 12.0, 1e-9);
    EXPECT_NEAR(ranking[1].score, (0.2 / range) * -std::log10(0.04), 1e-9);
    EXPECT_NEAR(ranking[2].score, 0.0, 1e-12);

    // Inputs are carried through
    EXPECT_DOUBLE_EQ(ranking[1].r, -0.3);
    EXPECT_DOUBLE_EQ(ranking[1].p_value, 0.04);
    EXPECT_DOUBLE_EQ(ranking[0].p_value, 1e-20);
}

TEST_F(ImpactRankerTest, EqualCoefficientsAreNotNormalized) {
    auto ranking = ranker_.Rank({Record("a", 0.4, 0.1), Record("b", -0.4, 0.001)});
    ASSERT_EQ(ranking.size(), 2u);
    EXPECT_EQ(ranking[0].driver_name, "b");
    EXPECT_NEAR(ranking[0].score, 0.4 * 3.0, 1e-12);
    EXPECT_NEAR(ranking[1].score, 0.4 * 1.0, 1e-12);
}

TEST_F(ImpactRankerTest, TiesKeepInputOrder) {
    auto ranking = ranker_.Rank({
        Record("first", 0.5, 0.2),
        Record("second", 0.5, 0.2),
        Record("third", 0.5, 0.2),
    });
    ASSERT_EQ(ranking.size(), 3u);
    EXPECT_EQ(ranking[0].driver_name, "first");
    EXPECT_EQ(ranking[1].driver_name, "second");
    EXPECT_EQ(ranking[2].driver_name, "third");
}

TEST_F(ImpactRankerTest, TopKTruncation) {
    std::vector<CorrelationRecord> records = {
        Record("a", 0.9, 1e-5), Record("b", 0.6, 1e-3), Record("c", 0.2, 0.3)};

    EXPECT_EQ(ranker_.Rank(records, 2).size(), 2u);
    EXPECT_EQ(ranker_.Rank(records, 10).size(), 3u);
    EXPECT_EQ(ranker_.Rank(records, std::nullopt).size(), 3u);
    EXPECT_TRUE(ranker_.Rank(records, 0).empty());
}

TEST_F(ImpactRankerTest, ClassifyStrength) {
    EXPECT_EQ(ranker_.ClassifyStrength(0.71), "Strong");
    EXPECT_EQ(ranker_.ClassifyStrength(-0.8), "Strong");
    EXPECT_EQ(ranker_.ClassifyStrength(0.7), "Moderate");
    EXPECT_EQ(ranker_.ClassifyStrength(0.31), "Moderate");
    EXPECT_EQ(ranker_.ClassifyStrength(0.3), "Weak");
    EXPECT_EQ(ranker_.ClassifyStrength(0.0), "Weak");
}

TEST_F(ImpactRankerTest, Explanation) {
    EXPECT_EQ(ranker_.Explain(0.85, 0.001),
              "Strong positive correlation with statistical significance");
    EXPECT_EQ(ranker_.Explain(-0.5, 0.2),
              "Moderate negative correlation with moderate confidence");
    EXPECT_EQ(ranker_.Explain(0.0, 0.05),
              "Weak positive correlation with moderate confidence");

    auto ranking = ranker_.Rank({Record("x", -0.75, 0.01)});
    ASSERT_EQ(ranking.size(), 1u);
    EXPECT_EQ(ranking[0].strength, "Strong");
    EXPECT_EQ(ranking[0].explanation,
              "Strong negative correlation with statistical significance");
}

TEST_F(ImpactRankerTest, EnrichmentFromMetadata) {
    auto provider = JsonDriverMetadataProvider::FromJson(json::parse(R"({
        "drivers": {
            "speed": {"description": "Line speed", "unit": "m/min", "normal_range": [40, 60]}
        }
    })"));
    ASSERT_TRUE(provider.ok());

    ImpactRanker ranker({}, std::make_shared<JsonDriverMetadataProvider>(std::move(*provider)));
    auto ranking = ranker.Rank({Record("value_speed", 0.8, 0.001), Record("value_temp", 0.2, 0.4)});
    ASSERT_EQ(ranking.size(), 2u);

    const RankedDriver& speed = ranking[0];
    ASSERT_EQ(speed.driver_name, "value_speed");
    ASSERT_TRUE(speed.description.has_value());
    EXPECT_EQ(*speed.description, "Line speed");
    EXPECT_EQ(speed.unit.value_or(""), "m/min");
    ASSERT_TRUE(speed.normal_range.has_value());
    EXPECT_EQ(*speed.normal_range, json({40, 60}));

    // Unknown driver is not an error, just not enriched
    const RankedDriver& temp = ranking[1];
    EXPECT_FALSE(temp.description.has_value());
    EXPECT_FALSE(temp.unit.has_value());
    EXPECT_FALSE(temp.normal_range.has_value());
}

}  // namespace
}  // namespace rootscope::analysis
