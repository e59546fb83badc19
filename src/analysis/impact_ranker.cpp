/// @file impact_ranker.cpp
/// @brief Impact ranker implementation

#include "analysis/impact_ranker.h"

#include <algorithm>
#include <cmath>

#include <absl/strings/str_cat.h>

#include "common/logging.h"

namespace rootscope::analysis {

ImpactRanker::ImpactRanker(ImpactRankerConfig config,
                           std::shared_ptr<const DriverMetadataProvider> metadata)
    : config_(std::move(config)), metadata_(std::move(metadata)) {}

std::vector<RankedDriver> ImpactRanker::Rank(const std::vector<CorrelationRecord>& records,
                                             std::optional<size_t> top_k) const {
    std::vector<RankedDriver> ranking;
    if (records.empty()) {
        return ranking;
    }

    std::vector<double> r_abs;
    r_abs.reserve(records.size());
    for (const auto& record : records) {
        r_abs.push_back(std::abs(record.r));
    }
    const auto [min_it, max_it] = std::minmax_element(r_abs.begin(), r_abs.end());
    const double r_min = *min_it;
    const double r_max = *max_it;
    const bool normalize = records.size() > 1 && r_max != r_min;

    ranking.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        const double r_norm =
            normalize ? (r_abs[i] - r_min) / (r_max - r_min + config_.epsilon) : r_abs[i];
        const double p_clipped = std::max(record.p_value, config_.p_value_floor);

        RankedDriver driver;
        driver.driver_name = record.driver_name;
        driver.method = record.method;
        driver.r = record.r;
        driver.p_value = record.p_value;
        driver.score = r_norm * -std::log10(p_clipped);
        driver.strength = ClassifyStrength(record.r);
        driver.explanation = Explain(record.r, record.p_value);
        Enrich(driver);
        ranking.push_back(std::move(driver));
    }

    std::stable_sort(ranking.begin(), ranking.end(),
                     [](const RankedDriver& a, const RankedDriver& b) {
                         return a.score > b.score;
                     });

    if (top_k.has_value() && ranking.size() > *top_k) {
        ranking.resize(*top_k);
    }

    ROOTSCOPE_LOG_DEBUG("Ranked {} of {} driver(s)", ranking.size(), records.size());
    return ranking;
}

std::string ImpactRanker::ClassifyStrength(double r) const {
    const double r_abs = std::abs(r);
    if (r_abs > config_.strong_threshold) return "Strong";
    if (r_abs > config_.moderate_threshold) return "Moderate";
    return "Weak";
}

std::string ImpactRanker::Explain(double r, double p_value) const {
    return absl::StrCat(ClassifyStrength(r), " ", r >= 0.0 ? "positive" : "negative",
                        " correlation with ",
                        p_value < config_.significance_level ? "statistical significance"
                                                             : "moderate confidence");
}

void ImpactRanker::Enrich(RankedDriver& driver) const {
    if (!metadata_) return;
    auto metadata = metadata_->Lookup(driver.driver_name);
    if (!metadata.has_value()) return;

    if (!metadata->description.empty()) driver.description = metadata->description;
    if (!metadata->unit.empty()) driver.unit = metadata->unit;
    if (metadata->normal_range.has_value()) driver.normal_range = metadata->normal_range;
}

}  // namespace rootscope::analysis
