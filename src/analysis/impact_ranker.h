#pragma once

/// @file impact_ranker.h
/// @brief Composite scoring and ranking of correlated drivers

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analysis/driver_metadata.h"
#include "analysis/types.h"

namespace rootscope::analysis {

/// @brief Configuration for the impact ranker
struct ImpactRankerConfig {
    /// Added to the normalization range to avoid division by zero
    double epsilon = 1e-9;

    /// Lower bound on p-values before taking log10
    double p_value_floor = 1e-12;

    /// |r| above this is "Strong"
    double strong_threshold = 0.7;

    /// |r| above this (and not strong) is "Moderate"
    double moderate_threshold = 0.3;

    /// p-values below this are reported as statistically significant
    double significance_level = 0.05;
};

/// @brief Turns a correlation batch into an ordered, explained ranking
///
/// score = r_norm * -log10(max(p, p_value_floor)), where r_norm is |r|
/// min-max normalized across the batch when the batch has more than one
/// record and |r| varies; otherwise r_norm = |r|. Ties keep input order.
///
/// Example usage:
/// @code
///   ImpactRanker ranker({}, metadata_provider);
///   auto ranking = ranker.Rank(records, /*top_k=*/5);
/// @endcode
class ImpactRanker {
public:
    explicit ImpactRanker(ImpactRankerConfig config = {},
                          std::shared_ptr<const DriverMetadataProvider> metadata = nullptr);

    /// @brief Score, sort and explain a batch
    /// @param top_k Keep at most this many drivers, nullopt keeps all
    std::vector<RankedDriver> Rank(const std::vector<CorrelationRecord>& records,
                                   std::optional<size_t> top_k = std::nullopt) const;

    /// @brief "Strong" / "Moderate" / "Weak" for a coefficient
    std::string ClassifyStrength(double r) const;

    /// @brief e.g. "Strong positive correlation with statistical significance"
    std::string Explain(double r, double p_value) const;

    const ImpactRankerConfig& GetConfig() const { return config_; }

private:
    void Enrich(RankedDriver& driver) const;

    ImpactRankerConfig config_;
    std::shared_ptr<const DriverMetadataProvider> metadata_;
};

}  // namespace rootscope::analysis
