#pragma once

/// @file correlation_engine.h
/// @brief Per-driver correlation against a KPI column

#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "analysis/types.h"
#include "store/table.h"

namespace rootscope::analysis {

/// @brief Configuration for the correlation engine
struct CorrelationEngineConfig {
    /// Both sides must have |skewness| below this for the linear method
    double skew_threshold = 1.0;

    /// Pairwise-complete rows required before a driver gets a real estimate
    size_t min_pairs = 2;
};

/// @brief Correlates every numeric driver column with the KPI column
///
/// Method is chosen per driver: Pearson when the driver and the KPI are both
/// roughly symmetric over the rows where both are present, Spearman otherwise.
/// Rows missing either value are dropped pairwise. A driver with too few
/// usable rows or no variance gets the neutral record {r: 0, p_value: 1}
/// instead of failing the batch.
///
/// Output is ordered by ascending p-value.
///
/// Example usage:
/// @code
///   CorrelationEngine engine;
///   auto records = engine.Compute(table, "KPI");
///   if (!records.ok()) {
///       // Missing or non-numeric KPI, empty table
///   }
/// @endcode
class CorrelationEngine {
public:
    explicit CorrelationEngine(CorrelationEngineConfig config = {});

    /// @brief Correlate all numeric drivers with the KPI column
    /// @return MissingKey if the KPI column is absent, TypeMismatch if it is
    ///         not numeric, InvalidArgument for a table without rows
    absl::StatusOr<std::vector<CorrelationRecord>> Compute(
        const store::Table& table, std::string_view kpi) const;

    /// @brief Correlate one driver with the KPI (NaN = missing on either side)
    CorrelationRecord ComputePair(std::string_view driver_name,
                                  const std::vector<double>& driver,
                                  const std::vector<double>& kpi) const;

    /// @brief Method the selection rule picks for already-paired samples
    CorrelationMethod SelectMethod(const std::vector<double>& driver,
                                   const std::vector<double>& kpi) const;

    const CorrelationEngineConfig& GetConfig() const { return config_; }

private:
    CorrelationEngineConfig config_;
};

}  // namespace rootscope::analysis
