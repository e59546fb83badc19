#pragma once

/// @file outlier_detector.h
/// @brief Per-driver outlier flagging with the z-score and Tukey IQR rules

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "analysis/types.h"
#include "store/table.h"

namespace rootscope::analysis {

/// @brief Configuration for the outlier detector
struct OutlierDetectorConfig {
    /// |z| above this flags a value (population standard deviation)
    double z_threshold = 3.0;

    /// Fence multiplier for the IQR rule
    double iqr_multiplier = 1.5;

    /// Columns with fewer present values are skipped
    size_t min_values = 2;
};

/// @brief Flags anomalous (row, driver) pairs
///
/// A value is flagged when either rule trips; the two sets are unioned so a
/// point appears once. Missing values are never flagged. Rows are reported
/// ascending within each driver, drivers in table order.
class OutlierDetector {
public:
    explicit OutlierDetector(OutlierDetectorConfig config = {});

    /// @brief Flag outliers in every numeric column except the KPI
    /// @return MissingKey if the KPI column is absent, InvalidArgument for a
    ///         table without rows
    absl::StatusOr<std::vector<OutlierPoint>> Detect(const store::Table& table,
                                                     std::string_view kpi) const;

    /// @brief Flagged row indices of one column (NaN = missing)
    std::vector<size_t> DetectColumn(const std::vector<double>& values) const;

    const OutlierDetectorConfig& GetConfig() const { return config_; }

private:
    OutlierDetectorConfig config_;
};

/// @brief One-line summary of a flagged set
///
/// "<N> outlying data points were flagged across <M> driver(s): a, b." or
/// "No significant outliers were detected."
std::string SummarizeOutliers(const std::vector<OutlierPoint>& outliers);

}  // namespace rootscope::analysis
