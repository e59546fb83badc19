/// @file outlier_detector.cpp
/// @brief Outlier detector implementation

#include "analysis/outlier_detector.h"

#include <algorithm>
#include <cmath>
#include <set>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "analysis/stats_utils.h"
#include "common/error.h"
#include "common/logging.h"

namespace rootscope::analysis {

OutlierDetector::OutlierDetector(OutlierDetectorConfig config)
    : config_(std::move(config)) {}

absl::StatusOr<std::vector<OutlierPoint>> OutlierDetector::Detect(
    const store::Table& table, std::string_view kpi) const {
    if (!table.HasColumn(kpi)) {
        return MissingKeyError(absl::StrCat("KPI column '", absl::string_view(kpi.data(), kpi.size()), "' not found in table"));
    }
    if (table.RowCount() == 0) {
        return InvalidArgumentError("Cannot detect outliers in a table without rows");
    }

    std::vector<OutlierPoint> outliers;
    for (const auto& column : table.Columns()) {
        if (!column.IsNumeric() || column.name == kpi) {
            continue;
        }
        for (size_t row : DetectColumn(column.numbers)) {
            outliers.push_back(OutlierPoint{row, column.name});
        }
    }

    ROOTSCOPE_LOG_DEBUG("Flagged {} outlier(s) excluding KPI '{}'", outliers.size(), kpi);
    return outliers;
}

std::vector<size_t> OutlierDetector::DetectColumn(const std::vector<double>& values) const {
    std::vector<double> present;
    present.reserve(values.size());
    for (double v : values) {
        if (!std::isnan(v)) present.push_back(v);
    }
    if (present.size() < std::max<size_t>(config_.min_values, 2)) {
        return {};
    }

    const double mean = Mean(present);
    const double std_dev = PopulationStdDev(present);

    std::vector<double> sorted = present;
    std::sort(sorted.begin(), sorted.end());
    const double q1 = Quantile(sorted, 0.25);
    const double q3 = Quantile(sorted, 0.75);
    const double iqr = q3 - q1;
    const double lower = q1 - config_.iqr_multiplier * iqr;
    const double upper = q3 + config_.iqr_multiplier * iqr;

    // Indices come out ascending, each at most once
    std::vector<size_t> flagged;
    for (size_t i = 0; i < values.size(); ++i) {
        const double v = values[i];
        if (std::isnan(v)) continue;

        const bool z_flag =
            std_dev > 0.0 && std::abs((v - mean) / std_dev) > config_.z_threshold;
        const bool iqr_flag = v < lower || v > upper;
        if (z_flag || iqr_flag) {
            flagged.push_back(i);
        }
    }
    return flagged;
}

std::string SummarizeOutliers(const std::vector<OutlierPoint>& outliers) {
    if (outliers.empty()) {
        return "No significant outliers were detected.";
    }
    std::set<std::string> drivers;
    for (const auto& point : outliers) {
        drivers.insert(point.driver);
    }
    return absl::StrCat(outliers.size(), " outlying data points were flagged across ",
                        drivers.size(), " driver(s): ", absl::StrJoin(drivers, ", "), ".");
}

}  // namespace rootscope::analysis
