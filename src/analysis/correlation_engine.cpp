/// @file correlation_engine.cpp
/// @brief Correlation engine implementation

#include "analysis/correlation_engine.h"

#include <algorithm>
#include <cmath>

#include <absl/strings/str_cat.h>

#include "analysis/stats_utils.h"
#include "common/error.h"
#include "common/logging.h"

namespace rootscope::analysis {

CorrelationEngine::CorrelationEngine(CorrelationEngineConfig config)
    : config_(std::move(config)) {}

absl::StatusOr<std::vector<CorrelationRecord>> CorrelationEngine::Compute(
    const store::Table& table, std::string_view kpi) const {
    const store::Column* target = table.FindColumn(kpi);
    if (target == nullptr) {
        return MissingKeyError(absl::StrCat("KPI column '", absl::string_view(kpi.data(), kpi.size()), "' not found in table"));
    }
    if (!target->IsNumeric()) {
        return TypeMismatchError(absl::StrCat("KPI column '", absl::string_view(kpi.data(), kpi.size()), "' is not numeric"));
    }
    if (table.RowCount() == 0) {
        return InvalidArgumentError("Cannot correlate a table without rows");
    }

    std::vector<double> present;
    for (double v : target->numbers) {
        if (!std::isnan(v)) present.push_back(v);
    }
    if (present.size() < config_.min_pairs) {
        return NumericError(absl::StrCat("KPI column '", absl::string_view(kpi.data(), kpi.size()), "' has ", present.size(),
                                         " usable value(s), need at least ",
                                         config_.min_pairs));
    }
    if (IsConstant(present)) {
        return NumericError(absl::StrCat("KPI column '", absl::string_view(kpi.data(), kpi.size()), "' is constant"));
    }

    std::vector<CorrelationRecord> records;
    for (const auto& column : table.Columns()) {
        if (!column.IsNumeric() || column.name == kpi) {
            continue;
        }
        records.push_back(ComputePair(column.name, column.numbers, target->numbers));
    }

    std::stable_sort(records.begin(), records.end(),
                     [](const CorrelationRecord& a, const CorrelationRecord& b) {
                         return a.p_value < b.p_value;
                     });

    ROOTSCOPE_LOG_DEBUG("Correlated {} driver(s) against '{}'", records.size(), kpi);
    return records;
}

CorrelationRecord CorrelationEngine::ComputePair(std::string_view driver_name,
                                                 const std::vector<double>& driver,
                                                 const std::vector<double>& kpi) const {
    CorrelationRecord record;
    record.driver_name = std::string(driver_name);

    // Pairwise deletion
    std::vector<double> x;
    std::vector<double> y;
    const size_t n = std::min(driver.size(), kpi.size());
    x.reserve(n);
    y.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (std::isnan(driver[i]) || std::isnan(kpi[i])) continue;
        x.push_back(driver[i]);
        y.push_back(kpi[i]);
    }

    if (x.size() < std::max<size_t>(config_.min_pairs, 2)) {
        ROOTSCOPE_LOG_DEBUG("Driver '{}' has {} usable row(s), using neutral record",
                            driver_name, x.size());
        return record;
    }
    if (IsConstant(x) || IsConstant(y)) {
        ROOTSCOPE_LOG_DEBUG("Driver '{}' has no variance against the KPI, using neutral record",
                            driver_name);
        return record;
    }

    record.method = SelectMethod(x, y);
    const double r = record.method == CorrelationMethod::kPearson
                         ? PearsonCorrelation(x, y)
                         : SpearmanCorrelation(x, y);
    if (!std::isfinite(r)) {
        ROOTSCOPE_LOG_DEBUG("Driver '{}' produced a non-finite coefficient", driver_name);
        return record;
    }

    record.r = std::clamp(r, -1.0, 1.0);
    record.p_value = std::clamp(CorrelationPValue(record.r, x.size()), 0.0, 1.0);
    return record;
}

CorrelationMethod CorrelationEngine::SelectMethod(const std::vector<double>& driver,
                                                  const std::vector<double>& kpi) const {
    // Skewness is undefined below 3 points, stay linear
    if (driver.size() < 3 || kpi.size() < 3) {
        return CorrelationMethod::kPearson;
    }
    const double skew_driver = SampleSkewness(driver);
    const double skew_kpi = SampleSkewness(kpi);
    if (std::abs(skew_driver) < config_.skew_threshold &&
        std::abs(skew_kpi) < config_.skew_threshold) {
        return CorrelationMethod::kPearson;
    }
    return CorrelationMethod::kSpearman;
}

}  // namespace rootscope::analysis
