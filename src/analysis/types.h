#pragma once

/// @file types.h
/// @brief Result types shared by the correlation, ranking and outlier stages

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "analysis/error_envelope.h"

namespace rootscope::analysis {

/// @brief Correlation flavor chosen per driver
enum class CorrelationMethod {
    kPearson,   ///< Linear, both sides roughly symmetric
    kSpearman   ///< Rank based, used when either side is skewed
};

/// @brief "pearson" / "spearman"
std::string_view CorrelationMethodToString(CorrelationMethod method);

/// @brief Parse "pearson" / "spearman"
absl::StatusOr<CorrelationMethod> ParseCorrelationMethod(std::string_view name);

/// @brief One driver's association with the KPI
struct CorrelationRecord {
    std::string driver_name;
    CorrelationMethod method = CorrelationMethod::kPearson;
    double r = 0.0;         ///< In [-1, 1]
    double p_value = 1.0;   ///< In [0, 1]
};

/// @brief A correlation record with its composite score and explanation
struct RankedDriver {
    std::string driver_name;
    CorrelationMethod method = CorrelationMethod::kPearson;
    double r = 0.0;
    double p_value = 1.0;
    double score = 0.0;
    std::string strength;      ///< "Strong" / "Moderate" / "Weak"
    std::string explanation;

    // Optional enrichment from driver metadata
    std::optional<std::string> description;
    std::optional<std::string> unit;
    std::optional<nlohmann::json> normal_range;
};

/// @brief A flagged (row, driver) pair
struct OutlierPoint {
    size_t row = 0;            ///< 0-based row index in the analyzed table
    std::string driver;

    bool operator==(const OutlierPoint& other) const {
        return row == other.row && driver == other.driver;
    }
};

/// @brief Output of the correlation stage
struct CorrelationResult {
    std::string kpi_name;
    std::vector<CorrelationRecord> drivers;
    std::optional<ErrorEnvelope> error;

    bool HasError() const { return error.has_value(); }

    /// {kpi_name, drivers:[{driver_name, method, r, p_value}]} plus envelope fields
    nlohmann::json ToJson() const;
    static absl::StatusOr<CorrelationResult> FromJson(const nlohmann::json& j);
};

/// @brief Output of the ranking stage
struct RankingResult {
    std::string kpi_name;
    std::vector<RankedDriver> ranking;
    std::optional<ErrorEnvelope> error;

    bool HasError() const { return error.has_value(); }

    nlohmann::json ToJson() const;
    static absl::StatusOr<RankingResult> FromJson(const nlohmann::json& j);
};

/// @brief Output of the outlier stage
struct OutlierResult {
    std::string kpi;
    std::vector<OutlierPoint> outliers;
    std::string summary;
    std::optional<ErrorEnvelope> error;

    bool HasError() const { return error.has_value(); }

    nlohmann::json ToJson() const;
    static absl::StatusOr<OutlierResult> FromJson(const nlohmann::json& j);
};

}  // namespace rootscope::analysis
