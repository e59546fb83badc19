/// @file types.cpp
/// @brief JSON mapping of the analysis result types

#include "analysis/types.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace rootscope::analysis {

using json = nlohmann::json;

namespace {

absl::Status MalformedResult(std::string_view what, const json::exception& e) {
    return MakeError(ErrorCode::kSerializationError,
                     absl::StrCat("Malformed ", absl::string_view(what.data(), what.size()), ": ", e.what()));
}

absl::StatusOr<std::optional<ErrorEnvelope>> ReadEnvelope(const json& j) {
    if (!HasErrorState(j)) {
        return std::optional<ErrorEnvelope>{};
    }
    ROOTSCOPE_ASSIGN_OR_RETURN(auto envelope, ErrorEnvelope::FromJson(j));
    return std::optional<ErrorEnvelope>(std::move(envelope));
}

}  // namespace

std::string_view CorrelationMethodToString(CorrelationMethod method) {
    switch (method) {
        case CorrelationMethod::kPearson:
            return "pearson";
        case CorrelationMethod::kSpearman:
            return "spearman";
    }
    return "pearson";
}

absl::StatusOr<CorrelationMethod> ParseCorrelationMethod(std::string_view name) {
    if (name == "pearson") return CorrelationMethod::kPearson;
    if (name == "spearman") return CorrelationMethod::kSpearman;
    return InvalidArgumentError(absl::StrCat("Unknown correlation method: ", absl::string_view(name.data(), name.size())));
}

// =============================================================================
// CorrelationResult
// =============================================================================

json CorrelationResult::ToJson() const {
    json j;
    j["kpi_name"] = kpi_name;
    j["drivers"] = json::array();
    for (const auto& record : drivers) {
        j["drivers"].push_back({
            {"driver_name", record.driver_name},
            {"method", std::string(CorrelationMethodToString(record.method))},
            {"r", record.r},
            {"p_value", record.p_value},
        });
    }
    if (error.has_value()) {
        error->MergeInto(j);
    }
    return j;
}

absl::StatusOr<CorrelationResult> CorrelationResult::FromJson(const json& j) {
    CorrelationResult result;
    try {
        result.kpi_name = j.value("kpi_name", "");
        for (const auto& item : j.value("drivers", json::array())) {
            CorrelationRecord record;
            record.driver_name = item.at("driver_name").get<std::string>();
            ROOTSCOPE_ASSIGN_OR_RETURN(
                record.method,
                ParseCorrelationMethod(item.value("method", "pearson")));
            record.r = item.at("r").get<double>();
            record.p_value = item.at("p_value").get<double>();
            result.drivers.push_back(std::move(record));
        }
    } catch (const json::exception& e) {
        return MalformedResult("correlation result", e);
    }
    ROOTSCOPE_ASSIGN_OR_RETURN(result.error, ReadEnvelope(j));
    return result;
}

// =============================================================================
// RankingResult
// =============================================================================

json RankingResult::ToJson() const {
    json j;
    j["kpi_name"] = kpi_name;
    j["ranking"] = json::array();
    for (const auto& driver : ranking) {
        json item = {
            {"driver_name", driver.driver_name},
            {"method", std::string(CorrelationMethodToString(driver.method))},
            {"r", driver.r},
            {"p_value", driver.p_value},
            {"score", driver.score},
            {"strength", driver.strength},
            {"explanation", driver.explanation},
        };
        if (driver.description) item["description"] = *driver.description;
        if (driver.unit) item["unit"] = *driver.unit;
        if (driver.normal_range) item["normal_range"] = *driver.normal_range;
        j["ranking"].push_back(std::move(item));
    }
    if (error.has_value()) {
        error->MergeInto(j);
    }
    return j;
}

absl::StatusOr<RankingResult> RankingResult::FromJson(const json& j) {
    RankingResult result;
    try {
        result.kpi_name = j.value("kpi_name", "");
        for (const auto& item : j.value("ranking", json::array())) {
            RankedDriver driver;
            driver.driver_name = item.at("driver_name").get<std::string>();
            ROOTSCOPE_ASSIGN_OR_RETURN(
                driver.method,
                ParseCorrelationMethod(item.value("method", "pearson")));
            driver.r = item.at("r").get<double>();
            driver.p_value = item.at("p_value").get<double>();
            driver.score = item.at("score").get<double>();
            driver.strength = item.value("strength", "");
            driver.explanation = item.value("explanation", "");
            if (item.contains("description")) {
                driver.description = item["description"].get<std::string>();
            }
            if (item.contains("unit")) {
                driver.unit = item["unit"].get<std::string>();
            }
            if (item.contains("normal_range")) {
                driver.normal_range = item["normal_range"];
            }
            result.ranking.push_back(std::move(driver));
        }
    } catch (const json::exception& e) {
        return MalformedResult("ranking result", e);
    }
    ROOTSCOPE_ASSIGN_OR_RETURN(result.error, ReadEnvelope(j));
    return result;
}

// =============================================================================
// OutlierResult
// =============================================================================

json OutlierResult::ToJson() const {
    json j;
    j["kpi"] = kpi;
    j["outliers"] = json::array();
    for (const auto& point : outliers) {
        j["outliers"].push_back({{"row", point.row}, {"driver", point.driver}});
    }
    j["summary"] = summary;
    if (error.has_value()) {
        error->MergeInto(j);
    }
    return j;
}

absl::StatusOr<OutlierResult> OutlierResult::FromJson(const json& j) {
    OutlierResult result;
    try {
        result.kpi = j.value("kpi", "");
        for (const auto& item : j.value("outliers", json::array())) {
            OutlierPoint point;
            point.row = item.at("row").get<size_t>();
            point.driver = item.at("driver").get<std::string>();
            result.outliers.push_back(std::move(point));
        }
        result.summary = j.value("summary", "");
    } catch (const json::exception& e) {
        return MalformedResult("outlier result", e);
    }
    ROOTSCOPE_ASSIGN_OR_RETURN(result.error, ReadEnvelope(j));
    return result;
}

}  // namespace rootscope::analysis
