#pragma once

/// @file error_envelope.h
/// @brief Uniform error annotation carried by failed analysis results

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace rootscope::analysis {

/// @brief Stage names recorded in envelopes
namespace stage {
inline constexpr std::string_view kLoadDataset = "load_dataset";
inline constexpr std::string_view kCorrelation = "correlation_matrix";
inline constexpr std::string_view kRanking = "impact_ranking";
inline constexpr std::string_view kOutliers = "outlier_report";
}  // namespace stage

/// @brief Replaces a result's payload when its stage failed
///
/// Serialized flat into the result object, next to the (empty) collection:
/// {error_state: true, error_message, user_message, stage, suggestions}
struct ErrorEnvelope {
    std::string error_message;   ///< Machine-facing, the status message
    std::string user_message;    ///< Selected from the error category
    std::string stage;
    std::vector<std::string> suggestions;
    std::string error_code;      ///< ErrorCodeName() of the status

    /// @brief Write the envelope fields into an existing result object
    void MergeInto(nlohmann::json& result) const;

    /// @brief Read envelope fields from a result object
    /// @return InvalidArgument if error_state is absent or false
    static absl::StatusOr<ErrorEnvelope> FromJson(const nlohmann::json& result);
};

/// @brief Build an envelope from a failed status
ErrorEnvelope MakeErrorEnvelope(const absl::Status& status, std::string_view stage_name);

/// @brief User-facing message for the category of a status
std::string_view UserMessageFor(const absl::Status& status);

/// @brief Generic remediation hints attached to every envelope
const std::vector<std::string>& DefaultSuggestions();

/// @brief True if a result object carries error_state = true
bool HasErrorState(const nlohmann::json& result);

/// @brief Render the user message and suggestions as Markdown text
std::string FormatErrorForUser(const ErrorEnvelope& envelope);

}  // namespace rootscope::analysis
