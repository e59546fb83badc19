/// @file error_envelope.cpp
/// @brief Error envelope construction and rendering

#include "analysis/error_envelope.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace rootscope::analysis {

using json = nlohmann::json;

namespace {

constexpr std::string_view kValueMessage =
    "The provided values are not valid. Check the input data.";
constexpr std::string_view kMissingKeyMessage =
    "A required key was not found. Check that the column names are correct.";
constexpr std::string_view kTypeMessage =
    "A value has the wrong data type. Check that the data is in the expected format.";
constexpr std::string_view kFileNotFoundMessage =
    "A required file was not found. Check that the file paths are correct.";
constexpr std::string_view kNumericMessage =
    "The numeric data could not be analyzed. Check for constant or missing values.";
constexpr std::string_view kOutOfRangeMessage =
    "An index was out of range. Some data may be missing.";
constexpr std::string_view kCorruptMessage =
    "Stored data could not be decoded. The file format may be invalid.";
constexpr std::string_view kDefaultMessage =
    "An unexpected error occurred. Please retry the operation.";

}  // namespace

std::string_view UserMessageFor(const absl::Status& status) {
    switch (GetErrorCode(status)) {
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
            return kValueMessage;
        case ErrorCode::kMissingKey:
            return kMissingKeyMessage;
        case ErrorCode::kTypeMismatch:
            return kTypeMessage;
        case ErrorCode::kFileNotFound:
        case ErrorCode::kNotFound:
            return kFileNotFoundMessage;
        case ErrorCode::kNumericError:
            return kNumericMessage;
        case ErrorCode::kOutOfRange:
            return kOutOfRangeMessage;
        case ErrorCode::kDataLoss:
        case ErrorCode::kSerializationError:
            return kCorruptMessage;
        default:
            return kDefaultMessage;
    }
}

const std::vector<std::string>& DefaultSuggestions() {
    static const std::vector<std::string> kSuggestions = {
        "Verify that the input data is in the correct format",
        "Make sure all required files are present",
        "Check the logs for more specific technical details",
    };
    return kSuggestions;
}

ErrorEnvelope MakeErrorEnvelope(const absl::Status& status, std::string_view stage_name) {
    ErrorEnvelope envelope;
    envelope.error_message = status.ok() ? std::string("unknown error")
                                         : std::string(status.message());
    if (envelope.error_message.empty()) {
        envelope.error_message = std::string(absl::StatusCodeToString(status.code()));
    }
    envelope.user_message = std::string(UserMessageFor(status));
    envelope.stage = std::string(stage_name);
    envelope.suggestions = DefaultSuggestions();
    envelope.error_code = std::string(ErrorCodeName(GetErrorCode(status)));
    return envelope;
}

void ErrorEnvelope::MergeInto(json& result) const {
    result["error_state"] = true;
    result["error_message"] = error_message;
    result["user_message"] = user_message;
    result["stage"] = stage;
    result["suggestions"] = suggestions;
    if (!error_code.empty()) {
        result["error_code"] = error_code;
    }
}

absl::StatusOr<ErrorEnvelope> ErrorEnvelope::FromJson(const json& result) {
    if (!HasErrorState(result)) {
        return InvalidArgumentError("Result does not carry an error state");
    }
    try {
        ErrorEnvelope envelope;
        envelope.error_message = result.value("error_message", "");
        envelope.user_message = result.value("user_message", std::string(kDefaultMessage));
        envelope.stage = result.value("stage", "");
        envelope.error_code = result.value("error_code", "");
        if (result.contains("suggestions")) {
            envelope.suggestions = result["suggestions"].get<std::vector<std::string>>();
        } else {
            envelope.suggestions = DefaultSuggestions();
        }
        return envelope;
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kSerializationError,
                         absl::StrCat("Malformed error envelope: ", e.what()));
    }
}

bool HasErrorState(const json& result) {
    if (!result.is_object()) return false;
    auto it = result.find("error_state");
    return it != result.end() && it->is_boolean() && it->get<bool>();
}

std::string FormatErrorForUser(const ErrorEnvelope& envelope) {
    std::string message = absl::StrCat("# ", envelope.user_message, "\n\n");
    if (!envelope.suggestions.empty()) {
        absl::StrAppend(&message, "## Suggestions\n\n");
        for (const auto& suggestion : envelope.suggestions) {
            absl::StrAppend(&message, "- ", suggestion, "\n");
        }
    }
    return message;
}

}  // namespace rootscope::analysis
