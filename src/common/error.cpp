#include "error.h"

#include <optional>

#include <absl/strings/cord.h>

namespace rootscope {

namespace {

constexpr ErrorCode kAllCodes[] = {
    ErrorCode::kOk,
    ErrorCode::kUnknown,
    ErrorCode::kInvalidArgument,
    ErrorCode::kNotFound,
    ErrorCode::kAlreadyExists,
    ErrorCode::kFailedPrecondition,
    ErrorCode::kOutOfRange,
    ErrorCode::kInternal,
    ErrorCode::kDataLoss,
    ErrorCode::kMissingKey,
    ErrorCode::kTypeMismatch,
    ErrorCode::kFileNotFound,
    ErrorCode::kNumericError,
    ErrorCode::kSerializationError,
    ErrorCode::kConfigurationError,
    ErrorCode::kValidationError,
};

std::optional<ErrorCode> ErrorCodeFromName(std::string_view name) {
    for (ErrorCode code : kAllCodes) {
        if (ErrorCodeName(code) == name) {
            return code;
        }
    }
    return std::nullopt;
}

}  // namespace

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
        case ErrorCode::kTypeMismatch:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
        case ErrorCode::kMissingKey:
        case ErrorCode::kFileNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kAlreadyExists:
            return absl::StatusCode::kAlreadyExists;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kOutOfRange:
        case ErrorCode::kNumericError:
            return absl::StatusCode::kOutOfRange;
        case ErrorCode::kInternal:
        case ErrorCode::kSerializationError:
            return absl::StatusCode::kInternal;
        case ErrorCode::kDataLoss:
            return absl::StatusCode::kDataLoss;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "ok";
        case ErrorCode::kUnknown: return "unknown";
        case ErrorCode::kInvalidArgument: return "invalid_argument";
        case ErrorCode::kNotFound: return "not_found";
        case ErrorCode::kAlreadyExists: return "already_exists";
        case ErrorCode::kFailedPrecondition: return "failed_precondition";
        case ErrorCode::kOutOfRange: return "out_of_range";
        case ErrorCode::kInternal: return "internal";
        case ErrorCode::kDataLoss: return "data_loss";
        case ErrorCode::kMissingKey: return "missing_key";
        case ErrorCode::kTypeMismatch: return "type_mismatch";
        case ErrorCode::kFileNotFound: return "file_not_found";
        case ErrorCode::kNumericError: return "numeric_error";
        case ErrorCode::kSerializationError: return "serialization_error";
        case ErrorCode::kConfigurationError: return "configuration_error";
        case ErrorCode::kValidationError: return "validation_error";
    }
    return "unknown";
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
    if (!status.ok()) {
        status.SetPayload(
            absl::string_view(kErrorCodePayloadUrl.data(), kErrorCodePayloadUrl.size()),
            absl::Cord(absl::string_view(ErrorCodeName(code).data(), ErrorCodeName(code).size())));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }

    if (auto payload = status.GetPayload(
            absl::string_view(kErrorCodePayloadUrl.data(), kErrorCodePayloadUrl.size()))) {
        if (auto code = ErrorCodeFromName(std::string(*payload))) {
            return *code;
        }
    }

    switch (status.code()) {
        case absl::StatusCode::kInvalidArgument:
            return ErrorCode::kInvalidArgument;
        case absl::StatusCode::kNotFound:
            return ErrorCode::kNotFound;
        case absl::StatusCode::kAlreadyExists:
            return ErrorCode::kAlreadyExists;
        case absl::StatusCode::kFailedPrecondition:
            return ErrorCode::kFailedPrecondition;
        case absl::StatusCode::kOutOfRange:
            return ErrorCode::kOutOfRange;
        case absl::StatusCode::kInternal:
            return ErrorCode::kInternal;
        case absl::StatusCode::kDataLoss:
            return ErrorCode::kDataLoss;
        default:
            return ErrorCode::kUnknown;
    }
}

}  // namespace rootscope
