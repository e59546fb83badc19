#pragma once

/// @file error.h
/// @brief rootscope error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace rootscope {

/// @brief Error codes specific to rootscope
///
/// The project code is attached to the absl::Status as a payload by
/// MakeError(), so it survives propagation and can be recovered with
/// GetErrorCode() where the user-facing error envelope is built.
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kAlreadyExists,
    kFailedPrecondition,
    kOutOfRange,
    kInternal,
    kDataLoss,

    // rootscope-specific error codes
    kMissingKey,        ///< Column or registry key absent
    kTypeMismatch,      ///< Column has the wrong kind (e.g. text target)
    kFileNotFound,      ///< Artifact, version or referenced file absent
    kNumericError,      ///< Degenerate statistics for a whole batch
    kSerializationError,
    kConfigurationError,
    kValidationError,
};

/// @brief Type URL under which the ErrorCode payload is stored
inline constexpr std::string_view kErrorCodePayloadUrl =
    "type.rootscope/rootscope.ErrorCode";

/// @brief Convert rootscope error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Stable name of an error code ("kMissingKey" -> "missing_key")
std::string_view ErrorCodeName(ErrorCode code);

/// @brief Create an OK status
inline absl::Status OkStatus() {
    return absl::OkStatus();
}

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Recover the rootscope error code of a status
///
/// Uses the payload written by MakeError() when present, otherwise maps the
/// canonical absl code back to the closest ErrorCode.
ErrorCode GetErrorCode(const absl::Status& status);

/// @brief Create an internal error
inline absl::Status InternalError(std::string_view message) {
    return MakeError(ErrorCode::kInternal, message);
}

/// @brief Create an invalid argument error
inline absl::Status InvalidArgumentError(std::string_view message) {
    return MakeError(ErrorCode::kInvalidArgument, message);
}

/// @brief Create a missing key error (absent column / key)
inline absl::Status MissingKeyError(std::string_view message) {
    return MakeError(ErrorCode::kMissingKey, message);
}

/// @brief Create a type mismatch error
inline absl::Status TypeMismatchError(std::string_view message) {
    return MakeError(ErrorCode::kTypeMismatch, message);
}

/// @brief Create a file not found error (missing artifact or version)
inline absl::Status FileNotFoundError(std::string_view message) {
    return MakeError(ErrorCode::kFileNotFound, message);
}

/// @brief Create a numeric error
inline absl::Status NumericError(std::string_view message) {
    return MakeError(ErrorCode::kNumericError, message);
}

/// @brief Create a data loss error (corrupt persisted content)
inline absl::Status CorruptError(std::string_view message) {
    return MakeError(ErrorCode::kDataLoss, message);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define ROOTSCOPE_RETURN_IF_ERROR(expr)                                        \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define ROOTSCOPE_ASSIGN_OR_RETURN(lhs, rhs)                                   \
    ROOTSCOPE_ASSIGN_OR_RETURN_IMPL(                                           \
        ROOTSCOPE_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define ROOTSCOPE_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                    \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define ROOTSCOPE_CONCAT(a, b) ROOTSCOPE_CONCAT_IMPL(a, b)
#define ROOTSCOPE_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define ROOTSCOPE_CHECK_OR_RETURN(condition, error_status)                     \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace rootscope
