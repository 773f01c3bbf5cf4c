#pragma once

/// @file error.h
/// @brief Inventory Sense error handling utilities using absl::Status

#include <optional>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace invsense {

/// @brief Error kinds raised by the analytics pipeline
///
/// Every kind maps onto a canonical absl::StatusCode. The precise kind is
/// attached to the status as a payload so that callers can tell, for
/// example, a schema failure from a parse failure even though both are
/// INVALID_ARGUMENT.
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kInternal,

    // Analytics-specific error kinds
    kSchemaError,            ///< Required column absent from the input schema
    kInsufficientData,       ///< Not enough data to compute a result
    kParseError,             ///< Label or value does not match its format
    kConfigurationError,
};

/// @brief Payload type URL under which the error kind is stored
inline constexpr std::string_view kErrorCodePayloadUrl =
    "type.invsense.dev/invsense.ErrorCode";

/// @brief Convert an error kind to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given kind and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Recover the error kind stored on a status
/// @return The stored kind, or nullopt for OK statuses and statuses created
///         outside of MakeError
std::optional<ErrorCode> GetErrorCode(const absl::Status& status);

/// @brief Check whether a status carries the given error kind
bool HasErrorCode(const absl::Status& status, ErrorCode code);

/// @brief Human readable name of an error kind
std::string ErrorCodeToString(ErrorCode code);

inline absl::Status SchemaError(std::string_view message) {
    return MakeError(ErrorCode::kSchemaError, message);
}

inline absl::Status InsufficientDataError(std::string_view message) {
    return MakeError(ErrorCode::kInsufficientData, message);
}

inline absl::Status NotFoundError(std::string_view message) {
    return MakeError(ErrorCode::kNotFound, message);
}

inline absl::Status ParseError(std::string_view message) {
    return MakeError(ErrorCode::kParseError, message);
}

inline absl::Status InvalidArgumentError(std::string_view message) {
    return MakeError(ErrorCode::kInvalidArgument, message);
}

inline absl::Status FailedPreconditionError(std::string_view message) {
    return MakeError(ErrorCode::kFailedPrecondition, message);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define INVSENSE_RETURN_IF_ERROR(expr)                                         \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define INVSENSE_ASSIGN_OR_RETURN(lhs, rhs)                                    \
    INVSENSE_ASSIGN_OR_RETURN_IMPL(                                            \
        INVSENSE_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define INVSENSE_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                     \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define INVSENSE_CONCAT(a, b) INVSENSE_CONCAT_IMPL(a, b)
#define INVSENSE_CONCAT_IMPL(a, b) a##b

}  // namespace invsense
