#include "error.h"

#include <exception>
#include <string>

#include <absl/strings/cord.h>

namespace invsense {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kSchemaError:
        case ErrorCode::kParseError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kInsufficientData:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    if (code == ErrorCode::kOk) {
        return absl::OkStatus();
    }
    absl::Status status(ToAbslCode(code), message);
    status.SetPayload(kErrorCodePayloadUrl,
                      absl::Cord(std::to_string(static_cast<int>(code))));
    return status;
}

std::optional<ErrorCode> GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return std::nullopt;
    }
    auto payload = status.GetPayload(kErrorCodePayloadUrl);
    if (!payload.has_value()) {
        return std::nullopt;
    }
    int raw = 0;
    try {
        raw = std::stoi(std::string(*payload));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (raw <= static_cast<int>(ErrorCode::kOk) ||
        raw > static_cast<int>(ErrorCode::kConfigurationError)) {
        return std::nullopt;
    }
    return static_cast<ErrorCode>(raw);
}

bool HasErrorCode(const absl::Status& status, ErrorCode code) {
    auto stored = GetErrorCode(status);
    return stored.has_value() && *stored == code;
}

std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "Ok";
        case ErrorCode::kInvalidArgument: return "InvalidArgument";
        case ErrorCode::kNotFound: return "NotFoundError";
        case ErrorCode::kFailedPrecondition: return "FailedPrecondition";
        case ErrorCode::kInternal: return "Internal";
        case ErrorCode::kSchemaError: return "SchemaError";
        case ErrorCode::kInsufficientData: return "InsufficientDataError";
        case ErrorCode::kParseError: return "ParseError";
        case ErrorCode::kConfigurationError: return "ConfigurationError";
        case ErrorCode::kUnknown:
        default:
            return "Unknown";
    }
}

}  // namespace invsense
