#include "error.h"

namespace rulemux {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kPolicyParseError:
        case ErrorCode::kRuleParseError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
        case ErrorCode::kMissingEngine:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kCancelled:
            return absl::StatusCode::kCancelled;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnavailable:
        case ErrorCode::kFilesystemError:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kTimeout:
            return absl::StatusCode::kDeadlineExceeded;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
}

absl::Status Annotate(const absl::Status& status, std::string_view prefix) {
    if (status.ok()) {
        return status;
    }
    return absl::Status(status.code(), absl::StrCat(absl::string_view(prefix.data(), prefix.size()), ": ", status.message()));
}

void MultiError::Add(absl::Status status) {
    if (!status.ok()) {
        errors_.push_back(std::move(status));
    }
}

void MultiError::Merge(const MultiError& other) {
    errors_.insert(errors_.end(), other.errors_.begin(), other.errors_.end());
}

absl::Status MultiError::Err() const {
    if (errors_.empty()) {
        return absl::OkStatus();
    }
    if (errors_.size() == 1) {
        return errors_.front();
    }

    std::string message = absl::StrCat(errors_.size(), " errors: ");
    for (size_t i = 0; i < errors_.size(); ++i) {
        if (i > 0) {
            absl::StrAppend(&message, "; ");
        }
        absl::StrAppend(&message, errors_[i].message());
    }
    return absl::Status(errors_.front().code(), message);
}

}  // namespace rulemux
