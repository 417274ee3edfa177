#pragma once

/// @file error.h
/// @brief rulemux error handling utilities using absl::Status

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace rulemux {

/// @brief Error codes specific to rulemux
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kCancelled,
    kInternal,
    kUnavailable,

    // rulemux-specific error codes
    kConfigurationError,
    kPolicyParseError,
    kRuleParseError,
    kFilesystemError,
    kMissingEngine,
    kTimeout,
};

/// @brief Convert rulemux error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Prefix the message of a non-OK status, keeping its code
absl::Status Annotate(const absl::Status& status, std::string_view prefix);

/// @brief Collects independent failures and reports them as one status
///
/// Used where one bad input must not prevent the others from being applied,
/// e.g. a reload cycle over many rule files.
class MultiError {
public:
    /// @brief Record a status; OK statuses are ignored
    void Add(absl::Status status);

    /// @brief Append every error collected by another MultiError
    void Merge(const MultiError& other);

    bool Empty() const { return errors_.empty(); }
    size_t Size() const { return errors_.size(); }
    const std::vector<absl::Status>& Errors() const { return errors_; }

    /// @brief OK when empty, the error itself when there is one, otherwise a
    /// status with the first error's code listing every message
    absl::Status Err() const;

private:
    std::vector<absl::Status> errors_;
};

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define RULEMUX_RETURN_IF_ERROR(expr)                                          \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define RULEMUX_ASSIGN_OR_RETURN(lhs, rhs)                                     \
    RULEMUX_ASSIGN_OR_RETURN_IMPL(                                             \
        RULEMUX_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define RULEMUX_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                      \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define RULEMUX_CONCAT(a, b) RULEMUX_CONCAT_IMPL(a, b)
#define RULEMUX_CONCAT_IMPL(a, b) a##b

}  // namespace rulemux
