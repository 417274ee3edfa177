#pragma once

/// @file duration.h
/// @brief Duration strings in the Prometheus notation ("30s", "1h30m", "2w")

#include <chrono>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

namespace rulemux {

/// @brief Parse a duration such as "15s", "1h30m" or "500ms"
///
/// Units: y (365d), w, d, h, m, s, ms. Units must appear in decreasing order
/// and at most once each. "0" is accepted as zero.
absl::StatusOr<std::chrono::milliseconds> ParseDuration(std::string_view text);

/// @brief Format a duration using the largest units that divide it exactly
std::string FormatDuration(std::chrono::milliseconds duration);

/// @brief Duration as fractional seconds
inline double ToSeconds(std::chrono::nanoseconds duration) {
    return std::chrono::duration<double>(duration).count();
}

}  // namespace rulemux
