#pragma once

/// @file query_response.h
/// @brief Decoding of Prometheus instant query responses

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "rules/rule.h"

namespace rulemux::query {

/// @brief Result of an instant query
struct QueryResult {
    rules::Vector vector;

    /// Warnings reported with a partial response
    std::vector<std::string> warnings;
};

/// @brief Decode a `/api/v1/query` response body
///
/// Accepts "vector" and "scalar" results; a scalar becomes one sample
/// without labels. An error envelope is returned as kUnavailable with the
/// server's message.
absl::StatusOr<QueryResult> ParseQueryResponse(std::string_view body);

}  // namespace rulemux::query
