#pragma once

/// @file query_client.h
/// @brief Instant query client for Prometheus-compatible HTTP endpoints

#include <chrono>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "query/query_response.h"
#include "rules/rule.h"
#include "rules/strategy.h"

namespace rulemux::query {

/// @brief Query client configuration
struct QueryClientConfig {
    /// Base URLs, e.g. "http://querier:9090"; tried in order
    std::vector<std::string> endpoints;

    std::chrono::milliseconds timeout{30000};
};

/// @brief Evaluates rule queries against remote query endpoints
///
/// Each call tries the endpoints in order and returns the first answer;
/// transport failures move on to the next endpoint.
class QueryClient {
public:
    explicit QueryClient(QueryClientConfig config);

    /// @brief Run an instant query at `ts`
    /// @param partial_response whether the endpoint may answer with partial data
    absl::StatusOr<QueryResult> Query(const std::string& query, rules::Clock::time_point ts,
                                      bool partial_response) const;

    /// @brief Query function applying a strategy
    ///
    /// ABORT disables partial responses and treats warnings as failures; WARN
    /// allows them and logs the warnings; NONE allows them silently.
    rules::QueryFunc QueryFuncFor(rules::Strategy strategy) const;

    const QueryClientConfig& GetConfig() const { return config_; }

private:
    absl::StatusOr<std::string> Post(const std::string& endpoint, const std::string& query,
                                     rules::Clock::time_point ts,
                                     bool partial_response) const;

    QueryClientConfig config_;
};

}  // namespace rulemux::query
