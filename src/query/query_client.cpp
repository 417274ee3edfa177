/// @file query_client.cpp
/// @brief Instant query client implementation

#include "query/query_client.h"

#include <httplib.h>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"

namespace rulemux::query {

QueryClient::QueryClient(QueryClientConfig config) : config_(std::move(config)) {}

absl::StatusOr<QueryResult> QueryClient::Query(const std::string& query,
                                               rules::Clock::time_point ts,
                                               bool partial_response) const {
    if (config_.endpoints.empty()) {
        return MakeError(ErrorCode::kFailedPrecondition, "no query endpoints configured");
    }

    MultiError errors;
    for (const auto& endpoint : config_.endpoints) {
        auto body = Post(endpoint, query, ts, partial_response);
        if (!body.ok()) {
            RULEMUX_LOG_DEBUG("Query endpoint {} failed: {}", endpoint, std::string_view(body.status().message().data(), body.status().message().size()));
            errors.Add(Annotate(body.status(), endpoint));
            continue;
        }
        return ParseQueryResponse(*body);
    }
    return errors.Err();
}

absl::StatusOr<std::string> QueryClient::Post(const std::string& endpoint,
                                              const std::string& query,
                                              rules::Clock::time_point ts,
                                              bool partial_response) const {
    httplib::Client client(endpoint);
    client.set_connection_timeout(config_.timeout);
    client.set_read_timeout(config_.timeout);

    const double seconds = std::chrono::duration<double>(ts.time_since_epoch()).count();
    httplib::Params params = {
        {"query", query},
        {"time", absl::StrFormat("%.3f", seconds)},
        {"partial_response", partial_response ? "true" : "false"},
    };

    auto res = client.Post("/api/v1/query", params);
    if (!res) {
        return MakeError(ErrorCode::kUnavailable,
                         absl::StrCat("HTTP request failed: ", httplib::to_string(res.error())));
    }
    // Prometheus reports query errors with 4xx/5xx and a JSON error body.
    if (res->status >= 500 && res->body.empty()) {
        return MakeError(ErrorCode::kUnavailable,
                         absl::StrCat("HTTP error ", res->status));
    }
    return res->body;
}

rules::QueryFunc QueryClient::QueryFuncFor(rules::Strategy strategy) const {
    const bool partial_response = strategy != v1::ABORT;
    return [this, strategy, partial_response](
               const std::string& query,
               rules::Clock::time_point ts) -> absl::StatusOr<rules::Vector> {
        RULEMUX_ASSIGN_OR_RETURN(QueryResult result, Query(query, ts, partial_response));
        if (!result.warnings.empty()) {
            const std::string warnings = absl::StrJoin(result.warnings, ", ");
            switch (strategy) {
                case v1::ABORT:
                    return MakeError(ErrorCode::kUnavailable,
                                     absl::StrCat("partial response: ", warnings));
                case v1::WARN:
                    RULEMUX_LOG_WARN("Query {} returned warnings: {}", query, warnings);
                    break;
                default:
                    break;
            }
        }
        return std::move(result.vector);
    };
}

}  // namespace rulemux::query
