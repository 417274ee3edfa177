/// @file query_response.cpp
/// @brief Decoding of Prometheus instant query responses

#include "query/query_response.h"

#include <chrono>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <nlohmann/json.hpp>

#include "common/error.h"

namespace rulemux::query {

using json = nlohmann::json;

namespace {

absl::Status MalformedError(std::string_view message) {
    return MakeError(ErrorCode::kInternal,
                     absl::StrCat("malformed query response: ", absl::string_view(message.data(), message.size())));
}

/// `[<unix seconds>, "<value>"]`
absl::StatusOr<rules::Sample> ParseSamplePair(const json& pair) {
    if (!pair.is_array() || pair.size() != 2 || !pair[0].is_number() ||
        !pair[1].is_string()) {
        return MalformedError("sample must be [timestamp, \"value\"]");
    }

    rules::Sample sample;
    const double seconds = pair[0].get<double>();
    sample.timestamp = rules::Clock::time_point(
        std::chrono::duration_cast<rules::Clock::duration>(
            std::chrono::duration<double>(seconds)));

    const std::string text = pair[1].get<std::string>();
    if (!absl::SimpleAtod(text, &sample.value)) {
        return MalformedError(absl::StrCat("invalid sample value \"", text, "\""));
    }
    return sample;
}

}  // namespace

absl::StatusOr<QueryResult> ParseQueryResponse(std::string_view body) {
    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::exception& e) {
        return MalformedError(e.what());
    }
    if (!doc.is_object()) {
        return MalformedError("not an object");
    }

    const std::string status = doc.value("status", "");
    if (status == "error") {
        return MakeError(ErrorCode::kUnavailable,
                         absl::StrCat("query failed: ", doc.value("errorType", ""), ": ",
                                      doc.value("error", "")));
    }
    if (status != "success") {
        return MalformedError(absl::StrCat("unknown status \"", status, "\""));
    }

    QueryResult result;
    auto warnings = doc.find("warnings");
    if (warnings != doc.end() && warnings->is_array()) {
        for (const auto& warning : *warnings) {
            if (warning.is_string()) {
                result.warnings.push_back(warning.get<std::string>());
            }
        }
    }

    auto data = doc.find("data");
    if (data == doc.end() || !data->is_object()) {
        return MalformedError("missing data");
    }
    const std::string type = data->value("resultType", "");
    auto payload = data->find("result");
    if (payload == data->end()) {
        return MalformedError("missing result");
    }

    if (type == "scalar") {
        RULEMUX_ASSIGN_OR_RETURN(rules::Sample sample, ParseSamplePair(*payload));
        result.vector.push_back(std::move(sample));
        return result;
    }
    if (type != "vector") {
        return MakeError(ErrorCode::kInvalidArgument,
                         absl::StrCat("unsupported result type \"", type,
                                      "\", rule queries must return a vector"));
    }
    if (!payload->is_array()) {
        return MalformedError("vector result must be a list");
    }

    for (const auto& element : *payload) {
        if (!element.is_object()) {
            return MalformedError("vector element must be an object");
        }
        auto value = element.find("value");
        if (value == element.end()) {
            return MalformedError("vector element without value");
        }
        RULEMUX_ASSIGN_OR_RETURN(rules::Sample sample, ParseSamplePair(*value));

        auto metric = element.find("metric");
        if (metric != element.end() && metric->is_object()) {
            for (auto it = metric->begin(); it != metric->end(); ++it) {
                if (it.value().is_string()) {
                    sample.labels[it.key()] = it.value().get<std::string>();
                }
            }
        }
        result.vector.push_back(std::move(sample));
    }
    return result;
}

}  // namespace rulemux::query
