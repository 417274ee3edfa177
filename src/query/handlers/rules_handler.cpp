/// @file rules_handler.cpp
/// @brief Rules and alerts API handler implementation

#include "query/handlers/rules_handler.h"

#include <stdexcept>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <google/protobuf/util/time_util.h>

#include "common/logging.h"

namespace rulemux::query::handlers {

using json = nlohmann::json;
using google::protobuf::util::TimeUtil;

namespace {

/// Buffers every group of a listing
class CollectingStream : public rules::RulesStream {
public:
    absl::Status Send(const v1::RulesResponse& response) override {
        if (response.has_group()) {
            groups.push_back(response.group());
        }
        return absl::OkStatus();
    }

    bool IsCancelled() const override { return false; }

    std::vector<v1::RuleGroup> groups;
};

std::string AlertStateJson(v1::AlertState state) {
    return absl::AsciiStrToLower(v1::AlertState_Name(state));
}

std::string StrategyJson(v1::PartialResponseStrategy strategy) {
    return v1::PartialResponseStrategy_Name(strategy);
}

}  // namespace

// ============================================================================
// JSON projection
// ============================================================================

json LabelsToJson(const v1::Labels& labels) {
    json j = json::object();
    for (const auto& label : labels.labels()) {
        j[label.name()] = label.value();
    }
    return j;
}

json AlertInstanceToJson(const v1::AlertInstance& alert) {
    return json{
        {"labels", LabelsToJson(alert.labels())},
        {"annotations", LabelsToJson(alert.annotations())},
        {"state", AlertStateJson(alert.state())},
        {"activeAt", TimeUtil::ToString(alert.active_at())},
        {"value", alert.value()},
        {"partialResponseStrategy", StrategyJson(alert.partial_response_strategy())},
    };
}

json RuleToJson(const v1::Rule& rule) {
    if (rule.has_alert()) {
        const auto& alert = rule.alert();
        json alerts = json::array();
        for (const auto& instance : alert.alerts()) {
            alerts.push_back(AlertInstanceToJson(instance));
        }
        return json{
            {"type", "alerting"},
            {"state", AlertStateJson(alert.state())},
            {"name", alert.name()},
            {"query", alert.query()},
            {"duration", alert.duration_seconds()},
            {"labels", LabelsToJson(alert.labels())},
            {"annotations", LabelsToJson(alert.annotations())},
            {"alerts", alerts},
            {"health", alert.health()},
            {"lastError", alert.last_error()},
            {"evaluationTime", alert.evaluation_duration_seconds()},
            {"lastEvaluation", TimeUtil::ToString(alert.last_evaluation())},
        };
    }

    const auto& recording = rule.recording();
    return json{
        {"type", "recording"},
        {"name", recording.name()},
        {"query", recording.query()},
        {"labels", LabelsToJson(recording.labels())},
        {"health", recording.health()},
        {"lastError", recording.last_error()},
        {"evaluationTime", recording.evaluation_duration_seconds()},
        {"lastEvaluation", TimeUtil::ToString(recording.last_evaluation())},
    };
}

json RuleGroupToJson(const v1::RuleGroup& group) {
    json rules = json::array();
    for (const auto& rule : group.rules()) {
        rules.push_back(RuleToJson(rule));
    }
    return json{
        {"name", group.name()},
        {"file", group.file()},
        {"interval", group.interval()},
        {"partialResponseStrategy", StrategyJson(group.partial_response_strategy())},
        {"rules", rules},
    };
}

absl::StatusOr<v1::RulesRequest::Type> ParseRuleType(const std::string& value) {
    const std::string lower = absl::AsciiStrToLower(value);
    if (lower.empty()) {
        return v1::RulesRequest::ALL;
    }
    if (lower == "alert") {
        return v1::RulesRequest::ALERT;
    }
    if (lower == "record") {
        return v1::RulesRequest::RECORD;
    }
    return absl::InvalidArgumentError(absl::StrCat("invalid rule type \"", value, "\""));
}

absl::StatusOr<std::vector<v1::RuleGroup>> ListRuleGroups(const rules::Manager& manager,
                                                          v1::RulesRequest::Type type) {
    v1::RulesRequest request;
    request.set_type(type);

    CollectingStream stream;
    auto status = manager.Rules(request, stream);
    if (!status.ok()) {
        return status;
    }
    return std::move(stream.groups);
}

// ============================================================================
// Handlers
// ============================================================================

RulesHandler::RulesHandler(const rules::Manager& manager) : manager_(manager) {}

HttpResponse RulesHandler::Handle(const HttpRequest& request) {
    if (request.method != HttpMethod::kGet) {
        return HttpResponse::Error(405, "bad_data", "method not allowed");
    }

    auto type = ParseRuleType(QueryParam(request, "type"));
    if (!type.ok()) {
        return HttpResponse::BadRequest(std::string(type.status().message()));
    }

    try {
        auto groups = ListRuleGroups(manager_, *type);
        if (!groups.ok()) {
            return HttpResponse::InternalError(std::string(groups.status().message()));
        }

        json list = json::array();
        for (const auto& group : *groups) {
            list.push_back(RuleGroupToJson(group));
        }
        return HttpResponse::Ok(json{{"groups", list}});
    } catch (const std::logic_error& e) {
        RULEMUX_LOG_ERROR("Listing rules failed: {}", e.what());
        return HttpResponse::InternalError(e.what());
    }
}

AlertsHandler::AlertsHandler(const rules::Manager& manager) : manager_(manager) {}

HttpResponse AlertsHandler::Handle(const HttpRequest& request) {
    if (request.method != HttpMethod::kGet) {
        return HttpResponse::Error(405, "bad_data", "method not allowed");
    }

    try {
        auto groups = ListRuleGroups(manager_, v1::RulesRequest::ALERT);
        if (!groups.ok()) {
            return HttpResponse::InternalError(std::string(groups.status().message()));
        }

        json alerts = json::array();
        for (const auto& group : *groups) {
            for (const auto& rule : group.rules()) {
                for (const auto& instance : rule.alert().alerts()) {
                    alerts.push_back(AlertInstanceToJson(instance));
                }
            }
        }
        return HttpResponse::Ok(json{{"alerts", alerts}});
    } catch (const std::logic_error& e) {
        RULEMUX_LOG_ERROR("Listing alerts failed: {}", e.what());
        return HttpResponse::InternalError(e.what());
    }
}

}  // namespace rulemux::query::handlers
