#pragma once

/// @file rules_handler.h
/// @brief HTTP handlers listing rule groups and active alerts
///
/// Endpoints:
/// - GET /api/v1/rules[?type=alert|record] - Rule groups of every strategy
/// - GET /api/v1/alerts - Active alert instances
///
/// Responses use the Prometheus rules API JSON shape with an additional
/// partialResponseStrategy field on groups and alerts.

#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "proto/rulemux/v1/rules.pb.h"
#include "query/handlers/handler_base.h"
#include "rules/manager.h"

namespace rulemux::query::handlers {

/// @brief GET /api/v1/rules
class RulesHandler : public Handler {
public:
    explicit RulesHandler(const rules::Manager& manager);

    HttpResponse Handle(const HttpRequest& request) override;
    std::string GetRoute() const override { return "/api/v1/rules"; }
    std::vector<HttpMethod> GetMethods() const override { return {HttpMethod::kGet}; }

private:
    const rules::Manager& manager_;
};

/// @brief GET /api/v1/alerts
class AlertsHandler : public Handler {
public:
    explicit AlertsHandler(const rules::Manager& manager);

    HttpResponse Handle(const HttpRequest& request) override;
    std::string GetRoute() const override { return "/api/v1/alerts"; }
    std::vector<HttpMethod> GetMethods() const override { return {HttpMethod::kGet}; }

private:
    const rules::Manager& manager_;
};

/// @brief Map the `type` query parameter ("", "alert", "record")
absl::StatusOr<v1::RulesRequest::Type> ParseRuleType(const std::string& value);

/// @brief Collect a full listing
/// @throws std::logic_error as Manager::Rules does
absl::StatusOr<std::vector<v1::RuleGroup>> ListRuleGroups(const rules::Manager& manager,
                                                          v1::RulesRequest::Type type);

nlohmann::json LabelsToJson(const v1::Labels& labels);
nlohmann::json AlertInstanceToJson(const v1::AlertInstance& alert);
nlohmann::json RuleToJson(const v1::Rule& rule);
nlohmann::json RuleGroupToJson(const v1::RuleGroup& group);

}  // namespace rulemux::query::handlers
