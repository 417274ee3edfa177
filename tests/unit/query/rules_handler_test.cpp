/// @file rules_handler_test.cpp
/// @brief Tests for the rules and alerts HTTP handlers

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "query/handlers/rules_handler.h"
#include "rules/local_engine.h"
#include "test_util.h"

namespace rulemux::query::handlers {
namespace {

using json = nlohmann::json;
using rulemux::testing::TempDir;

constexpr const char* kRules = R"(
groups:
  - name: availability
    partial_response_strategy: warn
    interval: 30s
    rules:
      - alert: InstanceDown
        expr: up == 0
        labels:
          severity: page
        annotations:
          summary: instance down
      - record: job:up:sum
        expr: sum(up)
)";

class RulesHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        rules::ManagerOptions options;
        options.data_dir = dir_.Path();
        options.registry = &registry_;

        rules::QueryFuncCreator creator = [](rules::Strategy) -> rules::QueryFunc {
            return [](const std::string&, rules::Clock::time_point)
                       -> absl::StatusOr<rules::Vector> {
                rules::Sample sample;
                sample.labels = {{"instance", "db-1"}};
                sample.value = 0;
                return rules::Vector{sample};
            };
        };
        rules::EngineFactory factory = [this](rules::EngineOptions engine_options) {
            auto engine = std::make_unique<rules::LocalEngine>(std::move(engine_options));
            engines_.push_back(engine.get());
            return std::unique_ptr<rules::Engine>(std::move(engine));
        };
        manager_ = std::make_unique<rules::Manager>(std::move(options), creator, factory);

        rules_file_ = dir_.WriteFile("rules.yaml", kRules);
        ASSERT_TRUE(manager_->Update(std::chrono::seconds(60), {rules_file_}).ok());
        for (auto* engine : engines_) {
            engine->EvaluateAll(rules::Clock::now());
        }
    }

    static json Body(const HttpResponse& response) { return json::parse(response.body); }

    static HttpRequest Get(const std::string& path, const std::string& type = "") {
        HttpRequest request;
        request.path = path;
        if (!type.empty()) {
            request.query_params["type"] = type;
        }
        return request;
    }

    TempDir dir_;
    MetricsRegistry registry_;
    std::vector<rules::LocalEngine*> engines_;
    std::unique_ptr<rules::Manager> manager_;
    std::string rules_file_;
};

TEST_F(RulesHandlerTest, Routes) {
    RulesHandler rules(*manager_);
    AlertsHandler alerts(*manager_);
    EXPECT_EQ(rules.GetRoute(), "/api/v1/rules");
    EXPECT_EQ(alerts.GetRoute(), "/api/v1/alerts");
    EXPECT_EQ(rules.GetMethods(), std::vector<HttpMethod>{HttpMethod::kGet});
}

TEST_F(RulesHandlerTest, ListsAllRules) {
    RulesHandler handler(*manager_);
    auto response = handler.Handle(Get("/api/v1/rules"));
    ASSERT_EQ(response.status_code, 200) << response.body;

    auto body = Body(response);
    EXPECT_EQ(body["status"], "success");
    const auto& groups = body["data"]["groups"];
    ASSERT_EQ(groups.size(), 1u);

    const auto& group = groups[0];
    EXPECT_EQ(group["name"], "availability");
    EXPECT_EQ(group["file"], rules_file_);
    EXPECT_EQ(group["interval"], 30.0);
    EXPECT_EQ(group["partialResponseStrategy"], "WARN");
    ASSERT_EQ(group["rules"].size(), 2u);

    const auto& alert = group["rules"][0];
    EXPECT_EQ(alert["type"], "alerting");
    EXPECT_EQ(alert["name"], "InstanceDown");
    EXPECT_EQ(alert["state"], "firing");
    EXPECT_EQ(alert["health"], "ok");
    EXPECT_EQ(alert["labels"]["severity"], "page");
    ASSERT_EQ(alert["alerts"].size(), 1u);
    EXPECT_EQ(alert["alerts"][0]["labels"]["instance"], "db-1");
    EXPECT_EQ(alert["alerts"][0]["value"], "0e+00");
    EXPECT_EQ(alert["alerts"][0]["partialResponseStrategy"], "WARN");

    const auto& record = group["rules"][1];
    EXPECT_EQ(record["type"], "recording");
    EXPECT_EQ(record["name"], "job:up:sum");
}

TEST_F(RulesHandlerTest, FiltersByType) {
    RulesHandler handler(*manager_);

    auto alerts = Body(handler.Handle(Get("/api/v1/rules", "ALERT")));
    ASSERT_EQ(alerts["data"]["groups"][0]["rules"].size(), 1u);
    EXPECT_EQ(alerts["data"]["groups"][0]["rules"][0]["type"], "alerting");

    auto records = Body(handler.Handle(Get("/api/v1/rules", "record")));
    ASSERT_EQ(records["data"]["groups"][0]["rules"].size(), 1u);
    EXPECT_EQ(records["data"]["groups"][0]["rules"][0]["type"], "recording");
}

TEST_F(RulesHandlerTest, RejectsUnknownType) {
    RulesHandler handler(*manager_);
    auto response = handler.Handle(Get("/api/v1/rules", "bogus"));
    EXPECT_EQ(response.status_code, 400);

    auto body = Body(response);
    EXPECT_EQ(body["status"], "error");
    EXPECT_EQ(body["errorType"], "bad_data");
    EXPECT_EQ(body["error"], "invalid rule type \"bogus\"");
}

TEST_F(RulesHandlerTest, RejectsNonGet) {
    RulesHandler handler(*manager_);
    auto request = Get("/api/v1/rules");
    request.method = HttpMethod::kPost;
    EXPECT_EQ(handler.Handle(request).status_code, 405);
}

TEST_F(RulesHandlerTest, ListsAlertInstances) {
    AlertsHandler handler(*manager_);
    auto response = handler.Handle(Get("/api/v1/alerts"));
    ASSERT_EQ(response.status_code, 200);

    auto body = Body(response);
    const auto& alerts = body["data"]["alerts"];
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0]["labels"]["alertname"], "InstanceDown");
    EXPECT_EQ(alerts[0]["annotations"]["summary"], "instance down");
    EXPECT_EQ(alerts[0]["state"], "firing");
    EXPECT_TRUE(alerts[0]["activeAt"].is_string());
}

TEST(ParseRuleTypeTest, Values) {
    EXPECT_EQ(*ParseRuleType(""), v1::RulesRequest::ALL);
    EXPECT_EQ(*ParseRuleType("alert"), v1::RulesRequest::ALERT);
    EXPECT_EQ(*ParseRuleType("Record"), v1::RulesRequest::RECORD);
    EXPECT_FALSE(ParseRuleType("all").ok());
}

TEST(ResponseTest, Envelopes) {
    auto ok = HttpResponse::Ok(json{{"x", 1}});
    EXPECT_EQ(ok.status_code, 200);
    EXPECT_EQ(json::parse(ok.body)["data"]["x"], 1);

    auto unavailable = HttpResponse::Unavailable("later");
    EXPECT_EQ(unavailable.status_code, 503);
    EXPECT_EQ(json::parse(unavailable.body)["errorType"], "unavailable");
}

TEST(HandlerRegistryTest, KeepsRegistrationOrder) {
    TempDir dir;
    rules::ManagerOptions options;
    options.data_dir = dir.Path();
    MetricsRegistry registry;
    options.registry = &registry;
    rules::Manager manager(std::move(options), nullptr, nullptr);

    HandlerRegistry handlers;
    handlers.Register(std::make_unique<RulesHandler>(manager));
    handlers.Register(std::make_unique<AlertsHandler>(manager));
    ASSERT_EQ(handlers.GetHandlers().size(), 2u);
    EXPECT_EQ(handlers.GetHandlers()[0]->GetRoute(), "/api/v1/rules");

    // No engines: every listing is empty.
    auto response = handlers.GetHandlers()[0]->Handle(HttpRequest{});
    EXPECT_EQ(json::parse(response.body)["data"]["groups"].size(), 0u);
}

}  // namespace
}  // namespace rulemux::query::handlers
