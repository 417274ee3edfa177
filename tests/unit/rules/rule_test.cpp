/// @file rule_test.cpp
/// @brief Tests for alerting and recording rule evaluation

#include <gtest/gtest.h>

#include "rules/rule.h"

namespace rulemux::rules {
namespace {

using std::chrono::minutes;
using std::chrono::seconds;

AlertingRuleDef HighLatency() {
    AlertingRuleDef def;
    def.alert = "HighLatency";
    def.expr = "latency_seconds > 1";
    def.for_duration = minutes(5);
    def.labels = {{"severity", "page"}};
    def.annotations = {{"summary", "latency is high"}};
    return def;
}

/// Returns a query function that always yields `vector`.
QueryFunc Returning(Vector vector) {
    return [vector](const std::string&, Clock::time_point) -> absl::StatusOr<Vector> {
        return vector;
    };
}

Sample MakeSample(Labels labels, double value) {
    Sample sample;
    sample.labels = std::move(labels);
    sample.value = value;
    return sample;
}

TEST(AlertingRuleTest, PendingThenFiring) {
    AlertingRule rule(HighLatency());
    const auto t0 = Clock::now();
    auto query = Returning({MakeSample({{"__name__", "latency_seconds"}, {"job", "api"}}, 2.5)});

    ASSERT_TRUE(rule.Evaluate(query, t0).ok());
    auto alerts = rule.ActiveAlerts();
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].state, AlertState::kPending);
    EXPECT_EQ(alerts[0].active_at, t0);
    EXPECT_EQ(alerts[0].value, 2.5);
    EXPECT_EQ(alerts[0].labels.count("__name__"), 0u);
    EXPECT_EQ(alerts[0].labels.at("alertname"), "HighLatency");
    EXPECT_EQ(alerts[0].labels.at("severity"), "page");
    EXPECT_EQ(alerts[0].labels.at("job"), "api");
    EXPECT_EQ(alerts[0].annotations.at("summary"), "latency is high");
    EXPECT_EQ(rule.State(), AlertState::kPending);

    ASSERT_TRUE(rule.Evaluate(query, t0 + minutes(4)).ok());
    EXPECT_EQ(rule.State(), AlertState::kPending);

    ASSERT_TRUE(rule.Evaluate(query, t0 + minutes(5)).ok());
    alerts = rule.ActiveAlerts();
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].state, AlertState::kFiring);
    EXPECT_EQ(alerts[0].active_at, t0);
    EXPECT_EQ(rule.State(), AlertState::kFiring);
}

TEST(AlertingRuleTest, ZeroDurationFiresImmediately) {
    auto def = HighLatency();
    def.for_duration = std::chrono::milliseconds(0);
    AlertingRule rule(def);

    ASSERT_TRUE(rule.Evaluate(Returning({MakeSample({}, 1)}), Clock::now()).ok());
    EXPECT_EQ(rule.State(), AlertState::kFiring);
}

TEST(AlertingRuleTest, ResolvedInstancesAreDropped) {
    AlertingRule rule(HighLatency());
    const auto t0 = Clock::now();

    ASSERT_TRUE(rule.Evaluate(Returning({MakeSample({{"job", "a"}}, 2),
                                         MakeSample({{"job", "b"}}, 3)}),
                              t0)
                    .ok());
    EXPECT_EQ(rule.ActiveAlerts().size(), 2u);

    ASSERT_TRUE(rule.Evaluate(Returning({MakeSample({{"job", "b"}}, 4)}), t0 + seconds(30)).ok());
    auto alerts = rule.ActiveAlerts();
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].labels.at("job"), "b");
    EXPECT_EQ(alerts[0].value, 4);
    EXPECT_EQ(alerts[0].active_at, t0);

    ASSERT_TRUE(rule.Evaluate(Returning({}), t0 + seconds(60)).ok());
    EXPECT_TRUE(rule.ActiveAlerts().empty());
    EXPECT_EQ(rule.State(), AlertState::kInactive);
}

TEST(AlertingRuleTest, DuplicateLabelsetIsError) {
    AlertingRule rule(HighLatency());

    // Both samples collapse to the same labels once __name__ is dropped.
    auto status = rule.Evaluate(Returning({MakeSample({{"__name__", "a"}}, 1),
                                           MakeSample({{"__name__", "b"}}, 2)}),
                                Clock::now());
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(rule.Health(), RuleHealth::kErr);
    EXPECT_NE(rule.LastError().find("same labelset"), std::string::npos);
}

TEST(RuleTest, HealthTracksLastEvaluation) {
    RecordingRule rule(RecordingRuleDef{"job:up:sum", "sum(up)", {}});
    EXPECT_EQ(rule.Health(), RuleHealth::kUnknown);
    EXPECT_EQ(RuleHealthName(rule.Health()), "unknown");

    const auto ts = Clock::now();
    QueryFunc failing = [](const std::string&, Clock::time_point) -> absl::StatusOr<Vector> {
        return absl::UnavailableError("querier down");
    };
    ASSERT_FALSE(rule.Evaluate(failing, ts).ok());
    EXPECT_EQ(rule.Health(), RuleHealth::kErr);
    EXPECT_EQ(rule.LastError(), "querier down");
    EXPECT_EQ(rule.LastEvaluation(), ts);

    ASSERT_TRUE(rule.Evaluate(Returning({}), ts + seconds(1)).ok());
    EXPECT_EQ(rule.Health(), RuleHealth::kOk);
    EXPECT_EQ(RuleHealthName(rule.Health()), "ok");
    EXPECT_TRUE(rule.LastError().empty());
    EXPECT_GE(rule.EvaluationDuration().count(), 0);
}

TEST(RuleTest, MissingQueryFunctionIsError) {
    RecordingRule rule(RecordingRuleDef{"r", "x", {}});
    EXPECT_FALSE(rule.Evaluate(QueryFunc(), Clock::now()).ok());
    EXPECT_EQ(rule.Health(), RuleHealth::kErr);
}

TEST(RecordingRuleTest, AppliesNameAndLabels) {
    RecordingRule rule(RecordingRuleDef{"job:up:sum", "sum by (job) (up)", {{"team", "infra"}}});
    const auto ts = Clock::now();

    ASSERT_TRUE(rule.Evaluate(Returning({MakeSample({{"job", "api"}}, 3)}), ts).ok());
    auto result = rule.LastResult();
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].labels.at("__name__"), "job:up:sum");
    EXPECT_EQ(result[0].labels.at("team"), "infra");
    EXPECT_EQ(result[0].labels.at("job"), "api");
    EXPECT_EQ(result[0].value, 3);
    EXPECT_EQ(result[0].timestamp, ts);
}

TEST(RecordingRuleTest, DuplicateLabelsetIsError) {
    RecordingRule rule(RecordingRuleDef{"r", "x", {}});
    auto status = rule.Evaluate(Returning({MakeSample({{"__name__", "a"}}, 1),
                                           MakeSample({{"__name__", "b"}}, 2)}),
                                Clock::now());
    EXPECT_FALSE(status.ok());
}

TEST(GroupTest, AlertingRulesFiltersKinds) {
    std::vector<std::shared_ptr<Rule>> rules = {
        MakeRule(HighLatency()),
        MakeRule(RecordingRuleDef{"r", "x", {}}),
    };
    Group group("g", "/rules/a.yaml", seconds(30), rules, v1::WARN);

    EXPECT_EQ(group.Name(), "g");
    EXPECT_EQ(group.File(), "/rules/a.yaml");
    EXPECT_EQ(group.Interval(), seconds(30));
    EXPECT_EQ(group.GetStrategy(), v1::WARN);
    ASSERT_EQ(group.AlertingRules().size(), 1u);
    EXPECT_EQ(group.AlertingRules()[0]->Name(), "HighLatency");
}

TEST(AlertStateTest, Names) {
    EXPECT_EQ(AlertStateName(AlertState::kInactive), "inactive");
    EXPECT_EQ(AlertStateName(AlertState::kPending), "pending");
    EXPECT_EQ(AlertStateName(AlertState::kFiring), "firing");
}

}  // namespace
}  // namespace rulemux::rules
