/// @file rule_file_test.cpp
/// @brief Tests for rule group document parsing and emission

#include <gtest/gtest.h>

#include "rules/rule_file.h"

namespace rulemux::rules {
namespace {

using std::chrono::milliseconds;
using std::chrono::minutes;
using std::chrono::seconds;

constexpr const char* kMixedGroups = R"(
groups:
  - name: availability
    interval: 30s
    partial_response_strategy: warn
    rules:
      - alert: InstanceDown
        expr: up == 0
        for: 5m
        labels:
          severity: page
        annotations:
          summary: instance is down
      - record: job:up:sum
        expr: sum by (job) (up)
  - name: defaults
    rules:
      - record: instance:cpu:rate5m
        expr: rate(cpu_seconds_total[5m])
)";

TEST(RuleFileTest, ParseWithStrategy) {
    auto groups = ParseRuleGroups(kMixedGroups, ParseMode::kWithStrategy);
    ASSERT_TRUE(groups.ok()) << groups.status().message();
    ASSERT_EQ(groups->size(), 2u);

    const auto& first = (*groups)[0];
    EXPECT_EQ(first.name, "availability");
    EXPECT_EQ(first.strategy, v1::WARN);
    ASSERT_TRUE(first.interval.has_value());
    EXPECT_EQ(*first.interval, seconds(30));
    ASSERT_EQ(first.rules.size(), 2u);

    const auto& alert = std::get<AlertingRuleDef>(first.rules[0]);
    EXPECT_EQ(alert.alert, "InstanceDown");
    EXPECT_EQ(alert.expr, "up == 0");
    EXPECT_EQ(alert.for_duration, minutes(5));
    EXPECT_EQ(alert.labels.at("severity"), "page");
    EXPECT_EQ(alert.annotations.at("summary"), "instance is down");

    const auto& record = std::get<RecordingRuleDef>(first.rules[1]);
    EXPECT_EQ(record.record, "job:up:sum");
    EXPECT_EQ(RuleName(first.rules[1]), "job:up:sum");

    const auto& second = (*groups)[1];
    EXPECT_EQ(second.strategy, v1::ABORT);
    EXPECT_FALSE(second.interval.has_value());
}

TEST(RuleFileTest, StrictModeRejectsStrategyKey) {
    auto groups = ParseRuleGroups(kMixedGroups, ParseMode::kStrict);
    ASSERT_FALSE(groups.ok());
    EXPECT_NE(groups.status().message().find(
                  "field partial_response_strategy not found in type"),
              std::string_view::npos);
}

TEST(RuleFileTest, StrictModeAcceptsPlainGroups) {
    auto groups = ParseRuleGroups(R"(
groups:
  - name: plain
    rules:
      - record: a:b
        expr: vector(1)
)",
                                  ParseMode::kStrict);
    ASSERT_TRUE(groups.ok()) << groups.status().message();
    ASSERT_EQ(groups->size(), 1u);
    EXPECT_EQ((*groups)[0].strategy, kDefaultStrategy);
}

TEST(RuleFileTest, GroupNamesAreScopedByStrategy) {
    const std::string split = R"(
groups:
  - name: g
    partial_response_strategy: none
    rules: []
  - name: g
    rules: []
)";
    auto groups = ParseRuleGroups(split, ParseMode::kWithStrategy);
    ASSERT_TRUE(groups.ok()) << groups.status().message();
    ASSERT_EQ(groups->size(), 2u);
    EXPECT_EQ((*groups)[0].strategy, v1::NONE);
    EXPECT_EQ((*groups)[1].strategy, v1::ABORT);

    auto strict = ParseRuleGroups("groups:\n  - name: g\n  - name: g\n", ParseMode::kStrict);
    ASSERT_FALSE(strict.ok());
    EXPECT_NE(strict.status().message().find("g: repeated in the same file"),
              std::string_view::npos);
}

TEST(RuleFileTest, BogusStrategyIsPolicyError) {
    auto groups = ParseRuleGroups(R"(
groups:
  - name: g
    partial_response_strategy: bogus
    rules: []
)",
                                  ParseMode::kWithStrategy);
    ASSERT_FALSE(groups.ok());
    EXPECT_NE(groups.status().message().find("failed to unmarshal 'partial_response_strategy'"),
              std::string_view::npos);
}

TEST(RuleFileTest, EmptyDocumentHasNoGroups) {
    for (const char* content : {"", "groups: []", "groups:"}) {
        auto groups = ParseRuleGroups(content, ParseMode::kWithStrategy);
        ASSERT_TRUE(groups.ok()) << content;
        EXPECT_TRUE(groups->empty()) << content;
    }
}

struct InvalidCase {
    const char* content;
    const char* message;
};

TEST(RuleFileTest, ValidationErrors) {
    const InvalidCase cases[] = {
        {"groups:\n  - name: g\n    rules:\n      - alert: A\n        record: b\n        expr: x\n",
         "exactly one of 'alert' or 'record' must be set"},
        {"groups:\n  - name: g\n    rules:\n      - expr: x\n",
         "exactly one of 'alert' or 'record' must be set"},
        {"groups:\n  - name: g\n    rules:\n      - alert: A\n",
         "field 'expr' must be set in rule"},
        {"groups:\n  - name: g\n    rules:\n      - record: r\n        expr: x\n        for: 1m\n",
         "invalid field 'for' in recording rule"},
        {"groups:\n  - name: g\n    rules:\n      - record: r\n        expr: x\n"
         "        annotations:\n          a: b\n",
         "invalid field 'annotations' in recording rule"},
        {"groups:\n  - name: g\n    rules:\n      - record: 'bad name'\n        expr: x\n",
         "invalid recording rule name"},
        {"groups:\n  - name: g\n    rules:\n      - alert: A\n        expr: x\n"
         "        labels:\n          '0bad': v\n",
         "invalid labels name"},
        {"groups:\n  - name: g\n    rules:\n      - alert: A\n        expr: x\n        for: soon\n",
         "not a valid duration string"},
        {"groups:\n  - name: g\n    interval: often\n", "not a valid duration string"},
        {"groups:\n  - rules: []\n", "groupname must not be empty"},
        {"groups:\n  - name: g\n  - name: g\n", "g: repeated in the same file"},
        {"groups:\n  - name: g\n    extra: 1\n", "field extra not found in type"},
        {"other: 1\n", "field other not found in type"},
        {"groups: notalist\n", "groups must be a list"},
        {"- a\n- b\n", "rule file must be a map"},
    };

    for (const auto& c : cases) {
        auto groups = ParseRuleGroups(c.content, ParseMode::kWithStrategy);
        ASSERT_FALSE(groups.ok()) << c.content;
        EXPECT_EQ(groups.status().code(), absl::StatusCode::kInvalidArgument) << c.content;
        EXPECT_NE(groups.status().message().find(c.message), std::string_view::npos)
            << c.content << " -> " << groups.status().message();
    }
}

TEST(RuleFileTest, MalformedYaml) {
    auto groups = ParseRuleGroups("groups: [ {name: ", ParseMode::kWithStrategy);
    ASSERT_FALSE(groups.ok());
    EXPECT_EQ(groups.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(RuleFileTest, EmitDropsStrategyAndParsesStrictly) {
    auto groups = ParseRuleGroups(kMixedGroups, ParseMode::kWithStrategy);
    ASSERT_TRUE(groups.ok());

    auto emitted = EmitRuleGroups(*groups);
    ASSERT_TRUE(emitted.ok());
    EXPECT_EQ(emitted->find("partial_response_strategy"), std::string::npos);

    auto reparsed = ParseRuleGroups(*emitted, ParseMode::kStrict);
    ASSERT_TRUE(reparsed.ok()) << reparsed.status().message() << "\n" << *emitted;
    EXPECT_EQ(*reparsed, *groups);
}

TEST(RuleFileTest, GroupEqualityIgnoresStrategy) {
    RuleGroupConfig a;
    a.name = "g";
    a.interval = milliseconds(1000);
    a.rules.push_back(RecordingRuleDef{"r", "x", {}});

    RuleGroupConfig b = a;
    b.strategy = v1::NONE;
    EXPECT_EQ(a, b);

    b.interval.reset();
    EXPECT_NE(a, b);
}

TEST(RuleFileTest, NameValidation) {
    EXPECT_TRUE(IsValidMetricName("job:up:sum"));
    EXPECT_TRUE(IsValidMetricName("_x"));
    EXPECT_FALSE(IsValidMetricName("1abc"));
    EXPECT_FALSE(IsValidMetricName(""));

    EXPECT_TRUE(IsValidLabelName("severity"));
    EXPECT_FALSE(IsValidLabelName("a:b"));
    EXPECT_FALSE(IsValidLabelName("a-b"));
}

}  // namespace
}  // namespace rulemux::rules
