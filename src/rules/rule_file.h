#pragma once

/// @file rule_file.h
/// @brief Rule group documents: parsing, validation and re-emission
///
/// A rule file is a YAML document of the form
///
///   groups:
///     - name: example
///       interval: 30s
///       partial_response_strategy: warn
///       rules:
///         - alert: HighLatency
///           expr: latency_seconds > 1
///           for: 5m
///         - record: job:requests:rate5m
///           expr: sum by (job) (rate(requests_total[5m]))
///
/// Files written by users may carry `partial_response_strategy`; the
/// per-strategy files handed to rule engines never do.

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>

#include "rules/strategy.h"

namespace rulemux::rules {

/// @brief Label or annotation set, ordered by name
using Labels = std::map<std::string, std::string>;

/// @brief Alerting rule as written in a rule file
struct AlertingRuleDef {
    std::string alert;
    std::string expr;

    /// How long a result must persist before the alert fires
    std::chrono::milliseconds for_duration{0};

    Labels labels;
    Labels annotations;

    bool operator==(const AlertingRuleDef& other) const;
};

/// @brief Recording rule as written in a rule file
struct RecordingRuleDef {
    std::string record;
    std::string expr;
    Labels labels;

    bool operator==(const RecordingRuleDef& other) const;
};

using RuleDef = std::variant<AlertingRuleDef, RecordingRuleDef>;

/// @brief One rule group of a rule file
struct RuleGroupConfig {
    std::string name;

    /// Unset means the engine's default evaluation interval applies
    std::optional<std::chrono::milliseconds> interval;

    std::vector<RuleDef> rules;

    /// Resolved strategy; kDefaultStrategy when the group names none
    Strategy strategy = kDefaultStrategy;

    /// @brief Definition equality; the strategy is not part of it
    bool operator==(const RuleGroupConfig& other) const;
    bool operator!=(const RuleGroupConfig& other) const { return !(*this == other); }
};

/// @brief Which group schema a document is parsed against
enum class ParseMode {
    kWithStrategy,  ///< `partial_response_strategy` allowed and resolved
    kStrict         ///< `partial_response_strategy` is an unknown field
};

/// @brief Parse and validate a rule file
///
/// An empty document yields no groups. Unknown fields, missing names,
/// group names repeated under one strategy, malformed durations and invalid metric or label
/// names are kRuleParseError; an unknown strategy is kPolicyParseError.
absl::StatusOr<std::vector<RuleGroupConfig>> ParseRuleGroups(std::string_view content,
                                                             ParseMode mode);

/// @brief Serialize groups using the strict schema (no strategy key)
absl::StatusOr<std::string> EmitRuleGroups(const std::vector<RuleGroupConfig>& groups);

/// @brief Name of the rule, whichever kind it is
const std::string& RuleName(const RuleDef& rule);

/// @brief Whether `name` is a valid metric name
bool IsValidMetricName(std::string_view name);

/// @brief Whether `name` is a valid label name
bool IsValidLabelName(std::string_view name);

}  // namespace rulemux::rules
