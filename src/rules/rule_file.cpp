/// @file rule_file.cpp
/// @brief Rule group document codec

#include "rules/rule_file.h"

#include <regex>
#include <set>
#include <utility>

#include <absl/strings/str_cat.h>
#include <yaml-cpp/yaml.h>

#include "common/duration.h"
#include "common/error.h"

namespace rulemux::rules {

namespace {

constexpr const char* kStrategyKey = "partial_response_strategy";

absl::Status ParseError(std::string_view context, std::string_view message) {
    return MakeError(ErrorCode::kRuleParseError, absl::StrCat(absl::string_view(context.data(), context.size()), ": ", absl::string_view(message.data(), message.size())));
}

/// Every key of `node` must be in `allowed`.
absl::Status CheckKeys(const YAML::Node& node, const std::set<std::string>& allowed,
                       std::string_view context) {
    for (const auto& kv : node) {
        const std::string key = kv.first.as<std::string>();
        if (allowed.count(key) == 0) {
            return ParseError(context, absl::StrCat("field ", key, " not found in type"));
        }
    }
    return absl::OkStatus();
}

absl::StatusOr<std::string> ScalarField(const YAML::Node& node, const char* key,
                                        std::string_view context) {
    const YAML::Node field = node[key];
    if (!field || field.IsNull()) {
        return std::string();
    }
    if (!field.IsScalar()) {
        return ParseError(context, absl::StrCat(key, " must be a string"));
    }
    return field.as<std::string>();
}

absl::StatusOr<Labels> LabelField(const YAML::Node& node, const char* key,
                                  std::string_view context) {
    Labels labels;
    const YAML::Node field = node[key];
    if (!field || field.IsNull()) {
        return labels;
    }
    if (!field.IsMap()) {
        return ParseError(context, absl::StrCat(key, " must be a map"));
    }
    for (const auto& kv : field) {
        const std::string name = kv.first.as<std::string>();
        if (!IsValidLabelName(name)) {
            return ParseError(context, absl::StrCat("invalid ", key, " name: ", name));
        }
        if (!kv.second.IsScalar()) {
            return ParseError(context, absl::StrCat(key, " value of ", name,
                                                    " must be a string"));
        }
        labels[name] = kv.second.as<std::string>();
    }
    return labels;
}

absl::StatusOr<RuleDef> ParseRule(const YAML::Node& node, std::string_view context) {
    if (!node.IsMap()) {
        return ParseError(context, "rule must be a map");
    }
    RULEMUX_RETURN_IF_ERROR(CheckKeys(
        node, {"alert", "record", "expr", "for", "labels", "annotations"}, context));

    RULEMUX_ASSIGN_OR_RETURN(std::string alert, ScalarField(node, "alert", context));
    RULEMUX_ASSIGN_OR_RETURN(std::string record, ScalarField(node, "record", context));
    RULEMUX_ASSIGN_OR_RETURN(std::string expr, ScalarField(node, "expr", context));
    RULEMUX_ASSIGN_OR_RETURN(std::string for_text, ScalarField(node, "for", context));
    RULEMUX_ASSIGN_OR_RETURN(Labels labels, LabelField(node, "labels", context));
    RULEMUX_ASSIGN_OR_RETURN(Labels annotations, LabelField(node, "annotations", context));

    if (alert.empty() == record.empty()) {
        return ParseError(context, "exactly one of 'alert' or 'record' must be set");
    }
    if (expr.empty()) {
        return ParseError(context, "field 'expr' must be set in rule");
    }

    if (!record.empty()) {
        if (!for_text.empty()) {
            return ParseError(context, "invalid field 'for' in recording rule");
        }
        if (!annotations.empty()) {
            return ParseError(context, "invalid field 'annotations' in recording rule");
        }
        if (!IsValidMetricName(record)) {
            return ParseError(context, absl::StrCat("invalid recording rule name: ", record));
        }
        return RecordingRuleDef{std::move(record), std::move(expr), std::move(labels)};
    }

    AlertingRuleDef rule;
    rule.alert = std::move(alert);
    rule.expr = std::move(expr);
    rule.labels = std::move(labels);
    rule.annotations = std::move(annotations);
    if (!for_text.empty()) {
        auto for_duration = ParseDuration(for_text);
        if (!for_duration.ok()) {
            return ParseError(context, std::string_view(for_duration.status().message().data(), for_duration.status().message().size()));
        }
        rule.for_duration = *for_duration;
    }
    return rule;
}

absl::StatusOr<RuleGroupConfig> ParseGroup(const YAML::Node& node, size_t index,
                                           ParseMode mode) {
    std::string context = absl::StrCat("group ", index + 1);
    if (!node.IsMap()) {
        return ParseError(context, "group must be a map");
    }

    std::set<std::string> allowed = {"name", "interval", "rules"};
    if (mode == ParseMode::kWithStrategy) {
        allowed.insert(kStrategyKey);
    }
    RULEMUX_RETURN_IF_ERROR(CheckKeys(node, allowed, context));

    RuleGroupConfig group;
    RULEMUX_ASSIGN_OR_RETURN(group.name, ScalarField(node, "name", context));
    if (group.name.empty()) {
        return ParseError(context, "groupname must not be empty");
    }
    context = absl::StrCat("group \"", group.name, "\"");

    RULEMUX_ASSIGN_OR_RETURN(std::string interval, ScalarField(node, "interval", context));
    if (!interval.empty()) {
        auto parsed = ParseDuration(interval);
        if (!parsed.ok()) {
            return ParseError(context, std::string_view(parsed.status().message().data(), parsed.status().message().size()));
        }
        group.interval = *parsed;
    }

    if (mode == ParseMode::kWithStrategy) {
        RULEMUX_ASSIGN_OR_RETURN(std::string tag, ScalarField(node, kStrategyKey, context));
        RULEMUX_ASSIGN_OR_RETURN(group.strategy, ParseStrategy(tag));
    }

    const YAML::Node rules = node["rules"];
    if (rules && !rules.IsNull()) {
        if (!rules.IsSequence()) {
            return ParseError(context, "rules must be a list");
        }
        for (size_t i = 0; i < rules.size(); ++i) {
            RULEMUX_ASSIGN_OR_RETURN(
                RuleDef rule,
                ParseRule(rules[i], absl::StrCat(context, ", rule ", i + 1)));
            group.rules.push_back(std::move(rule));
        }
    }
    return group;
}

void EmitLabels(YAML::Emitter& out, const char* key, const Labels& labels) {
    if (labels.empty()) {
        return;
    }
    out << YAML::Key << key << YAML::Value << YAML::BeginMap;
    for (const auto& [name, value] : labels) {
        out << YAML::Key << name << YAML::Value << value;
    }
    out << YAML::EndMap;
}

}  // namespace

bool AlertingRuleDef::operator==(const AlertingRuleDef& other) const {
    return alert == other.alert && expr == other.expr &&
           for_duration == other.for_duration && labels == other.labels &&
           annotations == other.annotations;
}

bool RecordingRuleDef::operator==(const RecordingRuleDef& other) const {
    return record == other.record && expr == other.expr && labels == other.labels;
}

bool RuleGroupConfig::operator==(const RuleGroupConfig& other) const {
    return name == other.name && interval == other.interval && rules == other.rules;
}

absl::StatusOr<std::vector<RuleGroupConfig>> ParseRuleGroups(std::string_view content,
                                                             ParseMode mode) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(content));
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kRuleParseError, e.what());
    }

    std::vector<RuleGroupConfig> groups;
    if (!root || root.IsNull()) {
        return groups;
    }
    if (!root.IsMap()) {
        return MakeError(ErrorCode::kRuleParseError, "rule file must be a map");
    }

    try {
        RULEMUX_RETURN_IF_ERROR(CheckKeys(root, {"groups"}, "rule file"));
        const YAML::Node list = root["groups"];
        if (!list || list.IsNull()) {
            return groups;
        }
        if (!list.IsSequence()) {
            return MakeError(ErrorCode::kRuleParseError, "groups must be a list");
        }

        // Each strategy becomes its own file, so names only clash within one.
        // Strict groups all carry the default strategy.
        std::set<std::pair<std::string, Strategy>> seen;
        for (size_t i = 0; i < list.size(); ++i) {
            RULEMUX_ASSIGN_OR_RETURN(RuleGroupConfig group, ParseGroup(list[i], i, mode));
            if (!seen.emplace(group.name, group.strategy).second) {
                return MakeError(ErrorCode::kRuleParseError,
                                 absl::StrCat(group.name, ": repeated in the same file"));
            }
            groups.push_back(std::move(group));
        }
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kRuleParseError, e.what());
    }
    return groups;
}

absl::StatusOr<std::string> EmitRuleGroups(const std::vector<RuleGroupConfig>& groups) {
    YAML::Emitter out;
    out << YAML::BeginMap << YAML::Key << "groups" << YAML::Value << YAML::BeginSeq;

    for (const auto& group : groups) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << group.name;
        if (group.interval) {
            out << YAML::Key << "interval" << YAML::Value << FormatDuration(*group.interval);
        }
        out << YAML::Key << "rules" << YAML::Value << YAML::BeginSeq;
        for (const auto& rule : group.rules) {
            out << YAML::BeginMap;
            if (const auto* alerting = std::get_if<AlertingRuleDef>(&rule)) {
                out << YAML::Key << "alert" << YAML::Value << alerting->alert;
                out << YAML::Key << "expr" << YAML::Value << alerting->expr;
                if (alerting->for_duration.count() != 0) {
                    out << YAML::Key << "for" << YAML::Value
                        << FormatDuration(alerting->for_duration);
                }
                EmitLabels(out, "labels", alerting->labels);
                EmitLabels(out, "annotations", alerting->annotations);
            } else {
                const auto& recording = std::get<RecordingRuleDef>(rule);
                out << YAML::Key << "record" << YAML::Value << recording.record;
                out << YAML::Key << "expr" << YAML::Value << recording.expr;
                EmitLabels(out, "labels", recording.labels);
            }
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }

    out << YAML::EndSeq << YAML::EndMap;
    if (!out.good()) {
        return MakeError(ErrorCode::kInternal,
                         absl::StrCat("failed to emit rule groups: ", out.GetLastError()));
    }
    return std::string(out.c_str()) + "\n";
}

const std::string& RuleName(const RuleDef& rule) {
    if (const auto* alerting = std::get_if<AlertingRuleDef>(&rule)) {
        return alerting->alert;
    }
    return std::get<RecordingRuleDef>(rule).record;
}

bool IsValidMetricName(std::string_view name) {
    static const std::regex kMetricName("^[a-zA-Z_:][a-zA-Z0-9_:]*$");
    return std::regex_match(name.begin(), name.end(), kMetricName);
}

bool IsValidLabelName(std::string_view name) {
    static const std::regex kLabelName("^[a-zA-Z_][a-zA-Z0-9_]*$");
    return std::regex_match(name.begin(), name.end(), kLabelName);
}

}  // namespace rulemux::rules
