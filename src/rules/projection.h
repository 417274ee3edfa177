#pragma once

/// @file projection.h
/// @brief Conversion of live engine state into rulemux.v1 messages

#include <string>

#include <google/protobuf/timestamp.pb.h>

#include "proto/rulemux/v1/rules.pb.h"
#include "rules/rule.h"
#include "rules/strategy.h"

namespace rulemux::rules {

/// @brief Project a live group
///
/// `file` is the user-facing file name reported for the group. Rules are
/// projected in order.
/// @throws std::logic_error if the group holds a rule that is neither an
///         AlertingRule nor a RecordingRule
v1::RuleGroup GroupToProto(const Group& group, const std::string& file);

/// @brief Project an alerting rule with its active instances
v1::Alert AlertingRuleToProto(const AlertingRule& rule, Strategy strategy);

/// @brief Project a recording rule
v1::RecordingRule RecordingRuleToProto(const RecordingRule& rule);

/// @brief Project one active alert instance
v1::AlertInstance AlertToProto(const Alert& alert, Strategy strategy);

v1::Labels LabelsToProto(const Labels& labels);
v1::AlertState AlertStateToProto(AlertState state);
google::protobuf::Timestamp TimeToProto(Clock::time_point ts);

/// @brief Shortest scientific notation that parses back to `value`
///
/// 150 -> "1.5e+02"; NaN -> "NaN"; infinities -> "+Inf" / "-Inf".
std::string FormatValue(double value);

}  // namespace rulemux::rules
