/// @file projection.cpp
/// @brief Conversion of live engine state into rulemux.v1 messages

#include "rules/projection.h"

#include <charconv>
#include <cmath>
#include <stdexcept>

#include <absl/strings/str_cat.h>
#include <google/protobuf/util/time_util.h>

#include "common/duration.h"

namespace rulemux::rules {

using google::protobuf::util::TimeUtil;

v1::RuleGroup GroupToProto(const Group& group, const std::string& file) {
    v1::RuleGroup out;
    out.set_name(group.Name());
    out.set_file(file);
    out.set_interval(ToSeconds(group.Interval()));
    out.set_partial_response_strategy(group.GetStrategy());

    for (const auto& rule : group.Rules()) {
        if (const auto* alerting = dynamic_cast<const AlertingRule*>(rule.get())) {
            *out.add_rules()->mutable_alert() =
                AlertingRuleToProto(*alerting, group.GetStrategy());
        } else if (const auto* recording = dynamic_cast<const RecordingRule*>(rule.get())) {
            *out.add_rules()->mutable_recording() = RecordingRuleToProto(*recording);
        } else {
            throw std::logic_error(absl::StrCat("rule ", rule->Name(), " of group ",
                                                group.Name(), " has unsupported type"));
        }
    }
    return out;
}

v1::Alert AlertingRuleToProto(const AlertingRule& rule, Strategy strategy) {
    v1::Alert out;
    out.set_state(AlertStateToProto(rule.State()));
    out.set_name(rule.Name());
    out.set_query(rule.Query());
    out.set_duration_seconds(ToSeconds(rule.Duration()));
    *out.mutable_labels() = LabelsToProto(rule.GetLabels());
    *out.mutable_annotations() = LabelsToProto(rule.Annotations());
    for (const auto& alert : rule.ActiveAlerts()) {
        *out.add_alerts() = AlertToProto(alert, strategy);
    }
    out.set_health(RuleHealthName(rule.Health()));
    out.set_last_error(rule.LastError());
    out.set_evaluation_duration_seconds(ToSeconds(rule.EvaluationDuration()));
    *out.mutable_last_evaluation() = TimeToProto(rule.LastEvaluation());
    return out;
}

v1::RecordingRule RecordingRuleToProto(const RecordingRule& rule) {
    v1::RecordingRule out;
    out.set_name(rule.Name());
    out.set_query(rule.Query());
    *out.mutable_labels() = LabelsToProto(rule.GetLabels());
    out.set_health(RuleHealthName(rule.Health()));
    out.set_last_error(rule.LastError());
    out.set_evaluation_duration_seconds(ToSeconds(rule.EvaluationDuration()));
    *out.mutable_last_evaluation() = TimeToProto(rule.LastEvaluation());
    return out;
}

v1::AlertInstance AlertToProto(const Alert& alert, Strategy strategy) {
    v1::AlertInstance out;
    out.set_partial_response_strategy(strategy);
    *out.mutable_labels() = LabelsToProto(alert.labels);
    *out.mutable_annotations() = LabelsToProto(alert.annotations);
    out.set_state(AlertStateToProto(alert.state));
    *out.mutable_active_at() = TimeToProto(alert.active_at);
    out.set_value(FormatValue(alert.value));
    return out;
}

v1::Labels LabelsToProto(const Labels& labels) {
    v1::Labels out;
    for (const auto& [name, value] : labels) {
        auto* label = out.add_labels();
        label->set_name(name);
        label->set_value(value);
    }
    return out;
}

v1::AlertState AlertStateToProto(AlertState state) {
    switch (state) {
        case AlertState::kPending: return v1::PENDING;
        case AlertState::kFiring: return v1::FIRING;
        case AlertState::kInactive: break;
    }
    return v1::INACTIVE;
}

google::protobuf::Timestamp TimeToProto(Clock::time_point ts) {
    const auto nanos =
        std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch());
    return TimeUtil::NanosecondsToTimestamp(nanos.count());
}

std::string FormatValue(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    char buf[64];
    auto result = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    return std::string(buf, result.ptr);
}

}  // namespace rulemux::rules
