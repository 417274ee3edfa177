/// @file rule.cpp
/// @brief Live rule evaluation state

#include "rules/rule.h"

#include <algorithm>
#include <type_traits>
#include <variant>

#include "common/error.h"

namespace rulemux::rules {

namespace {

constexpr const char* kMetricNameLabel = "__name__";
constexpr const char* kAlertNameLabel = "alertname";

}  // namespace

std::string RuleHealthName(RuleHealth health) {
    switch (health) {
        case RuleHealth::kOk: return "ok";
        case RuleHealth::kErr: return "err";
        case RuleHealth::kUnknown: break;
    }
    return "unknown";
}

std::string AlertStateName(AlertState state) {
    switch (state) {
        case AlertState::kPending: return "pending";
        case AlertState::kFiring: return "firing";
        case AlertState::kInactive: break;
    }
    return "inactive";
}

// ============================================================================
// Rule
// ============================================================================

Rule::Rule(std::string name, std::string query, Labels labels)
    : name_(std::move(name)), query_(std::move(query)), labels_(std::move(labels)) {}

RuleHealth Rule::Health() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return health_;
}

std::string Rule::LastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::chrono::nanoseconds Rule::EvaluationDuration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evaluation_duration_;
}

Clock::time_point Rule::LastEvaluation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_evaluation_;
}

absl::Status Rule::Evaluate(const QueryFunc& query_func, Clock::time_point ts) {
    const auto start = std::chrono::steady_clock::now();

    // The query runs unlocked; it may block on the network.
    absl::StatusOr<Vector> result =
        query_func ? query_func(query_, ts)
                   : absl::StatusOr<Vector>(
                         MakeError(ErrorCode::kFailedPrecondition, "no query function"));

    std::lock_guard<std::mutex> lock(mutex_);
    absl::Status status = result.ok() ? Apply(*result, ts) : result.status();

    evaluation_duration_ = std::chrono::steady_clock::now() - start;
    last_evaluation_ = ts;
    if (status.ok()) {
        health_ = RuleHealth::kOk;
        last_error_.clear();
    } else {
        health_ = RuleHealth::kErr;
        last_error_ = std::string(status.message());
    }
    return status;
}

// ============================================================================
// AlertingRule
// ============================================================================

AlertingRule::AlertingRule(const AlertingRuleDef& def)
    : Rule(def.alert, def.expr, def.labels),
      duration_(def.for_duration),
      annotations_(def.annotations) {}

std::vector<Alert> AlertingRule::ActiveAlerts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Alert> alerts;
    alerts.reserve(active_.size());
    for (const auto& [labels, alert] : active_) {
        alerts.push_back(alert);
    }
    return alerts;
}

AlertState AlertingRule::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    AlertState state = AlertState::kInactive;
    for (const auto& [labels, alert] : active_) {
        state = std::max(state, alert.state);
    }
    return state;
}

absl::Status AlertingRule::Apply(const Vector& result, Clock::time_point ts) {
    std::map<Labels, Alert> next;
    for (const auto& sample : result) {
        Labels labels = sample.labels;
        labels.erase(kMetricNameLabel);
        for (const auto& [name, value] : GetLabels()) {
            labels[name] = value;
        }
        labels[kAlertNameLabel] = Name();

        if (next.count(labels) != 0) {
            return MakeError(ErrorCode::kInvalidArgument,
                             "vector contains metrics with the same labelset after "
                             "applying alert labels");
        }

        Alert alert;
        auto it = active_.find(labels);
        if (it != active_.end()) {
            alert = it->second;
        } else {
            alert.state = AlertState::kPending;
            alert.active_at = ts;
        }
        alert.labels = labels;
        alert.annotations = annotations_;
        alert.value = sample.value;
        if (alert.state == AlertState::kPending && ts - alert.active_at >= duration_) {
            alert.state = AlertState::kFiring;
        }
        next.emplace(std::move(labels), std::move(alert));
    }

    active_ = std::move(next);
    return absl::OkStatus();
}

// ============================================================================
// RecordingRule
// ============================================================================

RecordingRule::RecordingRule(const RecordingRuleDef& def)
    : Rule(def.record, def.expr, def.labels) {}

Vector RecordingRule::LastResult() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_result_;
}

absl::Status RecordingRule::Apply(const Vector& result, Clock::time_point ts) {
    Vector out;
    out.reserve(result.size());
    std::map<Labels, bool> seen;
    for (const auto& sample : result) {
        Sample recorded;
        recorded.labels = sample.labels;
        recorded.labels[kMetricNameLabel] = Name();
        for (const auto& [name, value] : GetLabels()) {
            recorded.labels[name] = value;
        }
        if (!seen.emplace(recorded.labels, true).second) {
            return MakeError(ErrorCode::kInvalidArgument,
                             "vector contains metrics with the same labelset after "
                             "applying rule labels");
        }
        recorded.value = sample.value;
        recorded.timestamp = ts;
        out.push_back(std::move(recorded));
    }

    last_result_ = std::move(out);
    return absl::OkStatus();
}

std::shared_ptr<Rule> MakeRule(const RuleDef& def) {
    return std::visit([](const auto& rule) -> std::shared_ptr<Rule> {
        using T = std::decay_t<decltype(rule)>;
        if constexpr (std::is_same_v<T, AlertingRuleDef>) {
            return std::make_shared<AlertingRule>(rule);
        } else {
            return std::make_shared<RecordingRule>(rule);
        }
    }, def);
}

// ============================================================================
// Group
// ============================================================================

Group::Group(std::string name, std::string file, std::chrono::milliseconds interval,
             std::vector<std::shared_ptr<Rule>> rules, Strategy strategy)
    : name_(std::move(name)),
      file_(std::move(file)),
      interval_(interval),
      rules_(std::move(rules)),
      strategy_(strategy) {}

std::vector<std::shared_ptr<AlertingRule>> Group::AlertingRules() const {
    std::vector<std::shared_ptr<AlertingRule>> alerting;
    for (const auto& rule : rules_) {
        if (auto alert = std::dynamic_pointer_cast<AlertingRule>(rule)) {
            alerting.push_back(std::move(alert));
        }
    }
    return alerting;
}

}  // namespace rulemux::rules
