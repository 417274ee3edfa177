#pragma once

/// @file rule.h
/// @brief Live rule state owned by rule engines
///
/// Groups are immutable once built. Rules carry their own evaluation state
/// behind a per-rule mutex, so listing can read them while an engine thread
/// evaluates.

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "rules/rule_file.h"
#include "rules/strategy.h"

namespace rulemux::rules {

using Clock = std::chrono::system_clock;

// ============================================================================
// Query results
// ============================================================================

/// @brief One element of an instant vector
struct Sample {
    Labels labels;
    double value = 0.0;
    Clock::time_point timestamp;
};

using Vector = std::vector<Sample>;

/// @brief Evaluates an instant query at the given time
using QueryFunc =
    std::function<absl::StatusOr<Vector>(const std::string& query, Clock::time_point ts)>;

/// @brief Builds the query function used by the engine of one strategy
using QueryFuncCreator = std::function<QueryFunc(Strategy)>;

// ============================================================================
// Rules
// ============================================================================

enum class RuleHealth {
    kUnknown,
    kOk,
    kErr
};

/// @brief "unknown", "ok" or "err"
std::string RuleHealthName(RuleHealth health);

/// @brief Base class of every evaluated rule
class Rule {
public:
    virtual ~Rule() = default;

    Rule(const Rule&) = delete;
    Rule& operator=(const Rule&) = delete;

    const std::string& Name() const { return name_; }
    const std::string& Query() const { return query_; }
    const Labels& GetLabels() const { return labels_; }

    RuleHealth Health() const;
    std::string LastError() const;
    std::chrono::nanoseconds EvaluationDuration() const;

    /// @brief Time of the last evaluation, epoch if never evaluated
    Clock::time_point LastEvaluation() const;

    /// @brief Run the query at `ts` and apply its result
    ///
    /// Health, last error, duration and timestamp are updated whatever the
    /// outcome; the returned status is the evaluation error, if any.
    absl::Status Evaluate(const QueryFunc& query_func, Clock::time_point ts);

protected:
    Rule(std::string name, std::string query, Labels labels);

    /// @brief Apply a successful query result; called with mutex_ held
    virtual absl::Status Apply(const Vector& result, Clock::time_point ts) = 0;

    mutable std::mutex mutex_;

private:
    const std::string name_;
    const std::string query_;
    const Labels labels_;

    RuleHealth health_ = RuleHealth::kUnknown;
    std::string last_error_;
    std::chrono::nanoseconds evaluation_duration_{0};
    Clock::time_point last_evaluation_;
};

// ============================================================================
// Alerting rules
// ============================================================================

enum class AlertState {
    kInactive,
    kPending,
    kFiring
};

/// @brief "inactive", "pending" or "firing"
std::string AlertStateName(AlertState state);

/// @brief One active instance of an alerting rule
struct Alert {
    Labels labels;
    Labels annotations;
    AlertState state = AlertState::kInactive;
    Clock::time_point active_at;
    double value = 0.0;
};

/// @brief Rule whose result series become alert instances
///
/// Each series of a result is an instance keyed by its labels (rule labels
/// applied on top). An instance is pending until it has been active for the
/// rule's `for` duration, then firing. Instances absent from a result are
/// dropped.
class AlertingRule : public Rule {
public:
    explicit AlertingRule(const AlertingRuleDef& def);

    std::chrono::milliseconds Duration() const { return duration_; }
    const Labels& Annotations() const { return annotations_; }

    /// @brief Snapshot of the active instances, ordered by labels
    std::vector<Alert> ActiveAlerts() const;

    /// @brief Highest state among active instances
    AlertState State() const;

protected:
    absl::Status Apply(const Vector& result, Clock::time_point ts) override;

private:
    const std::chrono::milliseconds duration_;
    const Labels annotations_;
    std::map<Labels, Alert> active_;
};

// ============================================================================
// Recording rules
// ============================================================================

/// @brief Rule whose result is re-labelled under a new metric name
class RecordingRule : public Rule {
public:
    explicit RecordingRule(const RecordingRuleDef& def);

    /// @brief Series produced by the last successful evaluation
    Vector LastResult() const;

protected:
    absl::Status Apply(const Vector& result, Clock::time_point ts) override;

private:
    Vector last_result_;
};

/// @brief Build the live rule for a definition
std::shared_ptr<Rule> MakeRule(const RuleDef& def);

// ============================================================================
// Groups
// ============================================================================

/// @brief A rule group as loaded by an engine
class Group {
public:
    Group(std::string name, std::string file, std::chrono::milliseconds interval,
          std::vector<std::shared_ptr<Rule>> rules, Strategy strategy);

    const std::string& Name() const { return name_; }

    /// @brief File the group was loaded from
    const std::string& File() const { return file_; }

    std::chrono::milliseconds Interval() const { return interval_; }
    const std::vector<std::shared_ptr<Rule>>& Rules() const { return rules_; }
    Strategy GetStrategy() const { return strategy_; }

    /// @brief Alerting rules of this group, in order
    std::vector<std::shared_ptr<AlertingRule>> AlertingRules() const;

private:
    const std::string name_;
    const std::string file_;
    const std::chrono::milliseconds interval_;
    const std::vector<std::shared_ptr<Rule>> rules_;
    const Strategy strategy_;
};

}  // namespace rulemux::rules
