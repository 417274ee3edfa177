#pragma once

/// @file local_engine.h
/// @brief In-process rule engine evaluating groups on a background thread

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <absl/status/status.h>

#include "common/metrics.h"
#include "rules/engine.h"
#include "rules/rule_file.h"

namespace rulemux::rules {

/// @brief Engine that loads strict rule files and evaluates each group at its
/// interval through the strategy's query function
///
/// Groups whose file, name and definition are unchanged by an Update keep
/// their live state (alert instances, health) and schedule.
class LocalEngine : public Engine {
public:
    explicit LocalEngine(EngineOptions options);
    ~LocalEngine() override;

    // Non-copyable, non-movable
    LocalEngine(const LocalEngine&) = delete;
    LocalEngine& operator=(const LocalEngine&) = delete;

    /// @brief EngineFactory building a LocalEngine
    static std::unique_ptr<Engine> Create(EngineOptions options);

    absl::Status Update(std::chrono::milliseconds interval,
                        const std::vector<std::string>& files) override;

    std::vector<std::shared_ptr<Group>> RuleGroups() const override;
    std::vector<std::shared_ptr<AlertingRule>> AlertingRules() const override;

    void Run() override;
    void Stop() override;

    /// @brief Evaluate every loaded group once, synchronously
    void EvaluateAll(Clock::time_point ts);

    bool IsRunning() const { return running_.load(); }
    Strategy GetStrategy() const { return options_.strategy; }

private:
    struct LoadedGroup {
        std::shared_ptr<Group> group;
        RuleGroupConfig definition;
        std::chrono::steady_clock::time_point next_eval;
    };

    /// Evaluation thread function
    void EvalLoop();

    void EvaluateGroup(const Group& group, Clock::time_point ts);

    /// Gauge holding the rule count of one group
    Gauge& GroupRulesGauge(const Group& group) const;

    EngineOptions options_;

    Counter& evaluations_;
    Counter& evaluation_failures_;
    Histogram& evaluation_duration_;

    std::vector<LoadedGroup> groups_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool groups_changed_ = false;

    std::thread eval_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace rulemux::rules
