/// @file local_engine.cpp
/// @brief In-process rule engine

#include "rules/local_engine.h"

#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>

#include <absl/strings/str_cat.h>

#include "common/duration.h"
#include "common/error.h"
#include "common/logging.h"

namespace rulemux::rules {

namespace {

absl::StatusOr<std::string> ReadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return MakeError(ErrorCode::kFilesystemError, absl::StrCat("open ", path));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string GroupKey(const std::string& file, const std::string& name) {
    return absl::StrCat(file, ";", name);
}

}  // namespace

LocalEngine::LocalEngine(EngineOptions options)
    : options_(std::move(options)),
      evaluations_(options_.metrics.GetCounter(
          "rulemux_rule_evaluations_total", "The total number of rule evaluations")),
      evaluation_failures_(options_.metrics.GetCounter(
          "rulemux_rule_evaluation_failures_total",
          "The total number of rule evaluation failures")),
      evaluation_duration_(options_.metrics.GetHistogram(
          "rulemux_rule_evaluation_duration_seconds",
          "The duration of rule group evaluations")) {}

LocalEngine::~LocalEngine() {
    Stop();
}

std::unique_ptr<Engine> LocalEngine::Create(EngineOptions options) {
    return std::make_unique<LocalEngine>(std::move(options));
}

absl::Status LocalEngine::Update(std::chrono::milliseconds interval,
                                 const std::vector<std::string>& files) {
    if (interval <= std::chrono::milliseconds::zero()) {
        return MakeError(ErrorCode::kInvalidArgument,
                         absl::StrCat("evaluation interval must be positive, got ",
                                      FormatDuration(interval)));
    }

    // Parse everything before touching the live groups.
    MultiError errors;
    std::vector<std::pair<std::string, RuleGroupConfig>> configs;
    for (const auto& file : files) {
        auto content = ReadFile(file);
        if (!content.ok()) {
            errors.Add(content.status());
            continue;
        }
        auto groups = ParseRuleGroups(*content, ParseMode::kStrict);
        if (!groups.ok()) {
            errors.Add(Annotate(groups.status(), file));
            continue;
        }
        for (auto& group : *groups) {
            configs.emplace_back(file, std::move(group));
        }
    }
    RULEMUX_RETURN_IF_ERROR(errors.Err());

    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, LoadedGroup*> previous;
    for (auto& loaded : groups_) {
        previous[GroupKey(loaded.group->File(), loaded.group->Name())] = &loaded;
    }

    const auto now = std::chrono::steady_clock::now();
    std::vector<LoadedGroup> next;
    next.reserve(configs.size());
    size_t reused = 0;
    for (auto& [file, config] : configs) {
        std::chrono::milliseconds group_interval = interval;
        if (config.interval && config.interval->count() > 0) {
            group_interval = *config.interval;
        }

        auto it = previous.find(GroupKey(file, config.name));
        if (it != previous.end() && it->second->definition == config &&
            it->second->group->Interval() == group_interval) {
            next.push_back(std::move(*it->second));
            previous.erase(it);
            ++reused;
            continue;
        }

        std::vector<std::shared_ptr<Rule>> rules;
        rules.reserve(config.rules.size());
        for (const auto& def : config.rules) {
            rules.push_back(MakeRule(def));
        }
        auto group = std::make_shared<Group>(config.name, file, group_interval,
                                             std::move(rules), options_.strategy);
        next.push_back(LoadedGroup{std::move(group), std::move(config), now});
    }

    // Groups that did not survive stop reporting a rule count.
    for (const auto& [key, loaded] : previous) {
        GroupRulesGauge(*loaded->group).Set(0);
    }
    for (const auto& loaded : next) {
        GroupRulesGauge(*loaded.group).Set(static_cast<double>(loaded.group->Rules().size()));
    }

    RULEMUX_LOG_DEBUG("Engine {} loaded {} groups from {} files ({} unchanged)",
                      StrategyName(options_.strategy), next.size(), files.size(), reused);

    groups_ = std::move(next);
    groups_changed_ = true;
    cv_.notify_all();
    return absl::OkStatus();
}

std::vector<std::shared_ptr<Group>> LocalEngine::RuleGroups() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Group>> groups;
    groups.reserve(groups_.size());
    for (const auto& loaded : groups_) {
        groups.push_back(loaded.group);
    }
    return groups;
}

std::vector<std::shared_ptr<AlertingRule>> LocalEngine::AlertingRules() const {
    std::vector<std::shared_ptr<AlertingRule>> rules;
    for (const auto& group : RuleGroups()) {
        auto alerting = group->AlertingRules();
        rules.insert(rules.end(), alerting.begin(), alerting.end());
    }
    return rules;
}

void LocalEngine::Run() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    eval_thread_ = std::thread(&LocalEngine::EvalLoop, this);

    RULEMUX_LOG_INFO("Rule engine {} started", StrategyName(options_.strategy));
}

void LocalEngine::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (eval_thread_.joinable()) {
        eval_thread_.join();
    }

    RULEMUX_LOG_INFO("Rule engine {} stopped", StrategyName(options_.strategy));
}

void LocalEngine::EvaluateAll(Clock::time_point ts) {
    for (const auto& group : RuleGroups()) {
        EvaluateGroup(*group, ts);
    }
}

void LocalEngine::EvalLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        const auto now = std::chrono::steady_clock::now();
        auto wake = now + std::chrono::hours(1);

        std::vector<std::shared_ptr<Group>> due;
        for (auto& loaded : groups_) {
            if (loaded.next_eval <= now) {
                due.push_back(loaded.group);
                loaded.next_eval = now + loaded.group->Interval();
            }
            wake = std::min(wake, loaded.next_eval);
        }

        if (!due.empty()) {
            lock.unlock();
            for (const auto& group : due) {
                EvaluateGroup(*group, Clock::now());
            }
            lock.lock();
            continue;
        }

        cv_.wait_until(lock, wake, [this] { return stop_requested_ || groups_changed_; });
        groups_changed_ = false;
    }
}

void LocalEngine::EvaluateGroup(const Group& group, Clock::time_point ts) {
    const auto start = std::chrono::steady_clock::now();
    for (const auto& rule : group.Rules()) {
        evaluations_.Increment();
        auto status = rule->Evaluate(options_.query_func, ts);
        if (!status.ok()) {
            evaluation_failures_.Increment();
            RULEMUX_LOG_DEBUG("Evaluating rule {} of group {} failed: {}", rule->Name(),
                              group.Name(), status.message());
        }
    }
    evaluation_duration_.Observe(ToSeconds(std::chrono::steady_clock::now() - start));
}

Gauge& LocalEngine::GroupRulesGauge(const Group& group) const {
    return options_.metrics.With({{"rule_group", GroupKey(group.File(), group.Name())}})
        .GetGauge("rulemux_rule_group_rules", "The number of rules in a group");
}

}  // namespace rulemux::rules
