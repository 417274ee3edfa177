#pragma once

/// @file engine.h
/// @brief Rule engine interface
///
/// An engine periodically evaluates the rule groups of a set of files
/// against one query function. The manager keeps one engine per strategy.

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <absl/status/status.h>

#include "common/metrics.h"
#include "rules/rule.h"
#include "rules/strategy.h"

namespace rulemux::rules {

/// @brief Periodic evaluator of rule groups
///
/// Implementations synchronize internally: Update may run while another
/// thread lists groups, and groups returned by RuleGroups stay valid after a
/// later Update replaced them.
class Engine {
public:
    virtual ~Engine() = default;

    /// @brief Replace the loaded files
    ///
    /// Groups without an interval use `interval`. On error the previously
    /// loaded groups stay active.
    virtual absl::Status Update(std::chrono::milliseconds interval,
                                const std::vector<std::string>& files) = 0;

    /// @brief Currently loaded groups
    virtual std::vector<std::shared_ptr<Group>> RuleGroups() const = 0;

    /// @brief Alerting rules of all loaded groups
    virtual std::vector<std::shared_ptr<AlertingRule>> AlertingRules() const = 0;

    /// @brief Start evaluating in the background
    virtual void Run() = 0;

    /// @brief Stop evaluating; returns once evaluation has quiesced
    virtual void Stop() = 0;
};

/// @brief Everything an engine of one strategy is built with
struct EngineOptions {
    Strategy strategy;
    QueryFunc query_func;

    /// Scope labelled with the strategy
    MetricsScope metrics;
};

/// @brief Creates the engine for one strategy; nullptr means none
using EngineFactory = std::function<std::unique_ptr<Engine>(EngineOptions)>;

}  // namespace rulemux::rules
