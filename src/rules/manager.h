#pragma once

/// @file manager.h
/// @brief Multi-strategy rule manager
///
/// Owns one rule engine per partial response strategy. Every reload splits
/// the user rule files by strategy into scratch files, hands each engine its
/// share and then publishes a new scratch -> original file index. Listing
/// merges the groups of all engines and reports them under their original
/// file names.

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include <absl/status/status.h>

#include "common/metrics.h"
#include "proto/rulemux/v1/rules.pb.h"
#include "rules/engine.h"
#include "rules/partitioner.h"
#include "rules/strategy.h"

namespace rulemux::rules {

/// @brief Sink of a Rules listing
class RulesStream {
public:
    virtual ~RulesStream() = default;

    /// @brief Deliver one message; a non-OK status ends the listing
    virtual absl::Status Send(const v1::RulesResponse& response) = 0;

    /// @brief Whether the receiver has gone away
    virtual bool IsCancelled() const = 0;
};

/// @brief Manager configuration
struct ManagerOptions {
    /// Working directory; scratch files go to `<data_dir>/.tmp-rules`
    std::filesystem::path data_dir;

    /// Registry for manager and engine metrics; the process registry if null
    MetricsRegistry* registry = nullptr;
};

/// @brief Orchestrates one rule engine per strategy
class Manager {
public:
    /// @brief Build the engine of every strategy
    ///
    /// `engine_factory` is called once per strategy with that strategy's query
    /// function and metrics scope. A strategy it returns nullptr for has no
    /// engine, and files assigned to it are reported by Update.
    Manager(ManagerOptions options, const QueryFuncCreator& query_func_creator,
            const EngineFactory& engine_factory);

    /// Stops every engine
    ~Manager();

    // Non-copyable
    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    /// @brief Reload the rule files
    ///
    /// Best effort: a bad file, a strategy without engine or a failing engine
    /// does not prevent the rest from being applied. Every engine is updated,
    /// those without files with an empty list. Strategies whose engine
    /// rejected the update keep their previous files. All failures are
    /// returned as one status.
    absl::Status Update(std::chrono::milliseconds eval_interval,
                        const std::vector<std::string>& files);

    /// @brief Groups of every engine; no ordering across strategies
    std::vector<std::shared_ptr<Group>> RuleGroups() const;

    /// @brief Alerting rules of every engine
    std::vector<std::shared_ptr<AlertingRule>> AlertingRules() const;

    /// @brief Stream every group, one message per group
    ///
    /// ALERT and RECORD keep the group and drop the other rule kind; groups
    /// left without rules are still sent.
    /// @return CANCELLED if the stream was cancelled, the status of the first
    ///         failed Send, OK otherwise
    /// @throws std::logic_error on a rule of unsupported type
    absl::Status Rules(const v1::RulesRequest& request, RulesStream& stream) const;

    /// @brief User file a group was generated from, its own file if unknown
    std::string OriginalFile(const Group& group) const;

    /// @brief Scratch files currently active for a strategy
    std::vector<std::string> ActiveFiles(Strategy strategy) const;

    /// @brief Whether an engine exists for the strategy
    bool HasEngine(Strategy strategy) const { return engines_.count(strategy) != 0; }

    const std::filesystem::path& ScratchDir() const { return partitioner_.ScratchDir(); }

    /// @brief Start every engine
    void Run();

    /// @brief Stop every engine; returns once all have quiesced
    void Stop();

    /// @brief Keep only the rules of the requested kind
    static void FilterRules(v1::RuleGroup& group, v1::RulesRequest::Type type);

private:
    /// Scratch -> original file mapping plus the active files per strategy;
    /// replaced wholesale on reload.
    struct FileIndex {
        std::map<std::string, std::string> original_files;
        std::map<Strategy, std::vector<std::string>> active_files;
    };

    std::shared_ptr<const FileIndex> Snapshot() const;

    static std::string OriginalFile(const FileIndex& index, const std::string& file);

    MetricsRegistry& registry_;
    Partitioner partitioner_;
    std::map<Strategy, std::unique_ptr<Engine>> engines_;

    Counter& reloads_;
    Counter& reload_failures_;

    std::shared_ptr<const FileIndex> file_index_;
    mutable std::shared_mutex index_mutex_;

    /// Serializes reloads
    std::mutex update_mutex_;
};

}  // namespace rulemux::rules
