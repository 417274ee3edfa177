/// @file manager.cpp
/// @brief Multi-strategy rule manager

#include "rules/manager.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "rules/projection.h"

namespace rulemux::rules {

namespace {

constexpr const char* kScratchDirName = ".tmp-rules";

bool MatchesType(const v1::Rule& rule, v1::RulesRequest::Type type) {
    switch (type) {
        case v1::RulesRequest::ALERT: return rule.has_alert();
        case v1::RulesRequest::RECORD: return rule.has_recording();
        default: return true;
    }
}

}  // namespace

Manager::Manager(ManagerOptions options, const QueryFuncCreator& query_func_creator,
                 const EngineFactory& engine_factory)
    : registry_(options.registry != nullptr ? *options.registry
                                            : MetricsRegistry::Instance()),
      partitioner_(options.data_dir / kScratchDirName),
      reloads_(registry_.GetCounter("rulemux_rule_config_reloads_total",
                                    "The total number of rule configuration reloads")),
      reload_failures_(registry_.GetCounter(
          "rulemux_rule_config_reload_failures_total",
          "The total number of rule configuration reloads with errors")),
      file_index_(std::make_shared<const FileIndex>()) {
    for (Strategy strategy : kAllStrategies) {
        EngineOptions engine_options{
            strategy,
            query_func_creator ? query_func_creator(strategy) : QueryFunc(),
            MetricsScope(registry_, {{"strategy", StrategyLabel(strategy)}}),
        };
        std::unique_ptr<Engine> engine;
        if (engine_factory) {
            engine = engine_factory(std::move(engine_options));
        }
        if (!engine) {
            RULEMUX_LOG_WARN("No rule engine for strategy {}", StrategyName(strategy));
            continue;
        }
        engines_.emplace(strategy, std::move(engine));
    }
}

Manager::~Manager() {
    Stop();
}

absl::Status Manager::Update(std::chrono::milliseconds eval_interval,
                             const std::vector<std::string>& files) {
    std::lock_guard<std::mutex> update_lock(update_mutex_);
    reloads_.Increment();

    MultiError errors;
    std::vector<RuleFileInput> inputs;
    inputs.reserve(files.size());
    for (const auto& path : files) {
        std::ifstream in(path);
        if (!in) {
            errors.Add(MakeError(ErrorCode::kFilesystemError, absl::StrCat("read ", path)));
            continue;
        }
        // Opening a directory succeeds but reads nothing.
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            errors.Add(MakeError(ErrorCode::kFilesystemError,
                                 absl::StrCat("read ", path, ": is a directory")));
            continue;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        inputs.push_back(RuleFileInput{path, buffer.str()});
    }

    // Without a scratch directory nothing can be handed to the engines.
    auto scratch_status = partitioner_.PrepareScratchDir();
    if (!scratch_status.ok()) {
        errors.Add(scratch_status);
        reload_failures_.Increment();
        RULEMUX_LOG_ERROR("Rule reload aborted: {}", std::string_view(scratch_status.message().data(), scratch_status.message().size()));
        return errors.Err();
    }

    PartitionResult result = partitioner_.Partition(inputs);
    errors.Merge(result.errors);

    for (const auto& [strategy, scratch_files] : result.files_by_strategy) {
        if (engines_.count(strategy) == 0) {
            errors.Add(MakeError(ErrorCode::kMissingEngine,
                                 absl::StrCat("no engine found for strategy ",
                                              StrategyName(strategy))));
        }
    }

    // Engines synchronize internally; the index lock is only taken for the swap.
    auto previous = Snapshot();
    auto next = std::make_shared<FileIndex>();
    for (const auto& [strategy, engine] : engines_) {
        std::vector<std::string> scratch_files;
        auto it = result.files_by_strategy.find(strategy);
        if (it != result.files_by_strategy.end()) {
            scratch_files = it->second;
        }

        auto status = engine->Update(eval_interval, scratch_files);
        if (!status.ok()) {
            RULEMUX_LOG_ERROR("Updating rule engine {} failed: {}", StrategyName(strategy),
                              std::string_view(status.message().data(), status.message().size()));
            errors.Add(Annotate(status, absl::StrCat("strategy ", StrategyName(strategy))));

            auto kept = previous->active_files.find(strategy);
            if (kept != previous->active_files.end()) {
                next->active_files[strategy] = kept->second;
                for (const auto& file : kept->second) {
                    next->original_files[file] = OriginalFile(*previous, file);
                }
            }
            continue;
        }

        for (const auto& file : scratch_files) {
            next->original_files[file] = result.original_files[file];
        }
        next->active_files[strategy] = std::move(scratch_files);
    }

    {
        std::unique_lock<std::shared_mutex> lock(index_mutex_);
        file_index_ = std::move(next);
    }

    if (!errors.Empty()) {
        reload_failures_.Increment();
        RULEMUX_LOG_WARN("Reloaded {} rule files with {} errors", files.size(), errors.Size());
    } else {
        RULEMUX_LOG_INFO("Reloaded {} rule files", files.size());
    }
    return errors.Err();
}

std::vector<std::shared_ptr<Group>> Manager::RuleGroups() const {
    std::vector<std::shared_ptr<Group>> groups;
    for (const auto& [strategy, engine] : engines_) {
        auto engine_groups = engine->RuleGroups();
        groups.insert(groups.end(), engine_groups.begin(), engine_groups.end());
    }
    return groups;
}

std::vector<std::shared_ptr<AlertingRule>> Manager::AlertingRules() const {
    std::vector<std::shared_ptr<AlertingRule>> rules;
    for (const auto& [strategy, engine] : engines_) {
        auto engine_rules = engine->AlertingRules();
        rules.insert(rules.end(), engine_rules.begin(), engine_rules.end());
    }
    return rules;
}

absl::Status Manager::Rules(const v1::RulesRequest& request, RulesStream& stream) const {
    const auto index = Snapshot();
    const auto cancelled = [] {
        return MakeError(ErrorCode::kCancelled, "rules stream cancelled");
    };

    for (const auto& [strategy, engine] : engines_) {
        if (stream.IsCancelled()) {
            return cancelled();
        }
        for (const auto& group : engine->RuleGroups()) {
            if (stream.IsCancelled()) {
                return cancelled();
            }

            v1::RulesResponse response;
            auto* out = response.mutable_group();
            *out = GroupToProto(*group, OriginalFile(*index, group->File()));
            FilterRules(*out, request.type());

            RULEMUX_RETURN_IF_ERROR(stream.Send(response));
        }
    }
    return absl::OkStatus();
}

std::string Manager::OriginalFile(const Group& group) const {
    return OriginalFile(*Snapshot(), group.File());
}

std::vector<std::string> Manager::ActiveFiles(Strategy strategy) const {
    const auto index = Snapshot();
    auto it = index->active_files.find(strategy);
    if (it == index->active_files.end()) {
        return {};
    }
    return it->second;
}

void Manager::Run() {
    for (const auto& [strategy, engine] : engines_) {
        engine->Run();
    }
}

void Manager::Stop() {
    for (const auto& [strategy, engine] : engines_) {
        engine->Stop();
    }
}

void Manager::FilterRules(v1::RuleGroup& group, v1::RulesRequest::Type type) {
    if (type == v1::RulesRequest::ALL) {
        return;
    }
    google::protobuf::RepeatedPtrField<v1::Rule> rules;
    rules.Swap(group.mutable_rules());
    for (auto& rule : rules) {
        if (MatchesType(rule, type)) {
            group.add_rules()->Swap(&rule);
        }
    }
}

std::shared_ptr<const Manager::FileIndex> Manager::Snapshot() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return file_index_;
}

std::string Manager::OriginalFile(const FileIndex& index, const std::string& file) {
    auto it = index.original_files.find(file);
    if (it == index.original_files.end()) {
        return file;
    }
    return it->second;
}

}  // namespace rulemux::rules
