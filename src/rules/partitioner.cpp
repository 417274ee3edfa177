/// @file partitioner.cpp
/// @brief Per-strategy rule file partitioning

#include "rules/partitioner.h"

#include <fstream>
#include <system_error>

#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>
#include <openssl/sha.h>

#include "common/logging.h"
#include "rules/rule_file.h"

namespace rulemux::rules {

namespace fs = std::filesystem;

Partitioner::Partitioner(fs::path scratch_dir) : scratch_dir_(std::move(scratch_dir)) {}

absl::Status Partitioner::PrepareScratchDir() const {
    std::error_code ec;
    fs::remove_all(scratch_dir_, ec);
    if (ec) {
        return MakeError(ErrorCode::kFilesystemError,
                         absl::StrCat("remove ", scratch_dir_.string(), ": ", ec.message()));
    }
    fs::create_directories(scratch_dir_, ec);
    if (ec) {
        return MakeError(ErrorCode::kFilesystemError,
                         absl::StrCat("create ", scratch_dir_.string(), ": ", ec.message()));
    }
    return absl::OkStatus();
}

PartitionResult Partitioner::Partition(const std::vector<RuleFileInput>& files) const {
    PartitionResult result;
    for (const auto& file : files) {
        PartitionFile(file, result);
    }
    return result;
}

void Partitioner::PartitionFile(const RuleFileInput& file, PartitionResult& result) const {
    auto groups = ParseRuleGroups(file.content, ParseMode::kWithStrategy);
    if (!groups.ok()) {
        RULEMUX_LOG_WARN("Skipping rule file {}: {}", file.path, std::string_view(groups.status().message().data(), groups.status().message().size()));
        result.errors.Add(Annotate(groups.status(), file.path));
        return;
    }

    std::map<Strategy, std::vector<RuleGroupConfig>> buckets;
    for (auto& group : *groups) {
        buckets[group.strategy].push_back(std::move(group));
    }

    // A failed bucket is skipped; the other strategies of the file still load.
    for (const auto& [strategy, bucket] : buckets) {
        auto status = WriteBucket(file.path, strategy, bucket, result);
        if (!status.ok()) {
            RULEMUX_LOG_WARN("Skipping {} groups of rule file {}: {}", StrategyName(strategy),
                             file.path, std::string_view(status.message().data(), status.message().size()));
            result.errors.Add(std::move(status));
        }
    }
}

absl::Status Partitioner::WriteBucket(const std::string& path, Strategy strategy,
                                      const std::vector<RuleGroupConfig>& bucket,
                                      PartitionResult& result) const {
    auto content = EmitRuleGroups(bucket);
    if (!content.ok()) {
        return Annotate(content.status(), path);
    }

    const fs::path scratch = scratch_dir_ / ScratchFileName(path, strategy);
    std::ofstream out(scratch, std::ios::out | std::ios::trunc);
    out << *content;
    out.close();
    if (!out) {
        return MakeError(ErrorCode::kFilesystemError,
                         absl::StrCat(path, ": write ", scratch.string()));
    }

    result.files_by_strategy[strategy].push_back(scratch.string());
    result.original_files[scratch.string()] = path;
    return absl::OkStatus();
}

std::string Partitioner::ScratchFileName(const std::string& path, Strategy strategy) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(path.data()), path.size(), digest);
    const std::string hex = absl::BytesToHexString(
        absl::string_view(reinterpret_cast<const char*>(digest), sizeof(digest)));
    return absl::StrCat(fs::path(path).filename().string(), ".", hex, ".",
                        StrategyName(strategy));
}

}  // namespace rulemux::rules
