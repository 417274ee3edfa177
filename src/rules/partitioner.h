#pragma once

/// @file partitioner.h
/// @brief Splits user rule files into per-strategy scratch files

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <absl/status/status.h>

#include "common/error.h"
#include "rules/rule_file.h"
#include "rules/strategy.h"

namespace rulemux::rules {

/// @brief A rule file as read from disk
struct RuleFileInput {
    std::string path;
    std::string content;
};

/// @brief Output of one partitioning pass
struct PartitionResult {
    /// Scratch files written for each strategy, in input order
    std::map<Strategy, std::vector<std::string>> files_by_strategy;

    /// Scratch file path -> user rule file it was generated from
    std::map<std::string, std::string> original_files;

    /// Failures of individual files or strategy buckets; the rest were
    /// still partitioned
    MultiError errors;
};

/// @brief Writes the groups of each rule file into one scratch file per
/// strategy, dropping the strategy key
///
/// The scratch directory is owned by the partitioner and recreated empty on
/// every pass.
class Partitioner {
public:
    explicit Partitioner(std::filesystem::path scratch_dir);

    /// @brief Recreate the scratch directory
    /// @return kFilesystemError if the directory cannot be removed or created
    absl::Status PrepareScratchDir() const;

    /// @brief Partition `files`; per-file failures land in `errors`
    ///
    /// PrepareScratchDir must have succeeded first.
    PartitionResult Partition(const std::vector<RuleFileInput>& files) const;

    /// @brief Scratch file name for a (path, strategy) pair
    ///
    /// `<basename>.<hex sha256 of path>.<STRATEGY>`; stable across runs and
    /// distinct for files sharing a base name.
    static std::string ScratchFileName(const std::string& path, Strategy strategy);

    const std::filesystem::path& ScratchDir() const { return scratch_dir_; }

private:
    void PartitionFile(const RuleFileInput& file, PartitionResult& result) const;
    absl::Status WriteBucket(const std::string& path, Strategy strategy,
                             const std::vector<RuleGroupConfig>& bucket,
                             PartitionResult& result) const;

    std::filesystem::path scratch_dir_;
};

}  // namespace rulemux::rules
