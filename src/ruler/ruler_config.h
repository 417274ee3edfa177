#pragma once

/// @file ruler_config.h
/// @brief Ruler daemon configuration

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"

namespace rulemux::ruler {

/// Complete ruler configuration
///
/// YAML layout:
/// @code
///   data_dir: /var/lib/rulemux
///   eval_interval: 1m
///   rule_files: ["/etc/rulemux/rules/*.yaml"]
///   query:
///     endpoints: ["http://querier:9090"]
///     timeout: 30s
///   grpc: {address: "0.0.0.0:10901"}
///   http: {address: "0.0.0.0:10902"}
///   logging: {level: info, file: ""}
/// @endcode
struct RulerConfig {
    /// Working directory; holds the scratch rule files
    std::filesystem::path data_dir = "data";

    /// Evaluation interval of groups that do not set one
    std::chrono::milliseconds eval_interval{std::chrono::minutes(1)};

    /// Glob patterns of rule files, expanded on every reload
    std::vector<std::string> rule_files;

    struct Query {
        /// Prometheus-compatible query endpoints, tried in order
        std::vector<std::string> endpoints;
        std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    };
    Query query;

    struct Grpc {
        std::string address = "0.0.0.0:10901";
    };
    Grpc grpc;

    struct Http {
        std::string address = "0.0.0.0:10902";
    };
    Http http;

    struct Logging {
        std::string level = "info";

        /// Rotating log file; console only when empty
        std::string file;
    };
    Logging logging;

    /// Create default configuration
    static RulerConfig Default();

    /// Build from a loaded Config; missing keys keep their defaults
    static absl::StatusOr<RulerConfig> FromConfig(const Config& config);

    /// Load a YAML file (optional, may be empty) with environment overrides
    static absl::StatusOr<RulerConfig> Load(const std::string& path,
                                            std::string_view env_prefix = "RULEMUX_");

    /// Check value ranges
    absl::Status Validate() const;
};

/// @brief Expand rule file glob patterns into absolute paths
///
/// Patterns matching nothing contribute nothing. Results are sorted per
/// pattern and de-duplicated across patterns, keeping the first occurrence.
absl::StatusOr<std::vector<std::string>> ExpandRuleFiles(
    const std::vector<std::string>& patterns);

}  // namespace rulemux::ruler
