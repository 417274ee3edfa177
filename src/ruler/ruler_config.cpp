/// @file ruler_config.cpp
/// @brief Ruler daemon configuration loading

#include "ruler/ruler_config.h"

#include <glob.h>

#include <algorithm>
#include <set>

#include <absl/strings/str_cat.h>

#include "common/duration.h"
#include "common/error.h"

namespace rulemux::ruler {

RulerConfig RulerConfig::Default() {
    return RulerConfig{};
}

absl::StatusOr<RulerConfig> RulerConfig::FromConfig(const Config& config) {
    RulerConfig out = Default();

    out.data_dir = config.GetString("data_dir", out.data_dir.string());
    RULEMUX_ASSIGN_OR_RETURN(out.eval_interval,
                             config.GetDuration("eval_interval", out.eval_interval));

    if (config.HasKey("rule_files")) {
        out.rule_files = config.GetStringList("rule_files");
    }

    // Query section
    if (config.HasKey("query.endpoints")) {
        out.query.endpoints = config.GetStringList("query.endpoints");
    }
    RULEMUX_ASSIGN_OR_RETURN(out.query.timeout,
                             config.GetDuration("query.timeout", out.query.timeout));

    // Listen addresses
    out.grpc.address = config.GetString("grpc.address", out.grpc.address);
    out.http.address = config.GetString("http.address", out.http.address);

    // Logging
    out.logging.level = config.GetString("logging.level", out.logging.level);
    out.logging.file = config.GetString("logging.file", out.logging.file);

    RULEMUX_RETURN_IF_ERROR(out.Validate());
    return out;
}

absl::StatusOr<RulerConfig> RulerConfig::Load(const std::string& path,
                                              std::string_view env_prefix) {
    Config config;
    if (!path.empty()) {
        RULEMUX_ASSIGN_OR_RETURN(config, Config::LoadFromFile(path));
    }
    config.Merge(Config::LoadFromEnvironment(env_prefix));
    return FromConfig(config);
}

absl::Status RulerConfig::Validate() const {
    if (data_dir.empty()) {
        return MakeError(ErrorCode::kConfigurationError, "data_dir must not be empty");
    }
    if (eval_interval <= std::chrono::milliseconds::zero()) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("eval_interval must be positive, got ",
                                      FormatDuration(eval_interval)));
    }
    if (query.timeout <= std::chrono::milliseconds::zero()) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("query.timeout must be positive, got ",
                                      FormatDuration(query.timeout)));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::vector<std::string>> ExpandRuleFiles(
    const std::vector<std::string>& patterns) {
    std::vector<std::string> files;
    std::set<std::string> seen;

    for (const auto& pattern : patterns) {
        glob_t matches{};
        const int rc = glob(pattern.c_str(), 0, nullptr, &matches);
        if (rc != 0 && rc != GLOB_NOMATCH) {
            globfree(&matches);
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("expanding rule file pattern ", pattern,
                                          " failed (", rc, ")"));
        }

        std::vector<std::string> expanded;
        for (size_t i = 0; i < matches.gl_pathc; ++i) {
            expanded.push_back(std::filesystem::absolute(matches.gl_pathv[i]).string());
        }
        globfree(&matches);

        std::sort(expanded.begin(), expanded.end());
        for (auto& file : expanded) {
            if (seen.insert(file).second) {
                files.push_back(std::move(file));
            }
        }
    }
    return files;
}

}  // namespace rulemux::ruler
