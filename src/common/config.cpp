#include "config.h"

#include <cstdlib>
#include <functional>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "duration.h"

namespace rulemux {

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = std::string(prefix) + suffix;
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto val = get_env("DATA_DIR")) {
        config.Set("data_dir", *val);
    }
    if (auto val = get_env("EVAL_INTERVAL")) {
        config.Set("eval_interval", *val);
    }
    if (auto val = get_env("RULE_FILES")) {
        std::vector<std::string> patterns = absl::StrSplit(*val, ',', absl::SkipEmpty());
        config.Set("rule_files", patterns);
    }

    // Query endpoints
    if (auto val = get_env("QUERY_ENDPOINTS")) {
        std::vector<std::string> endpoints = absl::StrSplit(*val, ',', absl::SkipEmpty());
        config.Set("query.endpoints", endpoints);
    }

    // Listen addresses
    if (auto val = get_env("GRPC_ADDRESS")) {
        config.Set("grpc.address", *val);
    }
    if (auto val = get_env("HTTP_ADDRESS")) {
        config.Set("http.address", *val);
    }

    // Log level
    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }

    return config;
}

void Config::Merge(const Config& other) {
    // Deep merge YAML nodes
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (overlay.IsMap()) {
            for (const auto& kv : overlay) {
                const std::string key = kv.first.as<std::string>();
                if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                    YAML::Node base_child = base[key];
                    merge_nodes(base_child, kv.second);
                } else {
                    base[key] = kv.second;
                }
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');
    YAML::Node current = YAML::Clone(root_);

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        current = current[part];
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<double>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::Exception&) {
            return default_value;
        }
    }
    return default_value;
}

absl::StatusOr<std::chrono::milliseconds> Config::GetDuration(
    std::string_view key, std::chrono::milliseconds default_value) const {
    auto node = GetNestedNode(key);
    if (!node || !node->IsScalar()) {
        return default_value;
    }
    auto parsed = ParseDuration(node->as<std::string>());
    if (!parsed.ok()) {
        return absl::InvalidArgumentError(
            absl::StrCat(absl::string_view(key.data(), key.size()), ": ", parsed.status().message()));
    }
    return *parsed;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    // yaml-cpp nodes are handles; assigning through operator[] keeps the
    // intermediate maps attached to root_.
    std::function<void(YAML::Node, size_t, const YAML::Node&)> assign;
    assign = [&](YAML::Node node, size_t index, const YAML::Node& leaf) {
        if (index + 1 == parts.size()) {
            node[parts[index]] = leaf;
            return;
        }
        if (!node[parts[index]] || !node[parts[index]].IsMap()) {
            node[parts[index]] = YAML::Node(YAML::NodeType::Map);
        }
        assign(node[parts[index]], index + 1, leaf);
    };

    YAML::Node leaf = std::visit([](auto&& val) -> YAML::Node {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            return seq;
        } else if constexpr (std::is_same_v<T, std::unordered_map<std::string, std::string>>) {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& [k, v] : val) {
                map[k] = v;
            }
            return map;
        } else {
            return YAML::Node(val);
        }
    }, value);

    if (!root_ || !root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    assign(root_, 0, leaf);
}

}  // namespace rulemux
