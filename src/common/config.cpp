#include "config.h"

#include <cstdlib>
#include <functional>
#include <type_traits>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "error.h"

namespace invsense {

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kConfigurationError,
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kConfigurationError,
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = absl::StrCat(prefix, suffix);
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }
    if (auto val = get_env("LOG_FILE")) {
        config.Set("logging.file", *val);
    }
    if (auto val = get_env("DATA_PATH")) {
        config.Set("data.path", *val);
    }
    if (auto val = get_env("TOP_RISKY_LIMIT")) {
        int64_t limit = 0;
        if (!absl::SimpleAtoi(*val, &limit) || limit <= 0) {
            return MakeError(ErrorCode::kConfigurationError,
                absl::StrCat(prefix, "TOP_RISKY_LIMIT must be a positive integer, got '",
                             *val, "'"));
        }
        config.Set("trend.top_risky_limit", limit);
    }

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                YAML::Node base_child = base[key];
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = kv.second;
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(key, '.');
    YAML::Node current = root_;

    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        // Lookups go through a const view; assigning to a YAML::Node handle
        // would rewrite the node it refers to.
        const YAML::Node& view = current;
        YAML::Node next = view[part];
        if (!next) {
            return std::nullopt;
        }
        current.reset(next);
    }

    if (current.IsNull()) {
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
    std::vector<std::string> parts = absl::StrSplit(key, '.');

    YAML::Node leaf = std::visit([](auto&& val) -> YAML::Node {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            return seq;
        } else {
            return YAML::Node(val);
        }
    }, value);

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    std::function<void(YAML::Node, size_t)> assign;
    assign = [&](YAML::Node node, size_t depth) {
        const std::string& part = parts[depth];
        if (depth + 1 == parts.size()) {
            node[part] = leaf;
            return;
        }
        if (!node[part].IsMap()) {
            node[part] = YAML::Node(YAML::NodeType::Map);
        }
        assign(node[part], depth + 1);
    };
    assign(root_, 0);
}

absl::StatusOr<Config> LoadLayeredConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix) {
    Config config;

    if (config_path.has_value()) {
        INVSENSE_ASSIGN_OR_RETURN(Config file_config, Config::LoadFromFile(*config_path));
        config.Merge(file_config);
    }

    INVSENSE_ASSIGN_OR_RETURN(Config env_config, Config::LoadFromEnvironment(env_prefix));
    config.Merge(env_config);

    return config;
}

}  // namespace invsense
