#pragma once

/// @file config.h
/// @brief Inventory Sense configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

namespace invsense {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// @brief Configuration manager backed by a YAML document
///
/// Keys use dot notation ("risk.high_risk_pct"). Later sources override
/// earlier ones through Merge(): file first, then environment.
class Config {
public:
    Config() = default;

    /// @brief Load configuration from a YAML file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load configuration from environment variables with a prefix
    ///
    /// Recognized variables (with the default prefix):
    /// INVSENSE_LOG_LEVEL, INVSENSE_LOG_FILE, INVSENSE_DATA_PATH,
    /// INVSENSE_TOP_RISKY_LIMIT.
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "INVSENSE_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Get a list of strings, empty if the key is absent or not a sequence
    std::vector<std::string> GetStringList(std::string_view key) const;

    bool HasKey(std::string_view key) const;

    void Set(std::string_view key, ConfigValue value);

    const YAML::Node& GetNode() const { return root_; }

private:
    YAML::Node root_;

    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

/// @brief Load file configuration (when a path is given) overlaid with the
///        environment
absl::StatusOr<Config> LoadLayeredConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix = "INVSENSE_");

}  // namespace invsense
