#pragma once

/// @file config.h
/// @brief rootscope configuration management

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "common/logging.h"

namespace rootscope {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>,
    std::unordered_map<std::string, std::string>
>;

/// @brief Configuration manager for loading and accessing configuration
///
/// Recognized keys:
/// - store.base_dir            Artifact store root (default "flow_context")
/// - analysis.top_k            Ranking truncation, 0 keeps all (default 10)
/// - analysis.parallel_branches Run correlation and outliers concurrently
/// - metadata.path             Driver metadata JSON file (optional)
/// - logging.level / logging.file
class Config {
public:
    /// @brief Default constructor creates empty configuration
    Config() = default;

    /// @brief Load configuration from a YAML file
    /// @param path Path to the YAML configuration file
    /// @return Status indicating success or failure
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    /// @param yaml_content YAML content as a string
    /// @return Status indicating success or failure
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load configuration from environment variables with a prefix
    /// @param prefix Environment variable prefix (e.g., "ROOTSCOPE_")
    /// @return Configuration loaded from environment
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "ROOTSCOPE_");

    /// @brief Merge another configuration into this one (other takes precedence)
    /// @param other Configuration to merge
    void Merge(const Config& other);

    /// @brief Get a string value
    /// @param key Configuration key (supports dot notation, e.g., "store.base_dir")
    /// @param default_value Default value if key not found
    /// @return Configuration value or default
    std::string GetString(std::string_view key, std::string_view default_value = "") const;

    /// @brief Get an integer value
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;

    /// @brief Get a double value
    double GetDouble(std::string_view key, double default_value = 0.0) const;

    /// @brief Get a boolean value
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Get a list of strings
    /// @return List of strings or empty vector if not found
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief Check if a key exists
    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value
    void Set(std::string_view key, ConfigValue value);

    /// @brief Get the underlying YAML node for advanced access
    const YAML::Node& GetNode() const { return root_; }

    /// @brief Export configuration to JSON
    nlohmann::json ToJson() const;

private:
    YAML::Node root_;

    /// @brief Navigate to a nested node using dot notation
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

/// @brief Build the logging configuration from "logging.*" keys
LogConfig MakeLogConfig(const Config& config);

}  // namespace rootscope
