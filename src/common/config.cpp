#include "config.h"

#include <cstdlib>
#include <functional>
#include <type_traits>

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>

#include "common/error.h"

namespace rootscope {

namespace {

/// @brief Scalars keep their YAML spelling unless they read as bool or number
nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(YamlToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Scalar: {
            const std::string text = node.Scalar();
            int64_t as_int = 0;
            double as_double = 0.0;
            if (absl::SimpleAtoi(text, &as_int)) return as_int;
            if (absl::SimpleAtod(text, &as_double)) return as_double;
            if (text == "true") return true;
            if (text == "false") return false;
            return text;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return FileNotFoundError(
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
        std::string key = std::string(prefix) + suffix;
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    // Store settings
    if (auto val = get_env("STORE_BASE_DIR")) {
        config.Set("store.base_dir", *val);
    }

    // Analysis settings
    if (auto val = get_env("TOP_K")) {
        int64_t top_k = 0;
        if (!absl::SimpleAtoi(*val, &top_k) || top_k < 0) {
            return MakeError(ErrorCode::kConfigurationError,
                absl::StrCat("Invalid ", absl::string_view(prefix.data(), prefix.size()), "TOP_K: '", *val, "'"));
        }
        config.Set("analysis.top_k", top_k);
    }

    // Driver metadata
    if (auto val = get_env("METADATA_PATH")) {
        config.Set("metadata.path", *val);
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
                    // Clone so later merges into this tree leave other untouched
                    base[key] = YAML::Clone(kv.second);
                }
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    const std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    // Recurse over const nodes: assigning one YAML::Node handle to another
    // rebinds the shared node and would rewrite root_.
    std::function<std::optional<YAML::Node>(const YAML::Node&, size_t)> find;
    find = [&](const YAML::Node& node, size_t index) -> std::optional<YAML::Node> {
        if (index == parts.size()) {
            if (!node || node.IsNull()) {
                return std::nullopt;
            }
            return node;
        }
        if (!node || !node.IsMap()) {
            return std::nullopt;
        }
        return find(node[parts[index]], index + 1);
    };

    return find(root_, 0);
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
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    // yaml-cpp nodes are handles; walk with copies so that writes land in root_
    std::vector<YAML::Node> path{root_};
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node parent = path.back();
        if (!parent[parts[i]] || !parent[parts[i]].IsMap()) {
            parent[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        path.push_back(parent[parts[i]]);
    }
    YAML::Node target = path.back();

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            target[parts.back()] = seq;
        } else if constexpr (std::is_same_v<T, std::unordered_map<std::string, std::string>>) {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& [k, v] : val) {
                map[k] = v;
            }
            target[parts.back()] = map;
        } else {
            target[parts.back()] = val;
        }
    }, value);
}

nlohmann::json Config::ToJson() const {
    return YamlToJson(root_);
}

LogConfig MakeLogConfig(const Config& config) {
    LogConfig log_config;
    if (auto level = ParseLogLevel(config.GetString("logging.level", "info"))) {
        log_config.level = *level;
    }
    const std::string file = config.GetString("logging.file");
    if (!file.empty()) {
        log_config.enable_file = true;
        log_config.file_path = file;
    }
    return log_config;
}

}  // namespace rootscope
