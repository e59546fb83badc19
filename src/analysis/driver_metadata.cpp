/// @file driver_metadata.cpp
/// @brief Driver metadata providers

#include "analysis/driver_metadata.h"

#include <fstream>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace rootscope::analysis {

using json = nlohmann::json;

namespace {
constexpr std::string_view kValuePrefix = "value_";
}  // namespace

std::string DriverBaseName(std::string_view driver_name) {
    if (absl::StartsWith(absl::string_view(driver_name.data(), driver_name.size()), absl::string_view(kValuePrefix.data(), kValuePrefix.size()))) {
        driver_name.remove_prefix(kValuePrefix.size());
    }
    return std::string(driver_name);
}

std::unordered_map<std::string, std::string> DriverMetadataProvider::EnrichDriverNames(
    const std::vector<std::string>& driver_names) const {
    std::unordered_map<std::string, std::string> enriched;
    for (const auto& name : driver_names) {
        auto metadata = Lookup(name);
        std::string description = metadata && !metadata->description.empty()
                                      ? metadata->description
                                      : absl::StrCat("Driver ", DriverBaseName(name));
        if (metadata && !metadata->unit.empty()) {
            enriched[name] = absl::StrCat(description, " (", metadata->unit, ")");
        } else {
            enriched[name] = std::move(description);
        }
    }
    return enriched;
}

absl::StatusOr<JsonDriverMetadataProvider> JsonDriverMetadataProvider::FromJson(
    const json& doc) {
    JsonDriverMetadataProvider provider;
    if (!doc.is_object() || !doc.contains("drivers")) {
        return provider;
    }
    const json& drivers = doc["drivers"];
    if (!drivers.is_object()) {
        return TypeMismatchError("Driver metadata 'drivers' must be an object");
    }

    try {
        for (const auto& [name, entry] : drivers.items()) {
            if (!entry.is_object()) {
                ROOTSCOPE_LOG_WARN("Ignoring driver metadata for '{}': not an object", name);
                continue;
            }
            DriverMetadata metadata;
            metadata.description = entry.value("description", "");
            metadata.unit = entry.value("unit", "");
            if (entry.contains("normal_range") && !entry["normal_range"].is_null()) {
                metadata.normal_range = entry["normal_range"];
            }
            provider.drivers_.emplace(name, std::move(metadata));
        }
    } catch (const json::exception& e) {
        return TypeMismatchError(absl::StrCat("Invalid driver metadata: ", e.what()));
    }
    return provider;
}

absl::StatusOr<JsonDriverMetadataProvider> JsonDriverMetadataProvider::LoadFromFile(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return FileNotFoundError(absl::StrCat("Driver metadata file not found: ", path.string()));
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        return CorruptError(absl::StrCat("Driver metadata file ", path.string(),
                                         " is not valid JSON: ", e.what()));
    }

    ROOTSCOPE_ASSIGN_OR_RETURN(auto provider, FromJson(doc));
    ROOTSCOPE_LOG_INFO("Loaded metadata for {} driver(s) from {}", provider.Size(),
                       path.string());
    return provider;
}

std::optional<DriverMetadata> JsonDriverMetadataProvider::Lookup(
    std::string_view driver_name) const {
    auto it = drivers_.find(DriverBaseName(driver_name));
    if (it == drivers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace rootscope::analysis
