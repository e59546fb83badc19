#pragma once

/// @file driver_metadata.h
/// @brief Human-readable descriptions of driver columns

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace rootscope::analysis {

/// @brief Description of one driver
struct DriverMetadata {
    std::string description;
    std::string unit;
    std::optional<nlohmann::json> normal_range;  ///< Kept as given, e.g. [40, 60]
};

/// @brief Driver column name with the "value_" prefix removed
std::string DriverBaseName(std::string_view driver_name);

/// @brief Source of driver metadata used for ranking enrichment
class DriverMetadataProvider {
public:
    virtual ~DriverMetadataProvider() = default;

    /// @brief Metadata for a driver column, nullopt when unknown
    virtual std::optional<DriverMetadata> Lookup(std::string_view driver_name) const = 0;

    /// @brief "description (unit)" per driver, "Driver <base>" when unknown
    std::unordered_map<std::string, std::string> EnrichDriverNames(
        const std::vector<std::string>& driver_names) const;
};

/// @brief Provider backed by a JSON document
///
/// Expected shape:
/// @code
///   {"drivers": {"speed": {"description": "Line speed", "unit": "m/min",
///                          "normal_range": [40, 60]}}}
/// @endcode
/// Keys are base names, so "value_speed" resolves to "speed".
class JsonDriverMetadataProvider : public DriverMetadataProvider {
public:
    JsonDriverMetadataProvider() = default;

    /// @brief Build from an already parsed document
    static absl::StatusOr<JsonDriverMetadataProvider> FromJson(const nlohmann::json& doc);

    /// @brief Load from a file; FileNotFound if it does not exist
    static absl::StatusOr<JsonDriverMetadataProvider> LoadFromFile(
        const std::filesystem::path& path);

    std::optional<DriverMetadata> Lookup(std::string_view driver_name) const override;

    size_t Size() const { return drivers_.size(); }

private:
    std::unordered_map<std::string, DriverMetadata> drivers_;
};

}  // namespace rootscope::analysis
