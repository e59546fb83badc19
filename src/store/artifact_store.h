#pragma once

/// @file artifact_store.h
/// @brief Session-scoped, versioned storage for pipeline artifacts

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "store/table.h"

namespace rootscope::store {

/// @brief Kind of persisted artifact
enum class ArtifactType {
    kTable,   ///< CSV file, extension "csv"
    kRecord   ///< JSON document, extension "json"
};

/// @brief Registry spelling of an artifact type ("table" / "record")
std::string_view ArtifactTypeToString(ArtifactType type);

/// @brief Identity of one pipeline run
struct SessionInfo {
    std::string session_id;               ///< e.g. "20261019T101502Z-3fa9c1"
    std::filesystem::path base_dir;
    std::filesystem::path session_dir;    ///< base_dir / session_id
    std::string created_at;               ///< RFC 3339, UTC
};

/// @brief Reference returned by a save call
struct ArtifactRef {
    std::string path;  ///< Relative to base_dir: "<session_id>/<name>.v<n>.<ext>"
    int version = 0;
};

/// @brief Registry entry for the latest version of a named artifact
struct ArtifactInfo {
    std::string name;
    ArtifactType type = ArtifactType::kRecord;
    std::string path;
    int version = 0;
    std::string created_at;

    // Tables only
    size_t rows = 0;
    size_t columns = 0;
    std::vector<std::string> column_names;
};

/// @brief Configuration for the artifact store
struct ArtifactStoreConfig {
    /// Root under which one directory per session is created
    std::filesystem::path base_dir = "flow_context";

    /// Registry document name inside the session directory
    std::string registry_file = "metadata.json";

    /// Attempts at finding an unused session directory
    int max_session_id_attempts = 16;
};

/// @brief Versioned hand-off of tables and records between pipeline stages
///
/// Layout: base_dir/session_id/{name}.v{n}.{csv|json} plus one registry
/// document (metadata.json) that is fully rewritten on every save.
///
/// Versions are per name and per artifact type, start at 1 and grow by one
/// with every save; a saved version is never rewritten. Saves of distinct
/// names may run concurrently. Concurrent saves of the same name must be
/// serialized by the caller.
///
/// Example usage:
/// @code
///   auto store = ArtifactStore::StartSession({.base_dir = "flow_context"});
///   if (!store.ok()) return store.status();
///
///   auto ref = (*store)->SaveTable("unified_dataset", table);
///   auto latest = (*store)->LoadTable("unified_dataset");
/// @endcode
class ArtifactStore {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Use StartSession
    ArtifactStore(PrivateTag, ArtifactStoreConfig config, SessionInfo session);
    ~ArtifactStore();

    // Disable copy
    ArtifactStore(const ArtifactStore&) = delete;
    ArtifactStore& operator=(const ArtifactStore&) = delete;

    /// @brief Create a new session directory and persist an empty registry
    static absl::StatusOr<std::unique_ptr<ArtifactStore>> StartSession(
        ArtifactStoreConfig config = {});

    const SessionInfo& Session() const { return session_; }

    // =========================================================================
    // Tables
    // =========================================================================

    /// @brief Save a table; version defaults to latest + 1
    ///
    /// A table without columns is rejected, it could not be read back.
    absl::StatusOr<ArtifactRef> SaveTable(const std::string& name,
                                          const Table& table,
                                          std::optional<int> version = std::nullopt);

    /// @brief Load a table; version defaults to the latest one
    ///
    /// A table whose single cell holds a path to another table file is
    /// treated as a stale cross-reference and the referenced file is loaded.
    absl::StatusOr<Table> LoadTable(const std::string& name,
                                    std::optional<int> version = std::nullopt) const;

    // =========================================================================
    // Records
    // =========================================================================

    absl::StatusOr<ArtifactRef> SaveRecord(const std::string& name,
                                           const nlohmann::json& record,
                                           std::optional<int> version = std::nullopt);

    absl::StatusOr<nlohmann::json> LoadRecord(const std::string& name,
                                              std::optional<int> version = std::nullopt) const;

    // =========================================================================
    // Registry
    // =========================================================================

    /// @brief Names present in the registry, sorted, optionally by type
    std::vector<std::string> ListArtifacts(
        std::optional<ArtifactType> type_filter = std::nullopt) const;

    /// @brief Registry entry for a name
    absl::StatusOr<ArtifactInfo> GetArtifactInfo(const std::string& name) const;

    /// @brief Highest stored version, NotFound if there is none
    absl::StatusOr<int> LatestVersion(const std::string& name, ArtifactType type) const;

    /// @brief "session/impact_ranking.v3.json" -> "impact_ranking"
    static std::string ResolveArtifactNameFromReference(std::string_view reference_path);

    /// @brief Absolute path of the registry document
    std::filesystem::path RegistryPath() const;

private:
    absl::Status ValidateName(const std::string& name) const;

    /// @brief Versions present on disk for name/type, ascending
    std::vector<int> ScanVersions(const std::string& name, ArtifactType type) const;

    /// @brief Pick the version to write and its target path
    absl::StatusOr<int> NextVersion(const std::string& name, ArtifactType type,
                                    std::optional<int> requested) const;

    /// @brief Resolve the file to read for name/type/version
    absl::StatusOr<std::filesystem::path> ResolveForLoad(
        const std::string& name, ArtifactType type, std::optional<int> version) const;

    std::filesystem::path ArtifactPath(const std::string& name, ArtifactType type,
                                       int version) const;

    /// @brief Follow a single-cell path reference, if the table is one
    absl::StatusOr<std::optional<Table>> FollowTableReference(
        const std::string& name, const Table& table) const;

    /// @brief Update the registry and rewrite the registry document
    absl::Status Register(ArtifactInfo info);

    /// @brief Requires mutex_ held
    absl::Status WriteRegistryLocked() const;

    ArtifactStoreConfig config_;
    SessionInfo session_;

    mutable std::mutex mutex_;
    std::map<std::string, ArtifactInfo> artifacts_;
};

}  // namespace rootscope::store
