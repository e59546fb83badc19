/// @file artifact_store.cpp
/// @brief Artifact store implementation

#include "store/artifact_store.h"

#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "common/error.h"
#include "common/logging.h"

namespace rootscope::store {

using json = nlohmann::json;

namespace {

std::string_view Extension(ArtifactType type) {
    return type == ArtifactType::kTable ? "csv" : "json";
}

std::string NowRfc3339() {
    return absl::FormatTime(absl::RFC3339_full, absl::Now(), absl::UTCTimeZone());
}

/// @brief Time-derived id with a random suffix so that sessions started in
///        the same second do not collide
std::string MakeSessionId() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFF);
    return absl::StrCat(
        absl::FormatTime("%Y%m%dT%H%M%SZ", absl::Now(), absl::UTCTimeZone()),
        "-", absl::StrFormat("%06x", dist(rng)));
}

absl::StatusOr<std::string> ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return InternalError(absl::StrCat("Cannot open file: ", path.string()));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

/// @brief Write to a sibling temp file then rename over the target
absl::Status WriteFileAtomically(const std::filesystem::path& path,
                                 std::string_view content) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return InternalError(absl::StrCat("Cannot open for writing: ", tmp.string()));
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            return InternalError(absl::StrCat("Failed writing: ", tmp.string()));
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        return InternalError(absl::StrCat("Failed to move ", tmp.string(), " to ",
                                          path.string(), ": ", ec.message()));
    }
    return absl::OkStatus();
}

/// @brief "name.v12.csv" -> 12 for the given name/extension
std::optional<int> ParseVersionedFilename(std::string_view filename,
                                          std::string_view name,
                                          std::string_view extension) {
    const std::string prefix = absl::StrCat(absl::string_view(name.data(), name.size()), ".v");
    const std::string suffix = absl::StrCat(".", absl::string_view(extension.data(), extension.size()));
    if (!absl::StartsWith(absl::string_view(filename.data(), filename.size()), prefix) || !absl::EndsWith(absl::string_view(filename.data(), filename.size()), suffix)) {
        return std::nullopt;
    }
    std::string_view digits = filename.substr(
        prefix.size(), filename.size() - prefix.size() - suffix.size());
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(),
                     [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    int version = 0;
    if (!absl::SimpleAtoi(absl::string_view(digits.data(), digits.size()), &version)) {
        return std::nullopt;
    }
    return version;
}

bool LooksLikeTablePath(std::string_view value) {
    return absl::StrContains(absl::string_view(value.data(), value.size()), '/') || absl::StrContains(absl::string_view(value.data(), value.size()), '\\') ||
           absl::EndsWithIgnoreCase(absl::string_view(value.data(), value.size()), ".csv");
}

json InfoToJson(const ArtifactInfo& info) {
    json entry;
    entry["type"] = std::string(ArtifactTypeToString(info.type));
    entry["path"] = info.path;
    entry["version"] = info.version;
    entry["created_at"] = info.created_at;
    if (info.type == ArtifactType::kTable) {
        entry["rows"] = info.rows;
        entry["columns"] = info.columns;
        entry["column_names"] = info.column_names;
    }
    return entry;
}

}  // namespace

std::string_view ArtifactTypeToString(ArtifactType type) {
    return type == ArtifactType::kTable ? "table" : "record";
}

// =============================================================================
// Session lifecycle
// =============================================================================

ArtifactStore::ArtifactStore(PrivateTag, ArtifactStoreConfig config, SessionInfo session)
    : config_(std::move(config)), session_(std::move(session)) {}

ArtifactStore::~ArtifactStore() = default;

absl::StatusOr<std::unique_ptr<ArtifactStore>> ArtifactStore::StartSession(
    ArtifactStoreConfig config) {
    std::error_code ec;
    std::filesystem::create_directories(config.base_dir, ec);
    if (ec) {
        return InternalError(absl::StrCat("Cannot create base directory ",
                                          config.base_dir.string(), ": ", ec.message()));
    }

    SessionInfo session;
    session.base_dir = config.base_dir;
    bool created = false;
    for (int attempt = 0; attempt < config.max_session_id_attempts && !created; ++attempt) {
        session.session_id = MakeSessionId();
        session.session_dir = config.base_dir / session.session_id;
        created = std::filesystem::create_directory(session.session_dir, ec);
        if (ec) {
            return InternalError(absl::StrCat("Cannot create session directory ",
                                              session.session_dir.string(), ": ",
                                              ec.message()));
        }
    }
    if (!created) {
        return MakeError(ErrorCode::kAlreadyExists,
                         "Could not allocate a unique session directory");
    }
    session.created_at = NowRfc3339();

    auto store = std::make_unique<ArtifactStore>(PrivateTag{}, std::move(config),
                                                 std::move(session));

    {
        // Persist the empty registry right away so the session is valid on disk
        std::lock_guard<std::mutex> lock(store->mutex_);
        ROOTSCOPE_RETURN_IF_ERROR(store->WriteRegistryLocked());
    }

    ROOTSCOPE_LOG_INFO("Artifact store session started: id={}, dir={}",
                       store->session_.session_id, store->session_.session_dir.string());
    return store;
}

std::filesystem::path ArtifactStore::RegistryPath() const {
    return session_.session_dir / config_.registry_file;
}

// =============================================================================
// Tables
// =============================================================================

absl::StatusOr<ArtifactRef> ArtifactStore::SaveTable(const std::string& name,
                                                     const Table& table,
                                                     std::optional<int> version) {
    ROOTSCOPE_RETURN_IF_ERROR(ValidateName(name));
    if (table.Empty()) {
        return InvalidArgumentError(absl::StrCat("Table '", name, "' has no columns"));
    }
    ROOTSCOPE_ASSIGN_OR_RETURN(int next, NextVersion(name, ArtifactType::kTable, version));

    const auto path = ArtifactPath(name, ArtifactType::kTable, next);
    // Re-create the session directory if it was removed underneath us
    std::error_code ec;
    std::filesystem::create_directories(session_.session_dir, ec);
    ROOTSCOPE_RETURN_IF_ERROR(WriteFileAtomically(path, WriteCsv(table)));

    ArtifactInfo info;
    info.name = name;
    info.type = ArtifactType::kTable;
    info.path = (std::filesystem::path(session_.session_id) / path.filename()).generic_string();
    info.version = next;
    info.created_at = NowRfc3339();
    info.rows = table.RowCount();
    info.columns = table.ColumnCount();
    info.column_names = table.ColumnNames();

    ArtifactRef ref{info.path, next};
    ROOTSCOPE_RETURN_IF_ERROR(Register(std::move(info)));

    ROOTSCOPE_LOG_DEBUG("Saved table '{}' v{} ({} rows x {} columns) -> {}",
                        name, next, table.RowCount(), table.ColumnCount(), ref.path);
    return ref;
}

absl::StatusOr<Table> ArtifactStore::LoadTable(const std::string& name,
                                               std::optional<int> version) const {
    ROOTSCOPE_RETURN_IF_ERROR(ValidateName(name));
    ROOTSCOPE_ASSIGN_OR_RETURN(auto path, ResolveForLoad(name, ArtifactType::kTable, version));
    ROOTSCOPE_ASSIGN_OR_RETURN(std::string content, ReadFile(path));

    auto table = ParseCsv(content);
    if (!table.ok()) {
        return CorruptError(absl::StrCat("Table artifact '", name, "' at ", path.string(),
                                         " is corrupt: ", table.status().message()));
    }

    ROOTSCOPE_ASSIGN_OR_RETURN(auto referenced, FollowTableReference(name, *table));
    if (referenced.has_value()) {
        return std::move(*referenced);
    }
    return table;
}

absl::StatusOr<std::optional<Table>> ArtifactStore::FollowTableReference(
    const std::string& name, const Table& table) const {
    if (table.ColumnCount() != 1 || table.RowCount() != 1) {
        return std::optional<Table>{};
    }
    const Column& column = table.Columns().front();
    if (column.IsNumeric() || !LooksLikeTablePath(column.text.front())) {
        return std::optional<Table>{};
    }

    const std::filesystem::path target(column.text.front());
    std::vector<std::filesystem::path> candidates;
    if (target.is_absolute()) {
        candidates.push_back(target);
    } else {
        candidates.push_back(session_.base_dir / target);
        candidates.push_back(session_.session_dir / target);
        candidates.push_back(target);
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(candidate, ec)) {
            continue;
        }
        ROOTSCOPE_LOG_WARN("Table artifact '{}' holds a file reference, loading {} instead",
                           name, candidate.string());
        auto resolved = ReadCsvFile(candidate);
        if (!resolved.ok()) {
            return CorruptError(absl::StrCat("Referenced table ", candidate.string(),
                                             " for artifact '", name, "' is corrupt: ",
                                             resolved.status().message()));
        }
        return std::optional<Table>(std::move(*resolved));
    }

    return FileNotFoundError(absl::StrCat("Table artifact '", name,
                                          "' references a missing file: ",
                                          column.text.front()));
}

// =============================================================================
// Records
// =============================================================================

absl::StatusOr<ArtifactRef> ArtifactStore::SaveRecord(const std::string& name,
                                                      const json& record,
                                                      std::optional<int> version) {
    ROOTSCOPE_RETURN_IF_ERROR(ValidateName(name));
    ROOTSCOPE_ASSIGN_OR_RETURN(int next, NextVersion(name, ArtifactType::kRecord, version));

    std::string content;
    try {
        content = record.dump(2);
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kSerializationError,
                         absl::StrCat("Cannot serialize record '", name, "': ", e.what()));
    }

    const auto path = ArtifactPath(name, ArtifactType::kRecord, next);
    std::error_code ec;
    std::filesystem::create_directories(session_.session_dir, ec);
    ROOTSCOPE_RETURN_IF_ERROR(WriteFileAtomically(path, content));

    ArtifactInfo info;
    info.name = name;
    info.type = ArtifactType::kRecord;
    info.path = (std::filesystem::path(session_.session_id) / path.filename()).generic_string();
    info.version = next;
    info.created_at = NowRfc3339();

    ArtifactRef ref{info.path, next};
    ROOTSCOPE_RETURN_IF_ERROR(Register(std::move(info)));

    ROOTSCOPE_LOG_DEBUG("Saved record '{}' v{} -> {}", name, next, ref.path);
    return ref;
}

absl::StatusOr<json> ArtifactStore::LoadRecord(const std::string& name,
                                               std::optional<int> version) const {
    ROOTSCOPE_RETURN_IF_ERROR(ValidateName(name));
    ROOTSCOPE_ASSIGN_OR_RETURN(auto path, ResolveForLoad(name, ArtifactType::kRecord, version));
    ROOTSCOPE_ASSIGN_OR_RETURN(std::string content, ReadFile(path));

    try {
        return json::parse(content);
    } catch (const json::parse_error& e) {
        return CorruptError(absl::StrCat("Record artifact '", name, "' at ", path.string(),
                                         " is corrupt: ", e.what()));
    }
}

// =============================================================================
// Registry
// =============================================================================

std::vector<std::string> ArtifactStore::ListArtifacts(
    std::optional<ArtifactType> type_filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, info] : artifacts_) {
        if (!type_filter.has_value() || info.type == *type_filter) {
            names.push_back(name);
        }
    }
    return names;
}

absl::StatusOr<ArtifactInfo> ArtifactStore::GetArtifactInfo(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = artifacts_.find(name);
    if (it == artifacts_.end()) {
        return MissingKeyError(absl::StrCat("No artifact named '", name, "' in session ",
                                            session_.session_id));
    }
    return it->second;
}

absl::StatusOr<int> ArtifactStore::LatestVersion(const std::string& name,
                                                 ArtifactType type) const {
    ROOTSCOPE_RETURN_IF_ERROR(ValidateName(name));
    auto versions = ScanVersions(name, type);
    if (versions.empty()) {
        return FileNotFoundError(absl::StrCat("No versions found for ",
                                              std::string(ArtifactTypeToString(type)), " '", name, "'"));
    }
    return versions.back();
}

std::string ArtifactStore::ResolveArtifactNameFromReference(std::string_view reference_path) {
    if (reference_path.empty()) {
        return "";
    }
    // Accept both separators regardless of the platform that wrote the path
    size_t slash = reference_path.find_last_of("/\\");
    std::string_view filename =
        slash == std::string_view::npos ? reference_path : reference_path.substr(slash + 1);

    // Artifact names never contain '.', so everything after the first dot is
    // version suffix and extension
    size_t dot = filename.find('.');
    return std::string(dot == std::string_view::npos ? filename : filename.substr(0, dot));
}

absl::Status ArtifactStore::Register(ArtifactInfo info) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string name = info.name;

    std::optional<ArtifactInfo> previous;
    auto it = artifacts_.find(name);
    if (it != artifacts_.end()) {
        // An explicit older version never displaces the latest entry
        if (it->second.type == info.type && info.version < it->second.version) {
            return absl::OkStatus();
        }
        previous = it->second;
    }

    artifacts_[name] = std::move(info);
    auto status = WriteRegistryLocked();
    if (!status.ok()) {
        if (previous.has_value()) {
            artifacts_[name] = std::move(*previous);
        } else {
            artifacts_.erase(name);
        }
    }
    return status;
}

absl::Status ArtifactStore::WriteRegistryLocked() const {
    std::string content;
    try {
        json doc;
        doc["session_id"] = session_.session_id;
        doc["created_at"] = session_.created_at;
        doc["artifacts"] = json::object();
        for (const auto& [name, info] : artifacts_) {
            doc["artifacts"][name] = InfoToJson(info);
        }
        // Column names come straight from CSV headers and may not be UTF-8
        content = doc.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kSerializationError,
                         absl::StrCat("Cannot serialize registry: ", e.what()));
    }

    std::error_code ec;
    std::filesystem::create_directories(session_.session_dir, ec);
    if (ec) {
        return InternalError(absl::StrCat("Cannot create session directory ",
                                          session_.session_dir.string(), ": ", ec.message()));
    }
    return WriteFileAtomically(RegistryPath(), content);
}

// =============================================================================
// Private helpers
// =============================================================================

absl::Status ArtifactStore::ValidateName(const std::string& name) const {
    if (name.empty()) {
        return InvalidArgumentError("Artifact name must not be empty");
    }
    for (char c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) {
            return InvalidArgumentError(absl::StrCat(
                "Artifact name '", name, "' may only contain letters, digits, '_' and '-'"));
        }
    }
    return absl::OkStatus();
}

std::filesystem::path ArtifactStore::ArtifactPath(const std::string& name,
                                                  ArtifactType type,
                                                  int version) const {
    return session_.session_dir / absl::StrCat(name, ".v", version, ".", std::string(Extension(type)));
}

std::vector<int> ArtifactStore::ScanVersions(const std::string& name,
                                             ArtifactType type) const {
    std::vector<int> versions;
    std::error_code ec;
    std::filesystem::directory_iterator it(session_.session_dir, ec);
    if (ec) {
        return versions;
    }
    // Other stages may be writing into the directory, so iterate without throwing
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const std::string filename = it->path().filename().string();
        if (auto version = ParseVersionedFilename(filename, name, Extension(type))) {
            versions.push_back(*version);
        }
    }
    std::sort(versions.begin(), versions.end());
    return versions;
}

absl::StatusOr<int> ArtifactStore::NextVersion(const std::string& name,
                                               ArtifactType type,
                                               std::optional<int> requested) const {
    if (!requested.has_value()) {
        auto versions = ScanVersions(name, type);
        return versions.empty() ? 1 : versions.back() + 1;
    }

    if (*requested < 1) {
        return InvalidArgumentError(absl::StrCat("Version must be >= 1, got ", *requested));
    }
    std::error_code ec;
    if (std::filesystem::exists(ArtifactPath(name, type, *requested), ec)) {
        return MakeError(ErrorCode::kAlreadyExists,
                         absl::StrCat("Version ", *requested, " of ",
                                      std::string(ArtifactTypeToString(type)), " '", name,
                                      "' already exists"));
    }
    return *requested;
}

absl::StatusOr<std::filesystem::path> ArtifactStore::ResolveForLoad(
    const std::string& name, ArtifactType type, std::optional<int> version) const {
    if (version.has_value()) {
        auto path = ArtifactPath(name, type, *version);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return FileNotFoundError(absl::StrCat("Version ", *version, " of ",
                                                  std::string(ArtifactTypeToString(type)), " '", name,
                                                  "' not found"));
        }
        return path;
    }

    ROOTSCOPE_ASSIGN_OR_RETURN(int latest, LatestVersion(name, type));
    return ArtifactPath(name, type, latest);
}

}  // namespace rootscope::store
