#pragma once

/// @file table_input.h
/// @brief Tagged input accepted at the pipeline boundary

#include <optional>
#include <string>
#include <variant>

#include <absl/status/statusor.h>

#include "store/artifact_store.h"
#include "store/table.h"

namespace rootscope::store {

/// @brief An already materialized table
struct InlineTable {
    Table table;
};

/// @brief A table artifact in the current session
struct TableReference {
    std::string name;
    std::optional<int> version;  ///< Latest when unset
};

/// @brief CSV content not yet parsed
struct RawCsv {
    std::string content;
};

/// @brief What a caller may hand to the pipeline
using TableInput = std::variant<InlineTable, TableReference, RawCsv>;

/// @brief Resolve an input into a Table exactly once
///
/// A TableReference may also carry a stored reference path
/// ("session/unified_dataset.v2.csv"), which is reduced to its artifact name.
absl::StatusOr<Table> ResolveTableInput(const ArtifactStore& store, const TableInput& input);

/// @brief Short description for log lines ("inline", "reference:name", "csv")
std::string DescribeTableInput(const TableInput& input);

}  // namespace rootscope::store
