#pragma once

/// @file table.h
/// @brief Column-oriented observation table and its CSV codec

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace rootscope::store {

/// @brief Kind of values held by a column
enum class ColumnType {
    kNumeric,  ///< Doubles, NaN marks a missing cell
    kText      ///< Raw strings, never used by the statistics
};

/// @brief A named column of a Table
struct Column {
    std::string name;
    ColumnType type = ColumnType::kNumeric;

    /// Numeric cells (numeric columns only); NaN = missing
    std::vector<double> numbers;

    /// Text cells (text columns only)
    std::vector<std::string> text;

    size_t Size() const {
        return type == ColumnType::kNumeric ? numbers.size() : text.size();
    }

    bool IsNumeric() const { return type == ColumnType::kNumeric; }

    /// @brief Number of non-missing numeric cells (0 for text columns)
    size_t CountPresent() const;
};

/// @brief Rows x named columns; every column has the same row count
///
/// Tables are built column by column and are treated as immutable values
/// once handed to the statistics or the artifact store.
class Table {
public:
    Table() = default;

    /// @brief Append a numeric column
    /// @return AlreadyExists for a duplicate name, InvalidArgument for a
    ///         row-count mismatch or empty name
    absl::Status AddNumericColumn(std::string name, std::vector<double> values);

    /// @brief Append a text column
    absl::Status AddTextColumn(std::string name, std::vector<std::string> values);

    size_t RowCount() const { return rows_; }
    size_t ColumnCount() const { return columns_.size(); }
    bool Empty() const { return columns_.empty(); }

    const std::vector<Column>& Columns() const { return columns_; }
    std::vector<std::string> ColumnNames() const;
    std::vector<std::string> NumericColumnNames() const;

    /// @brief Find a column by exact name
    /// @return nullptr if absent
    const Column* FindColumn(std::string_view name) const;

    bool HasColumn(std::string_view name) const { return FindColumn(name) != nullptr; }

    /// @brief Structural equality; NaN cells compare equal to NaN cells
    bool operator==(const Table& other) const;
    bool operator!=(const Table& other) const { return !(*this == other); }

private:
    absl::Status CheckNewColumn(std::string_view name, size_t size) const;

    std::vector<Column> columns_;
    size_t rows_ = 0;
};

/// @brief Parse CSV text (header row + records) into a Table
///
/// A column is numeric when every non-empty cell parses as a number and no
/// data cell is quoted; empty cells become missing values. Quoted fields and a
/// leading UTF-8 BOM are accepted.
absl::StatusOr<Table> ParseCsv(std::string_view content);

/// @brief Serialize a Table as CSV with round-trip numeric precision
///
/// Text cells are always quoted. A table without rows carries no column
/// types and reads back as all-numeric.
std::string WriteCsv(const Table& table);

/// @brief Read and parse a CSV file
absl::StatusOr<Table> ReadCsvFile(const std::filesystem::path& path);

/// @brief Write a Table to a CSV file, replacing any existing file
absl::Status WriteCsvFile(const Table& table, const std::filesystem::path& path);

}  // namespace rootscope::store
