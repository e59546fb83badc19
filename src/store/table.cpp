/// @file table.cpp
/// @brief Table model and CSV codec implementation

#include "store/table.h"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

#include "common/error.h"

namespace rootscope::store {

namespace {

struct CsvField {
    std::string value;
    bool quoted = false;
};

std::string_view TrimBlanks(std::string_view value) {
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string_view::npos) return {};
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

/// @brief Split CSV text into records of fields (RFC 4180 quoting)
absl::StatusOr<std::vector<std::vector<CsvField>>> Tokenize(std::string_view content) {
    if (content.size() >= 3 && content.substr(0, 3) == "\xEF\xBB\xBF") {
        content.remove_prefix(3);
    }

    std::vector<std::vector<CsvField>> records;
    std::vector<CsvField> record;
    CsvField field;
    bool in_quotes = false;
    bool field_started = false;
    size_t line = 1;

    auto push_field = [&]() {
        if (!field.quoted) {
            field.value = std::string(TrimBlanks(field.value));
        }
        record.push_back(std::move(field));
        field = CsvField{};
        field_started = false;
    };
    auto push_record = [&]() {
        push_field();
        // Skip blank lines
        if (!(record.size() == 1 && !record[0].quoted && record[0].value.empty())) {
            records.push_back(std::move(record));
        }
        record.clear();
    };

    for (size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field.value += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field.value += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                if (field_started && !TrimBlanks(field.value).empty()) {
                    return InvalidArgumentError(
                        absl::StrCat("Unexpected quote inside unquoted field at line ", line));
                }
                field.value.clear();
                field.quoted = true;
                field_started = true;
                in_quotes = true;
                break;
            case ',':
                push_field();
                break;
            case '\r':
                break;
            case '\n':
                push_record();
                ++line;
                break;
            default:
                if (field.quoted) {
                    if (c != ' ' && c != '\t') {
                        return InvalidArgumentError(
                            absl::StrCat("Characters after closing quote at line ", line));
                    }
                    break;
                }
                field.value += c;
                field_started = true;
                break;
        }
    }

    if (in_quotes) {
        return InvalidArgumentError("Unterminated quoted field");
    }
    if (field_started || !record.empty()) {
        push_record();
    }
    return records;
}

bool ParseNumber(std::string_view text, double* out) {
    return absl::SimpleAtod(absl::string_view(text.data(), text.size()), out);
}

bool NeedsQuoting(std::string_view value) {
    if (value.empty()) return false;
    if (value.front() == ' ' || value.back() == ' ' ||
        value.front() == '\t' || value.back() == '\t') {
        return true;
    }
    return value.find_first_of(",\"\r\n") != std::string_view::npos;
}

std::string QuoteText(std::string_view value) {
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string QuoteField(std::string_view value) {
    return NeedsQuoting(value) ? QuoteText(value) : std::string(value);
}

std::string FormatNumber(double value) {
    if (std::isnan(value)) {
        return "";
    }
    return absl::StrFormat("%.17g", value);
}

}  // namespace

// =============================================================================
// Column / Table
// =============================================================================

size_t Column::CountPresent() const {
    if (!IsNumeric()) return 0;
    size_t present = 0;
    for (double v : numbers) {
        if (!std::isnan(v)) ++present;
    }
    return present;
}

absl::Status Table::CheckNewColumn(std::string_view name, size_t size) const {
    if (name.empty()) {
        return InvalidArgumentError("Column name must not be empty");
    }
    if (HasColumn(name)) {
        return MakeError(ErrorCode::kAlreadyExists,
                         absl::StrCat("Duplicate column absl::string_view(name.data(), name.size()): ", absl::string_view(name.data(), name.size())));
    }
    if (!columns_.empty() && size != rows_) {
        return InvalidArgumentError(absl::StrCat(
            "Column '", absl::string_view(name.data(), name.size()), "' has ", size, " rows, table has ", rows_));
    }
    return absl::OkStatus();
}

absl::Status Table::AddNumericColumn(std::string name, std::vector<double> values) {
    ROOTSCOPE_RETURN_IF_ERROR(CheckNewColumn(name, values.size()));
    rows_ = values.size();
    Column column;
    column.name = std::move(name);
    column.type = ColumnType::kNumeric;
    column.numbers = std::move(values);
    columns_.push_back(std::move(column));
    return absl::OkStatus();
}

absl::Status Table::AddTextColumn(std::string name, std::vector<std::string> values) {
    ROOTSCOPE_RETURN_IF_ERROR(CheckNewColumn(name, values.size()));
    rows_ = values.size();
    Column column;
    column.name = std::move(name);
    column.type = ColumnType::kText;
    column.text = std::move(values);
    columns_.push_back(std::move(column));
    return absl::OkStatus();
}

std::vector<std::string> Table::ColumnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.name);
    }
    return names;
}

std::vector<std::string> Table::NumericColumnNames() const {
    std::vector<std::string> names;
    for (const auto& column : columns_) {
        if (column.IsNumeric()) {
            names.push_back(column.name);
        }
    }
    return names;
}

const Column* Table::FindColumn(std::string_view name) const {
    for (const auto& column : columns_) {
        if (column.name == name) {
            return &column;
        }
    }
    return nullptr;
}

bool Table::operator==(const Table& other) const {
    if (rows_ != other.rows_ || columns_.size() != other.columns_.size()) {
        return false;
    }
    for (size_t c = 0; c < columns_.size(); ++c) {
        const Column& a = columns_[c];
        const Column& b = other.columns_[c];
        if (a.name != b.name || a.type != b.type) {
            return false;
        }
        if (a.IsNumeric()) {
            for (size_t r = 0; r < a.numbers.size(); ++r) {
                const double x = a.numbers[r];
                const double y = b.numbers[r];
                if (std::isnan(x) || std::isnan(y)) {
                    if (std::isnan(x) != std::isnan(y)) return false;
                } else if (x != y) {
                    return false;
                }
            }
        } else if (a.text != b.text) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// CSV codec
// =============================================================================

absl::StatusOr<Table> ParseCsv(std::string_view content) {
    ROOTSCOPE_ASSIGN_OR_RETURN(auto records, Tokenize(content));
    if (records.empty()) {
        return InvalidArgumentError("CSV content has no header row");
    }

    const auto& header = records.front();
    const size_t num_columns = header.size();
    const size_t num_rows = records.size() - 1;

    for (size_t r = 1; r < records.size(); ++r) {
        if (records[r].size() != num_columns) {
            return InvalidArgumentError(absl::StrCat(
                "CSV record ", r, " has ", records[r].size(),
                " fields, header has ", num_columns));
        }
    }

    Table table;
    for (size_t c = 0; c < num_columns; ++c) {
        std::vector<double> numbers;
        numbers.reserve(num_rows);
        bool numeric = true;

        for (size_t r = 1; r <= num_rows && numeric; ++r) {
            if (records[r][c].quoted) {
                numeric = false;
                break;
            }
            const std::string& cell = records[r][c].value;
            if (cell.empty()) {
                numbers.push_back(std::numeric_limits<double>::quiet_NaN());
                continue;
            }
            double value = 0.0;
            if (ParseNumber(cell, &value)) {
                numbers.push_back(value);
            } else {
                numeric = false;
            }
        }

        if (numeric) {
            ROOTSCOPE_RETURN_IF_ERROR(
                table.AddNumericColumn(header[c].value, std::move(numbers)));
        } else {
            std::vector<std::string> text;
            text.reserve(num_rows);
            for (size_t r = 1; r <= num_rows; ++r) {
                text.push_back(records[r][c].value);
            }
            ROOTSCOPE_RETURN_IF_ERROR(
                table.AddTextColumn(header[c].value, std::move(text)));
        }
    }

    return table;
}

std::string WriteCsv(const Table& table) {
    std::ostringstream out;

    std::vector<std::string> header;
    for (const auto& name : table.ColumnNames()) {
        header.push_back(QuoteField(name));
    }
    out << absl::StrJoin(header, ",") << "\n";

    const auto& columns = table.Columns();
    for (size_t r = 0; r < table.RowCount(); ++r) {
        for (size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) out << ',';
            const Column& column = columns[c];
            if (column.IsNumeric()) {
                std::string cell = FormatNumber(column.numbers[r]);
                // A lone empty cell would read back as a blank line
                if (cell.empty() && columns.size() == 1) {
                    cell = "nan";
                }
                out << cell;
            } else {
                // Always quoted so that "007" or "" stay text on the way back
                out << QuoteText(column.text[r]);
            }
        }
        out << "\n";
    }
    return out.str();
}

absl::StatusOr<Table> ReadCsvFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return FileNotFoundError(absl::StrCat("Cannot open CSV file: ", path.string()));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return ParseCsv(buffer.str());
}

absl::Status WriteCsvFile(const Table& table, const std::filesystem::path& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return InternalError(absl::StrCat("Cannot open for writing: ", path.string()));
    }
    out << WriteCsv(table);
    out.flush();
    if (!out) {
        return InternalError(absl::StrCat("Failed writing CSV file: ", path.string()));
    }
    return absl::OkStatus();
}

}  // namespace rootscope::store
