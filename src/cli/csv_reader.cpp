/// @file csv_reader.cpp
/// @brief CSV reader implementation

#include "cli/csv_reader.h"

#include <cstdint>
#include <fstream>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/strip.h>

#include "common/error.h"
#include "common/logging.h"

namespace invsense::cli {

namespace {

constexpr char kFeatureColumn[] = "feature";
constexpr char kImportanceColumn[] = "importance";

data::Cell ToCell(const std::string& raw, data::ColumnType type) {
    if (raw.empty()) {
        return std::monostate{};
    }
    switch (type) {
        case data::ColumnType::kInteger: {
            int64_t value = 0;
            if (absl::SimpleAtoi(raw, &value)) {
                return value;
            }
            return std::monostate{};
        }
        case data::ColumnType::kFloat: {
            auto value = data::ParseNumber(raw);
            if (value.has_value()) {
                return *value;
            }
            return std::monostate{};
        }
        case data::ColumnType::kString:
        default:
            return raw;
    }
}

}  // namespace

std::vector<std::string> ParseCsvRecord(std::istream& in, char delimiter, bool* malformed) {
    if (malformed) *malformed = false;
    if (in.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string value;
    bool in_quotes = false;
    bool field_quoted = false;

    auto push_field = [&]() {
        row.push_back(field_quoted ? value : std::string(absl::StripAsciiWhitespace(value)));
        value.clear();
        field_quoted = false;
    };

    char c;
    while (in.get(c)) {
        if (in_quotes) {
            if (c == '"') {
                if (in.peek() == '"') {
                    in.get();
                    value += '"';
                } else {
                    in_quotes = false;
                }
            } else if (c == '\r') {
                if (in.peek() == '\n') in.get();
                value += '\n';
            } else {
                value += c;
            }
            continue;
        }

        if (c == '"' && absl::StripAsciiWhitespace(value).empty()) {
            value.clear();
            in_quotes = true;
            field_quoted = true;
        } else if (c == delimiter) {
            push_field();
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && in.peek() == '\n') in.get();
            push_field();
            return row;
        } else {
            value += c;
        }
    }

    if (in_quotes && malformed) {
        *malformed = true;
    }
    push_field();
    return row;
}

data::ColumnType InferColumnType(const std::vector<std::string>& cells) {
    bool all_integer = true;
    bool all_numeric = true;
    for (const auto& cell : cells) {
        if (cell.empty()) {
            continue;
        }
        int64_t integer = 0;
        if (!absl::SimpleAtoi(cell, &integer)) {
            all_integer = false;
        }
        if (!data::ParseNumber(cell).has_value()) {
            all_numeric = false;
            break;
        }
    }
    if (all_numeric && all_integer) {
        return data::ColumnType::kInteger;
    }
    return all_numeric ? data::ColumnType::kFloat : data::ColumnType::kString;
}

absl::StatusOr<data::Table> ReadCsv(std::istream& in, char delimiter) {
    bool malformed = false;
    std::vector<std::string> header = ParseCsvRecord(in, delimiter, &malformed);
    if (header.empty() || malformed) {
        return ParseError("CSV input has no header row");
    }

    std::vector<std::vector<std::string>> records;
    size_t line = 1;
    while (in.peek() != EOF) {
        ++line;
        std::vector<std::string> record = ParseCsvRecord(in, delimiter, &malformed);
        if (malformed) {
            return ParseError(absl::StrCat("Unterminated quoted field in record ", line));
        }
        if (record.empty() || (record.size() == 1 && record[0].empty())) {
            continue;
        }
        if (record.size() > header.size()) {
            return ParseError(absl::StrCat("Record ", line, " has ", record.size(),
                                           " fields, header has ", header.size()));
        }
        record.resize(header.size());
        records.push_back(std::move(record));
    }

    std::vector<data::Column> columns;
    columns.reserve(header.size());
    for (size_t col = 0; col < header.size(); ++col) {
        std::vector<std::string> cells;
        cells.reserve(records.size());
        for (const auto& record : records) {
            cells.push_back(record[col]);
        }
        columns.push_back({header[col], InferColumnType(cells)});
    }

    data::Table table(columns);
    for (const auto& record : records) {
        std::vector<data::Cell> row;
        row.reserve(record.size());
        for (size_t col = 0; col < record.size(); ++col) {
            row.push_back(ToCell(record[col], columns[col].type));
        }
        INVSENSE_RETURN_IF_ERROR(table.AddRow(std::move(row)));
    }
    return table;
}

absl::StatusOr<data::Table> ReadCsvFile(const std::filesystem::path& path, char delimiter) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return NotFoundError(absl::StrCat("Cannot open CSV file: ", path.string()));
    }
    auto table = ReadCsv(file, delimiter);
    if (table.ok()) {
        INVSENSE_LOG_DEBUG("Read {} rows x {} columns from {}",
                           table->num_rows(), table->num_columns(), path.string());
    }
    return table;
}

absl::StatusOr<std::vector<rca::FeatureImportance>> ReadFeatureImportances(
    const std::filesystem::path& path) {
    INVSENSE_ASSIGN_OR_RETURN(data::Table table, ReadCsvFile(path));

    auto feature_col = table.ColumnIndex(kFeatureColumn);
    auto importance_col = table.ColumnIndex(kImportanceColumn);
    if (!feature_col || !importance_col) {
        return SchemaError(absl::StrCat("Importance file needs columns '", kFeatureColumn,
                                        "' and '", kImportanceColumn, "'"));
    }

    std::vector<rca::FeatureImportance> importances;
    importances.reserve(table.num_rows());
    for (size_t row = 0; row < table.num_rows(); ++row) {
        auto feature = table.StringAt(row, *feature_col);
        auto importance = table.NumericAt(row, *importance_col);
        if (!feature.has_value() || !importance.has_value()) {
            return ParseError(absl::StrCat("Invalid importance row ", row + 1));
        }
        importances.push_back({*feature, *importance});
    }
    return importances;
}

}  // namespace invsense::cli
