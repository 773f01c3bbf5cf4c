#pragma once

/// @file table.h
/// @brief Row-oriented typed table handed over by the upload boundary

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/status.h>

namespace invsense::data {

/// @brief Declared type of a column
enum class ColumnType {
    kInteger,
    kFloat,
    kString
};

/// @brief A single cell: empty, integer, float or string
using Cell = std::variant<std::monostate, int64_t, double, std::string>;

/// @brief Column metadata
struct Column {
    std::string name;
    ColumnType type = ColumnType::kString;
};

/// @brief In-memory table with a fixed schema
///
/// The schema is set at construction and rows are appended afterwards.
/// Accessors coerce cells on read: numeric reads turn non-numeric strings
/// and NaN into nullopt instead of failing.
class Table {
public:
    Table() = default;
    explicit Table(std::vector<Column> columns);

    /// @brief Append a row; fails if the cell count does not match the schema
    absl::Status AddRow(std::vector<Cell> row);

    const std::vector<Column>& columns() const { return columns_; }
    size_t num_columns() const { return columns_.size(); }
    size_t num_rows() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    std::optional<size_t> ColumnIndex(std::string_view name) const;
    bool HasColumn(std::string_view name) const { return ColumnIndex(name).has_value(); }

    /// @brief Names from `required` that are not present in the schema
    std::vector<std::string> MissingColumns(const std::vector<std::string>& required) const;

    const Cell& At(size_t row, size_t column) const { return rows_[row][column]; }

    /// @brief Cell as a finite double, nullopt if empty or not numeric
    std::optional<double> NumericAt(size_t row, size_t column) const;

    /// @brief Cell as an integer, nullopt unless it holds an integral value
    std::optional<int64_t> IntegerAt(size_t row, size_t column) const;

    /// @brief Cell rendered as text, nullopt if empty
    std::optional<std::string> StringAt(size_t row, size_t column) const;

    /// @brief Indices of integer and float columns in schema order
    std::vector<size_t> NumericColumnIndices() const;

private:
    std::vector<Column> columns_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::vector<Cell>> rows_;
};

/// @brief Convert column type to string
std::string ColumnTypeToString(ColumnType type);

/// @brief Coerce a free-form string into a finite double
std::optional<double> ParseNumber(std::string_view text);

}  // namespace invsense::data
