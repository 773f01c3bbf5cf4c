/// @file table.cpp
/// @brief Typed table implementation

#include "data/table.h"

#include <cmath>
#include <limits>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace invsense::data {

namespace {

bool IsFinite(double value) {
    return std::isfinite(value);
}

}  // namespace

Table::Table(std::vector<Column> columns) : columns_(std::move(columns)) {
    for (size_t i = 0; i < columns_.size(); ++i) {
        // First occurrence wins for duplicated headers
        index_.emplace(columns_[i].name, i);
    }
}

absl::Status Table::AddRow(std::vector<Cell> row) {
    if (row.size() != columns_.size()) {
        return InvalidArgumentError(absl::StrCat(
            "Row ", rows_.size(), " has ", row.size(), " cells, expected ",
            columns_.size()));
    }
    rows_.push_back(std::move(row));
    return absl::OkStatus();
}

std::optional<size_t> Table::ColumnIndex(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> Table::MissingColumns(
    const std::vector<std::string>& required) const {
    std::vector<std::string> missing;
    for (const auto& name : required) {
        if (!HasColumn(name)) {
            missing.push_back(name);
        }
    }
    return missing;
}

std::optional<double> Table::NumericAt(size_t row, size_t column) const {
    const Cell& cell = At(row, column);
    if (const auto* i = std::get_if<int64_t>(&cell)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&cell)) {
        if (!IsFinite(*d)) {
            return std::nullopt;
        }
        return *d;
    }
    if (const auto* s = std::get_if<std::string>(&cell)) {
        return ParseNumber(*s);
    }
    return std::nullopt;
}

std::optional<int64_t> Table::IntegerAt(size_t row, size_t column) const {
    const Cell& cell = At(row, column);
    if (const auto* i = std::get_if<int64_t>(&cell)) {
        return *i;
    }
    auto value = NumericAt(row, column);
    if (!value.has_value() || std::trunc(*value) != *value ||
        std::fabs(*value) > static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
    }
    return static_cast<int64_t>(*value);
}

std::optional<std::string> Table::StringAt(size_t row, size_t column) const {
    const Cell& cell = At(row, column);
    if (const auto* s = std::get_if<std::string>(&cell)) {
        return *s;
    }
    if (const auto* i = std::get_if<int64_t>(&cell)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&cell)) {
        if (!IsFinite(*d)) {
            return std::nullopt;
        }
        return absl::StrCat(*d);
    }
    return std::nullopt;
}

std::vector<size_t> Table::NumericColumnIndices() const {
    std::vector<size_t> indices;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].type == ColumnType::kInteger ||
            columns_[i].type == ColumnType::kFloat) {
            indices.push_back(i);
        }
    }
    return indices;
}

std::string ColumnTypeToString(ColumnType type) {
    switch (type) {
        case ColumnType::kInteger: return "integer";
        case ColumnType::kFloat: return "float";
        case ColumnType::kString: return "string";
        default: return "unknown";
    }
}

std::optional<double> ParseNumber(std::string_view text) {
    std::string_view trimmed = absl::StripAsciiWhitespace(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    if (!absl::SimpleAtod(trimmed, &value) || !IsFinite(value)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace invsense::data
