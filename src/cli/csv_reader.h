#pragma once

/// @file csv_reader.h
/// @brief CSV input for the command line tool

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "data/table.h"
#include "processor/rca/root_cause.h"

namespace invsense::cli {

/// @brief Read one CSV record, honouring double-quoted fields
///
/// A quoted field may contain the delimiter, doubled quotes and line
/// breaks. Unquoted fields are trimmed.
/// @param malformed Set when the stream ends inside a quoted field
/// @return Empty vector at end of stream
std::vector<std::string> ParseCsvRecord(std::istream& in, char delimiter, bool* malformed);

/// @brief Infer a column type from its raw cells; empty cells are ignored
///
/// Integer if every cell parses as an integer, float if every cell parses
/// as a number, string otherwise. A column with no values is float.
data::ColumnType InferColumnType(const std::vector<std::string>& cells);

/// @brief Parse CSV text with a header row into a typed table
/// @return ParseError for a malformed record or a record with extra fields
absl::StatusOr<data::Table> ReadCsv(std::istream& in, char delimiter = ',');

/// @brief Read a CSV file
/// @return NotFoundError if the file cannot be opened
absl::StatusOr<data::Table> ReadCsvFile(const std::filesystem::path& path,
                                        char delimiter = ',');

/// @brief Read "feature,importance" rows
/// @return SchemaError without both columns, ParseError for a bad importance
absl::StatusOr<std::vector<rca::FeatureImportance>> ReadFeatureImportances(
    const std::filesystem::path& path);

}  // namespace invsense::cli
