#pragma once

/// @file dataset.h
/// @brief Normalized distributor transaction dataset

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>

#include "data/table.h"
#include "data/time_key.h"

namespace invsense::data {

// Column names of the upload boundary
inline constexpr char kDistributorIdColumn[] = "Distributor ID";
inline constexpr char kStateColumn[] = "US States";
inline constexpr char kMonthsColumn[] = "Months";
inline constexpr char kDeliveriesColumn[] = "Deliveries_Quantity";
inline constexpr char kReturnsColumn[] = "Returns_Quantity";
inline constexpr char kWasteAllowanceColumn[] = "Waste_Allowance_Quantity";
inline constexpr char kWasteColumn[] = "Waste_Quantity_Sum";

/// @brief One transactional row after coercion
///
/// Every field is nullable. Rows without a distributor id or a state never
/// take part in an aggregation; rows without a time key are left out of
/// quarter-keyed aggregation only.
struct RawRecord {
    std::optional<int64_t> distributor_id;
    std::optional<std::string> state;
    std::string month_label;
    std::optional<TimeKey> time_key;

    std::optional<double> deliveries;
    std::optional<double> returns;
    std::optional<double> waste_allowance;
    std::optional<double> waste;

    bool HasIdentity() const { return distributor_id.has_value() && state.has_value(); }
};

/// @brief Immutable dataset: the source table plus normalized records
class Dataset {
public:
    Dataset() = default;

    /// @brief Build records from a table, normalizing month labels
    ///
    /// Never fails: absent columns leave the matching record fields empty
    /// and computations that need them check the schema themselves.
    static Dataset FromTable(Table table);

    const Table& table() const { return table_; }
    const std::vector<RawRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }

    /// @brief Number of rows whose month label failed to parse
    size_t unparsed_month_labels() const { return unparsed_month_labels_; }

    /// @brief Fail with SchemaError naming every missing column
    absl::Status RequireColumns(const std::vector<std::string>& columns,
                                std::string_view purpose) const;

private:
    Table table_;
    std::vector<RawRecord> records_;
    size_t unparsed_month_labels_ = 0;
};

}  // namespace invsense::data
