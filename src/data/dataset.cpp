/// @file dataset.cpp
/// @brief Dataset normalization

#include "data/dataset.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"

namespace invsense::data {

Dataset Dataset::FromTable(Table table) {
    Dataset dataset;
    dataset.table_ = std::move(table);
    const Table& t = dataset.table_;

    const auto id_col = t.ColumnIndex(kDistributorIdColumn);
    const auto state_col = t.ColumnIndex(kStateColumn);
    const auto months_col = t.ColumnIndex(kMonthsColumn);
    const auto deliveries_col = t.ColumnIndex(kDeliveriesColumn);
    const auto returns_col = t.ColumnIndex(kReturnsColumn);
    const auto allowance_col = t.ColumnIndex(kWasteAllowanceColumn);
    const auto waste_col = t.ColumnIndex(kWasteColumn);

    auto numeric = [&t](size_t row, const std::optional<size_t>& col) -> std::optional<double> {
        if (!col.has_value()) {
            return std::nullopt;
        }
        return t.NumericAt(row, *col);
    };

    dataset.records_.reserve(t.num_rows());
    for (size_t row = 0; row < t.num_rows(); ++row) {
        RawRecord record;
        if (id_col) {
            record.distributor_id = t.IntegerAt(row, *id_col);
        }
        if (state_col) {
            record.state = t.StringAt(row, *state_col);
        }
        if (months_col) {
            record.month_label = t.StringAt(row, *months_col).value_or("");
            auto key = ParseMonthLabel(record.month_label);
            if (key.ok()) {
                record.time_key = *key;
            } else {
                ++dataset.unparsed_month_labels_;
            }
        }
        record.deliveries = numeric(row, deliveries_col);
        record.returns = numeric(row, returns_col);
        record.waste_allowance = numeric(row, allowance_col);
        record.waste = numeric(row, waste_col);
        dataset.records_.push_back(std::move(record));
    }

    if (dataset.unparsed_month_labels_ > 0) {
        INVSENSE_LOG_DEBUG("{} of {} rows have an unparseable month label",
                           dataset.unparsed_month_labels_, t.num_rows());
    }

    return dataset;
}

absl::Status Dataset::RequireColumns(const std::vector<std::string>& columns,
                                     std::string_view purpose) const {
    auto missing = table_.MissingColumns(columns);
    if (missing.empty()) {
        return absl::OkStatus();
    }
    return SchemaError(absl::StrCat(purpose, ": missing required columns [",
                                    absl::StrJoin(missing, ", "), "]"));
}

}  // namespace invsense::data
