/// @file aggregator.cpp
/// @brief Distributor-quarter aggregation implementation

#include "processor/analytics/aggregator.h"

#include <algorithm>
#include <map>
#include <tuple>

#include "common/error.h"
#include "common/logging.h"
#include "common/numeric.h"
#include "processor/analytics/trend_engine.h"

namespace invsense::analytics {

namespace {

using GroupKey = std::tuple<int64_t, std::string, int, data::Quarter>;

struct GroupSums {
    double deliveries = 0.0;
    double returns = 0.0;
    double waste_allowance = 0.0;
    double waste = 0.0;
};

void AddIfPresent(double& sum, const std::optional<double>& value) {
    if (value.has_value()) {
        sum += *value;
    }
}

}  // namespace

const std::vector<std::string>& RequiredAggregationColumns() {
    static const std::vector<std::string> kColumns = {
        data::kDistributorIdColumn,
        data::kStateColumn,
        data::kMonthsColumn,
        data::kDeliveriesColumn,
        data::kReturnsColumn,
        data::kWasteAllowanceColumn,
        data::kWasteColumn,
    };
    return kColumns;
}

absl::StatusOr<DistributorQuarterTable> BuildDistributorQuarterTable(
    const data::Dataset& dataset,
    const RiskThresholds& thresholds) {

    INVSENSE_RETURN_IF_ERROR(
        dataset.RequireColumns(RequiredAggregationColumns(), "Distributor-quarter build"));

    std::map<GroupKey, GroupSums> groups;
    size_t dropped = 0;

    for (const auto& record : dataset.records()) {
        if (!record.HasIdentity() || !record.time_key.has_value()) {
            ++dropped;
            continue;
        }
        GroupKey key{*record.distributor_id, *record.state,
                     record.time_key->year, record.time_key->quarter};
        GroupSums& sums = groups[key];
        AddIfPresent(sums.deliveries, record.deliveries);
        AddIfPresent(sums.returns, record.returns);
        AddIfPresent(sums.waste_allowance, record.waste_allowance);
        AddIfPresent(sums.waste, record.waste);
    }

    DistributorQuarterTable table;
    table.reserve(groups.size());
    for (const auto& [key, sums] : groups) {
        DistributorQuarterAggregate row;
        row.distributor_id = std::get<0>(key);
        row.state = std::get<1>(key);
        row.year = std::get<2>(key);
        row.quarter = std::get<3>(key);
        row.total_deliveries = RoundDecimals(sums.deliveries, 2);
        row.total_returns = RoundDecimals(sums.returns, 2);
        row.total_waste_allowance = RoundDecimals(sums.waste_allowance, 2);
        row.total_waste = RoundDecimals(sums.waste, 2);
        row.pct_from_limit = ComputePctFromLimit(row.total_waste, row.total_waste_allowance);
        table.push_back(std::move(row));
    }

    // Group order is (distributor, state, year, quarter); re-sort so each
    // distributor's quarters are consecutive and chronological.
    std::stable_sort(table.begin(), table.end(),
        [](const DistributorQuarterAggregate& a, const DistributorQuarterAggregate& b) {
            return std::tie(a.distributor_id, a.year, a.quarter) <
                   std::tie(b.distributor_id, b.year, b.quarter);
        });

    ApplyQuarterOverQuarterChange(table);

    for (auto& row : table) {
        row.status = ClassifyRisk(row.pct_from_limit, row.pct_change_from_prior_quarter,
                                  thresholds);
    }

    INVSENSE_LOG_DEBUG("Built distributor-quarter table: {} rows from {} records ({} dropped)",
                       table.size(), dataset.size(), dropped);
    return table;
}

}  // namespace invsense::analytics
