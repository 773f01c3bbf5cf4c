#pragma once

/// @file aggregator.h
/// @brief Distributor-quarter aggregation

#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "data/dataset.h"
#include "processor/analytics/distributor_quarter.h"
#include "processor/analytics/risk_classifier.h"

namespace invsense::analytics {

/// @brief Columns the aggregation needs in the input schema
const std::vector<std::string>& RequiredAggregationColumns();

/// @brief Build the distributor-quarter table from a normalized dataset
///
/// Groups records by (distributor, state, year, quarter), sums the four
/// measures and rounds the sums to 2 decimals. Records without a time key,
/// distributor id or state are dropped. Each row then gets its
/// pct_from_limit, its quarter-over-quarter waste change and its status.
///
/// @return SchemaError if any required column is missing
absl::StatusOr<DistributorQuarterTable> BuildDistributorQuarterTable(
    const data::Dataset& dataset,
    const RiskThresholds& thresholds = {});

}  // namespace invsense::analytics
