#pragma once

/// @file distributor_quarter.h
/// @brief Distributor-quarter aggregate rows

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "data/time_key.h"
#include "processor/analytics/risk_classifier.h"

namespace invsense::analytics {

/// @brief One summarized row per (distributor, state, year, quarter)
struct DistributorQuarterAggregate {
    int64_t distributor_id = 0;
    std::string state;
    int year = 0;
    data::Quarter quarter = data::Quarter::kQ1;

    double total_deliveries = 0.0;
    double total_returns = 0.0;
    double total_waste_allowance = 0.0;
    double total_waste = 0.0;

    double pct_from_limit = 0.0;
    /// Null for a distributor's first quarter or after a zero-waste quarter
    std::optional<double> pct_change_from_prior_quarter;
    RiskStatus status = RiskStatus::kNotClassified;

    data::QuarterRef quarter_ref() const { return data::QuarterRef{year, quarter}; }
};

/// @brief The full table, ordered by distributor id, (year, quarter), state
using DistributorQuarterTable = std::vector<DistributorQuarterAggregate>;

}  // namespace invsense::analytics
