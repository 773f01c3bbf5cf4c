#pragma once

/// @file risk_overview.h
/// @brief Global risk overview: state waste ranking, risky distributors, insights

#include <cstdint>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "data/dataset.h"
#include "processor/analytics/distributor_quarter.h"

namespace invsense::analytics {

inline constexpr char kAllYears[] = "All Years";
inline constexpr char kAllMonths[] = "All Months";

/// @brief Overview filters
///
/// Only years and months narrow the overview. States and distributors are
/// carried for callers that pass a full filter set and are ignored.
struct OverviewFilter {
    std::vector<int> years;           ///< empty means all years
    std::vector<std::string> months;  ///< "Jan" .. "Dec", empty means all
    std::vector<std::string> states;
    std::vector<std::string> distributors;
};

/// @brief Parse year filter values; "All Years" clears the filter
/// @return InvalidArgument for a value that is not an integer year
absl::StatusOr<std::vector<int>> ParseYearFilter(const std::vector<std::string>& values);

/// @brief Normalize month filter values; "All Months" clears the filter
std::vector<std::string> NormalizeMonthFilter(const std::vector<std::string>& values);

struct StateWaste {
    std::string state;
    double value = 0.0;
};

struct RiskyDistributor {
    int64_t distributor_id = 0;
    std::string state;
    double total_waste = 0.0;
    double risk_pct = 0.0;  ///< mean pct_from_limit clamped to [0, 100]
    std::string status;     ///< "High Risk", "Risk" or "OK"
};

struct RiskOverview {
    std::vector<StateWaste> state_wise_waste;
    std::vector<RiskyDistributor> high_risk_distributors;
    std::vector<std::string> key_insights;
};

/// @brief Overview status label for a clamped risk percentage
std::string OverviewStatus(double risk_pct);

/// @brief Build the overview
///
/// State waste comes from the raw records after the year and month filter
/// (top 10 states). Risky distributors come from the distributor-quarter
/// table after the year filter only (top 5). Insights describe the share
/// of the top state and of the top 5 distributors in the filtered waste.
RiskOverview BuildRiskOverview(const data::Dataset& dataset,
                               const DistributorQuarterTable& table,
                               const OverviewFilter& filter,
                               size_t top_states = 10,
                               size_t top_distributors = 5);

}  // namespace invsense::analytics
