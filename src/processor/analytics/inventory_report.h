#pragma once

/// @file inventory_report.h
/// @brief Inventory KPIs, monthly allowance charts and distributor allowance status

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "data/dataset.h"
#include "processor/analytics/risk_classifier.h"

namespace invsense::analytics {

/// @brief Headline inventory numbers
struct InventoryOverview {
    double total_waste = 0.0;
    double total_allowance = 0.0;
    double utilization_pct = 0.0;  ///< waste / allowance * 100, 1 decimal
    size_t high_risk_states = 0;   ///< states at >= 80% utilization
};

/// @brief Allowed vs actual waste for one calendar month
struct MonthlyWastePoint {
    int year = 0;
    int month = 0;
    std::string label;  ///< "Jan" .. "Dec"
    double allowed = 0.0;
    double actual = 0.0;
};

/// @brief Allowance usage of one distributor
struct DistributorAllowanceStatus {
    int64_t distributor_id = 0;
    double allowance = 0.0;
    double actual_waste = 0.0;
    double utilization_pct = 0.0;
    double pct_from_limit = 0.0;
    StatusBadge status = StatusBadge::kOk;
};

/// @brief Utilization at or above which a state counts as high risk
inline constexpr double kHighRiskStateUtilization = 80.0;

/// @brief Totals over all records; missing measures count as zero
InventoryOverview BuildInventoryOverview(const data::Dataset& dataset);

/// @brief Allowed vs actual waste for the most recent `months` calendar months
std::vector<MonthlyWastePoint> BuildMonthlyWasteChart(const data::Dataset& dataset,
                                                      size_t months = 6);

/// @brief Per-distributor allowance usage, highest utilization first
///
/// Missing allowance and waste values are imputed with the column medians
/// before summing. A zero allowance total is replaced by the median
/// allowance when computing the percentages.
std::vector<DistributorAllowanceStatus> BuildDistributorAllowanceStatus(
    const data::Dataset& dataset,
    const RiskThresholds& thresholds = {});

}  // namespace invsense::analytics
