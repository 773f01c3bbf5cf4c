#pragma once

/// @file trend_engine.h
/// @brief Quarter-over-quarter trends, quarter comparison and risk ranking
///
/// All functions are pure projections of a DistributorQuarterTable:
/// - Quarter-over-quarter waste change per distributor
/// - Two-quarter comparison for one or two distributors within a state
/// - Single distributor trend line
/// - Top risky distributor-quarters by pct_from_limit

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "processor/analytics/distributor_quarter.h"

namespace invsense::analytics {

/// @brief Direction of a waste delta
enum class TrendDirection {
    kUp,
    kDown,
    kFlat
};

/// @brief Percent change of `current` relative to `prior`
/// @return nullopt when prior is zero (no finite change exists)
std::optional<double> PercentChange(double current, double prior);

/// @brief Fill pct_change_from_prior_quarter on every row
///
/// Rows must already be ordered by distributor, then (year, quarter). For
/// each distributor the first row gets nullopt and every later row the
/// change of total_waste relative to the row before it, rounded to 2
/// decimals.
void ApplyQuarterOverQuarterChange(DistributorQuarterTable& table);

/// @brief Classify a delta as up, down or flat
TrendDirection ClassifyDelta(double delta);

/// @brief "up", "down", "flat"
std::string TrendDirectionToString(TrendDirection direction);

/// @brief Dashboard arrow glyph for a direction
std::string TrendArrow(TrendDirection direction);

// =============================================================================
// Quarter comparison
// =============================================================================

/// @brief Parameters for a two-quarter comparison
struct QuarterComparisonRequest {
    std::string state;
    std::string quarter_a;  ///< e.g. "2022 Q2"
    std::string quarter_b;
    std::vector<int64_t> distributor_ids;  ///< one or two ids
};

/// @brief One compared distributor
struct QuarterComparisonRow {
    int64_t distributor_id = 0;
    std::optional<double> total_waste_q1;  ///< null when no data that quarter
    std::optional<double> total_waste_q2;
    double delta = 0.0;
    TrendDirection trend = TrendDirection::kFlat;
    std::string status_change;  ///< "Good → High Risk"
};

/// @brief Comparison result
struct QuarterComparison {
    std::string state;
    std::string quarter_a;
    std::string quarter_b;
    std::vector<QuarterComparisonRow> rows;
};

/// @brief Compare two quarters within a state
///
/// Identical quarters compare each selected row with itself. Different
/// quarters outer-join the two subsets on distributor id, so a distributor
/// present in only one quarter still shows up with the other side null.
///
/// @return NotFoundError if the state has no rows, ParseError for a bad
///         quarter label, InvalidArgument for zero or more than two ids
absl::StatusOr<QuarterComparison> CompareQuarters(
    const DistributorQuarterTable& table,
    const QuarterComparisonRequest& request);

// =============================================================================
// Distributor trend
// =============================================================================

struct TrendPoint {
    std::string quarter;  ///< "2023 Q1"
    std::string state;
    double waste = 0.0;
    std::optional<double> pct_change;
    RiskStatus status = RiskStatus::kNotClassified;
};

struct DistributorTrend {
    int64_t distributor_id = 0;
    std::vector<TrendPoint> points;
};

/// @brief Chronological waste trend for one distributor
/// @return NotFoundError if the distributor has no rows
absl::StatusOr<DistributorTrend> GetDistributorTrend(
    const DistributorQuarterTable& table,
    int64_t distributor_id);

// =============================================================================
// Top risky
// =============================================================================

struct TopRiskyEntry {
    int64_t distributor_id = 0;
    std::string state;
    double risk_pct = 0.0;  ///< pct_from_limit rounded to 1 decimal
    RiskStatus status = RiskStatus::kNotClassified;
};

/// @brief Rows with the highest pct_from_limit, ties kept in table order
std::vector<TopRiskyEntry> TopRiskyDistributors(
    const DistributorQuarterTable& table,
    size_t limit = 5);

}  // namespace invsense::analytics
