#pragma once

/// @file risk_classifier.h
/// @brief Two-tier distributor risk classification
///
/// Tier 1 classifies by how far waste sits from its allowance
/// (pct_from_limit). Tier 2 is only consulted when tier 1 has no value and
/// classifies by the quarter-over-quarter waste change.

#include <optional>
#include <string>
#include <string_view>

namespace invsense::analytics {

/// @brief Risk status of an aggregate row
enum class RiskStatus {
    kHighRisk,
    kRisk,
    kGood,
    kVeryGood,
    kNotClassified
};

/// @brief Three-way badge shown by dashboards
enum class StatusBadge {
    kExceeded,
    kAtRisk,
    kOk
};

/// @brief Classification thresholds (percent)
struct RiskThresholds {
    // Tier 1: pct_from_limit
    double high_risk_pct = 120.0;   ///< >= is HighRisk
    double risk_pct = 100.0;        ///< >= is Risk
    double very_good_below = 80.0;  ///< < is VeryGood, otherwise Good

    // Tier 2: quarter-over-quarter change
    double trend_high_risk = 10.0;     ///< > is HighRisk
    double trend_risk = 0.0;           ///< > is Risk
    double trend_very_good = -10.0;    ///< < is VeryGood, otherwise Good
};

/// @brief Percent distance of waste from its allowance
///
/// Zero allowance or zero waste short-circuit to 0 (no risk signal). The
/// result is rounded to 2 decimals.
double ComputePctFromLimit(double waste, double allowance);

/// @brief Classify a row; total over all inputs
RiskStatus ClassifyRisk(std::optional<double> pct_from_limit,
                        std::optional<double> pct_change,
                        const RiskThresholds& thresholds = {});

/// @brief Project a status onto the dashboard badge
StatusBadge ToStatusBadge(RiskStatus status);

/// @brief Display name ("High Risk", "Very Good", ...)
std::string RiskStatusToString(RiskStatus status);

/// @brief Parse a display name back into a status
std::optional<RiskStatus> ParseRiskStatus(std::string_view name);

/// @brief Display name of a badge ("Exceeded", "At Risk", "OK")
std::string StatusBadgeToString(StatusBadge badge);

}  // namespace invsense::analytics
