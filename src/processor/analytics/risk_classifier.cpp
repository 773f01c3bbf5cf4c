/// @file risk_classifier.cpp
/// @brief Risk classification implementation

#include "processor/analytics/risk_classifier.h"

#include <cmath>

#include "common/numeric.h"

namespace invsense::analytics {

double ComputePctFromLimit(double waste, double allowance) {
    if (allowance == 0.0 || waste == 0.0) {
        return 0.0;
    }
    return RoundDecimals(((waste - allowance) / allowance) * 100.0, 2);
}

RiskStatus ClassifyRisk(std::optional<double> pct_from_limit,
                        std::optional<double> pct_change,
                        const RiskThresholds& thresholds) {
    if (pct_from_limit.has_value() && !std::isnan(*pct_from_limit)) {
        const double pct = *pct_from_limit;
        if (pct >= thresholds.high_risk_pct) {
            return RiskStatus::kHighRisk;
        }
        if (pct >= thresholds.risk_pct) {
            return RiskStatus::kRisk;
        }
        if (pct < thresholds.very_good_below) {
            return RiskStatus::kVeryGood;
        }
        return RiskStatus::kGood;
    }

    if (pct_change.has_value() && !std::isnan(*pct_change)) {
        const double change = *pct_change;
        if (change > thresholds.trend_high_risk) {
            return RiskStatus::kHighRisk;
        }
        if (change > thresholds.trend_risk) {
            return RiskStatus::kRisk;
        }
        if (change < thresholds.trend_very_good) {
            return RiskStatus::kVeryGood;
        }
        return RiskStatus::kGood;
    }

    return RiskStatus::kNotClassified;
}

StatusBadge ToStatusBadge(RiskStatus status) {
    switch (status) {
        case RiskStatus::kHighRisk:
            return StatusBadge::kExceeded;
        case RiskStatus::kRisk:
            return StatusBadge::kAtRisk;
        case RiskStatus::kGood:
        case RiskStatus::kVeryGood:
        case RiskStatus::kNotClassified:
        default:
            return StatusBadge::kOk;
    }
}

std::string RiskStatusToString(RiskStatus status) {
    switch (status) {
        case RiskStatus::kHighRisk: return "High Risk";
        case RiskStatus::kRisk: return "Risk";
        case RiskStatus::kGood: return "Good";
        case RiskStatus::kVeryGood: return "Very Good";
        case RiskStatus::kNotClassified: return "Not Classified";
        default: return "Not Classified";
    }
}

std::optional<RiskStatus> ParseRiskStatus(std::string_view name) {
    if (name == "High Risk") return RiskStatus::kHighRisk;
    if (name == "Risk") return RiskStatus::kRisk;
    if (name == "Good") return RiskStatus::kGood;
    if (name == "Very Good") return RiskStatus::kVeryGood;
    if (name == "Not Classified") return RiskStatus::kNotClassified;
    return std::nullopt;
}

std::string StatusBadgeToString(StatusBadge badge) {
    switch (badge) {
        case StatusBadge::kExceeded: return "Exceeded";
        case StatusBadge::kAtRisk: return "At Risk";
        case StatusBadge::kOk:
        default:
            return "OK";
    }
}

}  // namespace invsense::analytics
