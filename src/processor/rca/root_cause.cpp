/// @file root_cause.cpp
/// @brief Root-cause reporter implementation

#include "processor/rca/root_cause.h"

#include <algorithm>
#include <cmath>

#include "common/error.h"
#include "common/logging.h"
#include "common/numeric.h"

namespace invsense::rca {

namespace {

constexpr size_t kSecondaryDrivers = 2;

constexpr char kPrimaryReason[] = "Primary driver based on highest model contribution";
constexpr char kSecondaryReason[] = "Secondary contributor to inventory loss";

const std::vector<std::string>& RecommendedActions() {
    static const std::vector<std::string> kActions = {
        "Improve return handling for top-risk distributors",
        "Optimize delivery quantities using demand signals",
        "Reduce storage duration for slow-moving inventory",
    };
    return kActions;
}

}  // namespace

absl::StatusOr<RootCauseReport> BuildRootCauseReport(
    const std::vector<FeatureImportance>& importances,
    size_t top_n) {

    if (importances.empty()) {
        return InsufficientDataError("Feature importances are not available");
    }

    double total = 0.0;
    for (const auto& item : importances) {
        total += item.importance;
    }
    if (!std::isfinite(total) || total <= 0.0) {
        return InsufficientDataError("Feature importances must sum to a positive value");
    }

    std::vector<ContributingFactor> factors;
    factors.reserve(importances.size());
    for (const auto& item : importances) {
        factors.push_back({item.feature, item.importance / total * 100.0});
    }
    std::stable_sort(factors.begin(), factors.end(),
        [](const ContributingFactor& a, const ContributingFactor& b) {
            return a.contribution_pct > b.contribution_pct;
        });

    RootCauseReport report;
    const size_t limit = std::max<size_t>(top_n, 1);
    for (size_t i = 0; i < factors.size() && i < limit; ++i) {
        report.top_factors.push_back(
            {factors[i].feature, RoundDecimals(factors[i].contribution_pct, 2)});
    }

    report.primary_cause = {report.top_factors.front().feature, kPrimaryReason};
    for (size_t i = 1; i < report.top_factors.size() && i <= kSecondaryDrivers; ++i) {
        report.secondary_drivers.push_back({report.top_factors[i].feature, kSecondaryReason});
    }
    report.recommended_actions = RecommendedActions();

    INVSENSE_LOG_DEBUG("Root cause: primary '{}' ({:.2f}%) over {} features",
                       report.primary_cause.feature,
                       report.top_factors.front().contribution_pct, importances.size());
    return report;
}

}  // namespace invsense::rca
