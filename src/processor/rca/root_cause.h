#pragma once

/// @file root_cause.h
/// @brief Root-cause report from model feature importances

#include <cstddef>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

namespace invsense::rca {

/// @brief Importance of one feature as reported by a trained model
struct FeatureImportance {
    std::string feature;
    double importance = 0.0;
};

/// @brief Share of one feature in the total importance
struct ContributingFactor {
    std::string feature;
    double contribution_pct = 0.0;  ///< rounded to 2 decimals
};

struct CauseDriver {
    std::string feature;
    std::string reason;
};

struct RootCauseReport {
    std::vector<ContributingFactor> top_factors;
    CauseDriver primary_cause;
    std::vector<CauseDriver> secondary_drivers;
    std::vector<std::string> recommended_actions;
};

/// @brief Rank importances and explain the leading drivers
///
/// Importances are renormalized to percentages of their total and sorted
/// descending. The top `top_n` become the factors, the first is the primary
/// cause and the next two are secondary drivers.
///
/// @return InsufficientDataError for an empty list or a non-positive total
absl::StatusOr<RootCauseReport> BuildRootCauseReport(
    const std::vector<FeatureImportance>& importances,
    size_t top_n = 5);

}  // namespace invsense::rca
