#pragma once

/// @file correlation_engine.h
/// @brief Pearson correlation heatmap and key feature relationships

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "data/table.h"

namespace invsense::correlation {

/// @brief Bucket bounds for key relationships
struct CorrelationBounds {
    double strong = 0.75;    ///< |r| >=
    double moderate = 0.4;   ///< |r| >= (and below strong)
    double inverse = -0.4;   ///< r <=
    size_t bucket_limit = 5;
};

/// @brief One ordered feature pair
struct FeatureRelationship {
    std::string f1;
    std::string f2;
    double value = 0.0;  ///< rounded coefficient
    double abs = 0.0;
};

struct KeyRelationships {
    std::vector<FeatureRelationship> strong;
    std::vector<FeatureRelationship> moderate;
    std::vector<FeatureRelationship> inverse;
};

/// @brief Fixed modelling hint shown beside the heatmap
struct ModelRecommendation {
    std::string model;
    std::vector<std::string> features;
    bool all_numeric_features = false;  ///< features list replaced by "All numeric features"
    std::string reason;
};

/// @brief Square matrix aligned with `features`; null where undefined
using CorrelationMatrix = std::vector<std::vector<std::optional<double>>>;

struct CorrelationReport {
    std::vector<std::string> features;
    CorrelationMatrix matrix;
    KeyRelationships key_relationships;
    std::vector<ModelRecommendation> model_recommendations;
};

/// @brief Sample Pearson correlation of two equally sized series
/// @return nullopt with fewer than two points or a zero-variance series
std::optional<double> PearsonCorrelation(const std::vector<double>& x,
                                         const std::vector<double>& y);

/// @brief Correlate every pair of numeric columns
///
/// Each pair uses the rows where both values are present. Coefficients are
/// rounded to 2 decimals and the diagonal is exactly 1.
/// @return InsufficientDataError with fewer than two numeric columns
absl::StatusOr<CorrelationMatrix> ComputeCorrelationMatrix(
    const data::Table& table,
    std::vector<std::string>* features);

/// @brief Flatten the off-diagonal cells row-major and bucket them
KeyRelationships ExtractKeyRelationships(const std::vector<std::string>& features,
                                         const CorrelationMatrix& matrix,
                                         const CorrelationBounds& bounds = {});

/// @brief The fixed recommendations (linear regression, decision tree, xgboost)
const std::vector<ModelRecommendation>& DefaultModelRecommendations();

/// @brief Full correlation report for a table
absl::StatusOr<CorrelationReport> AnalyzeCorrelations(const data::Table& table,
                                                      const CorrelationBounds& bounds = {});

}  // namespace invsense::correlation
