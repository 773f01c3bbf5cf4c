/// @file correlation_engine.cpp
/// @brief Correlation engine implementation

#include "processor/correlation/correlation_engine.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/numeric.h"

namespace invsense::correlation {

namespace {

std::vector<FeatureRelationship> TakeTop(std::vector<FeatureRelationship> bucket,
                                         size_t limit,
                                         const std::function<bool(const FeatureRelationship&,
                                                                  const FeatureRelationship&)>& order) {
    std::stable_sort(bucket.begin(), bucket.end(), order);
    if (bucket.size() > limit) {
        bucket.resize(limit);
    }
    return bucket;
}

}  // namespace

std::optional<double> PearsonCorrelation(const std::vector<double>& x,
                                         const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) {
        return std::nullopt;
    }
    const double n = static_cast<double>(x.size());
    const double mean_x = std::accumulate(x.begin(), x.end(), 0.0) / n;
    const double mean_y = std::accumulate(y.begin(), y.end(), 0.0) / n;

    double sxx = 0.0;
    double syy = 0.0;
    double sxy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - mean_x;
        const double dy = y[i] - mean_y;
        sxx += dx * dx;
        syy += dy * dy;
        sxy += dx * dy;
    }
    if (sxx == 0.0 || syy == 0.0) {
        return std::nullopt;
    }
    return std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
}

absl::StatusOr<CorrelationMatrix> ComputeCorrelationMatrix(
    const data::Table& table,
    std::vector<std::string>* features) {

    const std::vector<size_t> columns = table.NumericColumnIndices();
    if (columns.size() < 2) {
        return InsufficientDataError(absl::StrCat(
            "Not enough numeric features: need at least 2, found ", columns.size()));
    }

    if (features != nullptr) {
        features->clear();
        for (size_t column : columns) {
            features->push_back(table.columns()[column].name);
        }
    }

    const size_t k = columns.size();
    CorrelationMatrix matrix(k, std::vector<std::optional<double>>(k));
    for (size_t i = 0; i < k; ++i) {
        matrix[i][i] = 1.0;
        for (size_t j = i + 1; j < k; ++j) {
            std::vector<double> x;
            std::vector<double> y;
            for (size_t row = 0; row < table.num_rows(); ++row) {
                auto a = table.NumericAt(row, columns[i]);
                auto b = table.NumericAt(row, columns[j]);
                if (a && b) {
                    x.push_back(*a);
                    y.push_back(*b);
                }
            }
            auto r = PearsonCorrelation(x, y);
            if (r.has_value()) {
                matrix[i][j] = RoundDecimals(*r, 2);
                matrix[j][i] = matrix[i][j];
            }
        }
    }
    return matrix;
}

KeyRelationships ExtractKeyRelationships(const std::vector<std::string>& features,
                                         const CorrelationMatrix& matrix,
                                         const CorrelationBounds& bounds) {
    std::vector<FeatureRelationship> strong;
    std::vector<FeatureRelationship> moderate;
    std::vector<FeatureRelationship> inverse;

    for (size_t i = 0; i < matrix.size(); ++i) {
        for (size_t j = 0; j < matrix[i].size(); ++j) {
            if (i == j || !matrix[i][j].has_value()) {
                continue;
            }
            FeatureRelationship rel{features[i], features[j], *matrix[i][j],
                                    std::fabs(*matrix[i][j])};
            if (rel.abs >= bounds.strong) {
                strong.push_back(rel);
            } else if (rel.abs >= bounds.moderate) {
                moderate.push_back(rel);
            }
            if (rel.value <= bounds.inverse) {
                inverse.push_back(rel);
            }
        }
    }

    auto by_abs_desc = [](const FeatureRelationship& a, const FeatureRelationship& b) {
        return a.abs > b.abs;
    };
    auto by_value_asc = [](const FeatureRelationship& a, const FeatureRelationship& b) {
        return a.value < b.value;
    };

    KeyRelationships result;
    result.strong = TakeTop(std::move(strong), bounds.bucket_limit, by_abs_desc);
    result.moderate = TakeTop(std::move(moderate), bounds.bucket_limit, by_abs_desc);
    result.inverse = TakeTop(std::move(inverse), bounds.bucket_limit, by_value_asc);
    return result;
}

const std::vector<ModelRecommendation>& DefaultModelRecommendations() {
    static const std::vector<ModelRecommendation> kRecommendations = {
        {"linear_regression",
         {"Storage_Duration", "Distributor_Size", "Region_Population"},
         false,
         "Strong linear correlation with waste"},
        {"decision_tree",
         {"Order_Frequency", "Storage_Duration", "Temperature_Variance"},
         false,
         "Captures non-linear interactions"},
        {"xgboost",
         {},
         true,
         "Handles multicollinearity and complex patterns"},
    };
    return kRecommendations;
}

absl::StatusOr<CorrelationReport> AnalyzeCorrelations(const data::Table& table,
                                                      const CorrelationBounds& bounds) {
    CorrelationReport report;
    INVSENSE_ASSIGN_OR_RETURN(report.matrix, ComputeCorrelationMatrix(table, &report.features));
    report.key_relationships = ExtractKeyRelationships(report.features, report.matrix, bounds);
    report.model_recommendations = DefaultModelRecommendations();

    INVSENSE_LOG_DEBUG("Correlation over {} features: {} strong, {} moderate, {} inverse",
                       report.features.size(),
                       report.key_relationships.strong.size(),
                       report.key_relationships.moderate.size(),
                       report.key_relationships.inverse.size());
    return report;
}

}  // namespace invsense::correlation
