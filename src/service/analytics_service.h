#pragma once

/// @file analytics_service.h
/// @brief Analytics service facade over the current dataset snapshot
///
/// Owns the data context and the tuning settings and exposes every query
/// the dashboard needs:
/// - Dataset upload (snapshot publication)
/// - Risk overview, distributor trend, quarter comparison, top risky
/// - Alerts with summary, deduplication and filters
/// - Correlation heatmap and key relationships
/// - Inventory overview, charts and distributor allowance status
/// - Root-cause report from model feature importances

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include <absl/status/statusor.h>

#include "common/config.h"
#include "data/data_context.h"
#include "data/table.h"
#include "processor/alerting/alert_rules.h"
#include "processor/alerting/deduplicator.h"
#include "processor/analytics/inventory_report.h"
#include "processor/analytics/risk_classifier.h"
#include "processor/analytics/risk_overview.h"
#include "processor/analytics/trend_engine.h"
#include "processor/correlation/correlation_engine.h"
#include "processor/rca/root_cause.h"

namespace invsense::service {

/// @brief Tunable analytics settings
struct AnalyticsSettings {
    analytics::RiskThresholds risk;
    alerting::AlertThresholds alerts;
    correlation::CorrelationBounds correlation;

    size_t top_risky_limit = 5;
    size_t overview_top_states = 10;
    size_t overview_top_distributors = 5;
    size_t chart_months = 6;
    size_t root_cause_top_factors = 5;

    /// @brief Read settings from configuration; absent keys keep the defaults
    ///
    /// Keys: risk.*, alerts.*, trend.*, correlation.*, rca.top_factors.
    /// @return Configuration error for a non-positive limit or inconsistent
    ///         thresholds
    static absl::StatusOr<AnalyticsSettings> FromConfig(const Config& config);
};

/// @brief Analytics facade
///
/// Queries run against the snapshot current at call time. Uploading a new
/// dataset never disturbs a query already holding the previous snapshot.
///
/// Example:
/// @code
///   AnalyticsService service(settings);
///   auto version = service.UploadDataset(std::move(table));
///   auto alerts = service.GetAlerts(alerting::AlertFilter{});
/// @endcode
class AnalyticsService {
public:
    explicit AnalyticsService(AnalyticsSettings settings = {});

    // Disable copy
    AnalyticsService(const AnalyticsService&) = delete;
    AnalyticsService& operator=(const AnalyticsService&) = delete;

    /// @brief Publish a new dataset
    /// @return Snapshot version, or SchemaError (previous snapshot kept)
    absl::StatusOr<uint64_t> UploadDataset(data::Table table);

    // =========================================================================
    // Risk
    // =========================================================================

    absl::StatusOr<analytics::DistributorQuarterTable> GetDistributorQuarters() const;

    absl::StatusOr<analytics::RiskOverview> GetRiskOverview(
        const analytics::OverviewFilter& filter) const;

    absl::StatusOr<analytics::DistributorTrend> GetDistributorTrend(int64_t distributor_id) const;

    absl::StatusOr<analytics::QuarterComparison> CompareQuarters(
        const analytics::QuarterComparisonRequest& request) const;

    absl::StatusOr<std::vector<analytics::TopRiskyEntry>> GetTopRisky() const;

    // =========================================================================
    // Alerts, correlation, inventory
    // =========================================================================

    absl::StatusOr<alerting::AlertReport> GetAlerts(const alerting::AlertFilter& filter) const;

    absl::StatusOr<correlation::CorrelationReport> GetCorrelation() const;

    absl::StatusOr<analytics::InventoryOverview> GetInventoryOverview() const;

    absl::StatusOr<std::vector<analytics::MonthlyWastePoint>> GetInventoryCharts() const;

    absl::StatusOr<std::vector<analytics::DistributorAllowanceStatus>>
    GetDistributorAllowanceStatus() const;

    // =========================================================================
    // Root cause
    // =========================================================================

    absl::StatusOr<rca::RootCauseReport> GetRootCause(
        const std::vector<rca::FeatureImportance>& importances) const;

    const AnalyticsSettings& settings() const { return settings_; }
    const data::DataContext& context() const { return context_; }

private:
    absl::StatusOr<std::shared_ptr<const data::Snapshot>> CurrentSnapshot() const;

    AnalyticsSettings settings_;
    alerting::AlertRulesEngine alert_engine_;
    data::DataContext context_;
};

}  // namespace invsense::service
