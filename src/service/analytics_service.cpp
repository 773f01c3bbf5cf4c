/// @file analytics_service.cpp
/// @brief Analytics service implementation

#include "service/analytics_service.h"

#include <utility>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace invsense::service {

namespace {

absl::Status ReadLimit(const Config& config, std::string_view key, size_t* value) {
    int64_t raw = config.GetInt(key, static_cast<int64_t>(*value));
    if (raw <= 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat(key, " must be positive, got ", raw));
    }
    *value = static_cast<size_t>(raw);
    return absl::OkStatus();
}

}  // namespace

absl::StatusOr<AnalyticsSettings> AnalyticsSettings::FromConfig(const Config& config) {
    AnalyticsSettings settings;

    auto& risk = settings.risk;
    risk.high_risk_pct = config.GetDouble("risk.high_risk_pct", risk.high_risk_pct);
    risk.risk_pct = config.GetDouble("risk.risk_pct", risk.risk_pct);
    risk.very_good_below = config.GetDouble("risk.very_good_below", risk.very_good_below);
    risk.trend_high_risk = config.GetDouble("risk.trend_high_risk", risk.trend_high_risk);
    risk.trend_risk = config.GetDouble("risk.trend_risk", risk.trend_risk);
    risk.trend_very_good = config.GetDouble("risk.trend_very_good", risk.trend_very_good);
    if (risk.high_risk_pct < risk.risk_pct || risk.trend_high_risk < risk.trend_risk ||
        risk.trend_risk < risk.trend_very_good) {
        return MakeError(ErrorCode::kConfigurationError,
                         "risk thresholds must be ordered from high risk down to very good");
    }

    auto& alerts = settings.alerts;
    alerts.waste_exceeded_ratio =
        config.GetDouble("alerts.waste_exceeded_ratio", alerts.waste_exceeded_ratio);
    alerts.high_return_ratio =
        config.GetDouble("alerts.high_return_ratio", alerts.high_return_ratio);
    alerts.good_control_ratio =
        config.GetDouble("alerts.good_control_ratio", alerts.good_control_ratio);

    auto& bounds = settings.correlation;
    bounds.strong = config.GetDouble("correlation.strong", bounds.strong);
    bounds.moderate = config.GetDouble("correlation.moderate", bounds.moderate);
    bounds.inverse = config.GetDouble("correlation.inverse", bounds.inverse);
    if (bounds.moderate > bounds.strong) {
        return MakeError(ErrorCode::kConfigurationError,
                         "correlation.moderate must not exceed correlation.strong");
    }

    INVSENSE_RETURN_IF_ERROR(ReadLimit(config, "correlation.bucket_limit", &bounds.bucket_limit));
    INVSENSE_RETURN_IF_ERROR(ReadLimit(config, "trend.top_risky_limit", &settings.top_risky_limit));
    INVSENSE_RETURN_IF_ERROR(ReadLimit(config, "trend.top_states", &settings.overview_top_states));
    INVSENSE_RETURN_IF_ERROR(
        ReadLimit(config, "trend.top_distributors", &settings.overview_top_distributors));
    INVSENSE_RETURN_IF_ERROR(ReadLimit(config, "trend.chart_months", &settings.chart_months));
    INVSENSE_RETURN_IF_ERROR(
        ReadLimit(config, "rca.top_factors", &settings.root_cause_top_factors));

    return settings;
}

AnalyticsService::AnalyticsService(AnalyticsSettings settings)
    : settings_(std::move(settings)),
      alert_engine_(settings_.alerts) {}

absl::StatusOr<uint64_t> AnalyticsService::UploadDataset(data::Table table) {
    const size_t rows = table.num_rows();
    auto version = context_.Publish(std::move(table), settings_.risk);
    if (!version.ok()) {
        return version.status();
    }
    INVSENSE_LOG_INFO("Dataset uploaded: {} rows, snapshot v{}", rows, *version);
    return version;
}

absl::StatusOr<std::shared_ptr<const data::Snapshot>> AnalyticsService::CurrentSnapshot() const {
    return context_.Current();
}

absl::StatusOr<analytics::DistributorQuarterTable>
AnalyticsService::GetDistributorQuarters() const {
    INVSENSE_ASSIGN_OR_RETURN(auto snapshot, CurrentSnapshot());
    return snapshot->distributor_quarters;
}

absl::StatusOr<analytics::RiskOverview> AnalyticsService::GetRiskOverview(
    const analytics::OverviewFilter& filter) const {
    INVSENSE_ASSIGN_OR_RETURN(auto snapshot, CurrentSnapshot());
    return analytics::BuildRiskOverview(snapshot->dataset, snapshot->distributor_quarters,
                                        filter, settings_.overview_top_states,
                                        settings_.overview_top_distributors);
}

absl::StatusOr<analytics::DistributorTrend> AnalyticsService::GetDistributorTrend(
    int64_t distributor_id) const {
    INVSENSE_ASSIGN_OR_RETURN(auto snapshot, CurrentSnapshot());
    return analytics::GetDistributorTrend(snapshot->distributor_quarters, distributor_id);
}

absl::StatusOr<analytics::QuarterComparison> AnalyticsService::CompareQuarters(
    const analytics::QuarterComparisonRequest& request) const {
    INVSENSE_ASSIGN_OR_RETURN(auto snapshot, CurrentSnapshot());
    return analytics::CompareQuarters(snapshot->distributor_quarters, request);
}

absl::StatusOr<std::vector<analytics::TopRiskyEntry>> AnalyticsService::GetTopRisky() const {
    INVSENSE_ASSIGN_OR_RETURN(auto snapshot, CurrentSnapshot());
    return analytics::TopRiskyDistributors(snapshot->distributor_quarters,
                                           settings_.top_risky_limit);
}

absl::StatusOr<alerting::AlertReport> AnalyticsService::GetAlerts(
    const alerting::AlertFilter& filter) const {
    INVSENSE_ASSIGN_OR_RETURN(auto snapshot, CurrentSnapshot());
    INVSENSE_ASSIGN_OR_RETURN(auto alerts, alert_engine_.Evaluate(snapshot->dataset));
    return alerting::BuildAlertReport(alerts, filter);
}

absl::StatusOr<correlation::CorrelationReport> AnalyticsService::GetCorrelation() const {
    INVSENSE_ASSIGN_OR_RETURN(auto snapshot, CurrentSnapshot());
    return correlation::AnalyzeCorrelations(snapshot->dataset.table(), settings_.correlation);
}

absl::StatusOr<analytics::InventoryOverview> AnalyticsService::GetInventoryOverview() const {
    INVSENSE_ASSIGN_OR_RETURN(auto snapshot, CurrentSnapshot());
    return analytics::BuildInventoryOverview(snapshot->dataset);
}

absl::StatusOr<std::vector<analytics::MonthlyWastePoint>>
AnalyticsService::GetInventoryCharts() const {
    INVSENSE_ASSIGN_OR_RETURN(auto snapshot, CurrentSnapshot());
    return analytics::BuildMonthlyWasteChart(snapshot->dataset, settings_.chart_months);
}

absl::StatusOr<std::vector<analytics::DistributorAllowanceStatus>>
AnalyticsService::GetDistributorAllowanceStatus() const {
    INVSENSE_ASSIGN_OR_RETURN(auto snapshot, CurrentSnapshot());
    return analytics::BuildDistributorAllowanceStatus(snapshot->dataset, settings_.risk);
}

absl::StatusOr<rca::RootCauseReport> AnalyticsService::GetRootCause(
    const std::vector<rca::FeatureImportance>& importances) const {
    auto report = rca::BuildRootCauseReport(importances, settings_.root_cause_top_factors);
    if (!report.ok()) {
        INVSENSE_LOG_WARN("Root-cause report unavailable: {}", report.status().message());
    }
    return report;
}

}  // namespace invsense::service
