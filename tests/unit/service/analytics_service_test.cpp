/// @file analytics_service_test.cpp
/// @brief Tests for the analytics service facade

#include <gtest/gtest.h>

#include "common/config.h"
#include "common/error.h"
#include "service/analytics_service.h"
#include "test_data.h"

namespace invsense::service {
namespace {

using test_data::MakeTable;
using test_data::SampleTransactions;

// ============================================================================
// Settings
// ============================================================================

TEST(AnalyticsSettingsTest, DefaultsWithEmptyConfig) {
    auto settings = AnalyticsSettings::FromConfig(Config{});
    ASSERT_TRUE(settings.ok()) << settings.status().message();

    EXPECT_DOUBLE_EQ(settings->risk.high_risk_pct, 120.0);
    EXPECT_DOUBLE_EQ(settings->alerts.high_return_ratio, 0.08);
    EXPECT_DOUBLE_EQ(settings->correlation.strong, 0.75);
    EXPECT_EQ(settings->top_risky_limit, 5);
    EXPECT_EQ(settings->overview_top_states, 10);
    EXPECT_EQ(settings->chart_months, 6);
}

TEST(AnalyticsSettingsTest, ReadsOverrides) {
    auto config = Config::LoadFromString(R"(
risk:
  high_risk_pct: 150
  risk_pct: 110
alerts:
  high_return_ratio: 0.1
correlation:
  strong: 0.9
  bucket_limit: 3
trend:
  top_risky_limit: 2
  chart_months: 12
rca:
  top_factors: 3
)");
    ASSERT_TRUE(config.ok());

    auto settings = AnalyticsSettings::FromConfig(*config);
    ASSERT_TRUE(settings.ok()) << settings.status().message();
    EXPECT_DOUBLE_EQ(settings->risk.high_risk_pct, 150.0);
    EXPECT_DOUBLE_EQ(settings->risk.risk_pct, 110.0);
    EXPECT_DOUBLE_EQ(settings->alerts.high_return_ratio, 0.1);
    EXPECT_DOUBLE_EQ(settings->correlation.strong, 0.9);
    EXPECT_EQ(settings->correlation.bucket_limit, 3);
    EXPECT_EQ(settings->top_risky_limit, 2);
    EXPECT_EQ(settings->chart_months, 12);
    EXPECT_EQ(settings->root_cause_top_factors, 3);
}

TEST(AnalyticsSettingsTest, RejectsBadValues) {
    auto unordered = Config::LoadFromString("risk:\n  high_risk_pct: 90\n  risk_pct: 100\n");
    ASSERT_TRUE(unordered.ok());
    auto settings = AnalyticsSettings::FromConfig(*unordered);
    ASSERT_FALSE(settings.ok());
    EXPECT_TRUE(HasErrorCode(settings.status(), ErrorCode::kConfigurationError));

    auto zero_limit = Config::LoadFromString("trend:\n  top_risky_limit: 0\n");
    ASSERT_TRUE(zero_limit.ok());
    EXPECT_TRUE(HasErrorCode(AnalyticsSettings::FromConfig(*zero_limit).status(),
                             ErrorCode::kConfigurationError));

    auto bounds = Config::LoadFromString("correlation:\n  strong: 0.3\n");
    ASSERT_TRUE(bounds.ok());
    EXPECT_TRUE(HasErrorCode(AnalyticsSettings::FromConfig(*bounds).status(),
                             ErrorCode::kConfigurationError));
}

// ============================================================================
// Service
// ============================================================================

class AnalyticsServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto version = service_.UploadDataset(MakeTable(SampleTransactions()));
        ASSERT_TRUE(version.ok()) << version.status().message();
    }

    AnalyticsService service_;
};

TEST(AnalyticsServiceEmptyTest, QueriesBeforeUploadFail) {
    AnalyticsService service;
    EXPECT_FALSE(service.context().HasSnapshot());

    auto top = service.GetTopRisky();
    ASSERT_FALSE(top.ok());
    EXPECT_EQ(top.status().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(top.status().message(), "Dataset not uploaded");

    EXPECT_FALSE(service.GetAlerts(alerting::AlertFilter{}).ok());
    EXPECT_FALSE(service.GetCorrelation().ok());
    EXPECT_FALSE(service.GetInventoryOverview().ok());
}

TEST_F(AnalyticsServiceTest, DistributorQuarters) {
    auto table = service_.GetDistributorQuarters();
    ASSERT_TRUE(table.ok());
    EXPECT_EQ(table->size(), 6);
}

TEST_F(AnalyticsServiceTest, TopRiskyUsesConfiguredLimit) {
    auto top = service_.GetTopRisky();
    ASSERT_TRUE(top.ok());
    ASSERT_EQ(top->size(), 5);
    EXPECT_EQ((*top)[0].distributor_id, 202);

    AnalyticsSettings settings;
    settings.top_risky_limit = 2;
    AnalyticsService limited(settings);
    ASSERT_TRUE(limited.UploadDataset(MakeTable(SampleTransactions())).ok());
    EXPECT_EQ(limited.GetTopRisky()->size(), 2);
}

TEST_F(AnalyticsServiceTest, TrendAndComparison) {
    auto trend = service_.GetDistributorTrend(202);
    ASSERT_TRUE(trend.ok());
    EXPECT_EQ(trend->points.size(), 2);

    EXPECT_EQ(service_.GetDistributorTrend(404).status().code(), absl::StatusCode::kNotFound);

    analytics::QuarterComparisonRequest request;
    request.state = "Texas";
    request.quarter_a = "2022 Q1";
    request.quarter_b = "2022 Q2";
    request.distributor_ids = {101};
    auto comparison = service_.CompareQuarters(request);
    ASSERT_TRUE(comparison.ok());
    ASSERT_EQ(comparison->rows.size(), 1);
    EXPECT_DOUBLE_EQ(comparison->rows[0].delta, 30.0);
}

TEST_F(AnalyticsServiceTest, RiskOverview) {
    auto overview = service_.GetRiskOverview(analytics::OverviewFilter{});
    ASSERT_TRUE(overview.ok());
    EXPECT_EQ(overview->state_wise_waste.size(), 2);
    EXPECT_EQ(overview->key_insights.size(), 2);
}

TEST_F(AnalyticsServiceTest, Alerts) {
    auto report = service_.GetAlerts(alerting::AlertFilter{});
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->summary.high, 2);
    EXPECT_EQ(report->alerts.size(), 3);

    alerting::AlertFilter filter;
    filter.state = "Ohio";
    auto ohio = service_.GetAlerts(filter);
    ASSERT_TRUE(ohio.ok());
    ASSERT_EQ(ohio->alerts.size(), 1);
    EXPECT_EQ(ohio->alerts[0].distributor_id, 303);
}

TEST_F(AnalyticsServiceTest, Correlation) {
    auto report = service_.GetCorrelation();
    ASSERT_TRUE(report.ok()) << report.status().message();
    // Distributor ID plus the four measures
    EXPECT_EQ(report->features.size(), 5);
    EXPECT_EQ(report->matrix.size(), 5);
}

TEST_F(AnalyticsServiceTest, Inventory) {
    auto overview = service_.GetInventoryOverview();
    ASSERT_TRUE(overview.ok());
    EXPECT_DOUBLE_EQ(overview->total_waste, 1160.0);

    auto charts = service_.GetInventoryCharts();
    ASSERT_TRUE(charts.ok());
    EXPECT_EQ(charts->size(), 6);

    auto status = service_.GetDistributorAllowanceStatus();
    ASSERT_TRUE(status.ok());
    EXPECT_EQ(status->size(), 3);
}

TEST_F(AnalyticsServiceTest, RootCause) {
    auto report = service_.GetRootCause({{"Returns_Quantity", 3.0}, {"Deliveries_Quantity", 1.0}});
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->primary_cause.feature, "Returns_Quantity");

    auto missing = service_.GetRootCause({});
    EXPECT_TRUE(HasErrorCode(missing.status(), ErrorCode::kInsufficientData));
}

TEST_F(AnalyticsServiceTest, RejectedUploadKeepsServing) {
    data::Table incomplete({{data::kDistributorIdColumn, data::ColumnType::kInteger}});
    ASSERT_TRUE(incomplete.AddRow({int64_t{1}}).ok());

    auto version = service_.UploadDataset(std::move(incomplete));
    ASSERT_FALSE(version.ok());
    EXPECT_TRUE(HasErrorCode(version.status(), ErrorCode::kSchemaError));

    auto top = service_.GetTopRisky();
    ASSERT_TRUE(top.ok());
    EXPECT_EQ(top->size(), 5);
}

TEST_F(AnalyticsServiceTest, CustomRiskThresholdsApplyOnUpload) {
    AnalyticsSettings settings;
    settings.risk.high_risk_pct = 30.0;
    settings.risk.risk_pct = 15.0;
    AnalyticsService strict(settings);
    ASSERT_TRUE(strict.UploadDataset(MakeTable(SampleTransactions())).ok());

    auto table = strict.GetDistributorQuarters();
    ASSERT_TRUE(table.ok());
    EXPECT_EQ((*table)[0].status, analytics::RiskStatus::kRisk);      // 20%
    EXPECT_EQ((*table)[1].status, analytics::RiskStatus::kHighRisk);  // 32%
}

}  // namespace
}  // namespace invsense::service
