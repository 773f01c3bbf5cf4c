/// @file json_export_test.cpp
/// @brief Tests for the JSON payloads

#include <gtest/gtest.h>

#include "processor/alerting/alert_rules.h"
#include "processor/analytics/aggregator.h"
#include "report/json_export.h"
#include "test_data.h"

namespace invsense::report {
namespace {

using test_data::MakeDataset;
using test_data::SampleTransactions;

TEST(JsonExportTest, DistributorQuarterRow) {
    auto table = analytics::BuildDistributorQuarterTable(MakeDataset(SampleTransactions()));
    ASSERT_TRUE(table.ok());

    json j = ToJson(*table);
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 6);

    EXPECT_EQ(j[0]["distributor_id"], 101);
    EXPECT_EQ(j[0]["quarter"], "Q1");
    EXPECT_EQ(j[0]["year"], 2022);
    EXPECT_TRUE(j[0]["pct_change_from_prior_quarter"].is_null());
    EXPECT_EQ(j[0]["status"], "Very Good");
    EXPECT_DOUBLE_EQ(j[1]["pct_change_from_prior_quarter"].get<double>(), 10.0);
    EXPECT_EQ(j[4]["status"], "High Risk");
}

TEST(JsonExportTest, QuarterComparisonNullSide) {
    analytics::QuarterComparison comparison;
    comparison.state = "Texas";
    comparison.quarter_a = "2022 Q2";
    comparison.quarter_b = "2022 Q3";
    analytics::QuarterComparisonRow row;
    row.distributor_id = 202;
    row.total_waste_q1 = 180.0;
    row.delta = -180.0;
    row.trend = analytics::TrendDirection::kDown;
    row.status_change = "High Risk → Unknown";
    comparison.rows.push_back(row);

    json j = ToJson(comparison);
    EXPECT_EQ(j["state"], "Texas");
    ASSERT_EQ(j["comparison"].size(), 1);
    const json& r = j["comparison"][0];
    EXPECT_EQ(r["total_waste_q1"], 180.0);
    EXPECT_TRUE(r["total_waste_q2"].is_null());
    EXPECT_EQ(r["trend"], "down");
    EXPECT_EQ(r["trend_arrow"].get<std::string>(),
              analytics::TrendArrow(analytics::TrendDirection::kDown));
    EXPECT_EQ(r["status_change"], "High Risk → Unknown");
}

TEST(JsonExportTest, InventoryOverviewWrapsValues) {
    analytics::InventoryOverview overview;
    overview.total_waste = 1160.0;
    overview.utilization_pct = 94.7;
    overview.high_risk_states = 1;

    json j = ToJson(overview);
    EXPECT_EQ(j["total_waste"]["value"], 1160.0);
    EXPECT_EQ(j["utilization_rate"]["value"], 94.7);
    EXPECT_EQ(j["high_risk_states"]["value"], 1);
}

TEST(JsonExportTest, ChartsCarryBothSeries) {
    std::vector<analytics::MonthlyWastePoint> chart = {
        {2022, 1, "Jan", 200.0, 170.0},
        {2022, 2, "Feb", 150.0, 180.0},
    };
    json j = ToJson(chart);
    ASSERT_EQ(j["allowed_vs_actual"].size(), 2);
    EXPECT_EQ(j["allowed_vs_actual"][1]["month"], "Feb");
    EXPECT_EQ(j["allowed_vs_actual"][1]["allowed"], 150.0);
    ASSERT_EQ(j["loss_trend"].size(), 2);
    EXPECT_EQ(j["loss_trend"][0]["value"], 170.0);
}

TEST(JsonExportTest, AlertReport) {
    alerting::AlertReport report;
    report.summary = {2, 1, 0};
    alerting::Alert alert;
    alert.severity = alerting::AlertSeverity::kHigh;
    alert.title = "Waste Threshold Exceeded";
    alert.distributor_id = 7;
    alert.state = "Ohio";
    report.alerts.push_back(alert);

    json j = ToJson(report);
    EXPECT_EQ(j["summary"]["high"], 2);
    EXPECT_EQ(j["summary"]["medium"], 1);
    EXPECT_EQ(j["summary"]["low"], 0);
    ASSERT_EQ(j["alerts"].size(), 1);
    EXPECT_EQ(j["alerts"][0]["severity"], "HIGH");
    EXPECT_EQ(j["alerts"][0]["time_ref"], "Recent");
}

TEST(JsonExportTest, CorrelationReport) {
    correlation::CorrelationReport report;
    report.features = {"x", "y"};
    report.matrix = {{1.0, std::nullopt}, {std::nullopt, 1.0}};
    report.model_recommendations = correlation::DefaultModelRecommendations();

    json j = ToJson(report);
    EXPECT_EQ(j["heatmap"]["features"], json({"x", "y"}));
    EXPECT_EQ(j["heatmap"]["matrix"][0][0], 1.0);
    EXPECT_TRUE(j["heatmap"]["matrix"][0][1].is_null());
    EXPECT_TRUE(j["key_relationships"]["strong"].is_array());
    EXPECT_EQ(j["model_recommendations"]["xgboost"]["features"], "All numeric features");
    EXPECT_TRUE(j["model_recommendations"]["linear_regression"]["features"].is_array());
}

TEST(JsonExportTest, RootCauseReport) {
    rca::RootCauseReport report;
    report.top_factors = {{"a", 60.0}, {"b", 40.0}};
    report.primary_cause = {"a", "first"};
    report.secondary_drivers = {{"b", "second"}};
    report.recommended_actions = {"act"};

    json j = ToJson(report);
    EXPECT_EQ(j["top_factors"][0]["feature"], "a");
    EXPECT_EQ(j["top_factors"][1]["contribution_pct"], 40.0);
    EXPECT_EQ(j["primary_cause"]["reason"], "first");
    EXPECT_EQ(j["secondary_drivers"][0]["feature"], "b");
    EXPECT_EQ(j["recommended_actions"][0], "act");
}

TEST(JsonExportTest, DumpIsParseable) {
    json j = {{"a", 1}, {"b", json::array({1, 2})}};
    std::string text = Dump(j);
    EXPECT_NE(text.find('\n'), std::string::npos);
    EXPECT_EQ(json::parse(text), j);
    EXPECT_EQ(Dump(j, -1), R"({"a":1,"b":[1,2]})");
}

}  // namespace
}  // namespace invsense::report
