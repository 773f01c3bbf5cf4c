/// @file alerting_test.cpp
/// @brief Unit tests for alerting system

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "common/error.h"
#include "processor/alerting/alert_rules.h"
#include "processor/alerting/deduplicator.h"
#include "test_data.h"

namespace invsense::alerting {
namespace {

using ::testing::ElementsAre;
using ::testing::Field;
using test_data::MakeDataset;
using test_data::SampleTransactions;

Alert MakeAlert(AlertSeverity severity, int64_t distributor_id, const std::string& state) {
    Alert alert;
    alert.severity = severity;
    alert.distributor_id = distributor_id;
    alert.state = state;
    alert.title = AlertSeverityToString(severity);
    return alert;
}

// ============================================================================
// Severity Tests
// ============================================================================

TEST(AlertSeverityTest, NamesAndPriorities) {
    EXPECT_EQ(AlertSeverityToString(AlertSeverity::kHigh), "HIGH");
    EXPECT_EQ(AlertSeverityToString(AlertSeverity::kMedium), "MEDIUM");
    EXPECT_EQ(AlertSeverityToString(AlertSeverity::kLow), "LOW");

    EXPECT_EQ(ParseAlertSeverity("high"), AlertSeverity::kHigh);
    EXPECT_EQ(ParseAlertSeverity("Medium"), AlertSeverity::kMedium);
    EXPECT_FALSE(ParseAlertSeverity("critical").has_value());

    EXPECT_GT(SeverityPriority(AlertSeverity::kHigh), SeverityPriority(AlertSeverity::kMedium));
    EXPECT_GT(SeverityPriority(AlertSeverity::kMedium), SeverityPriority(AlertSeverity::kLow));
}

// ============================================================================
// Alert Rules Engine Tests
// ============================================================================

class AlertRulesEngineTest : public ::testing::Test {
protected:
    AlertRulesEngine engine_;
};

TEST_F(AlertRulesEngineTest, BuiltinRulesRegistered) {
    ASSERT_EQ(engine_.rules().size(), 3);
    EXPECT_EQ(engine_.rules()[0].severity, AlertSeverity::kHigh);
    EXPECT_EQ(engine_.rules()[1].severity, AlertSeverity::kMedium);
    EXPECT_EQ(engine_.rules()[2].severity, AlertSeverity::kLow);
}

TEST_F(AlertRulesEngineTest, WasteExceeded) {
    auto alerts = engine_.Evaluate(MakeDataset({{1, "Utah", "Jan-22", 1000.0, 10.0, 400.0, 1000.0}}));
    ASSERT_TRUE(alerts.ok()) << alerts.status().message();
    ASSERT_EQ(alerts->size(), 1);

    const Alert& alert = (*alerts)[0];
    EXPECT_EQ(alert.severity, AlertSeverity::kHigh);
    EXPECT_EQ(alert.title, "Waste Threshold Exceeded");
    EXPECT_EQ(alert.description, "Waste exceeded allowance by 150.0%");
    EXPECT_EQ(alert.category, "Stale Inventory");
    EXPECT_EQ(alert.distributor_id, 1);
    EXPECT_EQ(alert.state, "Utah");
    EXPECT_EQ(alert.time_ref, "Recent");
}

TEST_F(AlertRulesEngineTest, HighReturnRate) {
    // Waste at 70% of allowance: neither HIGH nor LOW
    auto alerts = engine_.Evaluate(MakeDataset({{1, "Utah", "Jan-22", 1000.0, 90.0, 100.0, 70.0}}));
    ASSERT_TRUE(alerts.ok());
    ASSERT_EQ(alerts->size(), 1);
    EXPECT_EQ((*alerts)[0].severity, AlertSeverity::kMedium);
    EXPECT_EQ((*alerts)[0].description, "Returns at 9.0% of deliveries");
    EXPECT_EQ((*alerts)[0].category, "Returns");
}

TEST_F(AlertRulesEngineTest, GoodControl) {
    auto alerts = engine_.Evaluate(MakeDataset({{1, "Utah", "Jan-22", 1000.0, 10.0, 100.0, 59.0}}));
    ASSERT_TRUE(alerts.ok());
    ASSERT_EQ(alerts->size(), 1);
    EXPECT_EQ((*alerts)[0].severity, AlertSeverity::kLow);
    EXPECT_EQ((*alerts)[0].description, "Waste well within allowed limits");
    EXPECT_EQ((*alerts)[0].category, "Positive Signal");
}

TEST_F(AlertRulesEngineTest, BoundariesAreExclusive) {
    // Exactly at the allowance, 8% returns and 60% usage fire nothing
    auto alerts = engine_.Evaluate(MakeDataset({
        {1, "Utah", "Jan-22", 100.0, 8.0, 100.0, 100.0},
        {2, "Utah", "Jan-22", 100.0, 1.0, 100.0, 60.0},
    }));
    ASSERT_TRUE(alerts.ok());
    EXPECT_TRUE(alerts->empty());
}

TEST_F(AlertRulesEngineTest, ZeroDenominatorsSkipRules) {
    auto alerts = engine_.Evaluate(MakeDataset({{1, "Utah", "Jan-22", 0.0, 50.0, 0.0, 10.0}}));
    ASSERT_TRUE(alerts.ok());
    EXPECT_TRUE(alerts->empty());
}

TEST_F(AlertRulesEngineTest, SampleDatasetOrder) {
    auto alerts = engine_.Evaluate(MakeDataset(SampleTransactions()));
    ASSERT_TRUE(alerts.ok()) << alerts.status().message();

    ASSERT_EQ(alerts->size(), 4);
    EXPECT_EQ((*alerts)[0].severity, AlertSeverity::kHigh);
    EXPECT_EQ((*alerts)[0].distributor_id, 101);
    EXPECT_EQ((*alerts)[0].description, "Waste exceeded allowance by 4.0%");
    EXPECT_EQ((*alerts)[1].severity, AlertSeverity::kHigh);
    EXPECT_EQ((*alerts)[1].distributor_id, 202);
    EXPECT_EQ((*alerts)[1].description, "Waste exceeded allowance by 1.8%");
    EXPECT_EQ((*alerts)[2].severity, AlertSeverity::kMedium);
    EXPECT_EQ((*alerts)[2].distributor_id, 202);
    EXPECT_EQ((*alerts)[2].description, "Returns at 12.0% of deliveries");
    EXPECT_EQ((*alerts)[3].severity, AlertSeverity::kLow);
    EXPECT_EQ((*alerts)[3].distributor_id, 303);
}

TEST_F(AlertRulesEngineTest, GroupsIncludeRowsWithoutTimeKey) {
    auto groups = AlertRulesEngine::AggregateGroups(MakeDataset(SampleTransactions()));
    ASSERT_EQ(groups.size(), 3);
    EXPECT_EQ(groups[2].distributor_id, 303);
    EXPECT_DOUBLE_EQ(groups[2].waste, 100.0);
    EXPECT_DOUBLE_EQ(groups[2].waste_allowance, 200.0);
}

TEST_F(AlertRulesEngineTest, MissingColumnIsSchemaError) {
    data::Table table({{data::kDistributorIdColumn, data::ColumnType::kInteger},
                       {data::kStateColumn, data::ColumnType::kString},
                       {data::kWasteColumn, data::ColumnType::kFloat}});
    auto alerts = engine_.Evaluate(data::Dataset::FromTable(std::move(table)));
    ASSERT_FALSE(alerts.ok());
    EXPECT_TRUE(HasErrorCode(alerts.status(), ErrorCode::kSchemaError));
}

TEST(AlertRulesThresholdTest, CustomThresholds) {
    AlertThresholds thresholds;
    thresholds.high_return_ratio = 0.5;
    AlertRulesEngine engine(thresholds);

    auto alerts = engine.Evaluate(MakeDataset({{1, "Utah", "Jan-22", 1000.0, 90.0, 100.0, 70.0}}));
    ASSERT_TRUE(alerts.ok());
    EXPECT_TRUE(alerts->empty());
}

// ============================================================================
// Deduplicator Tests
// ============================================================================

TEST(AlertDeduplicatorTest, SummaryCountsDistinctDistributors) {
    std::vector<Alert> alerts = {
        MakeAlert(AlertSeverity::kHigh, 1, "A"),
        MakeAlert(AlertSeverity::kHigh, 1, "B"),
        MakeAlert(AlertSeverity::kHigh, 2, "A"),
        MakeAlert(AlertSeverity::kMedium, 2, "A"),
        MakeAlert(AlertSeverity::kLow, 3, "A"),
    };
    auto summary = SummarizeAlerts(alerts);
    EXPECT_EQ(summary.high, 2);
    EXPECT_EQ(summary.medium, 1);
    EXPECT_EQ(summary.low, 1);
}

TEST(AlertDeduplicatorTest, KeepsHighestSeverityPerDistributor) {
    std::vector<Alert> alerts = {
        MakeAlert(AlertSeverity::kLow, 1, "A"),
        MakeAlert(AlertSeverity::kMedium, 2, "A"),
        MakeAlert(AlertSeverity::kHigh, 1, "A"),
        MakeAlert(AlertSeverity::kMedium, 3, "A"),
    };
    auto deduped = DeduplicateAlerts(alerts);

    EXPECT_THAT(deduped, ElementsAre(
        Field(&Alert::distributor_id, 1),
        Field(&Alert::distributor_id, 2),
        Field(&Alert::distributor_id, 3)));
    EXPECT_EQ(deduped[0].severity, AlertSeverity::kHigh);
}

TEST(AlertDeduplicatorTest, EqualPriorityKeepsFirstSeen) {
    std::vector<Alert> alerts = {
        MakeAlert(AlertSeverity::kHigh, 1, "Texas"),
        MakeAlert(AlertSeverity::kHigh, 1, "Ohio"),
    };
    auto deduped = DeduplicateAlerts(alerts);
    ASSERT_EQ(deduped.size(), 1);
    EXPECT_EQ(deduped[0].state, "Texas");
}

class AlertFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        alerts_ = {
            MakeAlert(AlertSeverity::kHigh, 1, "Texas"),
            MakeAlert(AlertSeverity::kMedium, 2, "Ohio"),
            MakeAlert(AlertSeverity::kLow, 3, "Texas"),
        };
    }

    std::vector<Alert> alerts_;
};

TEST_F(AlertFilterTest, AllPassesEverything) {
    auto filtered = FilterAlerts(alerts_, AlertFilter{});
    ASSERT_TRUE(filtered.ok());
    EXPECT_EQ(filtered->size(), 3);
}

TEST_F(AlertFilterTest, SeverityIsCaseInsensitive) {
    AlertFilter filter;
    filter.severity = "medium";
    auto filtered = FilterAlerts(alerts_, filter);
    ASSERT_TRUE(filtered.ok());
    ASSERT_EQ(filtered->size(), 1);
    EXPECT_EQ((*filtered)[0].distributor_id, 2);
}

TEST_F(AlertFilterTest, UnknownSeverityMatchesNothing) {
    AlertFilter filter;
    filter.severity = "CRITICAL";
    auto filtered = FilterAlerts(alerts_, filter);
    ASSERT_TRUE(filtered.ok());
    EXPECT_TRUE(filtered->empty());
}

TEST_F(AlertFilterTest, DistributorAndState) {
    AlertFilter filter;
    filter.state = "Texas";
    auto by_state = FilterAlerts(alerts_, filter);
    ASSERT_TRUE(by_state.ok());
    EXPECT_EQ(by_state->size(), 2);

    filter.distributor = "3";
    auto both = FilterAlerts(alerts_, filter);
    ASSERT_TRUE(both.ok());
    ASSERT_EQ(both->size(), 1);
    EXPECT_EQ((*both)[0].severity, AlertSeverity::kLow);
}

TEST_F(AlertFilterTest, NonIntegerDistributorIsInvalid) {
    AlertFilter filter;
    filter.distributor = "abc";
    auto filtered = FilterAlerts(alerts_, filter);
    ASSERT_FALSE(filtered.ok());
    EXPECT_TRUE(HasErrorCode(filtered.status(), ErrorCode::kInvalidArgument));
}

TEST(AlertReportTest, SummaryIsTakenBeforeDedup) {
    AlertRulesEngine engine;
    auto alerts = engine.Evaluate(MakeDataset(SampleTransactions()));
    ASSERT_TRUE(alerts.ok());

    auto report = BuildAlertReport(*alerts, AlertFilter{});
    ASSERT_TRUE(report.ok()) << report.status().message();
    EXPECT_EQ(report->summary.high, 2);
    EXPECT_EQ(report->summary.medium, 1);
    EXPECT_EQ(report->summary.low, 1);

    ASSERT_EQ(report->alerts.size(), 3);
    EXPECT_EQ(report->alerts[0].distributor_id, 101);
    EXPECT_EQ(report->alerts[1].distributor_id, 202);
    EXPECT_EQ(report->alerts[1].severity, AlertSeverity::kHigh);
    EXPECT_EQ(report->alerts[2].distributor_id, 303);
}

TEST(AlertReportTest, FilterDoesNotChangeSummary) {
    AlertRulesEngine engine;
    auto alerts = engine.Evaluate(MakeDataset(SampleTransactions()));
    ASSERT_TRUE(alerts.ok());

    AlertFilter filter;
    filter.severity = "MEDIUM";
    auto report = BuildAlertReport(*alerts, filter);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->summary.medium, 1);
    // 202's MEDIUM alert was deduplicated under its HIGH alert
    EXPECT_TRUE(report->alerts.empty());
}

}  // namespace
}  // namespace invsense::alerting
