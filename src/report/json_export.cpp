/// @file json_export.cpp
/// @brief JSON serialization implementation

#include "report/json_export.h"

#include <optional>

#include "data/time_key.h"

namespace invsense::report {

namespace {

json OptionalToJson(const std::optional<double>& value) {
    return value.has_value() ? json(*value) : json(nullptr);
}

json RelationshipsToJson(const std::vector<correlation::FeatureRelationship>& bucket) {
    json j = json::array();
    for (const auto& rel : bucket) {
        j.push_back({{"f1", rel.f1}, {"f2", rel.f2}, {"value", rel.value}, {"abs", rel.abs}});
    }
    return j;
}

}  // namespace

json ToJson(const analytics::DistributorQuarterAggregate& row) {
    json j;
    j["distributor_id"] = row.distributor_id;
    j["state"] = row.state;
    j["year"] = row.year;
    j["quarter"] = data::QuarterToString(row.quarter);
    j["total_deliveries"] = row.total_deliveries;
    j["total_returns"] = row.total_returns;
    j["total_waste_allowance"] = row.total_waste_allowance;
    j["total_waste"] = row.total_waste;
    j["pct_from_limit"] = row.pct_from_limit;
    j["pct_change_from_prior_quarter"] = OptionalToJson(row.pct_change_from_prior_quarter);
    j["status"] = analytics::RiskStatusToString(row.status);
    return j;
}

json ToJson(const analytics::DistributorQuarterTable& table) {
    json j = json::array();
    for (const auto& row : table) {
        j.push_back(ToJson(row));
    }
    return j;
}

json ToJson(const analytics::QuarterComparison& comparison) {
    json rows = json::array();
    for (const auto& row : comparison.rows) {
        json r;
        r["distributor_id"] = row.distributor_id;
        r["total_waste_q1"] = OptionalToJson(row.total_waste_q1);
        r["total_waste_q2"] = OptionalToJson(row.total_waste_q2);
        r["delta"] = row.delta;
        r["trend"] = analytics::TrendDirectionToString(row.trend);
        r["trend_arrow"] = analytics::TrendArrow(row.trend);
        r["status_change"] = row.status_change;
        rows.push_back(std::move(r));
    }

    json j;
    j["state"] = comparison.state;
    j["quarter_a"] = comparison.quarter_a;
    j["quarter_b"] = comparison.quarter_b;
    j["comparison"] = std::move(rows);
    return j;
}

json ToJson(const analytics::DistributorTrend& trend) {
    json points = json::array();
    for (const auto& point : trend.points) {
        points.push_back({
            {"quarter", point.quarter},
            {"state", point.state},
            {"waste", point.waste},
            {"pct_change", OptionalToJson(point.pct_change)},
            {"status", analytics::RiskStatusToString(point.status)},
        });
    }
    return {{"distributor_id", trend.distributor_id}, {"trend", std::move(points)}};
}

json ToJson(const std::vector<analytics::TopRiskyEntry>& top) {
    json j = json::array();
    for (const auto& entry : top) {
        j.push_back({
            {"distributor_id", entry.distributor_id},
            {"state", entry.state},
            {"risk_pct", entry.risk_pct},
            {"status", analytics::RiskStatusToString(entry.status)},
        });
    }
    return j;
}

json ToJson(const analytics::RiskOverview& overview) {
    json states = json::array();
    for (const auto& state : overview.state_wise_waste) {
        states.push_back({{"state", state.state}, {"value", state.value}});
    }
    json risky = json::array();
    for (const auto& entry : overview.high_risk_distributors) {
        risky.push_back({
            {"distributor_id", entry.distributor_id},
            {"state", entry.state},
            {"risk_pct", entry.risk_pct},
            {"status", entry.status},
        });
    }

    json j;
    j["state_wise_waste"] = std::move(states);
    j["high_risk_distributors"] = std::move(risky);
    j["key_insights"] = overview.key_insights;
    return j;
}

json ToJson(const analytics::InventoryOverview& overview) {
    json j;
    j["total_waste"] = {{"value", overview.total_waste}};
    j["total_allowance"] = {{"value", overview.total_allowance}};
    j["utilization_rate"] = {{"value", overview.utilization_pct}};
    j["high_risk_states"] = {{"value", overview.high_risk_states}};
    return j;
}

json ToJson(const std::vector<analytics::MonthlyWastePoint>& chart) {
    json allowed_vs_actual = json::array();
    json loss_trend = json::array();
    for (const auto& point : chart) {
        allowed_vs_actual.push_back(
            {{"month", point.label}, {"allowed", point.allowed}, {"actual", point.actual}});
        loss_trend.push_back({{"month", point.label}, {"value", point.actual}});
    }
    return {{"allowed_vs_actual", std::move(allowed_vs_actual)},
            {"loss_trend", std::move(loss_trend)}};
}

json ToJson(const std::vector<analytics::DistributorAllowanceStatus>& rows) {
    json j = json::array();
    for (const auto& row : rows) {
        j.push_back({
            {"distributor_id", row.distributor_id},
            {"allowance", row.allowance},
            {"actual_waste", row.actual_waste},
            {"utilization_pct", row.utilization_pct},
            {"status", analytics::StatusBadgeToString(row.status)},
        });
    }
    return j;
}

json ToJson(const alerting::Alert& alert) {
    json j;
    j["severity"] = alerting::AlertSeverityToString(alert.severity);
    j["title"] = alert.title;
    j["description"] = alert.description;
    j["distributor_id"] = alert.distributor_id;
    j["state"] = alert.state;
    j["category"] = alert.category;
    j["time_ref"] = alert.time_ref;
    return j;
}

json ToJson(const alerting::AlertReport& report) {
    json alerts = json::array();
    for (const auto& alert : report.alerts) {
        alerts.push_back(ToJson(alert));
    }
    json j;
    j["summary"] = {
        {"high", report.summary.high},
        {"medium", report.summary.medium},
        {"low", report.summary.low},
    };
    j["alerts"] = std::move(alerts);
    return j;
}

json ToJson(const correlation::CorrelationReport& report) {
    json matrix = json::array();
    for (const auto& row : report.matrix) {
        json cells = json::array();
        for (const auto& cell : row) {
            cells.push_back(OptionalToJson(cell));
        }
        matrix.push_back(std::move(cells));
    }

    json recommendations = json::object();
    for (const auto& rec : report.model_recommendations) {
        json features = rec.all_numeric_features ? json("All numeric features")
                                                 : json(rec.features);
        recommendations[rec.model] = {{"features", std::move(features)}, {"reason", rec.reason}};
    }

    json j;
    j["heatmap"] = {{"features", report.features}, {"matrix", std::move(matrix)}};
    j["key_relationships"] = {
        {"strong", RelationshipsToJson(report.key_relationships.strong)},
        {"moderate", RelationshipsToJson(report.key_relationships.moderate)},
        {"inverse", RelationshipsToJson(report.key_relationships.inverse)},
    };
    j["model_recommendations"] = std::move(recommendations);
    return j;
}

json ToJson(const rca::RootCauseReport& report) {
    json factors = json::array();
    for (const auto& factor : report.top_factors) {
        factors.push_back({{"feature", factor.feature},
                           {"contribution_pct", factor.contribution_pct}});
    }
    json secondary = json::array();
    for (const auto& driver : report.secondary_drivers) {
        secondary.push_back({{"feature", driver.feature}, {"reason", driver.reason}});
    }

    json j;
    j["top_factors"] = std::move(factors);
    j["primary_cause"] = {{"feature", report.primary_cause.feature},
                          {"reason", report.primary_cause.reason}};
    j["secondary_drivers"] = std::move(secondary);
    j["recommended_actions"] = report.recommended_actions;
    return j;
}

std::string Dump(const json& j, int indent) {
    return j.dump(indent);
}

}  // namespace invsense::report
