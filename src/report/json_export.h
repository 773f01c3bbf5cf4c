#pragma once

/// @file json_export.h
/// @brief JSON serialization of analytics results
///
/// Field names follow the dashboard payloads. Optional values are written
/// as null.

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "processor/alerting/deduplicator.h"
#include "processor/analytics/distributor_quarter.h"
#include "processor/analytics/inventory_report.h"
#include "processor/analytics/risk_overview.h"
#include "processor/analytics/trend_engine.h"
#include "processor/correlation/correlation_engine.h"
#include "processor/rca/root_cause.h"

namespace invsense::report {

using json = nlohmann::json;

json ToJson(const analytics::DistributorQuarterAggregate& row);
json ToJson(const analytics::DistributorQuarterTable& table);

json ToJson(const analytics::QuarterComparison& comparison);
json ToJson(const analytics::DistributorTrend& trend);
json ToJson(const std::vector<analytics::TopRiskyEntry>& top);
json ToJson(const analytics::RiskOverview& overview);

json ToJson(const analytics::InventoryOverview& overview);
/// @brief {"allowed_vs_actual": [...], "loss_trend": [...]}
json ToJson(const std::vector<analytics::MonthlyWastePoint>& chart);
json ToJson(const std::vector<analytics::DistributorAllowanceStatus>& rows);

json ToJson(const alerting::Alert& alert);
json ToJson(const alerting::AlertReport& report);

json ToJson(const correlation::CorrelationReport& report);
json ToJson(const rca::RootCauseReport& report);

/// @brief Pretty-printed JSON text
std::string Dump(const json& j, int indent = 2);

}  // namespace invsense::report
