/// @file alert_rules.cpp
/// @brief Alert rules engine implementation

#include "processor/alerting/alert_rules.h"

#include <map>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/str_format.h>

#include "common/error.h"
#include "common/logging.h"

namespace invsense::alerting {

std::string AlertSeverityToString(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::kHigh: return "HIGH";
        case AlertSeverity::kMedium: return "MEDIUM";
        case AlertSeverity::kLow: return "LOW";
        default: return "UNKNOWN";
    }
}

std::optional<AlertSeverity> ParseAlertSeverity(std::string_view name) {
    std::string upper = absl::AsciiStrToUpper(name);
    if (upper == "HIGH") return AlertSeverity::kHigh;
    if (upper == "MEDIUM") return AlertSeverity::kMedium;
    if (upper == "LOW") return AlertSeverity::kLow;
    return std::nullopt;
}

int SeverityPriority(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::kHigh: return 3;
        case AlertSeverity::kMedium: return 2;
        case AlertSeverity::kLow: return 1;
        default: return 0;
    }
}

const std::vector<std::string>& RequiredAlertColumns() {
    static const std::vector<std::string> kColumns = {
        data::kDistributorIdColumn,
        data::kStateColumn,
        data::kWasteColumn,
        data::kWasteAllowanceColumn,
        data::kReturnsColumn,
        data::kDeliveriesColumn,
    };
    return kColumns;
}

AlertRulesEngine::AlertRulesEngine(AlertThresholds thresholds)
    : thresholds_(thresholds) {
    RegisterBuiltinRules();
}

void AlertRulesEngine::RegisterBuiltinRules() {
    const AlertThresholds t = thresholds_;

    rules_.push_back(AlertRule{
        "waste_threshold_exceeded",
        AlertSeverity::kHigh,
        "Waste Threshold Exceeded",
        "Stale Inventory",
        [t](const GroupTotals& g) -> std::optional<std::string> {
            if (g.waste_allowance <= 0.0) {
                return std::nullopt;
            }
            double usage = g.waste / g.waste_allowance;
            if (usage <= t.waste_exceeded_ratio) {
                return std::nullopt;
            }
            return absl::StrFormat("Waste exceeded allowance by %.1f%%", (usage - 1.0) * 100.0);
        }});

    rules_.push_back(AlertRule{
        "high_return_rate",
        AlertSeverity::kMedium,
        "High Return Rate",
        "Returns",
        [t](const GroupTotals& g) -> std::optional<std::string> {
            if (g.deliveries <= 0.0) {
                return std::nullopt;
            }
            double return_ratio = g.returns / g.deliveries;
            if (return_ratio <= t.high_return_ratio) {
                return std::nullopt;
            }
            return absl::StrFormat("Returns at %.1f%% of deliveries", return_ratio * 100.0);
        }});

    rules_.push_back(AlertRule{
        "good_inventory_control",
        AlertSeverity::kLow,
        "Good Inventory Control",
        "Positive Signal",
        [t](const GroupTotals& g) -> std::optional<std::string> {
            if (g.waste_allowance <= 0.0) {
                return std::nullopt;
            }
            if (g.waste / g.waste_allowance >= t.good_control_ratio) {
                return std::nullopt;
            }
            return std::string("Waste well within allowed limits");
        }});
}

std::vector<GroupTotals> AlertRulesEngine::AggregateGroups(const data::Dataset& dataset) {
    std::map<std::pair<int64_t, std::string>, GroupTotals> groups;
    for (const auto& record : dataset.records()) {
        if (!record.HasIdentity()) {
            continue;
        }
        auto key = std::make_pair(*record.distributor_id, *record.state);
        auto [it, inserted] = groups.try_emplace(key);
        GroupTotals& totals = it->second;
        if (inserted) {
            totals.distributor_id = key.first;
            totals.state = key.second;
        }
        totals.deliveries += record.deliveries.value_or(0.0);
        totals.returns += record.returns.value_or(0.0);
        totals.waste_allowance += record.waste_allowance.value_or(0.0);
        totals.waste += record.waste.value_or(0.0);
    }

    std::vector<GroupTotals> result;
    result.reserve(groups.size());
    for (auto& entry : groups) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

absl::StatusOr<std::vector<Alert>> AlertRulesEngine::Evaluate(
    const data::Dataset& dataset) const {

    INVSENSE_RETURN_IF_ERROR(dataset.RequireColumns(RequiredAlertColumns(), "Alerts"));

    std::vector<GroupTotals> groups = AggregateGroups(dataset);

    std::vector<Alert> alerts;
    for (const auto& rule : rules_) {
        for (const auto& group : groups) {
            auto description = rule.evaluate(group);
            if (!description.has_value()) {
                continue;
            }
            Alert alert;
            alert.severity = rule.severity;
            alert.title = rule.title;
            alert.description = std::move(*description);
            alert.distributor_id = group.distributor_id;
            alert.state = group.state;
            alert.category = rule.category;
            alerts.push_back(std::move(alert));
        }
    }

    INVSENSE_LOG_DEBUG("Evaluated {} alert rules over {} groups: {} alerts",
                       rules_.size(), groups.size(), alerts.size());
    return alerts;
}

}  // namespace invsense::alerting
