#pragma once

/// @file alert_rules.h
/// @brief Rule-based alert generation over distributor-state groups
///
/// Records are grouped by (distributor, state) and every rule is checked
/// against each group:
/// - HIGH: waste above its allowance
/// - MEDIUM: returns above a share of deliveries
/// - LOW: waste well within its allowance (positive signal)

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "data/dataset.h"

namespace invsense::alerting {

/// @brief Alert severity levels
enum class AlertSeverity {
    kLow,     ///< Positive signal
    kMedium,  ///< Needs attention
    kHigh     ///< Allowance exceeded
};

/// @brief "HIGH", "MEDIUM", "LOW"
std::string AlertSeverityToString(AlertSeverity severity);

/// @brief Parse a severity name, case-insensitive
std::optional<AlertSeverity> ParseAlertSeverity(std::string_view name);

/// @brief Dedup priority: HIGH 3, MEDIUM 2, LOW 1
int SeverityPriority(AlertSeverity severity);

/// @brief Alert raised for one distributor-state group
struct Alert {
    AlertSeverity severity = AlertSeverity::kLow;
    std::string title;
    std::string description;
    int64_t distributor_id = 0;
    std::string state;
    std::string category;
    std::string time_ref = "Recent";
};

/// @brief Ratio thresholds of the built-in rules
struct AlertThresholds {
    double waste_exceeded_ratio = 1.0;   ///< waste / allowance >
    double high_return_ratio = 0.08;     ///< returns / deliveries >
    double good_control_ratio = 0.6;     ///< waste / allowance <
};

/// @brief Summed measures of one (distributor, state) group
struct GroupTotals {
    int64_t distributor_id = 0;
    std::string state;
    double deliveries = 0.0;
    double returns = 0.0;
    double waste_allowance = 0.0;
    double waste = 0.0;
};

/// @brief One alert rule
///
/// `evaluate` returns the alert description when the rule fires for a
/// group, nullopt otherwise.
struct AlertRule {
    std::string rule_id;
    AlertSeverity severity = AlertSeverity::kLow;
    std::string title;
    std::string category;
    std::function<std::optional<std::string>(const GroupTotals&)> evaluate;
};

/// @brief Columns the alert rules need in the input schema
const std::vector<std::string>& RequiredAlertColumns();

/// @brief Alert rules engine
///
/// Example:
/// @code
///   AlertRulesEngine engine;
///   auto alerts = engine.Evaluate(dataset);
///   if (alerts.ok()) {
///       auto report = BuildAlertReport(*alerts, AlertFilter{});
///   }
/// @endcode
class AlertRulesEngine {
public:
    explicit AlertRulesEngine(AlertThresholds thresholds = {});

    /// @brief Group records and run every rule
    ///
    /// Output order: all HIGH alerts, then MEDIUM, then LOW; within a
    /// severity, groups in ascending (distributor, state) order.
    /// @return SchemaError if a required column is missing
    absl::StatusOr<std::vector<Alert>> Evaluate(const data::Dataset& dataset) const;

    /// @brief Sum measures per (distributor, state); rows without identity are skipped
    static std::vector<GroupTotals> AggregateGroups(const data::Dataset& dataset);

    const std::vector<AlertRule>& rules() const { return rules_; }
    const AlertThresholds& thresholds() const { return thresholds_; }

private:
    void RegisterBuiltinRules();

    AlertThresholds thresholds_;
    std::vector<AlertRule> rules_;
};

}  // namespace invsense::alerting
