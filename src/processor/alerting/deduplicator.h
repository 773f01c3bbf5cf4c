#pragma once

/// @file deduplicator.h
/// @brief Alert summary, deduplication and filtering
///
/// The summary counts distinct distributors per severity over the full
/// alert set. Deduplication then keeps one alert per distributor (the
/// highest severity) and filters narrow that view without touching the
/// summary.

#include <cstddef>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "processor/alerting/alert_rules.h"

namespace invsense::alerting {

/// @brief Filter value that disables a filter
inline constexpr char kFilterAll[] = "ALL";

/// @brief Distinct distributors per severity
struct AlertSummary {
    size_t high = 0;
    size_t medium = 0;
    size_t low = 0;
};

/// @brief Equality filters on deduplicated alerts; "ALL" disables a filter
struct AlertFilter {
    std::string severity = kFilterAll;     ///< case-insensitive
    std::string distributor = kFilterAll;  ///< integer id
    std::string state = kFilterAll;
};

/// @brief Alerts endpoint result
struct AlertReport {
    AlertSummary summary;
    std::vector<Alert> alerts;
};

/// @brief Count distinct distributors per severity
AlertSummary SummarizeAlerts(const std::vector<Alert>& alerts);

/// @brief Keep one alert per distributor, the one with the highest priority
///
/// Alerts are stable-sorted by priority (descending) and the first alert
/// seen for each distributor wins, so equal-priority alerts keep their
/// generation order.
std::vector<Alert> DeduplicateAlerts(const std::vector<Alert>& alerts);

/// @brief Apply a filter
/// @return InvalidArgument for a non-integer distributor filter
absl::StatusOr<std::vector<Alert>> FilterAlerts(const std::vector<Alert>& alerts,
                                                const AlertFilter& filter);

/// @brief Summary over all alerts plus the deduplicated, filtered list
absl::StatusOr<AlertReport> BuildAlertReport(const std::vector<Alert>& alerts,
                                             const AlertFilter& filter);

}  // namespace invsense::alerting
