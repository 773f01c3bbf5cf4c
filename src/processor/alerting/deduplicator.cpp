/// @file deduplicator.cpp
/// @brief Alert deduplication implementation

#include "processor/alerting/deduplicator.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <set>
#include <unordered_set>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/strip.h>

#include "common/error.h"
#include "common/logging.h"

namespace invsense::alerting {

namespace {

bool IsAll(const std::string& value) {
    return absl::AsciiStrToUpper(absl::StripAsciiWhitespace(value)) == kFilterAll;
}

}  // namespace

AlertSummary SummarizeAlerts(const std::vector<Alert>& alerts) {
    std::set<int64_t> high;
    std::set<int64_t> medium;
    std::set<int64_t> low;
    for (const auto& alert : alerts) {
        switch (alert.severity) {
            case AlertSeverity::kHigh: high.insert(alert.distributor_id); break;
            case AlertSeverity::kMedium: medium.insert(alert.distributor_id); break;
            case AlertSeverity::kLow: low.insert(alert.distributor_id); break;
        }
    }
    return AlertSummary{high.size(), medium.size(), low.size()};
}

std::vector<Alert> DeduplicateAlerts(const std::vector<Alert>& alerts) {
    std::vector<Alert> sorted = alerts;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const Alert& a, const Alert& b) {
            return SeverityPriority(a.severity) > SeverityPriority(b.severity);
        });

    std::unordered_set<int64_t> seen;
    std::vector<Alert> deduped;
    for (auto& alert : sorted) {
        if (seen.insert(alert.distributor_id).second) {
            deduped.push_back(std::move(alert));
        }
    }
    return deduped;
}

absl::StatusOr<std::vector<Alert>> FilterAlerts(const std::vector<Alert>& alerts,
                                                const AlertFilter& filter) {
    // An unknown severity name matches no alert
    std::optional<std::string> severity;
    if (!IsAll(filter.severity)) {
        severity = absl::AsciiStrToUpper(absl::StripAsciiWhitespace(filter.severity));
    }

    std::optional<int64_t> distributor;
    if (!IsAll(filter.distributor)) {
        int64_t id = 0;
        if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(filter.distributor), &id)) {
            return InvalidArgumentError(
                absl::StrCat("Distributor filter must be an integer: '", filter.distributor, "'"));
        }
        distributor = id;
    }

    std::optional<std::string> state;
    if (!IsAll(filter.state)) {
        state = filter.state;
    }

    std::vector<Alert> result;
    for (const auto& alert : alerts) {
        if (severity && AlertSeverityToString(alert.severity) != *severity) continue;
        if (distributor && alert.distributor_id != *distributor) continue;
        if (state && alert.state != *state) continue;
        result.push_back(alert);
    }
    return result;
}

absl::StatusOr<AlertReport> BuildAlertReport(const std::vector<Alert>& alerts,
                                             const AlertFilter& filter) {
    AlertReport report;
    report.summary = SummarizeAlerts(alerts);
    INVSENSE_ASSIGN_OR_RETURN(report.alerts, FilterAlerts(DeduplicateAlerts(alerts), filter));

    INVSENSE_LOG_DEBUG("Alert report: {} raw, {} after dedup and filter "
                       "(HIGH={}, MEDIUM={}, LOW={})",
                       alerts.size(), report.alerts.size(),
                       report.summary.high, report.summary.medium, report.summary.low);
    return report;
}

}  // namespace invsense::alerting
