/// @file risk_overview.cpp
/// @brief Risk overview implementation

#include "processor/analytics/risk_overview.h"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/strip.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/numeric.h"

namespace invsense::analytics {

namespace {

bool Contains(const std::vector<int>& values, int value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

bool Contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

bool PassesTimeFilter(const data::RawRecord& record, const OverviewFilter& filter) {
    if (filter.years.empty() && filter.months.empty()) {
        return true;
    }
    if (!record.time_key.has_value()) {
        return false;
    }
    if (!filter.years.empty() && !Contains(filter.years, record.time_key->year)) {
        return false;
    }
    if (!filter.months.empty() &&
        !Contains(filter.months, data::MonthAbbreviation(record.time_key->month))) {
        return false;
    }
    return true;
}

}  // namespace

absl::StatusOr<std::vector<int>> ParseYearFilter(const std::vector<std::string>& values) {
    std::vector<int> years;
    for (const auto& value : values) {
        absl::string_view text = absl::StripAsciiWhitespace(value);
        if (text == kAllYears) {
            return std::vector<int>{};
        }
        int year = 0;
        if (!absl::SimpleAtoi(text, &year)) {
            return InvalidArgumentError(absl::StrCat("Invalid year filter: '", value, "'"));
        }
        years.push_back(year);
    }
    return years;
}

std::vector<std::string> NormalizeMonthFilter(const std::vector<std::string>& values) {
    std::vector<std::string> months;
    for (const auto& value : values) {
        std::string month(absl::StripAsciiWhitespace(value));
        if (month == kAllMonths) {
            return {};
        }
        months.push_back(std::move(month));
    }
    return months;
}

std::string OverviewStatus(double risk_pct) {
    if (risk_pct >= 80.0) {
        return "High Risk";
    }
    if (risk_pct >= 60.0) {
        return "Risk";
    }
    return "OK";
}

RiskOverview BuildRiskOverview(const data::Dataset& dataset,
                               const DistributorQuarterTable& table,
                               const OverviewFilter& filter,
                               size_t top_states,
                               size_t top_distributors) {
    RiskOverview overview;

    // State-wise waste from the time-filtered records
    std::map<std::string, double> waste_by_state;
    double total_waste = 0.0;
    for (const auto& record : dataset.records()) {
        if (!PassesTimeFilter(record, filter)) {
            continue;
        }
        double waste = record.waste.value_or(0.0);
        total_waste += waste;
        if (record.state.has_value()) {
            waste_by_state[*record.state] += waste;
        }
    }

    std::vector<std::pair<std::string, double>> states(waste_by_state.begin(),
                                                       waste_by_state.end());
    std::stable_sort(states.begin(), states.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });
    if (states.size() > top_states) {
        states.resize(top_states);
    }
    for (const auto& [state, waste] : states) {
        overview.state_wise_waste.push_back({state, RoundDecimals(waste, 2)});
    }

    // Distributor risk from the year-filtered distributor-quarter rows
    struct RiskSums {
        double waste = 0.0;
        double pct_sum = 0.0;
        size_t count = 0;
    };
    std::map<std::pair<int64_t, std::string>, RiskSums> risk_groups;
    std::vector<const DistributorQuarterAggregate*> year_rows;
    for (const auto& row : table) {
        if (!filter.years.empty() && !Contains(filter.years, row.year)) {
            continue;
        }
        year_rows.push_back(&row);
        RiskSums& sums = risk_groups[{row.distributor_id, row.state}];
        sums.waste += row.total_waste;
        sums.pct_sum += row.pct_from_limit;
        ++sums.count;
    }

    std::vector<RiskyDistributor> risky;
    risky.reserve(risk_groups.size());
    for (const auto& [key, sums] : risk_groups) {
        RiskyDistributor entry;
        entry.distributor_id = key.first;
        entry.state = key.second;
        entry.total_waste = RoundDecimals(sums.waste, 2);
        double mean = sums.pct_sum / static_cast<double>(sums.count);
        entry.risk_pct = RoundDecimals(std::clamp(mean, 0.0, 100.0), 1);
        entry.status = OverviewStatus(entry.risk_pct);
        risky.push_back(std::move(entry));
    }
    std::stable_sort(risky.begin(), risky.end(),
        [](const RiskyDistributor& a, const RiskyDistributor& b) {
            return a.risk_pct > b.risk_pct;
        });
    if (risky.size() > top_distributors) {
        risky.resize(top_distributors);
    }
    overview.high_risk_distributors = risky;

    // Insights
    if (!states.empty() && total_waste > 0.0) {
        double pct = states.front().second / total_waste * 100.0;
        overview.key_insights.push_back(absl::StrFormat(
            "%s accounts for %.0f%% of total stale inventory losses.",
            states.front().first, pct));
    }

    std::set<int64_t> top_ids;
    for (const auto& entry : risky) {
        top_ids.insert(entry.distributor_id);
    }
    double top_waste = 0.0;
    for (const auto* row : year_rows) {
        if (top_ids.count(row->distributor_id) > 0) {
            top_waste += row->total_waste;
        }
    }
    double top_pct = total_waste != 0.0 ? top_waste / total_waste * 100.0 : 0.0;
    overview.key_insights.push_back(absl::StrFormat(
        "Top 5 distributors contribute to %.0f%% of total waste.", top_pct));

    INVSENSE_LOG_DEBUG("Risk overview: {} states, {} risky distributors, total waste {:.2f}",
                       overview.state_wise_waste.size(),
                       overview.high_risk_distributors.size(), total_waste);
    return overview;
}

}  // namespace invsense::analytics
