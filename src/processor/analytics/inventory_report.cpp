/// @file inventory_report.cpp
/// @brief Inventory report implementation

#include "processor/analytics/inventory_report.h"

#include <algorithm>
#include <map>
#include <optional>
#include <utility>

#include "common/logging.h"
#include "common/numeric.h"

namespace invsense::analytics {

namespace {

/// Median of the present values, nullopt when none are present
std::optional<double> Median(std::vector<double> values) {
    if (values.empty()) {
        return std::nullopt;
    }
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) {
        return values[mid];
    }
    return (values[mid - 1] + values[mid]) / 2.0;
}

}  // namespace

InventoryOverview BuildInventoryOverview(const data::Dataset& dataset) {
    InventoryOverview overview;

    std::map<std::string, std::pair<double, double>> by_state;  // waste, allowance
    double total_waste = 0.0;
    double total_allowance = 0.0;
    for (const auto& record : dataset.records()) {
        double waste = record.waste.value_or(0.0);
        double allowance = record.waste_allowance.value_or(0.0);
        total_waste += waste;
        total_allowance += allowance;
        if (record.state.has_value()) {
            auto& sums = by_state[*record.state];
            sums.first += waste;
            sums.second += allowance;
        }
    }

    overview.total_waste = RoundDecimals(total_waste, 2);
    overview.total_allowance = RoundDecimals(total_allowance, 2);
    overview.utilization_pct = total_allowance > 0.0
        ? RoundDecimals(total_waste / total_allowance * 100.0, 1)
        : 0.0;

    for (const auto& [state, sums] : by_state) {
        if (sums.second == 0.0) {
            continue;
        }
        if (sums.first / sums.second * 100.0 >= kHighRiskStateUtilization) {
            ++overview.high_risk_states;
        }
    }
    return overview;
}

std::vector<MonthlyWastePoint> BuildMonthlyWasteChart(const data::Dataset& dataset,
                                                      size_t months) {
    std::map<std::pair<int, int>, std::pair<double, double>> by_month;  // allowed, actual
    for (const auto& record : dataset.records()) {
        if (!record.time_key.has_value()) {
            continue;
        }
        auto& sums = by_month[{record.time_key->year, record.time_key->month}];
        sums.first += record.waste_allowance.value_or(0.0);
        sums.second += record.waste.value_or(0.0);
    }

    std::vector<MonthlyWastePoint> chart;
    size_t skip = by_month.size() > months ? by_month.size() - months : 0;
    for (const auto& [key, sums] : by_month) {
        if (skip > 0) {
            --skip;
            continue;
        }
        MonthlyWastePoint point;
        point.year = key.first;
        point.month = key.second;
        point.label = data::MonthAbbreviation(key.second);
        point.allowed = RoundDecimals(sums.first, 2);
        point.actual = RoundDecimals(sums.second, 2);
        chart.push_back(std::move(point));
    }
    return chart;
}

std::vector<DistributorAllowanceStatus> BuildDistributorAllowanceStatus(
    const data::Dataset& dataset,
    const RiskThresholds& thresholds) {

    std::vector<double> allowances;
    std::vector<double> wastes;
    for (const auto& record : dataset.records()) {
        if (record.waste_allowance.has_value()) {
            allowances.push_back(*record.waste_allowance);
        }
        if (record.waste.has_value()) {
            wastes.push_back(*record.waste);
        }
    }
    const std::optional<double> median_allowance = Median(std::move(allowances));
    const std::optional<double> median_waste = Median(std::move(wastes));

    std::map<int64_t, std::pair<double, double>> by_distributor;  // allowance, waste
    for (const auto& record : dataset.records()) {
        if (!record.distributor_id.has_value()) {
            continue;
        }
        auto& sums = by_distributor[*record.distributor_id];
        std::optional<double> allowance =
            record.waste_allowance.has_value() ? record.waste_allowance : median_allowance;
        std::optional<double> waste = record.waste.has_value() ? record.waste : median_waste;
        sums.first += allowance.value_or(0.0);
        sums.second += waste.value_or(0.0);
    }

    std::vector<DistributorAllowanceStatus> rows;
    rows.reserve(by_distributor.size());
    for (const auto& [id, sums] : by_distributor) {
        DistributorAllowanceStatus row;
        row.distributor_id = id;
        row.allowance = RoundDecimals(sums.first, 2);
        row.actual_waste = RoundDecimals(sums.second, 2);

        double denominator = sums.first;
        if (denominator == 0.0) {
            denominator = median_allowance.value_or(0.0);
        }
        std::optional<double> pct_from_limit;
        if (denominator != 0.0) {
            row.utilization_pct = RoundDecimals(sums.second / denominator * 100.0, 1);
            pct_from_limit = (sums.second - sums.first) / denominator * 100.0;
            row.pct_from_limit = RoundDecimals(*pct_from_limit, 2);
        }
        row.status = ToStatusBadge(ClassifyRisk(pct_from_limit, std::nullopt, thresholds));
        rows.push_back(std::move(row));
    }

    std::stable_sort(rows.begin(), rows.end(),
        [](const DistributorAllowanceStatus& a, const DistributorAllowanceStatus& b) {
            return a.utilization_pct > b.utilization_pct;
        });

    INVSENSE_LOG_DEBUG("Distributor allowance status: {} distributors", rows.size());
    return rows;
}

}  // namespace invsense::analytics
