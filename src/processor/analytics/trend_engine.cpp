/// @file trend_engine.cpp
/// @brief Trend engine implementation

#include "processor/analytics/trend_engine.h"

#include <algorithm>
#include <map>
#include <set>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/numeric.h"
#include "data/time_key.h"

namespace invsense::analytics {

namespace {

constexpr char kStatusArrow[] = " → ";
constexpr char kUnknownStatus[] = "Unknown";

std::string StatusChange(const std::optional<RiskStatus>& before,
                         const std::optional<RiskStatus>& after) {
    return absl::StrCat(before ? RiskStatusToString(*before) : kUnknownStatus,
                        kStatusArrow,
                        after ? RiskStatusToString(*after) : kUnknownStatus);
}

bool IsSelected(const std::vector<int64_t>& ids, int64_t id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

}  // namespace

std::optional<double> PercentChange(double current, double prior) {
    if (prior == 0.0) {
        return std::nullopt;
    }
    return (current / prior - 1.0) * 100.0;
}

void ApplyQuarterOverQuarterChange(DistributorQuarterTable& table) {
    const DistributorQuarterAggregate* previous = nullptr;
    for (auto& row : table) {
        if (previous == nullptr || previous->distributor_id != row.distributor_id) {
            row.pct_change_from_prior_quarter = std::nullopt;
        } else {
            auto change = PercentChange(row.total_waste, previous->total_waste);
            row.pct_change_from_prior_quarter =
                change ? std::optional<double>(RoundDecimals(*change, 2)) : std::nullopt;
        }
        previous = &row;
    }
}

TrendDirection ClassifyDelta(double delta) {
    if (delta > 0.0) {
        return TrendDirection::kUp;
    }
    if (delta < 0.0) {
        return TrendDirection::kDown;
    }
    return TrendDirection::kFlat;
}

std::string TrendDirectionToString(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::kUp: return "up";
        case TrendDirection::kDown: return "down";
        case TrendDirection::kFlat:
        default:
            return "flat";
    }
}

std::string TrendArrow(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::kUp: return "⬆️ \U0001F534";
        case TrendDirection::kDown: return "⬇️ \U0001F7E2";
        case TrendDirection::kFlat:
        default:
            return "➖";
    }
}

absl::StatusOr<QuarterComparison> CompareQuarters(
    const DistributorQuarterTable& table,
    const QuarterComparisonRequest& request) {

    if (request.distributor_ids.empty() || request.distributor_ids.size() > 2) {
        return InvalidArgumentError(absl::StrCat(
            "Quarter comparison takes one or two distributors, got ",
            request.distributor_ids.size()));
    }

    std::vector<const DistributorQuarterAggregate*> in_state;
    for (const auto& row : table) {
        if (row.state == request.state) {
            in_state.push_back(&row);
        }
    }
    if (in_state.empty()) {
        return NotFoundError(absl::StrCat("No data for state '", request.state, "'"));
    }

    INVSENSE_ASSIGN_OR_RETURN(data::QuarterRef ref_a, data::ParseQuarterLabel(request.quarter_a));
    INVSENSE_ASSIGN_OR_RETURN(data::QuarterRef ref_b, data::ParseQuarterLabel(request.quarter_b));

    QuarterComparison result;
    result.state = request.state;
    result.quarter_a = request.quarter_a;
    result.quarter_b = request.quarter_b;

    // State filtering makes distributor id unique within one quarter
    std::map<int64_t, const DistributorQuarterAggregate*> side_a;
    std::map<int64_t, const DistributorQuarterAggregate*> side_b;
    for (const auto* row : in_state) {
        if (!IsSelected(request.distributor_ids, row->distributor_id)) {
            continue;
        }
        if (row->quarter_ref() == ref_a) {
            side_a.emplace(row->distributor_id, row);
        }
        if (row->quarter_ref() == ref_b) {
            side_b.emplace(row->distributor_id, row);
        }
    }

    if (ref_a == ref_b) {
        for (const auto& [id, row] : side_a) {
            QuarterComparisonRow out;
            out.distributor_id = id;
            out.total_waste_q1 = RoundDecimals(row->total_waste, 2);
            out.total_waste_q2 = out.total_waste_q1;
            out.delta = 0.0;
            out.trend = TrendDirection::kFlat;
            out.status_change = StatusChange(row->status, row->status);
            result.rows.push_back(std::move(out));
        }
        return result;
    }

    std::set<int64_t> ids;
    for (const auto& entry : side_a) ids.insert(entry.first);
    for (const auto& entry : side_b) ids.insert(entry.first);

    for (int64_t id : ids) {
        auto a = side_a.find(id);
        auto b = side_b.find(id);

        QuarterComparisonRow out;
        out.distributor_id = id;
        std::optional<RiskStatus> status_a;
        std::optional<RiskStatus> status_b;
        if (a != side_a.end()) {
            out.total_waste_q1 = RoundDecimals(a->second->total_waste, 2);
            status_a = a->second->status;
        }
        if (b != side_b.end()) {
            out.total_waste_q2 = RoundDecimals(b->second->total_waste, 2);
            status_b = b->second->status;
        }

        out.delta = RoundDecimals(out.total_waste_q2.value_or(0.0) -
                                  out.total_waste_q1.value_or(0.0), 2);
        out.trend = ClassifyDelta(out.delta);
        out.status_change = StatusChange(status_a, status_b);
        result.rows.push_back(std::move(out));
    }

    INVSENSE_LOG_DEBUG("Compared {} vs {} in {} for [{}]: {} rows",
                       request.quarter_a, request.quarter_b, request.state,
                       absl::StrJoin(request.distributor_ids, ", "), result.rows.size());
    return result;
}

absl::StatusOr<DistributorTrend> GetDistributorTrend(
    const DistributorQuarterTable& table,
    int64_t distributor_id) {

    std::vector<const DistributorQuarterAggregate*> rows;
    for (const auto& row : table) {
        if (row.distributor_id == distributor_id) {
            rows.push_back(&row);
        }
    }
    if (rows.empty()) {
        return NotFoundError(absl::StrCat("No data found for distributor ", distributor_id));
    }

    std::stable_sort(rows.begin(), rows.end(),
        [](const DistributorQuarterAggregate* a, const DistributorQuarterAggregate* b) {
            return a->quarter_ref() < b->quarter_ref();
        });

    DistributorTrend trend;
    trend.distributor_id = distributor_id;
    trend.points.reserve(rows.size());
    for (const auto* row : rows) {
        TrendPoint point;
        point.quarter = data::FormatQuarterLabel(row->quarter_ref());
        point.state = row->state;
        point.waste = RoundDecimals(row->total_waste, 2);
        point.pct_change = row->pct_change_from_prior_quarter;
        point.status = row->status;
        trend.points.push_back(std::move(point));
    }
    return trend;
}

std::vector<TopRiskyEntry> TopRiskyDistributors(
    const DistributorQuarterTable& table,
    size_t limit) {

    std::vector<const DistributorQuarterAggregate*> ranked;
    ranked.reserve(table.size());
    for (const auto& row : table) {
        ranked.push_back(&row);
    }

    std::stable_sort(ranked.begin(), ranked.end(),
        [](const DistributorQuarterAggregate* a, const DistributorQuarterAggregate* b) {
            return a->pct_from_limit > b->pct_from_limit;
        });

    std::vector<TopRiskyEntry> top;
    for (size_t i = 0; i < ranked.size() && i < limit; ++i) {
        TopRiskyEntry entry;
        entry.distributor_id = ranked[i]->distributor_id;
        entry.state = ranked[i]->state;
        entry.risk_pct = RoundDecimals(ranked[i]->pct_from_limit, 1);
        entry.status = ranked[i]->status;
        top.push_back(std::move(entry));
    }
    return top;
}

}  // namespace invsense::analytics
