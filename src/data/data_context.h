#pragma once

/// @file data_context.h
/// @brief Holder of the current immutable dataset snapshot

#include <cstdint>
#include <memory>

#include <absl/status/statusor.h>

#include "data/dataset.h"
#include "data/table.h"
#include "processor/analytics/distributor_quarter.h"
#include "processor/analytics/risk_classifier.h"

namespace invsense::data {

/// @brief Dataset plus everything derived from it at publication time
struct Snapshot {
    Dataset dataset;
    analytics::DistributorQuarterTable distributor_quarters;
    uint64_t version = 0;
};

/// @brief Publishes and hands out dataset snapshots
///
/// A single writer replaces the snapshot pointer atomically. Readers take a
/// shared_ptr to one snapshot and keep it for the duration of a computation,
/// so they never see a half-built replacement. A failed publication keeps
/// the previous snapshot.
///
/// Example:
/// @code
///   DataContext context;
///   auto version = context.Publish(std::move(table));
///   auto snapshot = context.Current();
///   if (snapshot.ok()) {
///       auto top = analytics::TopRiskyDistributors((*snapshot)->distributor_quarters);
///   }
/// @endcode
class DataContext {
public:
    DataContext() = default;

    // Disable copy
    DataContext(const DataContext&) = delete;
    DataContext& operator=(const DataContext&) = delete;

    /// @brief Normalize a table, rebuild the distributor-quarter table and publish
    /// @return The new snapshot version, or the build error (snapshot unchanged)
    absl::StatusOr<uint64_t> Publish(Table table,
                                     const analytics::RiskThresholds& thresholds = {});

    /// @brief Current snapshot
    /// @return FailedPrecondition if nothing was published yet
    absl::StatusOr<std::shared_ptr<const Snapshot>> Current() const;

    bool HasSnapshot() const;

private:
    std::shared_ptr<const Snapshot> snapshot_;
    uint64_t next_version_ = 1;
};

}  // namespace invsense::data
