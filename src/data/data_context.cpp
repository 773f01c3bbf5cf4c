/// @file data_context.cpp
/// @brief Data context implementation

#include "data/data_context.h"

#include <atomic>
#include <utility>

#include "common/error.h"
#include "common/logging.h"
#include "processor/analytics/aggregator.h"

namespace invsense::data {

absl::StatusOr<uint64_t> DataContext::Publish(Table table,
                                              const analytics::RiskThresholds& thresholds) {
    auto snapshot = std::make_shared<Snapshot>();
    snapshot->dataset = Dataset::FromTable(std::move(table));

    auto quarters = analytics::BuildDistributorQuarterTable(snapshot->dataset, thresholds);
    if (!quarters.ok()) {
        INVSENSE_LOG_WARN("Rejected dataset ({} rows): {}",
                          snapshot->dataset.size(), quarters.status().message());
        return quarters.status();
    }
    snapshot->distributor_quarters = std::move(quarters).value();
    snapshot->version = next_version_++;

    const uint64_t version = snapshot->version;
    std::atomic_store(&snapshot_, std::shared_ptr<const Snapshot>(std::move(snapshot)));

    INVSENSE_LOG_INFO("Published dataset snapshot v{}", version);
    return version;
}

absl::StatusOr<std::shared_ptr<const Snapshot>> DataContext::Current() const {
    auto snapshot = std::atomic_load(&snapshot_);
    if (!snapshot) {
        return FailedPreconditionError("Dataset not uploaded");
    }
    return snapshot;
}

bool DataContext::HasSnapshot() const {
    return std::atomic_load(&snapshot_) != nullptr;
}

}  // namespace invsense::data
