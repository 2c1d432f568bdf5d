#include "fleet_driver.hpp"

#include "infra/interrupt.hpp"

namespace s3pull::core {

FleetDriver::FleetDriver(adapters::storage::ObjectStorage& storage,
                         const IgnoreMatcher& matcher,
                         SyncOrchestrator& orchestrator,
                         infra::Logger log)
    : storage_(storage)
    , matcher_(matcher)
    , orchestrator_(orchestrator)
    , log_(log ? std::move(log) : infra::null_logger()) {}

auto FleetDriver::run() -> infra::Result<FleetStats>
{
    auto buckets = storage_.list_buckets();
    if (!buckets) {
        log_->error("Error listing buckets: {}", buckets.error().message);
        return std::unexpected(std::move(buckets.error()));
    }

    FleetStats stats{};
    stats.buckets_total = buckets->size();
    if (buckets->empty()) {
        log_->info("No buckets found.");
        return stats;
    }

    for (const auto& bucket : *buckets) {
        if (infra::is_interrupted()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted, "User interrupted"));
        }

        if (matcher_.should_ignore(bucket)) {
            log_->info("Skipping bucket: {}", bucket);
            ++stats.buckets_ignored;
            continue;
        }

        log_->info("Processing bucket: {}", bucket);
        auto result = orchestrator_.sync_bucket(bucket);
        if (!result) {
            if (result.error().code == infra::ErrorCode::Interrupted) {
                return std::unexpected(std::move(result.error()));
            }
            ++stats.buckets_failed;
            continue;
        }
        ++stats.buckets_synced;
        stats.objects += *result;
    }

    return stats;
}

} // namespace s3pull::core
