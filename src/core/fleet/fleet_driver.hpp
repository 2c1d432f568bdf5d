#pragma once

#include <cstdint>
#include "adapters/storage/storage.hpp"
#include "core/ignore/ignore_matcher.hpp"
#include "core/sync/sync_orchestrator.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/logging/logger.hpp"

namespace s3pull::core {

struct FleetStats {
    std::uint64_t buckets_total = 0;
    std::uint64_t buckets_synced = 0;
    std::uint64_t buckets_ignored = 0;
    std::uint64_t buckets_failed = 0;
    SyncStats objects{};
};

// Все бакеты по очереди: фильтр -> SyncOrchestrator
class FleetDriver {
public:
    FleetDriver(adapters::storage::ObjectStorage& storage,
                const IgnoreMatcher& matcher,
                SyncOrchestrator& orchestrator,
                infra::Logger log);

    /// Fails when the bucket list cannot be obtained or the run was
    /// interrupted; a single bucket failing is counted and logged only.
    [[nodiscard]] auto run() -> infra::Result<FleetStats>;

private:
    adapters::storage::ObjectStorage& storage_;
    const IgnoreMatcher& matcher_;
    SyncOrchestrator& orchestrator_;
    infra::Logger log_;
};

} // namespace s3pull::core
