#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "adapters/storage/storage.hpp"
#include "core/catalog/object_catalog.hpp"
#include "core/transfer/transfer_engine.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/logging/logger.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace s3pull::core {

struct SyncStats {
    std::uint64_t files_total = 0;
    std::uint64_t files_downloaded = 0;    // полные локальные копии (включая уже скачанные)
    std::uint64_t files_incomplete = 0;    // передача не завершена, remote не тронут
    std::uint64_t files_skipped = 0;       // плохой путь или конфликт директорий
    std::uint64_t bytes_moved = 0;         // реально скачано за этот запуск
    std::uint64_t directories_created = 0;
    std::uint64_t markers_skipped = 0;     // плохой путь или директорию не создать
    std::uint64_t objects_deleted = 0;
    std::uint64_t delete_failures = 0;

    auto operator+=(const SyncStats& other) -> SyncStats&;
};

/// Downloads one bucket into <target_path>/<bucket>.
///
/// Content objects are processed in listing order, then directory markers.
/// A remote object is deleted (when delete_after_download is set) only
/// after its own transfer reported completion and the local file measured
/// at least the listed size. Per-object failures are logged and counted;
/// they never stop the bucket.
class SyncOrchestrator {
public:
    SyncOrchestrator(const infra::Config& config,
                     adapters::storage::ObjectStorage& storage,
                     TransferEngine& engine,
                     infra::Logger log);

    /// Fails only when the bucket cannot be listed or the run is interrupted.
    [[nodiscard]] auto sync_bucket(const std::string& bucket) -> infra::Result<SyncStats>;

private:
    void sync_object(const adapters::storage::RemoteObject& obj,
                     infra::ProgressState& progress,
                     SyncStats& stats);
    void sync_marker(const adapters::storage::RemoteObject& obj, SyncStats& stats);
    void delete_remote(const adapters::storage::RemoteObject& obj, SyncStats& stats);
    void log_summary(const std::string& bucket, const SyncStats& stats) const;

    const infra::Config& config_;
    adapters::storage::ObjectStorage& storage_;
    TransferEngine& engine_;
    ObjectCatalog catalog_;
    infra::Logger log_;
};

} // namespace s3pull::core
