#include "sync_orchestrator.hpp"

#include "adapters/fs.hpp"
#include "infra/format/size_format.hpp"
#include "infra/interrupt.hpp"

#include <fmt/core.h>

namespace s3pull::core {

auto SyncStats::operator+=(const SyncStats& other) -> SyncStats& {
    files_total += other.files_total;
    files_downloaded += other.files_downloaded;
    files_incomplete += other.files_incomplete;
    files_skipped += other.files_skipped;
    bytes_moved += other.bytes_moved;
    directories_created += other.directories_created;
    markers_skipped += other.markers_skipped;
    objects_deleted += other.objects_deleted;
    delete_failures += other.delete_failures;
    return *this;
}

SyncOrchestrator::SyncOrchestrator(const infra::Config& config,
                                   adapters::storage::ObjectStorage& storage,
                                   TransferEngine& engine,
                                   infra::Logger log)
    : config_(config)
    , storage_(storage)
    , engine_(engine)
    , catalog_(storage)
    , log_(log ? std::move(log) : infra::null_logger()) {}

auto SyncOrchestrator::sync_bucket(const std::string& bucket) -> infra::Result<SyncStats>
{
    auto listing = catalog_.list(bucket);
    if (!listing) {
        log_->error("Error listing objects in bucket {}: {}", bucket, listing.error().message);
        return std::unexpected(std::move(listing.error()));
    }

    const auto& catalog = *listing;
    infra::ProgressState progress{catalog.content.size(), catalog.total_bytes()};

    SyncStats stats{};
    stats.files_total = catalog.content.size();

    log_->info("Bucket '{}' has {} file(s) with a total size of {} bytes ({}), {} directory marker(s).",
               bucket, progress.total_files(), progress.total_bytes(),
               infra::format_size(progress.total_bytes()), catalog.markers.size());

    for (const auto& obj : catalog.content) {
        if (infra::is_interrupted()) {
            log_summary(bucket, stats);
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                                 fmt::format("Interrupted while syncing bucket {}", bucket)));
        }
        progress.begin_file();
        sync_object(obj, progress, stats);
    }

    for (const auto& marker : catalog.markers) {
        if (infra::is_interrupted()) {
            log_summary(bucket, stats);
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                                 fmt::format("Interrupted while syncing bucket {}", bucket)));
        }
        sync_marker(marker, stats);
    }

    log_summary(bucket, stats);
    return stats;
}

void SyncOrchestrator::sync_object(const adapters::storage::RemoteObject& obj,
                                   infra::ProgressState& progress,
                                   SyncStats& stats)
{
    auto local_path = adapters::fs::object_path(config_.target_path, obj.bucket, obj.key);
    if (!local_path) {
        log_->error("Skipping key {}: {}", obj.key, local_path.error().message);
        ++stats.files_skipped;
        return;
    }

    const auto local_dir = local_path->parent_path();
    if (auto dir = adapters::fs::ensure_directory(local_dir, *log_); !dir) {
        log_->error("Skipping key {} due to error ensuring directory {}: {}",
                    obj.key, local_dir.string(), dir.error().message);
        ++stats.files_skipped;
        return;
    }

    const auto outcome = engine_.transfer(obj, *local_path, progress);
    stats.bytes_moved += outcome.bytes_moved;

    // Размер перемеряется заново: решение об удалении опирается на диск, а не на outcome
    const auto local_size = adapters::fs::local_size(*local_path);
    const bool verified = outcome.completed && local_size && *local_size >= obj.size;

    if (!verified) {
        ++stats.files_incomplete;
        log_->warn("File {} was not fully downloaded or is missing. It will not be deleted from the remote store.",
                   obj.key);
        return;
    }

    progress.record_completed(obj.size);
    ++stats.files_downloaded;
    log_->info("File {}/{} ({}) downloaded successfully. Total downloaded bytes: {}/{}.",
               progress.current_file(), progress.total_files(), obj.key,
               progress.downloaded_bytes(), progress.total_bytes());

    if (config_.delete_after_download) {
        delete_remote(obj, stats);
    }
}

void SyncOrchestrator::sync_marker(const adapters::storage::RemoteObject& obj, SyncStats& stats)
{
    auto local_path = adapters::fs::object_path(config_.target_path, obj.bucket, obj.key);
    if (!local_path) {
        ++stats.markers_skipped;
        log_->error("Skipping directory marker {}: {}", obj.key, local_path.error().message);
        return;
    }

    std::error_code ec;
    const bool existed = std::filesystem::is_directory(*local_path, ec);

    if (auto dir = adapters::fs::ensure_directory(*local_path, *log_); !dir) {
        ++stats.markers_skipped;
        log_->error("Error creating directory for key {}: {}", obj.key, dir.error().message);
        return;
    }
    if (!existed) {
        ++stats.directories_created;
        log_->info("Created directory for key {}", obj.key);
    }

    // У маркера нет содержимого для проверки: удаляем, как только директория есть
    if (config_.delete_after_download) {
        delete_remote(obj, stats);
    }
}

void SyncOrchestrator::delete_remote(const adapters::storage::RemoteObject& obj, SyncStats& stats)
{
    auto res = storage_.delete_object(obj.bucket, obj.key);
    if (!res) {
        ++stats.delete_failures;
        log_->error("Error deleting s3://{}/{}: {}", obj.bucket, obj.key, res.error().message);
        return;
    }
    ++stats.objects_deleted;
    log_->info("Deleted s3://{}/{}", obj.bucket, obj.key);
}

void SyncOrchestrator::log_summary(const std::string& bucket, const SyncStats& stats) const
{
    log_->info("Bucket '{}' done: {}/{} file(s) complete, {} incomplete, {} skipped, {} downloaded this run, "
               "{} director(ies) created, {} marker(s) skipped, {} object(s) deleted, {} delete failure(s).",
               bucket, stats.files_downloaded, stats.files_total, stats.files_incomplete,
               stats.files_skipped, infra::format_size(stats.bytes_moved),
               stats.directories_created, stats.markers_skipped,
               stats.objects_deleted, stats.delete_failures);
}

} // namespace s3pull::core
