#include "transfer_engine.hpp"

#include "adapters/fs.hpp"
#include "infra/format/size_format.hpp"
#include "infra/interrupt.hpp"

#include <fmt/core.h>

namespace s3pull::core {

TransferEngine::TransferEngine(adapters::storage::ObjectStorage& storage,
                               infra::Logger log,
                               std::uint64_t chunk_size)
    : storage_(storage)
    , log_(log ? std::move(log) : infra::null_logger())
    , chunk_size_(chunk_size == 0 ? infra::kDefaultChunkSize : chunk_size) {}

auto TransferEngine::transfer(const adapters::storage::RemoteObject& remote,
                              const std::filesystem::path& local_path,
                              const infra::ProgressState& progress) -> TransferOutcome
{
    auto measured = adapters::fs::stat_local_file(local_path);
    if (!measured) {
        (void)infra::log_and_return(*log_, std::move(measured.error()));
        return TransferOutcome{.completed = false, .bytes_moved = 0};
    }
    std::uint64_t downloaded = measured->size;

    if (remote.size == 0 && !measured->exists) {
        // Пустой объект: скачивать нечего, но файл должен появиться
        if (auto created = adapters::fs::append_bytes(local_path, {}); !created) {
            log_->error("Error creating empty file {}: {}", local_path.string(), created.error().message);
            return TransferOutcome{.completed = false, .bytes_moved = 0};
        }
        log_->info("Created empty file {} for '{}'.", local_path.string(), remote.key);
        return TransferOutcome{.completed = true, .bytes_moved = 0};
    }

    if (downloaded >= remote.size) {
        log_->info("File '{}' already fully downloaded at {}.", remote.key, local_path.string());
        return TransferOutcome{.completed = true, .bytes_moved = 0};
    }

    log_->info("Downloading {} ({}/{} - {}%) {} ---> {}{}",
               infra::format_size(remote.size),
               progress.current_file(), progress.total_files(),
               progress.percent(),
               remote.key, local_path.string(),
               downloaded > 0 ? fmt::format(" (resuming at byte {})", downloaded) : std::string{});

    std::uint64_t moved = 0;
    while (downloaded < remote.size) {
        if (infra::is_interrupted()) {
            log_->warn("Interrupted while downloading {} at {}/{} bytes.", remote.key, downloaded, remote.size);
            break;
        }

        const auto range = next_chunk(downloaded, remote.size, chunk_size_);
        auto data = storage_.get_range(remote.bucket, remote.key, range.first, range.last);
        if (!data) {
            log_->error("Error downloading range bytes={}-{} for {}: {}",
                        range.first, range.last, remote.key, data.error().message);
            return TransferOutcome{.completed = false, .bytes_moved = moved};
        }

        if (data->empty()) {
            // Объект ещё не полный, а сервер больше ничего не отдаёт
            log_->warn("Empty response for range bytes={}-{} of {}, stopping.", range.first, range.last, remote.key);
            break;
        }

        auto written = adapters::fs::append_bytes(local_path, *data);
        if (!written) {
            log_->error("Error writing {}: {}", local_path.string(), written.error().message);
            return TransferOutcome{.completed = false, .bytes_moved = moved};
        }

        downloaded += data->size();
        moved += data->size();
        log_->debug("Progress for {}: {}/{} bytes ({}%)",
                    remote.key, downloaded, remote.size, progress.percent(moved));
    }

    if (downloaded >= remote.size) {
        log_->info("Download complete for {}.", remote.key);
        return TransferOutcome{.completed = true, .bytes_moved = moved};
    }

    log_->warn("Download incomplete for {}: {}/{} bytes.", remote.key, downloaded, remote.size);
    return TransferOutcome{.completed = false, .bytes_moved = moved};
}

} // namespace s3pull::core
