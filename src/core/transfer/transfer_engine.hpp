#pragma once

#include <cstdint>
#include <filesystem>
#include "adapters/storage/storage.hpp"
#include "infra/config/config.hpp"
#include "infra/logging/logger.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace s3pull::core {

struct TransferOutcome {
    bool completed = false;
    std::uint64_t bytes_moved = 0;     // только за этот вызов
};

/// Byte range [first, last] of the next chunk to request, given how much
/// of the object is already on disk. Only meaningful while local < remote.
struct ChunkRange {
    std::uint64_t first = 0;
    std::uint64_t last = 0;
};

[[nodiscard]] constexpr auto next_chunk(std::uint64_t local_size,
                                        std::uint64_t remote_size,
                                        std::uint64_t chunk_size) -> ChunkRange {
    // Сравниваем с остатком, а не с local_size + chunk_size: сумма может переполниться
    const std::uint64_t remaining = remote_size - local_size;
    return ChunkRange{local_size, chunk_size >= remaining ? remote_size - 1 : local_size + chunk_size - 1};
}

/// Resumable ranged download of a single object.
///
/// The resume point is the current length of the local file and nothing
/// else: there is no checkpoint file, so a killed process simply measures
/// the file again on the next run. Chunks are appended exactly as received.
class TransferEngine {
public:
    TransferEngine(adapters::storage::ObjectStorage& storage,
                   infra::Logger log,
                   std::uint64_t chunk_size = infra::kDefaultChunkSize);

    /// Never throws and never returns an error: a failed fetch or write
    /// ends the attempt with completed == false and the bytes appended so far.
    /// progress is used for log lines only.
    [[nodiscard]] auto transfer(const adapters::storage::RemoteObject& remote,
                                const std::filesystem::path& local_path,
                                const infra::ProgressState& progress) -> TransferOutcome;

    [[nodiscard]] auto chunk_size() const -> std::uint64_t { return chunk_size_; }

private:
    adapters::storage::ObjectStorage& storage_;
    infra::Logger log_;
    std::uint64_t chunk_size_;
};

} // namespace s3pull::core
