#pragma once

#include <cstdint>

namespace s3pull::infra {

// Прогресс одного бакета. Принадлежит SyncOrchestrator на время обработки
// бакета, после чего выбрасывается. Влияет только на логи.
class ProgressState {
public:
    ProgressState(std::uint64_t total_files, std::uint64_t total_bytes);

    void begin_file() { ++current_file_; }

    // Учитывает заявленный размер объекта, а не фактически скачанные байты
    void record_completed(std::uint64_t declared_size) { downloaded_bytes_ += declared_size; }

    [[nodiscard]] auto percent(std::uint64_t in_flight_bytes = 0) const -> int;

    [[nodiscard]] auto total_files() const -> std::uint64_t { return total_files_; }
    [[nodiscard]] auto total_bytes() const -> std::uint64_t { return total_bytes_; }
    [[nodiscard]] auto downloaded_bytes() const -> std::uint64_t { return downloaded_bytes_; }
    [[nodiscard]] auto current_file() const -> std::uint64_t { return current_file_; } // 1-based, 0 до первого файла

private:
    std::uint64_t total_files_ = 0;
    std::uint64_t total_bytes_ = 0;
    std::uint64_t downloaded_bytes_ = 0;
    std::uint64_t current_file_ = 0;
};

} // namespace s3pull::infra
