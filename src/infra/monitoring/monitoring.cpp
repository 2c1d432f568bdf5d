#include "monitoring.hpp"

namespace s3pull::infra {

ProgressState::ProgressState(std::uint64_t total_files, std::uint64_t total_bytes)
    : total_files_(total_files)
    , total_bytes_(total_bytes)
{
}

auto ProgressState::percent(std::uint64_t in_flight_bytes) const -> int {
    if (total_bytes_ == 0) return 0;

    const double done = static_cast<double>(downloaded_bytes_ + in_flight_bytes);
    return static_cast<int>(done / static_cast<double>(total_bytes_) * 100.0);
}

} // namespace s3pull::infra
