#pragma once

#include <cstdint>
#include <string>

namespace s3pull::infra {

/// Human readable byte count in binary units with no decimals:
/// 512 -> "512B", 35651584 -> "34MB", 5368709120 -> "5GB".
[[nodiscard]] auto format_size(std::uint64_t bytes) -> std::string;

} // namespace s3pull::infra
