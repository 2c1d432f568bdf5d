#include "size_format.hpp"

#include <array>
#include <fmt/core.h>

namespace s3pull::infra {

auto format_size(std::uint64_t bytes) -> std::string {
    constexpr std::array<const char*, 5> units{"B", "KB", "MB", "GB", "TB"};

    auto size = static_cast<double>(bytes);
    for (const char* unit : units) {
        if (size < 1024.0) {
            return fmt::format("{:.0f}{}", size, unit);
        }
        size /= 1024.0;
    }
    return fmt::format("{:.0f}PB", size);
}

} // namespace s3pull::infra
