#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace s3pull::infra {

struct Config;

using Logger = std::shared_ptr<spdlog::logger>;

inline constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";

/// Creates the console logger used by the whole run, registers it as the
/// spdlog default and applies the configured level (quiet forces warn).
[[nodiscard]] auto make_logger(const Config& config) -> Logger;

/// Logger that discards everything. Components fall back to it when
/// constructed without one.
[[nodiscard]] auto null_logger() -> Logger;

} // namespace s3pull::infra
