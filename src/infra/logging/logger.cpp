#include "logger.hpp"
#include "infra/config/config.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace s3pull::infra {

auto make_logger(const Config& config) -> Logger {
    auto log = spdlog::get("s3pull");
    if (!log) {
        log = spdlog::stdout_color_mt("s3pull");
    }
    log->set_pattern(kLogPattern);

    auto level = spdlog::level::from_str(config.log_level);
    if (config.quiet && level < spdlog::level::warn) {
        level = spdlog::level::warn;
    }
    log->set_level(level);

    spdlog::set_default_logger(log);
    return log;
}

auto null_logger() -> Logger {
    static Logger log = std::make_shared<spdlog::logger>(
        "s3pull-null", std::make_shared<spdlog::sinks::null_sink_mt>());
    return log;
}

} // namespace s3pull::infra
