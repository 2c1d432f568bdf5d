#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/logging/logger.hpp"
#include "infra/format/size_format.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "adapters/storage/s3_client.hpp"
#include "core/fleet/fleet_driver.hpp"
#include "core/ignore/ignore_matcher.hpp"
#include "core/sync/sync_orchestrator.hpp"
#include "core/transfer/transfer_engine.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

using GIT = s3pull::build_info::GitInfo;

constexpr auto load_from_cli = s3pull::infra::config_from_cli;
constexpr auto load_config_file = s3pull::infra::load_config_from_file;
constexpr auto args_parser = s3pull::args_parser::parse_args;
constexpr auto git = s3pull::build_info::get_git_info();

static auto
out_git_verse(const GIT& git)
-> void {
    fmt::print("s3pull {}\n", s3pull::build_info::version);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git commit short: {}\n", git.commit_short);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
log_config_verse(spdlog::logger& log, const s3pull::infra::Config& config)
-> void {
    log.info("Target download path set to: {}", config.target_path.string());
    log.info("Delete after download: {}", config.delete_after_download ? "yes" : "no");
    log.info("Chunk size: {}", s3pull::infra::format_size(config.chunk_size));
    log.info("Ignore patterns: starts_with={} ends_with={} contains={}",
             config.ignore.starts_with.size(), config.ignore.ends_with.size(), config.ignore.contains.size());
    log.debug("S3: region={} endpoint={} path_style={}",
              config.s3.region,
              config.s3.endpoint_url.empty() ? "(aws)" : config.s3.endpoint_url,
              config.s3.path_style ? "yes" : "no");
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern(s3pull::infra::kLogPattern);

        s3pull::infra::install_signal_handler();

        int parse_status = 0;
        auto args_opt = args_parser(argc, argv, parse_status);
        if (!args_opt) {
            return parse_status; // --help или ошибка
        }
        const auto& args = *args_opt;

        if (args.version) {
            out_git_verse(git);
            return 0;
        }

        // 1. Загрузить из файла
        std::optional<std::filesystem::path> config_path;
        if (args.config_path) config_path = *args.config_path;

        auto config_res = load_config_file(config_path);
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI и окружения
        config.merge_with(load_from_cli(args));
        s3pull::infra::apply_environment(config);

        if (auto valid = s3pull::infra::validate_config(config); !valid) {
            spdlog::error("Config error: {}", valid.error());
            return 1;
        }

        auto log = s3pull::infra::make_logger(config);
        log_config_verse(*log, config);

        s3pull::adapters::storage::S3Client storage{config.s3, config.retry, log};
        s3pull::core::TransferEngine engine{storage, log, config.chunk_size};
        s3pull::core::SyncOrchestrator orchestrator{config, storage, engine, log};
        s3pull::core::IgnoreMatcher matcher{config.ignore, log};
        s3pull::core::FleetDriver fleet{storage, matcher, orchestrator, log};

        auto start_time = std::chrono::steady_clock::now();

        auto result = fleet.run();

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        if (!result) {
            if (result.error().code == s3pull::infra::ErrorCode::Interrupted) {
                log->warn("Interrupted. Partial downloads will resume on the next run.");
            } else {
                log->error("Sync failed: {}", result.error().message);
            }
            return result.error().to_exit_code();
        }

        const auto& stats = *result;
        log->info("Sync finished.");
        log->info("Buckets: {} total, {} synced, {} ignored, {} failed",
                  stats.buckets_total, stats.buckets_synced, stats.buckets_ignored, stats.buckets_failed);
        log->info("Files complete: {}/{} ({} incomplete, {} skipped)",
                  stats.objects.files_downloaded, stats.objects.files_total,
                  stats.objects.files_incomplete, stats.objects.files_skipped);
        log->info("Directories: {} created, {} marker(s) skipped",
                  stats.objects.directories_created, stats.objects.markers_skipped);
        log->info("Downloaded this run: {} ({} bytes)",
                  s3pull::infra::format_size(stats.objects.bytes_moved), stats.objects.bytes_moved);
        log->info("Remote objects deleted: {} ({} failed)",
                  stats.objects.objects_deleted, stats.objects.delete_failures);
        log->info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);

        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
