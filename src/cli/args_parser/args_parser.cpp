#include "args_parser.hpp"

#include <CLI/CLI.hpp>

namespace s3pull::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code)
{
    CLIArgs args{};
    exit_code = 0;

    CLI::App app{"s3pull - download S3 buckets with resumable transfers"};

    std::string config_path;
    std::string target_path;
    std::string log_level;

    app.add_option("-c,--config", config_path, "Path to YAML config file")
        ->check(CLI::ExistingFile);
    app.add_option("-t,--target-path", target_path, "Local download root (overrides target_path)");
    app.add_option("--log-level", log_level, "trace|debug|info|warn|err|critical|off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"}));
    app.add_flag("--delete-after-download", args.delete_after_download,
                 "Delete each remote object once its local copy is complete");
    auto* verbose = app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("-q,--quiet", args.quiet, "Only warnings and errors")->excludes(verbose);
    app.add_flag("--version", args.version, "Print build information and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit_code = app.exit(e);
        return std::nullopt;
    }

    if (!config_path.empty()) args.config_path = config_path;
    if (!target_path.empty()) args.target_path = target_path;
    if (!log_level.empty()) {
        // spdlog знает только короткие имена
        if (log_level == "warning") log_level = "warn";
        if (log_level == "error") log_level = "err";
        args.log_level = log_level;
    }
    return args;
}

} // namespace s3pull::args_parser
