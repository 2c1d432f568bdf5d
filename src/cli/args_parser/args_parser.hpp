#pragma once

#include <string>
#include <optional>



namespace s3pull::args_parser {
    struct CLIArgs
{
    std::optional<std::string> config_path;   // -c, --config
    std::optional<std::string> target_path;   // -t, --target-path
    std::optional<std::string> log_level;     // --log-level
    bool delete_after_download{false};        // --delete-after-download
    bool verbose{false};                      // -v, --verbose
    bool quiet{false};                        // -q, --quiet
    bool version{false};                      // --version
};



/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns std::nullopt after printing help or a parse error; exit_code
/// receives the status main should return in that case.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code);

} // namespace s3pull::args_parser
