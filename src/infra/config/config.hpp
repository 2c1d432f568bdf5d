#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

#include "infra/retry.hpp"

namespace s3pull::args_parser{
    struct CLIArgs;
}

namespace s3pull::infra {

inline constexpr std::uint64_t kDefaultChunkSize = 8ULL * 1024 * 1024; // 8 MiB
inline constexpr const char* kDefaultTargetPath = "./s3_download";
inline constexpr const char* kDefaultRegion = "us-east-1";

// Правила исключения бакетов: prefix -> suffix -> substring
struct IgnoreRuleSet {
    std::vector<std::string> starts_with;
    std::vector<std::string> ends_with;
    std::vector<std::string> contains;
};

struct S3Settings {
    std::string region;                // пусто = AWS_REGION, AWS_DEFAULT_REGION, затем kDefaultRegion
    std::string endpoint_url;          // пусто = AWS, virtual-host style
    bool path_style = false;
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    long timeout_seconds = 0;          // 0 = таймаут libcurl по умолчанию
};

// Значения, которые можно переопределить из CLI
struct ConfigOverrides {
    std::optional<std::filesystem::path> target_path;
    std::optional<std::string> log_level;
    bool delete_after_download = false;
    bool quiet = false;
};

struct Config {
    // Sync
    std::filesystem::path target_path = kDefaultTargetPath;
    bool delete_after_download = false;
    std::uint64_t chunk_size = kDefaultChunkSize;
    IgnoreRuleSet ignore;

    // Remote
    S3Settings s3;
    RetryPolicy retry;

    // Output
    std::string log_level = "info";
    bool quiet = false;

    // CLI имеет приоритет над файлом
    void merge_with(const ConfigOverrides& other);
};

/// Parses a YAML document into a Config. Keys that are absent keep their
/// defaults; unknown keys are ignored.
[[nodiscard]] auto parse_config(const std::string& yaml_text) -> std::expected<Config, std::string>;

/// Загружает конфигурацию из файла YAML.
/// Если explicit_path задан, файл обязан существовать. Иначе ищет в порядке:
///   1. ./config.yaml
///   2. ./.s3pull.yaml
///   3. $XDG_CONFIG_HOME/s3pull/config.yaml или ~/.config/s3pull/config.yaml
/// Возвращает Config по умолчанию, если файл не найден.
[[nodiscard]] auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path = std::nullopt)
    -> std::expected<Config, std::string>;

/// Fills S3 settings left empty by the file from the AWS_* environment.
void apply_environment(Config& cfg);

/// Rejects values the sync pipeline cannot work with.
[[nodiscard]] auto validate_config(const Config& cfg) -> std::expected<void, std::string>;

[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> ConfigOverrides;

} // namespace s3pull::infra
