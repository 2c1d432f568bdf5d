#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>


#ifdef _WIN32
    #include <shlobj.h>
    #include <knownfolders.h>
#endif

#include "config.hpp"
#include "cli/args_parser/args_parser.hpp"

namespace s3pull::infra {
    void Config::merge_with(const ConfigOverrides& other) {
        if (other.target_path) target_path = *other.target_path;
        if (other.log_level) log_level = *other.log_level;
        if (other.delete_after_download) delete_after_download = true;
        if (other.quiet) quiet = true;
    }

    namespace {

    auto read_string_list(const YAML::Node& node, const char* key) -> std::vector<std::string> {
        std::vector<std::string> out;
        const auto seq = node[key];
        if (!seq || seq.IsNull()) return out;
        if (!seq.IsSequence()) {
            throw YAML::Exception(seq.Mark(), fmt::format("'{}' must be a list of strings", key));
        }
        for (const auto& item : seq) {
            out.push_back(item.as<std::string>());
        }
        return out;
    }

    template<typename T>
    void read_scalar(const YAML::Node& node, const char* key, T& out) {
        const auto value = node[key];
        if (value && !value.IsNull()) out = value.as<T>();
    }

    auto env_or_empty(const char* name) -> std::string {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string{};
    }

    auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальные файлы
        paths.push_back("config.yaml");
        paths.push_back(".s3pull.yaml");

        // 2. Глобальный файл
    #ifdef _WIN32
        PWSTR appdata_path = nullptr;
        if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_RoamingAppData, 0, nullptr, &appdata_path))) {
            paths.push_back(std::filesystem::path(appdata_path) / "s3pull" / "config.yaml");
            CoTaskMemFree(appdata_path);
        }
    #else
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "s3pull" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "s3pull" / "config.yaml");
            }
        }
    #endif

        return paths;
    }

    auto load_from_path(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        std::ifstream in(path);
        if (!in) {
            return std::unexpected(fmt::format("Cannot open config file {}", path.string()));
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        auto cfg = parse_config(buffer.str());
        if (!cfg) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), cfg.error()));
        }
        spdlog::debug("Loaded config from {}", path.string());
        return cfg;
    }

    } // namespace

    auto parse_config(const std::string& yaml_text) -> std::expected<Config, std::string> {
        Config cfg{};
        try {
            YAML::Node root = YAML::Load(yaml_text);
            if (!root || root.IsNull()) {
                return cfg; // пустой документ: значения по умолчанию
            }
            if (!root.IsMap()) {
                return std::unexpected(std::string("top-level document must be a mapping"));
            }

            if (const auto ignore = root["ignore_pattern"]; ignore && !ignore.IsNull()) {
                if (!ignore.IsMap()) {
                    return std::unexpected(std::string("'ignore_pattern' must be a mapping"));
                }
                cfg.ignore.starts_with = read_string_list(ignore, "starts_with");
                cfg.ignore.ends_with = read_string_list(ignore, "ends_with");
                cfg.ignore.contains = read_string_list(ignore, "contains");
            }

            if (const auto target = root["target_path"]; target && !target.IsNull()) {
                cfg.target_path = target.as<std::string>();
            }
            read_scalar(root, "delete_after_download", cfg.delete_after_download);
            read_scalar(root, "chunk_size", cfg.chunk_size);
            read_scalar(root, "log_level", cfg.log_level);

            if (const auto retry = root["retry"]; retry && retry.IsMap()) {
                read_scalar(retry, "max_attempts", cfg.retry.max_attempts);
                if (const auto delay = retry["initial_delay_ms"]; delay && !delay.IsNull()) {
                    cfg.retry.initial_delay = std::chrono::milliseconds(delay.as<long>());
                }
                read_scalar(retry, "backoff_factor", cfg.retry.backoff_factor);
            }

            if (const auto s3 = root["s3"]; s3 && s3.IsMap()) {
                read_scalar(s3, "region", cfg.s3.region);
                read_scalar(s3, "endpoint_url", cfg.s3.endpoint_url);
                read_scalar(s3, "path_style", cfg.s3.path_style);
                read_scalar(s3, "access_key_id", cfg.s3.access_key_id);
                read_scalar(s3, "secret_access_key", cfg.s3.secret_access_key);
                read_scalar(s3, "session_token", cfg.s3.session_token);
                read_scalar(s3, "timeout_seconds", cfg.s3.timeout_seconds);
            }
        } catch (const YAML::Exception& e) {
            return std::unexpected(std::string(e.what()));
        }
        return cfg;
    }

    auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path)
        -> std::expected<Config, std::string>
    {
        if (explicit_path) {
            if (!std::filesystem::exists(*explicit_path)) {
                return std::unexpected(fmt::format("Config file not found: {}", explicit_path->string()));
            }
            return load_from_path(*explicit_path);
        }

        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return load_from_path(path);
        }

        // Файл не найден: возвращаем конфиг по умолчанию (не ошибка!)
        spdlog::debug("No config file found, using defaults");
        return Config{};
    }

    void apply_environment(Config& cfg) {
        if (cfg.s3.access_key_id.empty()) cfg.s3.access_key_id = env_or_empty("AWS_ACCESS_KEY_ID");
        if (cfg.s3.secret_access_key.empty()) cfg.s3.secret_access_key = env_or_empty("AWS_SECRET_ACCESS_KEY");
        if (cfg.s3.session_token.empty()) cfg.s3.session_token = env_or_empty("AWS_SESSION_TOKEN");
        if (cfg.s3.endpoint_url.empty()) cfg.s3.endpoint_url = env_or_empty("AWS_ENDPOINT_URL");

        // Регион из файла не трогаем, даже если он совпадает с умолчанием
        if (cfg.s3.region.empty()) {
            if (auto region = env_or_empty("AWS_REGION"); !region.empty()) {
                cfg.s3.region = region;
            } else if (auto fallback = env_or_empty("AWS_DEFAULT_REGION"); !fallback.empty()) {
                cfg.s3.region = fallback;
            } else {
                cfg.s3.region = kDefaultRegion;
            }
        }
    }

    auto validate_config(const Config& cfg) -> std::expected<void, std::string> {
        if (cfg.target_path.empty()) {
            return std::unexpected(std::string("target_path must not be empty"));
        }
        if (cfg.chunk_size == 0) {
            return std::unexpected(std::string("chunk_size must be greater than zero"));
        }
        if (cfg.retry.max_attempts < 1) {
            return std::unexpected(std::string("retry.max_attempts must be at least 1"));
        }
        if (cfg.retry.backoff_factor < 1.0) {
            return std::unexpected(std::string("retry.backoff_factor must be >= 1.0"));
        }
        if (cfg.s3.region.empty()) {
            return std::unexpected(std::string("s3.region must not be empty"));
        }
        if (spdlog::level::from_str(cfg.log_level) == spdlog::level::off && cfg.log_level != "off") {
            return std::unexpected(fmt::format("unknown log_level '{}'", cfg.log_level));
        }
        return {};
    }

    [[nodiscard]]
    auto config_from_cli(const args_parser::CLIArgs& args) -> ConfigOverrides {
        ConfigOverrides cfg{};
        if (args.target_path) cfg.target_path = *args.target_path;
        if (args.verbose) {
            cfg.log_level = "debug";
        } else if (args.log_level) {
            cfg.log_level = *args.log_level;
        }
        cfg.delete_after_download = args.delete_after_download;
        cfg.quiet = args.quiet;
        return cfg;
    }

} // namespace s3pull::infra
