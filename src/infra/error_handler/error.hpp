#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace s3pull::infra {

enum class ErrorCode {
    // Фатальные ошибки (запуск невозможен)
    FileNotFound,
    PermissionDenied,
    InvalidPath,
    InvalidConfig,

    // Восстанавливаемые (объект пропускается, следующий запуск продолжит)
    DirectoryConflict,
    WriteFailed,
    Interrupted,

    // Сеть / удалённое хранилище
    NetworkTimeout,
    NetworkError,
    RemoteThrottled,   // 429 / 5xx
    RemoteError,       // S3 ответил ошибкой (NoSuchKey, AccessDenied, ...)

    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::NetworkTimeout ||
               code == ErrorCode::NetworkError ||
               code == ErrorCode::RemoteThrottled;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto error_code_name(ErrorCode code) -> std::string_view;

// Логирует ошибку в переданный логгер и возвращает её дальше
[[nodiscard]] auto log_and_return(spdlog::logger& log, Error&& err) -> Error;

} // namespace s3pull::infra
