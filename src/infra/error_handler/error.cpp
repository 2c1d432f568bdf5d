#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace s3pull::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::PermissionDenied:
        case ErrorCode::InvalidPath:
        case ErrorCode::InvalidConfig:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::Interrupted:    return 130; // SIGINT
        default:                        return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::FileNotFound:      return "FileNotFound";
        case ErrorCode::PermissionDenied:  return "PermissionDenied";
        case ErrorCode::InvalidPath:       return "InvalidPath";
        case ErrorCode::InvalidConfig:     return "InvalidConfig";
        case ErrorCode::DirectoryConflict: return "DirectoryConflict";
        case ErrorCode::WriteFailed:       return "WriteFailed";
        case ErrorCode::Interrupted:       return "Interrupted";
        case ErrorCode::NetworkTimeout:    return "NetworkTimeout";
        case ErrorCode::NetworkError:      return "NetworkError";
        case ErrorCode::RemoteThrottled:   return "RemoteThrottled";
        case ErrorCode::RemoteError:       return "RemoteError";
        case ErrorCode::Unknown:           break;
    }
    return "Unknown";
}

Error log_and_return(spdlog::logger& log, Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    log.log(level,
        "[{}:{}] {}: {}",
        err.file, err.line,
        error_code_name(err.code), err.message
    );
    return std::move(err);
}

} // namespace s3pull::infra
