#include "fs.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>
#include <fmt/core.h>

#ifndef _WIN32
    #include <fcntl.h>
    #include <sys/stat.h>
    #include <unistd.h>
#endif

namespace s3pull::adapters::fs {

namespace {

auto conflict_path_for(const std::filesystem::path& path) -> std::filesystem::path {
    const std::string base = path.string() + std::string(kConflictSuffix);
    std::filesystem::path candidate{base};

    std::error_code ec;
    for (int n = 1; std::filesystem::exists(candidate, ec); ++n) {
        candidate = fmt::format("{}_{}", base, n);
    }
    return candidate;
}

auto errno_code(int err) -> infra::ErrorCode {
    switch (err) {
        case EACCES:
        case EPERM:   return infra::ErrorCode::PermissionDenied;
        case ENOENT:  return infra::ErrorCode::FileNotFound;
        default:      return infra::ErrorCode::WriteFailed;
    }
}

} // namespace

auto stat_local_file(const std::filesystem::path& path)
    -> infra::Result<LocalFile>
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (!ec) {
        return LocalFile{.exists = true, .size = static_cast<std::uint64_t>(size)};
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return LocalFile{};
    }
    return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                         fmt::format("Cannot read size of {}: {}", path.string(), ec.message())));
}

auto local_size(const std::filesystem::path& path)
    -> infra::Result<std::uint64_t>
{
    auto file = stat_local_file(path);
    if (!file) {
        return std::unexpected(file.error());
    }
    return file->size;
}

// =============== Append ===============
auto append_bytes(const std::filesystem::path& path,
                  std::span<const char> data)
    -> infra::VoidResult
{
#ifndef _WIN32
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) {
        const int err = errno;
        return std::unexpected(infra::make_error(errno_code(err),
                             fmt::format("Cannot open {} for append: {}", path.string(), std::strerror(err))));
    }

    // write() может вернуть меньше запрошенного: дописываем остаток
    const char* cursor = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, cursor, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                                 fmt::format("Write to {} failed: {}", path.string(), std::strerror(err))));
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (::close(fd) != 0) {
        const int err = errno;
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                             fmt::format("Closing {} failed: {}", path.string(), std::strerror(err))));
    }
    return {};
#else
    std::ofstream ofs(path, std::ios::binary | std::ios::app);
    if (!ofs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                             fmt::format("Cannot open {} for append", path.string())));
    }
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                             fmt::format("Write to {} failed", path.string())));
    }
    return {};
#endif
}

// =============== Directories ===============
auto ensure_directory(const std::filesystem::path& dir,
                      spdlog::logger& log)
    -> infra::VoidResult
{
    // "logs/" -> "logs": иначе stat() на файле logs вернёт ENOTDIR
    const auto path = dir.has_filename() ? dir : dir.parent_path();

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return {};
    }

    // Первый не-каталог на пути (сам path или любой предок) отодвигается
    std::filesystem::path prefix;
    for (const auto& part : path) {
        prefix /= part;
        const auto st = std::filesystem::status(prefix, ec);
        if (!std::filesystem::exists(st)) {
            break;
        }
        if (std::filesystem::is_directory(st)) {
            continue;
        }

        const auto conflict_path = conflict_path_for(prefix);
        std::filesystem::rename(prefix, conflict_path, ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::DirectoryConflict,
                                 fmt::format("Error renaming conflicting file {}: {}",
                                             prefix.string(), ec.message())));
        }
        log.info("Renamed conflicting file '{}' to '{}' to create directory.",
                 prefix.string(), conflict_path.string());
        break;
    }

    std::filesystem::create_directories(path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::DirectoryConflict,
                             fmt::format("Cannot create directory {}: {}", path.string(), ec.message())));
    }
    log.debug("Ensured directory exists: {}", path.string());
    return {};
}

// =============== Paths ===============
auto object_path(const std::filesystem::path& root,
                 std::string_view bucket,
                 std::string_view key)
    -> infra::Result<std::filesystem::path>
{
    if (bucket.empty() || bucket == "." || bucket == ".." ||
        bucket.find('/') != std::string_view::npos) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                             fmt::format("Unusable bucket name '{}'", bucket)));
    }
    if (key.empty() || key.front() == '/') {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                             fmt::format("Key '{}' is empty or absolute", key)));
    }

    std::size_t start = 0;
    while (start <= key.size()) {
        auto end = key.find('/', start);
        if (end == std::string_view::npos) end = key.size();
        if (key.substr(start, end - start) == "..") {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                                 fmt::format("Key '{}' escapes the bucket directory", key)));
        }
        start = end + 1;
    }

    return root / std::filesystem::path(std::string(bucket)) / std::filesystem::path(std::string(key));
}

} // namespace s3pull::adapters::fs
