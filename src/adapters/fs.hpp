#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <spdlog/spdlog.h>
#include "infra/error_handler/error.hpp"

namespace s3pull::adapters::fs {

// Суффикс, с которым файл отодвигается, когда на его месте нужна директория
inline constexpr std::string_view kConflictSuffix = "_file_conflict";

struct LocalFile {
    bool exists = false;
    std::uint64_t size = 0;
};

/// One stat of path: whether a file is there and how long it is.
/// A missing file is not an error; anything else that stops the stat is.
[[nodiscard]] auto stat_local_file(const std::filesystem::path& path)
    -> infra::Result<LocalFile>;

/// Current byte length of the file at path, 0 if it does not exist.
/// Any other failure (a directory in the way, permissions) is an error.
[[nodiscard]] auto local_size(const std::filesystem::path& path)
    -> infra::Result<std::uint64_t>;

/// Appends data to path with one append-mode write (the file is created if
/// missing, never truncated). On failure the file may have grown by a
/// prefix of data; its length is still a valid resume point.
[[nodiscard]] auto append_bytes(const std::filesystem::path& path,
                                std::span<const char> data)
    -> infra::VoidResult;

/// Makes path a directory. An existing directory is left alone; a plain
/// file at path or at one of its ancestors is renamed to <file>_file_conflict
/// (or _file_conflict_N when that name is taken) before the directory is created.
[[nodiscard]] auto ensure_directory(const std::filesystem::path& path,
                                    spdlog::logger& log)
    -> infra::VoidResult;

/// root / bucket / key, refusing keys that would land outside root / bucket
/// (absolute keys, ".." segments) and empty or separator-bearing bucket names.
[[nodiscard]] auto object_path(const std::filesystem::path& root,
                               std::string_view bucket,
                               std::string_view key)
    -> infra::Result<std::filesystem::path>;

} // namespace s3pull::adapters::fs
