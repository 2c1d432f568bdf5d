// src/adapters/storage/storage.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace s3pull::adapters::storage {

// Объект из листинга. Не меняется после получения: новый листинг даёт
// новые экземпляры.
struct RemoteObject {
    std::string bucket;
    std::string key;
    std::uint64_t size = 0;        // из метаданных листинга, авторитетно
    std::string last_modified;

    // Ключ вида "logs/" это маркер директории, а не содержимое
    [[nodiscard]] auto is_directory_marker() const -> bool {
        return !key.empty() && key.back() == '/';
    }
};

/// Remote object store consumed by the sync pipeline. Every call blocks
/// until the request finished or failed.
class ObjectStorage {
public:
    virtual ~ObjectStorage() = default;

    [[nodiscard]] virtual auto list_buckets()
        -> infra::Result<std::vector<std::string>> = 0;

    /// Complete listing of the bucket, in the order the store returned it.
    [[nodiscard]] virtual auto list_objects(const std::string& bucket)
        -> infra::Result<std::vector<RemoteObject>> = 0;

    /// Bytes [first, last] inclusive. May return fewer bytes than asked for.
    [[nodiscard]] virtual auto get_range(const std::string& bucket,
                                         const std::string& key,
                                         std::uint64_t first,
                                         std::uint64_t last)
        -> infra::Result<std::vector<char>> = 0;

    [[nodiscard]] virtual auto delete_object(const std::string& bucket,
                                             const std::string& key)
        -> infra::VoidResult = 0;
};

} // namespace s3pull::adapters::storage
