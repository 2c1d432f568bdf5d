#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "adapters/storage/storage.hpp"
#include "infra/error_handler/error.hpp"

namespace s3pull::core {

struct BucketCatalog {
    std::vector<adapters::storage::RemoteObject> content;   // обычные объекты
    std::vector<adapters::storage::RemoteObject> markers;   // ключи на '/'

    [[nodiscard]] auto total_bytes() const -> std::uint64_t;
};

class ObjectCatalog {
public:
    explicit ObjectCatalog(adapters::storage::ObjectStorage& storage);

    /// Lists bucket and splits the result. Order within each part is the
    /// listing order; nothing is re-sorted.
    [[nodiscard]] auto list(const std::string& bucket) -> infra::Result<BucketCatalog>;

    [[nodiscard]] static auto partition(std::vector<adapters::storage::RemoteObject> objects)
        -> BucketCatalog;

private:
    adapters::storage::ObjectStorage& storage_;
};

} // namespace s3pull::core
