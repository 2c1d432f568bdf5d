#include "object_catalog.hpp"

#include <numeric>

namespace s3pull::core {

auto BucketCatalog::total_bytes() const -> std::uint64_t {
    return std::accumulate(content.begin(), content.end(), std::uint64_t{0},
        [](std::uint64_t sum, const adapters::storage::RemoteObject& obj) {
            return sum + obj.size;
        });
}

ObjectCatalog::ObjectCatalog(adapters::storage::ObjectStorage& storage)
    : storage_(storage) {}

auto ObjectCatalog::list(const std::string& bucket) -> infra::Result<BucketCatalog> {
    auto objects = storage_.list_objects(bucket);
    if (!objects) {
        return std::unexpected(std::move(objects.error()));
    }
    return partition(std::move(*objects));
}

auto ObjectCatalog::partition(std::vector<adapters::storage::RemoteObject> objects)
    -> BucketCatalog
{
    BucketCatalog catalog;
    for (auto& obj : objects) {
        if (obj.is_directory_marker()) {
            catalog.markers.push_back(std::move(obj));
        } else {
            catalog.content.push_back(std::move(obj));
        }
    }
    return catalog;
}

} // namespace s3pull::core
