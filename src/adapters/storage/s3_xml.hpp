#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "adapters/storage/storage.hpp"

namespace s3pull::adapters::storage::xml {

struct ListObjectsPage {
    std::vector<RemoteObject> objects;
    bool is_truncated = false;
    std::string next_continuation_token;
};

// Текст первого <tag>...</tag> после from, пустая строка если нет
[[nodiscard]] auto extract_tag(std::string_view xml, std::string_view tag,
                               std::size_t from = 0) -> std::string;

// &amp; &lt; &gt; &quot; &apos; и числовые ссылки &#NN; / &#xNN;
[[nodiscard]] auto unescape(std::string_view text) -> std::string;

/// "Code: Message" from an S3 <Error> document, empty when xml is not one.
[[nodiscard]] auto extract_error(std::string_view xml) -> std::string;

[[nodiscard]] auto parse_list_buckets(std::string_view xml) -> std::vector<std::string>;

/// One ListObjectsV2 page. Keys are unescaped; every object gets bucket.
[[nodiscard]] auto parse_list_objects(std::string_view xml, const std::string& bucket)
    -> infra::Result<ListObjectsPage>;

} // namespace s3pull::adapters::storage::xml
