// src/adapters/storage/s3_client.hpp
#pragma once

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/core.h>

#include "adapters/storage/storage.hpp"
#include "adapters/storage/s3_xml.hpp"
#include "infra/config/config.hpp"
#include "infra/logging/logger.hpp"
#include "infra/retry.hpp"

namespace s3pull::adapters::storage {

/// ObjectStorage over the S3 REST API. libcurl does the transport and the
/// SigV4 signing; transient failures are retried per RetryPolicy.
class S3Client final : public ObjectStorage {
public:
    S3Client(infra::S3Settings settings, infra::RetryPolicy retry, infra::Logger log);
    ~S3Client() override;

    S3Client(const S3Client&) = delete;
    S3Client& operator=(const S3Client&) = delete;

    [[nodiscard]] auto list_buckets()
        -> infra::Result<std::vector<std::string>> override;

    [[nodiscard]] auto list_objects(const std::string& bucket)
        -> infra::Result<std::vector<RemoteObject>> override;

    [[nodiscard]] auto get_range(const std::string& bucket,
                                 const std::string& key,
                                 std::uint64_t first,
                                 std::uint64_t last)
        -> infra::Result<std::vector<char>> override;

    [[nodiscard]] auto delete_object(const std::string& bucket,
                                     const std::string& key)
        -> infra::VoidResult override;

    // URL-построение открыто для тестов
    [[nodiscard]] auto service_url() const -> std::string;
    [[nodiscard]] auto bucket_url(const std::string& bucket) const -> std::string;
    [[nodiscard]] auto object_url(const std::string& bucket, const std::string& key) const -> std::string;

    /// RFC 3986 percent-encoding as SigV4 expects it; '/' survives when
    /// keep_slash is set (object keys).
    [[nodiscard]] static auto uri_encode(std::string_view value, bool keep_slash) -> std::string;

private:
    struct HttpResponse {
        long status = 0;
        std::vector<char> body;
    };

    // max_body == 0: без ограничения
    [[nodiscard]] auto perform(const char* method,
                               const std::string& url,
                               const std::vector<std::string>& extra_headers,
                               std::size_t max_body) const
        -> infra::Result<HttpResponse>;

    [[nodiscard]] auto http_error(const char* method,
                                  const std::string& url,
                                  const HttpResponse& response) const -> infra::Error;

    [[nodiscard]] auto use_path_style(const std::string& bucket) const -> bool;
    [[nodiscard]] auto endpoint_base() const -> std::string;

    infra::S3Settings settings_;
    infra::RetryPolicy retry_;
    infra::Logger log_;
    std::string sigv4_provider_;
};

namespace detail {

// Код ошибки для ответа вне 2xx: 429/5xx транзиентны, 401/403 это отказ в доступе
[[nodiscard]] auto classify_http_status(long status) -> infra::ErrorCode;

/// A ranged GET must answer 206. A 200 means the server ignored Range and
/// sent the object from byte 0, which is only usable when the range starts there.
[[nodiscard]] auto range_status_acceptable(long status, std::uint64_t first) -> bool;

// Лимит тела действует только на 2xx; тела ошибок читаются целиком
[[nodiscard]] auto body_within_limit(long status, std::size_t buffered,
                                     std::size_t incoming, std::size_t limit) -> bool;

// Параметры в алфавитном порядке: так их ждёт каноническая строка SigV4
[[nodiscard]] auto list_objects_query(std::string_view continuation_token) -> std::string;

/// Walks ListObjectsV2 pages until one is not truncated. fetch(query) returns
/// the XML body of one page. A truncated page without a continuation token
/// is an error.
template<typename FetchPage>
[[nodiscard]] auto collect_listing(const std::string& bucket, FetchPage&& fetch)
    -> infra::Result<std::vector<RemoteObject>>
{
    std::vector<RemoteObject> objects;
    std::string token;

    do {
        auto body = fetch(list_objects_query(token));
        if (!body) {
            return std::unexpected(std::move(body.error()));
        }

        auto page = xml::parse_list_objects(*body, bucket);
        if (!page) {
            return std::unexpected(std::move(page.error()));
        }
        objects.insert(objects.end(),
                       std::make_move_iterator(page->objects.begin()),
                       std::make_move_iterator(page->objects.end()));

        if (page->is_truncated && page->next_continuation_token.empty()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::RemoteError,
                                 fmt::format("Truncated listing of {} without continuation token", bucket)));
        }
        token = page->is_truncated ? std::move(page->next_continuation_token) : std::string{};
    } while (!token.empty());

    return objects;
}

} // namespace detail

} // namespace s3pull::adapters::storage
