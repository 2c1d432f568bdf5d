#include "s3_client.hpp"
#include "infra/interrupt.hpp"

#include <memory>
#include <string_view>
#include <curl/curl.h>
#include <fmt/core.h>

namespace s3pull::adapters::storage {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

struct BodySink {
    CURL* handle;
    std::vector<char>* body;
    std::size_t limit;      // 0 = без ограничения; к телам ошибок не применяется
};

size_t write_callback(char* contents, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* sink = static_cast<BodySink*>(userdata);
    if (sink->limit != 0) {
        long status = 0;
        curl_easy_getinfo(sink->handle, CURLINFO_RESPONSE_CODE, &status);
        if (!detail::body_within_limit(status, sink->body->size(), total, sink->limit)) {
            return 0; // libcurl прервёт передачу с CURLE_WRITE_ERROR
        }
    }
    sink->body->insert(sink->body->end(), contents, contents + total);
    return total;
}

int interrupt_callback(void* /*clientp*/, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                       curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    return infra::is_interrupted() ? 1 : 0;
}

auto curl_error_code(CURLcode code) -> infra::ErrorCode {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return infra::ErrorCode::NetworkTimeout;
        case CURLE_ABORTED_BY_CALLBACK:
            return infra::ErrorCode::Interrupted;
        case CURLE_WRITE_ERROR:
            return infra::ErrorCode::RemoteError;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return infra::ErrorCode::InvalidConfig;
        default:
            return infra::ErrorCode::NetworkError;
    }
}

auto body_view(const std::vector<char>& body) -> std::string_view {
    return {body.data(), body.size()};
}

} // namespace

S3Client::S3Client(infra::S3Settings settings, infra::RetryPolicy retry, infra::Logger log)
    : settings_(std::move(settings))
    , retry_(retry)
    , log_(log ? std::move(log) : infra::null_logger())
    , sigv4_provider_(fmt::format("aws:amz:{}:s3", settings_.region))
{
    curl_global_init(CURL_GLOBAL_DEFAULT);

    while (!settings_.endpoint_url.empty() && settings_.endpoint_url.back() == '/') {
        settings_.endpoint_url.pop_back();
    }
    if (settings_.access_key_id.empty() || settings_.secret_access_key.empty()) {
        log_->warn("No S3 credentials configured, sending unsigned requests");
    }
    log_->debug("S3Client: region={} endpoint={} path_style={}",
                settings_.region, endpoint_base(), settings_.path_style);
}

S3Client::~S3Client() {
    curl_global_cleanup();
}

// =============== Protocol rules ===============

namespace detail {

auto classify_http_status(long status) -> infra::ErrorCode {
    if (status == 429 || (status >= 500 && status < 600)) {
        return infra::ErrorCode::RemoteThrottled;
    }
    if (status == 401 || status == 403) {
        return infra::ErrorCode::PermissionDenied;
    }
    return infra::ErrorCode::RemoteError;
}

auto range_status_acceptable(long status, std::uint64_t first) -> bool {
    return status == 206 || (status == 200 && first == 0);
}

auto body_within_limit(long status, std::size_t buffered,
                       std::size_t incoming, std::size_t limit) -> bool {
    if (limit == 0 || status < 200 || status >= 300) {
        return true;
    }
    return buffered + incoming <= limit;
}

auto list_objects_query(std::string_view continuation_token) -> std::string {
    if (continuation_token.empty()) {
        return "list-type=2";
    }
    return fmt::format("continuation-token={}&list-type=2",
                       S3Client::uri_encode(continuation_token, false));
}

} // namespace detail

// =============== URLs ===============

auto S3Client::uri_encode(std::string_view value, bool keep_slash) -> std::string {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char c : value) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') ||
                                c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (keep_slash && c == '/')) {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded.push_back('%');
            encoded.push_back(hex[c >> 4]);
            encoded.push_back(hex[c & 0x0F]);
        }
    }
    return encoded;
}

auto S3Client::endpoint_base() const -> std::string {
    if (!settings_.endpoint_url.empty()) {
        return settings_.endpoint_url;
    }
    return fmt::format("https://s3.{}.amazonaws.com", settings_.region);
}

auto S3Client::use_path_style(const std::string& bucket) const -> bool {
    // Бакеты с точками ломают TLS-сертификат *.s3.amazonaws.com
    return settings_.path_style || !settings_.endpoint_url.empty() ||
           bucket.find('.') != std::string::npos;
}

auto S3Client::service_url() const -> std::string {
    return endpoint_base() + "/";
}

auto S3Client::bucket_url(const std::string& bucket) const -> std::string {
    if (use_path_style(bucket)) {
        return fmt::format("{}/{}/", endpoint_base(), uri_encode(bucket, false));
    }
    return fmt::format("https://{}.s3.{}.amazonaws.com/", bucket, settings_.region);
}

auto S3Client::object_url(const std::string& bucket, const std::string& key) const -> std::string {
    return bucket_url(bucket) + uri_encode(key, true);
}

// =============== HTTP ===============

auto S3Client::perform(const char* method,
                       const std::string& url,
                       const std::vector<std::string>& extra_headers,
                       std::size_t max_body) const
    -> infra::Result<HttpResponse>
{
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown, "Failed to init curl"));
    }

    HttpResponse response;
    BodySink sink{curl.get(), &response.body, max_body};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, interrupt_callback);
    if (settings_.timeout_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, settings_.timeout_seconds);
    }

    if (!settings_.access_key_id.empty() && !settings_.secret_access_key.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_AWS_SIGV4, sigv4_provider_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_USERNAME, settings_.access_key_id.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, settings_.secret_access_key.c_str());
    }

    HeaderList headers{nullptr, &curl_slist_free_all};
    auto add_header = [&headers](const std::string& line) {
        curl_slist* next = curl_slist_append(headers.get(), line.c_str());
        if (next) {
            headers.release();
            headers.reset(next);
        }
        return next != nullptr;
    };

    bool headers_ok = add_header("x-amz-content-sha256: UNSIGNED-PAYLOAD");
    if (!settings_.session_token.empty()) {
        headers_ok = headers_ok && add_header("x-amz-security-token: " + settings_.session_token);
    }
    for (const auto& line : extra_headers) {
        headers_ok = headers_ok && add_header(line);
    }
    if (!headers_ok) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown, "Failed to build request headers"));
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        const auto code = curl_error_code(res);
        if (res == CURLE_WRITE_ERROR && max_body != 0) {
            return std::unexpected(infra::make_error(code,
                                 fmt::format("{} {}: response exceeds the requested {} bytes", method, url, max_body)));
        }
        return std::unexpected(infra::make_error(code,
                             fmt::format("{} {}: {}", method, url, curl_easy_strerror(res))));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (response.status < 200 || response.status >= 300) {
        return std::unexpected(http_error(method, url, response));
    }
    return response;
}

auto S3Client::http_error(const char* method,
                          const std::string& url,
                          const HttpResponse& response) const -> infra::Error
{
    auto reason = xml::extract_error(body_view(response.body));
    if (reason.empty()) reason = "no error body";

    const auto message = fmt::format("{} {}: HTTP {} ({})", method, url, response.status, reason);
    return infra::make_error(detail::classify_http_status(response.status), message);
}

// =============== ObjectStorage ===============

auto S3Client::list_buckets()
    -> infra::Result<std::vector<std::string>>
{
    const auto url = service_url();
    auto response = infra::with_retry(*log_, "ListBuckets", [&]() {
        return perform("GET", url, {}, 0);
    }, retry_);
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }

    const auto body = body_view(response->body);
    if (body.find("<ListAllMyBucketsResult") == std::string_view::npos) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteError,
                             "Unexpected ListBuckets response"));
    }
    auto buckets = xml::parse_list_buckets(body);
    log_->debug("ListBuckets returned {} bucket(s)", buckets.size());
    return buckets;
}

auto S3Client::list_objects(const std::string& bucket)
    -> infra::Result<std::vector<RemoteObject>>
{
    const auto what = fmt::format("ListObjectsV2 {}", bucket);
    auto objects = detail::collect_listing(bucket, [&](const std::string& query) -> infra::Result<std::string> {
        const auto url = bucket_url(bucket) + "?" + query;
        auto response = infra::with_retry(*log_, what, [&]() {
            return perform("GET", url, {}, 0);
        }, retry_);
        if (!response) {
            return std::unexpected(std::move(response.error()));
        }
        return std::string(response->body.begin(), response->body.end());
    });

    if (objects) {
        log_->debug("{}: {} object(s)", what, objects->size());
    }
    return objects;
}

auto S3Client::get_range(const std::string& bucket,
                         const std::string& key,
                         std::uint64_t first,
                         std::uint64_t last)
    -> infra::Result<std::vector<char>>
{
    if (last < first) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                             fmt::format("Empty range {}-{} for {}", first, last, key)));
    }

    const auto url = object_url(bucket, key);
    const auto expected = static_cast<std::size_t>(last - first + 1);
    const std::vector<std::string> headers{fmt::format("Range: bytes={}-{}", first, last)};

    auto response = infra::with_retry(*log_, fmt::format("GetObject {}/{}", bucket, key), [&]() {
        return perform("GET", url, headers, expected);
    }, retry_);
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }

    if (!detail::range_status_acceptable(response->status, first)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteError,
                             fmt::format("GET {}: expected 206 for range {}-{}, got HTTP {}",
                                         url, first, last, response->status)));
    }
    return std::move(response->body);
}

auto S3Client::delete_object(const std::string& bucket,
                             const std::string& key)
    -> infra::VoidResult
{
    const auto url = object_url(bucket, key);
    auto response = infra::with_retry(*log_, fmt::format("DeleteObject {}/{}", bucket, key), [&]() {
        return perform("DELETE", url, {}, 0);
    }, retry_);
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }
    return {};
}

} // namespace s3pull::adapters::storage
