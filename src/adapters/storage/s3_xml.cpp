#include "s3_xml.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <fmt/core.h>

namespace s3pull::adapters::storage::xml {

namespace {

// Вызывает fn для содержимого каждого <element>...</element>
template<typename F>
void for_each_element(std::string_view xml, std::string_view element, F&& fn) {
    const std::string open = fmt::format("<{}>", element);
    const std::string close = fmt::format("</{}>", element);

    std::size_t pos = 0;
    while (true) {
        const auto start = xml.find(open, pos);
        if (start == std::string_view::npos) break;
        const auto body = start + open.size();
        const auto end = xml.find(close, body);
        if (end == std::string_view::npos) break;

        fn(xml.substr(body, end - body));
        pos = end + close.size();
    }
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace

auto extract_tag(std::string_view xml, std::string_view tag, std::size_t from) -> std::string {
    const std::string open = fmt::format("<{}>", tag);
    const std::string close = fmt::format("</{}>", tag);

    auto start = xml.find(open, from);
    if (start == std::string_view::npos) return "";
    start += open.size();
    const auto end = xml.find(close, start);
    if (end == std::string_view::npos) return "";
    return std::string(xml.substr(start, end - start));
}

auto unescape(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            out.push_back(text[i]);
            continue;
        }
        const auto semi = text.find(';', i);
        if (semi == std::string_view::npos) {
            out.append(text.substr(i));
            break;
        }
        const auto entity = text.substr(i + 1, semi - i - 1);

        if (entity == "amp")       out.push_back('&');
        else if (entity == "lt")   out.push_back('<');
        else if (entity == "gt")   out.push_back('>');
        else if (entity == "quot") out.push_back('"');
        else if (entity == "apos") out.push_back('\'');
        else if (entity.size() > 1 && entity.front() == '#') {
            const bool hex = entity[1] == 'x' || entity[1] == 'X';
            const auto digits = entity.substr(hex ? 2 : 1);
            std::uint32_t cp = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), cp, hex ? 16 : 10);
            if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
                out.append(text.substr(i, semi - i + 1)); // не наша сущность, оставляем как есть
            } else {
                append_utf8(out, cp);
            }
        } else {
            out.append(text.substr(i, semi - i + 1));
        }
        i = semi;
    }
    return out;
}

auto extract_error(std::string_view xml) -> std::string {
    const auto error_pos = xml.find("<Error>");
    if (error_pos == std::string_view::npos) return "";

    const auto code = unescape(extract_tag(xml, "Code", error_pos));
    const auto message = unescape(extract_tag(xml, "Message", error_pos));
    if (code.empty()) return "";
    return message.empty() ? code : fmt::format("{}: {}", code, message);
}

auto parse_list_buckets(std::string_view xml) -> std::vector<std::string> {
    std::vector<std::string> buckets;
    for_each_element(xml, "Bucket", [&](std::string_view body) {
        auto name = unescape(extract_tag(body, "Name"));
        if (!name.empty()) {
            buckets.push_back(std::move(name));
        }
    });
    return buckets;
}

auto parse_list_objects(std::string_view xml, const std::string& bucket)
    -> infra::Result<ListObjectsPage>
{
    if (auto error = extract_error(xml); !error.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteError, error));
    }
    if (xml.find("<ListBucketResult") == std::string_view::npos) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteError,
                             fmt::format("Unexpected ListObjectsV2 response for bucket {}", bucket)));
    }

    ListObjectsPage page;
    std::optional<infra::Error> failure;

    for_each_element(xml, "Contents", [&](std::string_view body) {
        if (failure) return;

        RemoteObject obj;
        obj.bucket = bucket;
        obj.key = unescape(extract_tag(body, "Key"));
        obj.last_modified = extract_tag(body, "LastModified");

        const auto size_text = extract_tag(body, "Size");
        auto [ptr, ec] = std::from_chars(size_text.data(), size_text.data() + size_text.size(), obj.size);
        if (size_text.empty() || ec != std::errc{} || ptr != size_text.data() + size_text.size()) {
            failure = infra::make_error(infra::ErrorCode::RemoteError,
                                        fmt::format("Malformed <Size> '{}' for key '{}'", size_text, obj.key));
            return;
        }
        if (!obj.key.empty()) {
            page.objects.push_back(std::move(obj));
        }
    });

    if (failure) {
        return std::unexpected(std::move(*failure));
    }

    page.is_truncated = extract_tag(xml, "IsTruncated") == "true";
    page.next_continuation_token = unescape(extract_tag(xml, "NextContinuationToken"));
    return page;
}

} // namespace s3pull::adapters::storage::xml
