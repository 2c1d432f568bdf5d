#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "adapters/storage/storage.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"

namespace s3pull::testing {

struct RangeCall {
    std::string bucket;
    std::string key;
    std::uint64_t first;
    std::uint64_t last;
};

// In-memory ObjectStorage: объекты задаются содержимым, все вызовы записываются
class FakeStorage : public adapters::storage::ObjectStorage {
public:
    void add_bucket(const std::string& bucket) { buckets_[bucket]; }

    void put(const std::string& bucket, const std::string& key, std::string content) {
        adapters::storage::RemoteObject obj{bucket, key, content.size(), "2024-01-01T00:00:00.000Z"};
        buckets_[bucket].push_back(obj);
        contents_[bucket + "/" + key] = std::move(content);
    }

    // Листинг может заявлять размер, отличный от реального содержимого
    void put_listed(const std::string& bucket, const std::string& key,
                    std::uint64_t listed_size, std::string content) {
        put(bucket, key, std::move(content));
        buckets_[bucket].back().size = listed_size;
    }

    void put_marker(const std::string& bucket, const std::string& key) {
        buckets_[bucket].push_back(adapters::storage::RemoteObject{bucket, key, 0, ""});
    }

    auto list_buckets() -> infra::Result<std::vector<std::string>> override {
        ++list_buckets_calls;
        if (fail_list_buckets) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied, "AccessDenied"));
        }
        std::vector<std::string> names;
        for (const auto& [name, objects] : buckets_) names.push_back(name);
        return names;
    }

    auto list_objects(const std::string& bucket)
        -> infra::Result<std::vector<adapters::storage::RemoteObject>> override
    {
        if (failing_buckets.contains(bucket)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::RemoteError, "NoSuchBucket"));
        }
        listed.push_back(bucket);
        auto it = buckets_.find(bucket);
        if (it == buckets_.end()) return std::vector<adapters::storage::RemoteObject>{};
        return it->second;
    }

    auto get_range(const std::string& bucket, const std::string& key,
                   std::uint64_t first, std::uint64_t last)
        -> infra::Result<std::vector<char>> override
    {
        ranges.push_back(RangeCall{bucket, key, first, last});

        if (fail_range_after && ranges.size() > *fail_range_after) {
            return std::unexpected(infra::make_error(infra::ErrorCode::NetworkError, "connection reset"));
        }
        if (stall_keys.contains(key)) {
            return std::vector<char>{};
        }
        if (interrupt_after_range && ranges.size() >= *interrupt_after_range) {
            infra::g_interrupted.store(true);
        }

        const auto& content = contents_.at(bucket + "/" + key);
        if (first >= content.size()) return std::vector<char>{};
        const auto end = std::min<std::uint64_t>(last + 1, content.size());
        return std::vector<char>(content.begin() + static_cast<std::ptrdiff_t>(first),
                                 content.begin() + static_cast<std::ptrdiff_t>(end));
    }

    auto delete_object(const std::string& bucket, const std::string& key) -> infra::VoidResult override {
        if (failing_deletes.contains(key)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::RemoteError, "AccessDenied"));
        }
        deleted.push_back(bucket + "/" + key);
        return {};
    }

    auto ranges_for(const std::string& key) const -> std::vector<RangeCall> {
        std::vector<RangeCall> out;
        for (const auto& call : ranges) {
            if (call.key == key) out.push_back(call);
        }
        return out;
    }

    // Failure knobs
    bool fail_list_buckets = false;
    std::set<std::string> failing_buckets;
    std::set<std::string> failing_deletes;
    std::set<std::string> stall_keys;
    std::optional<std::size_t> fail_range_after;      // N успешных вызовов, дальше ошибка
    std::optional<std::size_t> interrupt_after_range;  // выставить g_interrupted на N-м вызове

    // Recorded calls
    int list_buckets_calls = 0;
    std::vector<std::string> listed;
    std::vector<RangeCall> ranges;
    std::vector<std::string> deleted;

private:
    std::map<std::string, std::vector<adapters::storage::RemoteObject>> buckets_;
    std::map<std::string, std::string> contents_;
};

inline auto make_content(std::size_t size, unsigned seed = 42) -> std::string {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::string data(size, '\0');
    for (auto& c : data) c = static_cast<char>(dist(gen));
    return data;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Временная директория на тест, удаляется в TearDown
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        infra::reset_interrupted();
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = std::filesystem::temp_directory_path() /
                (std::string("s3pull_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
    }

    void TearDown() override {
        infra::reset_interrupted();
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
};

} // namespace s3pull::testing
