#include <gtest/gtest.h>

#include "core/fleet/fleet_driver.hpp"
#include "infra/logging/logger.hpp"
#include "test_support.hpp"

using namespace s3pull;
using s3pull::testing::FakeStorage;

namespace {

class FleetDriverTest : public s3pull::testing::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        config_.target_path = root_;
    }

    auto run() -> infra::Result<core::FleetStats> {
        core::TransferEngine engine{storage_, infra::null_logger(), config_.chunk_size};
        core::SyncOrchestrator orchestrator{config_, storage_, engine, infra::null_logger()};
        core::IgnoreMatcher matcher{config_.ignore, infra::null_logger()};
        core::FleetDriver fleet{storage_, matcher, orchestrator, infra::null_logger()};
        return fleet.run();
    }

    infra::Config config_;
    FakeStorage storage_;
};

} // namespace

TEST_F(FleetDriverTest, IgnoredBucketsAreNeverListed)
{
    config_.ignore.starts_with = {"tmp-"};
    config_.ignore.ends_with = {"-logs"};
    storage_.put("tmp-scratch", "x.txt", "x");
    storage_.put("app-logs", "y.txt", "y");
    storage_.put("prod-data", "z.txt", "z");

    auto stats = run();
    ASSERT_TRUE(stats.has_value());

    EXPECT_EQ(storage_.listed, (std::vector<std::string>{"prod-data"}));
    EXPECT_EQ(stats->buckets_total, 3u);
    EXPECT_EQ(stats->buckets_ignored, 2u);
    EXPECT_EQ(stats->buckets_synced, 1u);
    EXPECT_TRUE(std::filesystem::exists(root_ / "prod-data" / "z.txt"));
    EXPECT_FALSE(std::filesystem::exists(root_ / "tmp-scratch"));
}

TEST_F(FleetDriverTest, NoBucketsIsNotAnError)
{
    auto stats = run();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->buckets_total, 0u);
    EXPECT_EQ(storage_.list_buckets_calls, 1);
}

TEST_F(FleetDriverTest, BucketListFailureAbortsRun)
{
    storage_.fail_list_buckets = true;

    auto stats = run();
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, infra::ErrorCode::PermissionDenied);
    EXPECT_TRUE(storage_.listed.empty());
}

TEST_F(FleetDriverTest, FailingBucketDoesNotStopOthers)
{
    storage_.put("a-bucket", "1.txt", "one");
    storage_.put("b-bucket", "2.txt", "two");
    storage_.failing_buckets.insert("a-bucket");

    auto stats = run();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->buckets_failed, 1u);
    EXPECT_EQ(stats->buckets_synced, 1u);
    EXPECT_EQ(stats->objects.files_downloaded, 1u);
    EXPECT_EQ(s3pull::testing::read_file(root_ / "b-bucket" / "2.txt"), "two");
}

TEST_F(FleetDriverTest, InterruptPropagates)
{
    config_.chunk_size = 2;
    storage_.put("a-bucket", "1.txt", "abcdef");
    storage_.put("b-bucket", "2.txt", "ghijkl");
    storage_.interrupt_after_range = 1;

    auto stats = run();
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, infra::ErrorCode::Interrupted);
    EXPECT_EQ(stats.error().to_exit_code(), 130);
    EXPECT_EQ(storage_.listed, (std::vector<std::string>{"a-bucket"}));
}
