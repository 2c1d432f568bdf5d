#include <gtest/gtest.h>

#include <git_info.hpp>

TEST(BuildInfoTest, GitMetadataAvailable)
{
    EXPECT_FALSE(s3pull::build_info::git_commit.empty());
    EXPECT_FALSE(s3pull::build_info::git_commit_short.empty());
    EXPECT_EQ(s3pull::build_info::git_commit_short.size(), 7); // typical short SHA
}

TEST(BuildInfoTest, VersionAndTimestampFilled)
{
    EXPECT_FALSE(s3pull::build_info::version.empty());
    EXPECT_FALSE(s3pull::build_info::build_timestamp.empty());

    constexpr auto info = s3pull::build_info::get_git_info();
    EXPECT_EQ(info.commit, s3pull::build_info::git_commit);
    EXPECT_EQ(info.dirty, s3pull::build_info::git_dirty);
}
