#include <gtest/gtest.h>

#include "infra/format/size_format.hpp"

using s3pull::infra::format_size;

TEST(SizeFormatTest, Bytes)
{
    EXPECT_EQ(format_size(0), "0B");
    EXPECT_EQ(format_size(512), "512B");
    EXPECT_EQ(format_size(1023), "1023B");
}

TEST(SizeFormatTest, ScalesByPowersOf1024)
{
    EXPECT_EQ(format_size(1024), "1KB");
    EXPECT_EQ(format_size(35651584), "34MB");
    EXPECT_EQ(format_size(5368709120ULL), "5GB");
    EXPECT_EQ(format_size(3ULL * 1024 * 1024 * 1024 * 1024), "3TB");
}

TEST(SizeFormatTest, RoundsToWholeUnits)
{
    EXPECT_EQ(format_size(1700), "2KB");
    EXPECT_EQ(format_size(3'145'728), "3MB");
}

TEST(SizeFormatTest, PetabytesAreTheLastUnit)
{
    EXPECT_EQ(format_size(1ULL << 50), "1PB");
    EXPECT_EQ(format_size(2048ULL << 50), "2048PB");
}
