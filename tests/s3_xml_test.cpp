#include <gtest/gtest.h>

#include "adapters/storage/s3_xml.hpp"

namespace xml = s3pull::adapters::storage::xml;

TEST(S3XmlTest, ParsesBucketList)
{
    const std::string body = R"(<?xml version="1.0" encoding="UTF-8"?>
<ListAllMyBucketsResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <Owner><ID>abc</ID><DisplayName>me</DisplayName></Owner>
  <Buckets>
    <Bucket><Name>alpha</Name><CreationDate>2024-01-01T00:00:00.000Z</CreationDate></Bucket>
    <Bucket><Name>beta.example</Name><CreationDate>2024-02-01T00:00:00.000Z</CreationDate></Bucket>
  </Buckets>
</ListAllMyBucketsResult>)";

    EXPECT_EQ(xml::parse_list_buckets(body), (std::vector<std::string>{"alpha", "beta.example"}));
    EXPECT_TRUE(xml::parse_list_buckets("<ListAllMyBucketsResult><Buckets/></ListAllMyBucketsResult>").empty());
}

TEST(S3XmlTest, ParsesObjectPage)
{
    const std::string body = R"(<?xml version="1.0" encoding="UTF-8"?>
<ListBucketResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <Name>b1</Name>
  <KeyCount>3</KeyCount>
  <IsTruncated>true</IsTruncated>
  <NextContinuationToken>1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=</NextContinuationToken>
  <Contents><Key>a.bin</Key><LastModified>2024-03-01T10:00:00.000Z</LastModified><Size>3145728</Size></Contents>
  <Contents><Key>logs/</Key><LastModified>2024-03-01T10:00:00.000Z</LastModified><Size>0</Size></Contents>
  <Contents><Key>R&amp;D/notes &lt;v2&gt;.txt</Key><Size>12</Size></Contents>
</ListBucketResult>)";

    auto page = xml::parse_list_objects(body, "b1");
    ASSERT_TRUE(page.has_value()) << page.error().message;

    ASSERT_EQ(page->objects.size(), 3u);
    EXPECT_EQ(page->objects[0].bucket, "b1");
    EXPECT_EQ(page->objects[0].key, "a.bin");
    EXPECT_EQ(page->objects[0].size, 3145728u);
    EXPECT_EQ(page->objects[0].last_modified, "2024-03-01T10:00:00.000Z");
    EXPECT_TRUE(page->objects[1].is_directory_marker());
    EXPECT_EQ(page->objects[2].key, "R&D/notes <v2>.txt");

    EXPECT_TRUE(page->is_truncated);
    EXPECT_EQ(page->next_continuation_token, "1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=");
}

TEST(S3XmlTest, EmptyBucketPage)
{
    auto page = xml::parse_list_objects(
        "<ListBucketResult><Name>b1</Name><KeyCount>0</KeyCount><IsTruncated>false</IsTruncated></ListBucketResult>",
        "b1");
    ASSERT_TRUE(page.has_value());
    EXPECT_TRUE(page->objects.empty());
    EXPECT_FALSE(page->is_truncated);
    EXPECT_TRUE(page->next_continuation_token.empty());
}

TEST(S3XmlTest, ErrorDocumentBecomesRemoteError)
{
    const std::string body =
        "<?xml version=\"1.0\"?><Error><Code>NoSuchBucket</Code>"
        "<Message>The specified bucket does not exist</Message></Error>";

    EXPECT_EQ(xml::extract_error(body), "NoSuchBucket: The specified bucket does not exist");

    auto page = xml::parse_list_objects(body, "b1");
    ASSERT_FALSE(page.has_value());
    EXPECT_EQ(page.error().code, s3pull::infra::ErrorCode::RemoteError);
    EXPECT_NE(page.error().message.find("NoSuchBucket"), std::string::npos);
}

TEST(S3XmlTest, MalformedSizeIsRejected)
{
    auto page = xml::parse_list_objects(
        "<ListBucketResult><Contents><Key>a</Key><Size>12x</Size></Contents></ListBucketResult>", "b1");
    ASSERT_FALSE(page.has_value());
    EXPECT_EQ(page.error().code, s3pull::infra::ErrorCode::RemoteError);
}

TEST(S3XmlTest, UnrelatedDocumentIsRejected)
{
    EXPECT_FALSE(xml::parse_list_objects("<html>gateway timeout</html>", "b1").has_value());
}

TEST(S3XmlTest, UnescapeHandlesEntities)
{
    EXPECT_EQ(xml::unescape("a&amp;b&lt;c&gt;d&quot;e&apos;f"), "a&b<c>d\"e'f");
    EXPECT_EQ(xml::unescape("&#65;&#x42;"), "AB");
    EXPECT_EQ(xml::unescape("&#xE9;"), "\xC3\xA9");
    EXPECT_EQ(xml::unescape("&unknown; & tail"), "&unknown; & tail");
    EXPECT_EQ(xml::unescape("no entities"), "no entities");
}

TEST(S3XmlTest, ExtractTagStartsAtOffset)
{
    const std::string body = "<Key>one</Key><Key>two</Key>";
    EXPECT_EQ(xml::extract_tag(body, "Key"), "one");
    EXPECT_EQ(xml::extract_tag(body, "Key", 5), "two");
    EXPECT_EQ(xml::extract_tag(body, "Size"), "");
}
