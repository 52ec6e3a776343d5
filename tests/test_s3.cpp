#include <gtest/gtest.h>

#include <cstdlib>

#include "errors.hpp"
#include "s3_client.hpp"
#include "source.hpp"

/**
 * Clears the AWS environment for the duration of a test.
 */
class S3ClientTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        for (const char *name : {"AWS_REGION", "AWS_DEFAULT_REGION", "AWS_ACCESS_KEY_ID",
                                 "AWS_SECRET_ACCESS_KEY", "AWS_SESSION_TOKEN"})
        {
            ::unsetenv(name);
        }
    }

    void TearDown() override { SetUp(); }
};

TEST(S3LocatorTest, SplitsAliasAndKey)
{
    S3Locator locator = parseS3Locator("s3://minio/path/to/file.tar.gz");
    EXPECT_EQ(locator.alias, "minio");
    EXPECT_EQ(locator.key, "path/to/file.tar.gz");
}

TEST(S3LocatorTest, RejectsMalformedLocators)
{
    for (const char *url : {"s3://", "s3://alias", "s3://alias/", "s3:///key", "https://host/key"})
    {
        try
        {
            parseS3Locator(url);
            ADD_FAILURE() << "accepted " << url;
        }
        catch (const XgetError &e)
        {
            EXPECT_EQ(e.kind(), ErrorKind::Config) << url;
        }
    }
}

TEST(S3LocatorTest, EncodesObjectKeys)
{
    EXPECT_EQ(encodeObjectKey("dir/file-1_a.b~c"), "dir/file-1_a.b~c");
    EXPECT_EQ(encodeObjectKey("my file+v2.txt"), "my%20file%2Bv2.txt");
    EXPECT_EQ(encodeObjectKey("caf\xC3\xA9"), "caf%C3%A9");
}

TEST_F(S3ClientTest, EndpointMeansPathStyle)
{
    AliasConfig alias;
    alias.endpoint = "http://localhost:9000/";
    alias.bucket = "artifacts";
    alias.prefix = "builds/";

    S3Client client(alias, std::chrono::milliseconds(0));

    EXPECT_EQ(client.objectKey("a b.bin"), "builds/a b.bin");
    EXPECT_EQ(client.objectUrl("a b.bin"), "http://localhost:9000/artifacts/builds/a%20b.bin");
    EXPECT_EQ(client.region(), "us-east-1");
}

TEST_F(S3ClientTest, EndpointWithoutSchemeDefaultsToHttps)
{
    AliasConfig alias;
    alias.endpoint = "storage.example.com";
    alias.bucket = "b";

    S3Client client(alias, std::chrono::milliseconds(0));
    EXPECT_EQ(client.objectUrl("k"), "https://storage.example.com/b/k");
}

TEST_F(S3ClientTest, AwsUsesVirtualHostedStyle)
{
    AliasConfig alias;
    alias.bucket = "my-bucket";
    alias.region = "eu-central-1";

    S3Client client(alias, std::chrono::milliseconds(0));
    EXPECT_EQ(client.objectUrl("data/x.bin"), "https://my-bucket.s3.eu-central-1.amazonaws.com/data/x.bin");
}

TEST_F(S3ClientTest, RegionFromEnvironment)
{
    ::setenv("AWS_DEFAULT_REGION", "ap-south-1", 1);
    AliasConfig alias;
    alias.bucket = "b";
    EXPECT_EQ(S3Client(alias, std::chrono::milliseconds(0)).region(), "ap-south-1");

    ::setenv("AWS_REGION", "us-west-2", 1);
    EXPECT_EQ(S3Client(alias, std::chrono::milliseconds(0)).region(), "us-west-2");

    alias.region = "eu-west-3";
    EXPECT_EQ(S3Client(alias, std::chrono::milliseconds(0)).region(), "eu-west-3");
}

TEST_F(S3ClientTest, CredentialPrecedence)
{
    AliasConfig alias;
    alias.bucket = "b";

    EXPECT_FALSE(S3Client(alias, std::chrono::milliseconds(0)).isSigned());

    ::setenv("AWS_ACCESS_KEY_ID", "env-key", 1);
    ::setenv("AWS_SECRET_ACCESS_KEY", "env-secret", 1);
    EXPECT_TRUE(S3Client(alias, std::chrono::milliseconds(0)).isSigned());

    alias.noSignRequest = true;
    EXPECT_FALSE(S3Client(alias, std::chrono::milliseconds(0)).isSigned());

    alias.noSignRequest = false;
    alias.accessKey = "static";
    alias.secretKey = "secret";
    EXPECT_TRUE(S3Client(alias, std::chrono::milliseconds(0)).isSigned());
}

TEST(SourceResolverTest, UnknownAliasIsConfigError)
{
    AliasTable aliases;
    aliases["known"].bucket = "b";
    SourceResolver resolver(aliases, std::chrono::milliseconds(0));

    EXPECT_NE(resolver.resolve("s3://known/key"), nullptr);
    EXPECT_NE(resolver.resolve("https://example.com/file"), nullptr);

    try
    {
        resolver.resolve("s3://unknown/key");
        FAIL() << "expected an exception";
    }
    catch (const XgetError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Config);
        EXPECT_NE(std::string(e.what()).find("unknown"), std::string::npos);
    }
}

TEST(SourceResolverTest, UnsupportedSchemeIsConfigError)
{
    SourceResolver resolver({}, std::chrono::milliseconds(0));
    for (const char *url : {"ftp://host/file", "file:///etc/passwd", "just-a-path"})
    {
        try
        {
            resolver.resolve(url);
            ADD_FAILURE() << "accepted " << url;
        }
        catch (const XgetError &e)
        {
            EXPECT_EQ(e.kind(), ErrorKind::Config) << url;
        }
    }
}

TEST(SourceResolverTest, DescribesResolvedSources)
{
    AliasTable aliases;
    aliases["store"].bucket = "b";
    SourceResolver resolver(aliases, std::chrono::milliseconds(0));

    EXPECT_EQ(resolver.resolve("https://example.com/f")->describe(), "https://example.com/f");
    EXPECT_NE(resolver.resolve("s3://store/dir/f")->describe().find("dir/f"), std::string::npos);
}
