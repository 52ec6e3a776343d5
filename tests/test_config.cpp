#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>

#include "config.hpp"
#include "errors.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

static const std::string DIGEST = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

static ErrorKind errorKindOf(const std::function<void()> &fn)
{
    try
    {
        fn();
    }
    catch (const XgetError &e)
    {
        return e.kind();
    }
    ADD_FAILURE() << "no XgetError thrown";
    return ErrorKind::Io;
}

TEST(ConfigTest, ParsesFullDocument)
{
    const std::string yaml = R"(
aliases:
  minio:
    endpoint: http://localhost:9000
    region: eu-west-1
    bucket: artifacts
    prefix: builds/
    access_key: AKIA
    secret_key: SECRET
  public:
    bucket: open-data
    no_sign_request: true
cache:
  enabled: true
  alias: minio
settings:
  parallel: 8
  retries: 5
  retry_delay: 1m30s
  retry_backoff: exponential
  timeout: 45s
files:
  - url: s3://public/a.bin
    dest: out/a.bin
    sha256: )" + DIGEST + R"(
  - url: https://example.com/b.bin
    dest: out/b.bin
    sha256: )" + DIGEST + "\n";

    DownloadConfig config = parseConfig(yaml);

    ASSERT_EQ(config.aliases.size(), 2u);
    const AliasConfig &minio = config.aliases.at("minio");
    EXPECT_EQ(minio.endpoint, "http://localhost:9000");
    EXPECT_EQ(minio.region, "eu-west-1");
    EXPECT_EQ(minio.bucket, "artifacts");
    EXPECT_EQ(minio.prefix, "builds/");
    EXPECT_TRUE(minio.hasStaticCredentials());
    EXPECT_FALSE(minio.noSignRequest);
    EXPECT_TRUE(config.aliases.at("public").noSignRequest);

    EXPECT_TRUE(config.cache.enabled);
    EXPECT_EQ(config.cache.alias, "minio");
    ASSERT_TRUE(config.cacheAlias().has_value());
    EXPECT_EQ(config.cacheAlias()->bucket, "artifacts");

    EXPECT_EQ(config.settings.parallel, 8);
    EXPECT_EQ(config.settings.retries, 5);
    EXPECT_EQ(config.settings.retryDelay, 90s);
    EXPECT_EQ(config.settings.retryBackoff, BackoffMode::Exponential);
    EXPECT_EQ(config.settings.timeout, 45s);

    ASSERT_EQ(config.files.size(), 2u);
    EXPECT_EQ(config.files[0].url, "s3://public/a.bin");
    EXPECT_EQ(config.files[0].destination, "out/a.bin");
    EXPECT_EQ(config.files[1].sha256, DIGEST);
}

TEST(ConfigTest, EmptyDocumentIsEmptyConfig)
{
    DownloadConfig config = parseConfig("");
    EXPECT_TRUE(config.files.empty());
    EXPECT_TRUE(config.aliases.empty());
    EXPECT_FALSE(config.cache.enabled);
}

TEST(ConfigTest, MalformedYamlIsConfigError)
{
    EXPECT_EQ(errorKindOf([]
                          { parseConfig("files: [unterminated", "bad.yaml"); }),
              ErrorKind::Config);
}

TEST(ConfigTest, BadBackoffIsConfigError)
{
    EXPECT_EQ(errorKindOf([]
                          { parseConfig("settings:\n  retry_backoff: random\n"); }),
              ErrorKind::Config);
}

TEST(ConfigTest, ExpandsEnvironmentInAliases)
{
    ::setenv("XGET_TEST_ACCESS", "from-env", 1);
    ::unsetenv("XGET_TEST_UNSET");

    DownloadConfig config = parseConfig(R"(
aliases:
  store:
    bucket: b
    access_key: ${XGET_TEST_ACCESS}
    secret_key: ${XGET_TEST_UNSET}
)");

    EXPECT_EQ(config.aliases.at("store").accessKey, "from-env");
    EXPECT_EQ(config.aliases.at("store").secretKey, "${XGET_TEST_UNSET}");
}

TEST(ConfigTest, ExpandEnvVars)
{
    ::setenv("XGET_TEST_HOST", "minio", 1);
    ::setenv("XGET_TEST_PORT", "9000", 1);
    ::unsetenv("XGET_TEST_UNSET");

    EXPECT_EQ(expandEnvVars("http://${XGET_TEST_HOST}:${XGET_TEST_PORT}/"), "http://minio:9000/");
    EXPECT_EQ(expandEnvVars("${XGET_TEST_UNSET}-x"), "${XGET_TEST_UNSET}-x");
    EXPECT_EQ(expandEnvVars("no references"), "no references");
    EXPECT_EQ(expandEnvVars("$XGET_TEST_HOST"), "$XGET_TEST_HOST");
}

TEST(ConfigTest, MergeOverridesAndAccumulates)
{
    DownloadConfig base = parseConfig(R"(
aliases:
  a: {bucket: one}
  b: {bucket: two}
settings:
  parallel: 2
  retries: 4
files:
  - {url: "https://x/1", dest: "1", sha256: ")" + DIGEST + R"("}
)");

    DownloadConfig override = parseConfig(R"(
aliases:
  b: {bucket: replaced}
  c: {bucket: three}
cache: {enabled: true, alias: c}
settings:
  parallel: 16
files:
  - {url: "https://x/2", dest: "2", sha256: ")" + DIGEST + R"("}
)");

    mergeConfig(base, override);

    EXPECT_EQ(base.aliases.size(), 3u);
    EXPECT_EQ(base.aliases.at("a").bucket, "one");
    EXPECT_EQ(base.aliases.at("b").bucket, "replaced");
    EXPECT_TRUE(base.cache.enabled);
    EXPECT_EQ(base.cache.alias, "c");
    EXPECT_EQ(base.settings.parallel, 16);
    EXPECT_EQ(base.settings.retries, 4);
    ASSERT_EQ(base.files.size(), 2u);
    EXPECT_EQ(base.files[0].destination, "1");
    EXPECT_EQ(base.files[1].destination, "2");
}

TEST(ConfigTest, DefaultsFillUnsetSettings)
{
    DownloadConfig config;
    config.settings.retries = 9;
    applyDefaults(config);

    EXPECT_EQ(config.settings.parallel, DEFAULT_PARALLEL);
    EXPECT_EQ(config.settings.retries, 9);
    EXPECT_EQ(config.settings.retryDelay, DEFAULT_RETRY_DELAY);
    EXPECT_EQ(config.settings.retryBackoff, BackoffMode::Fixed);
    EXPECT_EQ(config.settings.timeout, 0ms);
}

TEST(ConfigTest, ValidationRequiresFields)
{
    auto withFile = [](FileTask task)
    {
        DownloadConfig config;
        config.files.push_back(task);
        return config;
    };

    EXPECT_EQ(errorKindOf([&]
                          { auto c = withFile({"", "out", DIGEST}); validateConfig(c); }),
              ErrorKind::Config);
    EXPECT_EQ(errorKindOf([&]
                          { auto c = withFile({"https://x", "", DIGEST}); validateConfig(c); }),
              ErrorKind::Config);
    EXPECT_EQ(errorKindOf([&]
                          { auto c = withFile({"https://x", "out", ""}); validateConfig(c); }),
              ErrorKind::Config);
    EXPECT_EQ(errorKindOf([&]
                          { auto c = withFile({"https://x", "out", "not-a-digest"}); validateConfig(c); }),
              ErrorKind::Config);
}

TEST(ConfigTest, ValidationNormalizesDigest)
{
    DownloadConfig config;
    std::string upper = DIGEST;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    config.files.push_back({"https://x", "out", "sha256:" + upper});

    validateConfig(config);
    EXPECT_EQ(config.files[0].sha256, DIGEST);
}

TEST(ConfigTest, CacheAliasMustExist)
{
    DownloadConfig config;
    config.cache.enabled = true;
    config.cache.alias = "missing";

    try
    {
        validateConfig(config);
        FAIL() << "expected an exception";
    }
    catch (const XgetError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Config);
        EXPECT_NE(std::string(e.what()).find("missing"), std::string::npos);
    }

    config.cache.enabled = false;
    EXPECT_NO_THROW(validateConfig(config));
}

TEST(ConfigTest, LoadsAndMergesFiles)
{
    TempDir dir;
    writeFile(dir / "base.yaml", "settings:\n  parallel: 2\nfiles:\n  - url: https://x/1\n    dest: a\n    sha256: " + DIGEST + "\n");
    writeFile(dir / "extra.yaml", "settings:\n  retry_delay: 250ms\nfiles:\n  - url: https://x/2\n    dest: b\n    sha256: " + DIGEST + "\n");

    DownloadConfig config = loadConfigs({dir / "base.yaml", dir / "extra.yaml"});

    EXPECT_EQ(config.settings.parallel, 2);
    EXPECT_EQ(config.settings.retries, DEFAULT_RETRIES);
    EXPECT_EQ(config.settings.retryDelay, 250ms);
    ASSERT_EQ(config.files.size(), 2u);
    EXPECT_EQ(config.files[1].destination, "b");
}

TEST(ConfigTest, MissingFileIsConfigError)
{
    TempDir dir;
    EXPECT_EQ(errorKindOf([&]
                          { loadConfigs({dir / "nope.yaml"}); }),
              ErrorKind::Config);
    EXPECT_EQ(errorKindOf([]
                          { loadConfigs({}); }),
              ErrorKind::Config);
}

TEST(DurationTest, ParsesGoStyleDurations)
{
    EXPECT_EQ(parseDuration("500ms"), 500ms);
    EXPECT_EQ(parseDuration("5s"), 5s);
    EXPECT_EQ(parseDuration("1m30s"), 90s);
    EXPECT_EQ(parseDuration("2h"), 7200s);
    EXPECT_EQ(parseDuration("1.5s"), 1500ms);
    EXPECT_EQ(parseDuration("0s"), 0ms);
    EXPECT_EQ(parseDuration("10"), 10s);
}

TEST(DurationTest, RejectsGarbage)
{
    EXPECT_THROW(parseDuration(""), XgetError);
    EXPECT_THROW(parseDuration("ms"), XgetError);
    EXPECT_THROW(parseDuration("5 s"), XgetError);
    EXPECT_THROW(parseDuration("3days"), XgetError);
}

TEST(DurationTest, OverlongValuesAreConfigErrors)
{
    EXPECT_EQ(errorKindOf([]
                          { parseDuration("99999999999999999999999"); }),
              ErrorKind::Config);
    EXPECT_EQ(errorKindOf([]
                          { parseDuration("9223372036854775807"); }),
              ErrorKind::Config);
    EXPECT_EQ(errorKindOf([]
                          { parseDuration("99999999999999999999h"); }),
              ErrorKind::Config);
    EXPECT_EQ(parseDuration("8760h"), std::chrono::hours(8760));
}

TEST(ConfigTest, OverlongDurationInDocumentIsConfigError)
{
    EXPECT_EQ(errorKindOf([]
                          { parseConfig("settings:\n  retry_delay: \"99999999999999999999999\"\n"); }),
              ErrorKind::Config);
}
