#include "core/Config.hpp"
#include "core/downloader/Errors.hpp"
#include "core/downloader/RunConfig.hpp"

#include "TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace bulkfetch;
using namespace bulkfetch::core;
using namespace bulkfetch::core::downloader;

namespace {

RunConfig validConfig() {
    RunConfig config;
    config.mainUrl = "https://files.test/zip";
    config.version = "3.0";
    config.baseDir = "/tmp/bulkfetch";
    return config;
}

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { Config::instance().setDefaults(); }
    void TearDown() override { Config::instance().setDefaults(); }
};

} // namespace

TEST_F(ConfigTest, DefaultsFeedRunConfig) {
    RunConfig run = RunConfig::fromConfig(Config::instance());

    EXPECT_FALSE(run.useMultiConnection);
    EXPECT_EQ(run.numConnections, 4);
    EXPECT_EQ(run.maxConcurrentFiles, 4);
    EXPECT_EQ(run.timeoutSeconds, 300);
    EXPECT_EQ(run.userAgent, "BulkFetch/1.0");
    EXPECT_TRUE(run.verifySSL);
    EXPECT_EQ(run.baseDir, std::filesystem::current_path());
}

TEST_F(ConfigTest, DotPathSetAndGet) {
    auto& config = Config::instance();
    config.set("downloads.numConnections", 8);
    config.set("paths.baseDir", std::string("/srv/mirror"));

    EXPECT_EQ(config.get<int>("downloads.numConnections"), 8);
    EXPECT_EQ(config.get<std::string>("paths.nothing", "fallback"), "fallback");

    RunConfig run = RunConfig::fromConfig(config);
    EXPECT_EQ(run.numConnections, 8);
    EXPECT_EQ(run.baseDir, std::filesystem::path("/srv/mirror"));
}

TEST_F(ConfigTest, LoadMergesOverDefaults) {
    test::TempDir dir;
    auto file = dir.path() / "bulkfetch.json";
    test::writeFile(file, R"({"downloads": {"useMultiConnection": true, "maxConcurrentFiles": 2}})");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(file.string()));

    EXPECT_TRUE(config.get<bool>("downloads.useMultiConnection"));
    EXPECT_EQ(config.get<int>("downloads.maxConcurrentFiles"), 2);
    EXPECT_EQ(config.get<int>("downloads.numConnections"), 4);
}

TEST_F(ConfigTest, LoadRejectsMissingOrInvalidFiles) {
    test::TempDir dir;
    auto& config = Config::instance();
    EXPECT_FALSE(config.load((dir.path() / "absent.json").string()));

    test::writeFile(dir.path() / "bad.json", "{ not json");
    EXPECT_FALSE(config.load((dir.path() / "bad.json").string()));
    EXPECT_EQ(config.get<int>("downloads.numConnections"), 4);
}

TEST(RunConfigTest, ValidConfigPasses) {
    EXPECT_NO_THROW(validConfig().validate());
}

TEST(RunConfigTest, RejectsBadMainUrl) {
    RunConfig config = validConfig();
    config.mainUrl = "";
    EXPECT_THROW(config.validate(), ConfigError);
    config.mainUrl = "ftp://files.test";
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(RunConfigTest, RejectsBadVersion) {
    RunConfig config = validConfig();
    config.version = "";
    EXPECT_THROW(config.validate(), ConfigError);
    config.version = "a/b";
    EXPECT_THROW(config.validate(), ConfigError);
    config.version = "..";
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(RunConfigTest, RejectsNonPositiveCounts) {
    RunConfig config = validConfig();
    config.numConnections = 0;
    EXPECT_THROW(config.validate(), ConfigError);

    config = validConfig();
    config.maxConcurrentFiles = -1;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(RunConfigTest, DirectoriesFollowLayout) {
    RunConfig config = validConfig();
    EXPECT_EQ(config.downloadDir(), std::filesystem::path("/tmp/bulkfetch/download/3.0"));
    EXPECT_EQ(config.failedDir(), std::filesystem::path("/tmp/bulkfetch/failed/3.0"));
}

TEST(RunConfigTest, HttpOptionsCarryRequestSettings) {
    RunConfig config = validConfig();
    config.timeoutSeconds = 42;
    config.verifySSL = false;
    config.userAgent = "probe/2";

    auto options = config.httpOptions();
    EXPECT_EQ(options.timeoutSeconds, 42);
    EXPECT_FALSE(options.verifySSL);
    EXPECT_EQ(options.userAgent, "probe/2");
}
