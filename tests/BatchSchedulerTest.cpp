#include "core/downloader/BatchScheduler.hpp"
#include "core/downloader/CatalogLoader.hpp"
#include "core/downloader/Errors.hpp"
#include "utils/HashUtils.hpp"
#include "utils/JsonUtils.hpp"

#include "FakeTransport.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <new>
#include <string>

using namespace bulkfetch;
using namespace bulkfetch::core::downloader;

namespace {

const std::string kMainUrl = "http://files.test/zip";

class BatchSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.mainUrl = kMainUrl;
        config.version = "2.1";
        config.baseDir = dir.path();
        config.numConnections = 2;
        config.maxConcurrentFiles = 3;
        catalog.name = "assets.json";
    }

    void publish(const std::string& dest, const std::string& content) {
        transport.serve(kMainUrl + "/" + dest, content);
        catalog.resources.push_back({dest, utils::HashUtils::md5String(content)});
    }

    std::filesystem::path downloaded(const std::string& dest) const {
        return dir.path() / "download" / "2.1" / dest;
    }

    std::filesystem::path reportFile() const {
        return dir.path() / "failed" / "2.1" / "assets.json";
    }

    test::TempDir dir;
    test::FakeTransport transport;
    RunConfig config;
    Catalog catalog;
};

} // namespace

TEST_F(BatchSchedulerTest, ValidFileIsSkippedAndMissingOneDownloaded) {
    publish("a.bin", "first file");
    publish("b.bin", "second file");
    test::writeFile(downloaded("a.bin"), "first file");

    BatchScheduler scheduler(transport, config);
    BatchReport report = scheduler.run(catalog);

    EXPECT_EQ(report.total, 2u);
    EXPECT_EQ(report.skipped, 1u);
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.failed, 0u);
    EXPECT_TRUE(report.allSucceeded());
    EXPECT_FALSE(report.reportPath.has_value());
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "failed"));
    EXPECT_EQ(test::readFile(downloaded("b.bin")), "second file");
}

TEST_F(BatchSchedulerTest, SecondRunMakesNoRequests) {
    config.useMultiConnection = true;
    publish("one.bin", test::patternBytes(5000));
    publish("dir/two.bin", test::patternBytes(777));
    publish("dir/sub/three.bin", "3");

    BatchScheduler first(transport, config);
    BatchReport initial = first.run(catalog);
    ASSERT_EQ(initial.succeeded, 3u);

    transport.resetCounters();
    BatchScheduler second(transport, config);
    BatchReport again = second.run(catalog);

    EXPECT_EQ(again.skipped, 3u);
    EXPECT_EQ(transport.requestCount(), 0u);
}

TEST_F(BatchSchedulerTest, ReportListsExactlyTheFailures) {
    publish("ok1.bin", "fine");
    publish("bad1.bin", "will be corrupted");
    publish("ok2.bin", "also fine");
    publish("bad2.bin", "missing upstream");
    transport.serve(kMainUrl + "/bad1.bin", "corrupted bytes");
    transport.failWith(kMainUrl + "/bad2.bin", 404);

    BatchScheduler scheduler(transport, config);
    BatchReport report = scheduler.run(catalog);

    EXPECT_EQ(report.succeeded, 2u);
    EXPECT_EQ(report.failed, 2u);
    EXPECT_FALSE(report.allSucceeded());
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures[0].resource, catalog.resources[1]);
    EXPECT_EQ(report.failures[1].resource, catalog.resources[3]);

    ASSERT_TRUE(report.reportPath.has_value());
    EXPECT_EQ(*report.reportPath, reportFile());

    auto written = utils::JsonUtils::parseFile(reportFile().string());
    ASSERT_TRUE(written.has_value());
    nlohmann::json expected = {{"resource", {
        {{"dest", "bad1.bin"}, {"md5", catalog.resources[1].md5}},
        {{"dest", "bad2.bin"}, {"md5", catalog.resources[3].md5}}
    }}};
    EXPECT_EQ(*written, expected);

    EXPECT_EQ(test::readFile(downloaded("ok1.bin")), "fine");
    EXPECT_EQ(test::readFile(downloaded("ok2.bin")), "also fine");
}

TEST_F(BatchSchedulerTest, ReportIsUsableAsCatalog) {
    publish("retry.bin", "expected");
    transport.serve(kMainUrl + "/retry.bin", "unexpected");

    BatchScheduler scheduler(transport, config);
    BatchReport report = scheduler.run(catalog);
    ASSERT_TRUE(report.reportPath.has_value());

    transport.serve(kMainUrl + "/retry.bin", "expected");
    auto document = utils::JsonUtils::parseFile(report.reportPath->string());
    ASSERT_TRUE(document.has_value());

    BatchScheduler retry(transport, config);
    BatchReport retried = retry.run(CatalogLoader::fromJson(*document, catalog.name));
    EXPECT_EQ(retried.succeeded, 1u);
}

TEST_F(BatchSchedulerTest, InvalidConfigIsRejectedBeforeAnyRequest) {
    publish("a.bin", "x");
    config.maxConcurrentFiles = 0;

    BatchScheduler scheduler(transport, config);
    EXPECT_THROW(scheduler.run(catalog), ConfigError);
    EXPECT_EQ(transport.requestCount(), 0u);
}

TEST_F(BatchSchedulerTest, DuplicateDestinationsAreRejected) {
    publish("same.bin", "x");
    publish("/same.bin", "x");

    BatchScheduler scheduler(transport, config);
    EXPECT_THROW(scheduler.run(catalog), ConfigError);
    EXPECT_EQ(transport.requestCount(), 0u);
}

TEST_F(BatchSchedulerTest, EquivalentDestinationsAreRejected) {
    publish("a/b.bin", "x");
    publish("a//b.bin", "x");

    BatchScheduler scheduler(transport, config);
    EXPECT_THROW(scheduler.run(catalog), ConfigError);

    catalog.resources.clear();
    publish("c.bin", "y");
    publish("./c.bin", "y");
    EXPECT_THROW(scheduler.run(catalog), ConfigError);
    EXPECT_EQ(transport.requestCount(), 0u);
}

TEST_F(BatchSchedulerTest, ShortRangeEndsUpInTheReport) {
    config.useMultiConnection = true;
    config.numConnections = 2;
    publish("a.bin", std::string(10, 'A'));
    transport.truncateRange(kMainUrl + "/a.bin", 5, 1);

    BatchScheduler scheduler(transport, config);
    BatchReport report = scheduler.run(catalog);

    EXPECT_EQ(report.failed, 1u);
    ASSERT_TRUE(report.reportPath.has_value());
    auto written = utils::JsonUtils::parseFile(reportFile().string());
    ASSERT_TRUE(written.has_value());
    nlohmann::json expected = {{"resource", {
        {{"dest", "a.bin"}, {"md5", catalog.resources[0].md5}}
    }}};
    EXPECT_EQ(*written, expected);
}

TEST_F(BatchSchedulerTest, RuntimeErrorInOneFileDoesNotAbortTheRun) {
    publish("boom.bin", "explodes");
    publish("bad.bin", "expected bytes");
    publish("good.bin", "fine");
    transport.serve(kMainUrl + "/bad.bin", "other bytes");
    transport.throwOnStream(kMainUrl + "/boom.bin", std::make_exception_ptr(std::bad_alloc()));

    BatchScheduler scheduler(transport, config);
    BatchReport report;
    ASSERT_NO_THROW(report = scheduler.run(catalog));

    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.failed, 2u);
    EXPECT_EQ(scheduler.completed(), 3u);

    auto written = utils::JsonUtils::parseFile(reportFile().string());
    ASSERT_TRUE(written.has_value());
    nlohmann::json expected = {{"resource", {
        {{"dest", "boom.bin"}, {"md5", catalog.resources[0].md5}},
        {{"dest", "bad.bin"}, {"md5", catalog.resources[1].md5}}
    }}};
    EXPECT_EQ(*written, expected);
    EXPECT_EQ(test::readFile(downloaded("good.bin")), "fine");
}

TEST_F(BatchSchedulerTest, EmptyCatalogCompletesImmediately) {
    BatchScheduler scheduler(transport, config);
    BatchReport report = scheduler.run(catalog);

    EXPECT_EQ(report.total, 0u);
    EXPECT_TRUE(report.allSucceeded());
    EXPECT_FALSE(report.reportPath.has_value());
}

TEST_F(BatchSchedulerTest, ProgressReachesTotal) {
    for (int i = 0; i < 7; ++i) {
        publish("file" + std::to_string(i) + ".bin", "content " + std::to_string(i));
    }

    std::atomic<size_t> callbacks{0};
    std::atomic<size_t> maxCompleted{0};
    std::atomic<size_t> fileCallbacks{0};

    BatchScheduler scheduler(transport, config);
    scheduler.setOverallProgressCallback([&](size_t completed, size_t total) {
        EXPECT_EQ(total, 7u);
        ++callbacks;
        size_t seen = maxCompleted.load();
        while (completed > seen && !maxCompleted.compare_exchange_weak(seen, completed)) {
        }
    });
    scheduler.setFileCompleteCallback([&](const Resource&, const DownloadOutcome& outcome) {
        EXPECT_TRUE(outcome.isSuccess());
        ++fileCallbacks;
    });

    EXPECT_FLOAT_EQ(scheduler.getOverallProgress(), 0.0f);
    scheduler.run(catalog);

    EXPECT_EQ(callbacks.load(), 7u);
    EXPECT_EQ(fileCallbacks.load(), 7u);
    EXPECT_EQ(maxCompleted.load(), 7u);
    EXPECT_EQ(scheduler.completed(), 7u);
    EXPECT_EQ(scheduler.total(), 7u);
    EXPECT_FLOAT_EQ(scheduler.getOverallProgress(), 1.0f);
}

TEST_F(BatchSchedulerTest, FilesInFlightStayWithinLimit) {
    config.maxConcurrentFiles = 2;
    for (int i = 0; i < 8; ++i) {
        publish("slow" + std::to_string(i) + ".bin", "payload");
    }
    transport.setStreamDelay(std::chrono::milliseconds(20));

    BatchScheduler scheduler(transport, config);
    BatchReport report = scheduler.run(catalog);

    EXPECT_EQ(report.succeeded, 8u);
    EXPECT_GE(transport.peakConcurrentStreams(), 1u);
    EXPECT_LE(transport.peakConcurrentStreams(), 2u);
}
