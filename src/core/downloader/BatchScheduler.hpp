#pragma once

/**
 * BatchScheduler.hpp
 *
 * Runs every resource of a catalog through the FileOrchestrator with a
 * bounded number of files in flight.
 */

#include "Resource.hpp"
#include "RunConfig.hpp"
#include "../../utils/HttpClient.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace bulkfetch::core::downloader {

/**
 * Overall progress callback, called from worker threads after each file
 */
using OverallProgressCallback = std::function<void(
    size_t completed,
    size_t total
)>;

/**
 * Per-file completion callback, called from worker threads
 */
using FileCompleteCallback = std::function<void(
    const Resource& resource,
    const DownloadOutcome& outcome
)>;

/**
 * Aggregate result of one batch run
 */
struct BatchReport {
    size_t total{0};
    size_t skipped{0};
    size_t succeeded{0};
    size_t failed{0};

    // Failed resources in catalog order
    std::vector<FailureRecord> failures;

    // Set when a failure report was written
    std::optional<std::filesystem::path> reportPath;

    bool allSucceeded() const { return failed == 0; }
};

/**
 * BatchScheduler - fire-and-collect download of a whole catalog
 *
 * Features:
 * - At most maxConcurrentFiles files in flight
 * - One file's failure never cancels the others
 * - Progress as files completed out of total
 * - Failure report written only when something failed
 */
class BatchScheduler {
public:
    BatchScheduler(utils::HttpTransport& transport, RunConfig config);

    // Disable copy
    BatchScheduler(const BatchScheduler&) = delete;
    BatchScheduler& operator=(const BatchScheduler&) = delete;

    /**
     * Download the catalog and wait for every resource.
     *
     * Throws ConfigError for an invalid RunConfig or duplicate destinations,
     * and LocalIOError when the failure report cannot be written.
     */
    BatchReport run(const Catalog& catalog);

    void setOverallProgressCallback(OverallProgressCallback callback);
    void setFileCompleteCallback(FileCompleteCallback callback);

    /**
     * Files finished so far in the current or last run
     */
    size_t completed() const { return m_completed.load(); }

    /**
     * Files in the current or last run
     */
    size_t total() const { return m_total.load(); }

    /**
     * completed / total, 0.0 before the first run
     */
    float getOverallProgress() const;

    const RunConfig& config() const { return m_config; }

private:
    void checkUniqueDestinations(const Catalog& catalog) const;

private:
    utils::HttpTransport& m_transport;
    RunConfig m_config;

    OverallProgressCallback m_overallProgressCallback;
    FileCompleteCallback m_fileCompleteCallback;

    std::atomic<size_t> m_total{0};
    std::atomic<size_t> m_completed{0};
};

} // namespace bulkfetch::core::downloader
