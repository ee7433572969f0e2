/**
 * BatchScheduler.cpp
 *
 * Implementation of the catalog-wide download scheduler.
 */

#include "BatchScheduler.hpp"
#include "Errors.hpp"
#include "FailureReporter.hpp"
#include "FileOrchestrator.hpp"
#include "../Logger.hpp"
#include "../ThreadPool.hpp"
#include "../../utils/PathUtils.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace bulkfetch::core::downloader {

BatchScheduler::BatchScheduler(utils::HttpTransport& transport, RunConfig config)
    : m_transport(transport)
    , m_config(std::move(config)) {
}

void BatchScheduler::setOverallProgressCallback(OverallProgressCallback callback) {
    m_overallProgressCallback = std::move(callback);
}

void BatchScheduler::setFileCompleteCallback(FileCompleteCallback callback) {
    m_fileCompleteCallback = std::move(callback);
}

float BatchScheduler::getOverallProgress() const {
    size_t total = m_total.load();
    if (total == 0) return 0.0f;
    return static_cast<float>(m_completed.load()) / static_cast<float>(total);
}

void BatchScheduler::checkUniqueDestinations(const Catalog& catalog) const {
    // Compare resolved paths so "a//b", "./a/b" and "/a/b" collide with "a/b"
    const std::filesystem::path root = m_config.downloadDir();
    std::unordered_set<std::string> seen;
    for (const auto& resource : catalog.resources) {
        auto resolved = utils::PathUtils::resolveUnder(root, resource.dest);
        std::string key = resolved ? resolved->string() : resource.dest;
        if (!seen.insert(key).second) {
            throw ConfigError("duplicate destination in catalog: " + resource.dest);
        }
    }
}

BatchReport BatchScheduler::run(const Catalog& catalog) {
    m_config.validate();
    checkUniqueDestinations(catalog);

    const size_t total = catalog.resources.size();
    m_total = total;
    m_completed = 0;

    BatchReport report;
    report.total = total;

    LOG_INFO("Downloading {} files from {} into {} (max concurrent: {}, connections per file: {})",
             total, m_config.mainUrl, m_config.downloadDir().string(), m_config.maxConcurrentFiles,
             m_config.useMultiConnection ? m_config.numConnections : 1);

    FailureSet failures;
    FileOrchestrator orchestrator(m_transport, m_config, failures);

    std::vector<DownloadOutcome> outcomes(total);
    std::exception_ptr fatal;

    if (total > 0) {
        size_t workers = std::min(total, static_cast<size_t>(m_config.maxConcurrentFiles));
        std::vector<std::future<void>> pending;
        pending.reserve(total);

        ThreadPool pool(workers);
        LOG_DEBUG("Started {} download workers", pool.size());
        for (size_t i = 0; i < total; ++i) {
            pending.push_back(pool.submit([this, &orchestrator, &catalog, &outcomes, i, total] {
                const Resource& resource = catalog.resources[i];
                outcomes[i] = orchestrator.run(resource);

                size_t done = ++m_completed;
                LOG_INFO("Downloading files: {}/{} ({} {})", done, total,
                         resource.dest, toString(outcomes[i].kind));

                if (m_fileCompleteCallback) {
                    m_fileCompleteCallback(resource, outcomes[i]);
                }
                if (m_overallProgressCallback) {
                    m_overallProgressCallback(done, total);
                }
            }));
        }

        // Fire and collect: wait for every file even after a fatal error
        for (auto& future : pending) {
            try {
                future.get();
            } catch (...) {
                if (!fatal) fatal = std::current_exception();
            }
        }
    }

    if (fatal) {
        std::rethrow_exception(fatal);
    }

    for (const auto& outcome : outcomes) {
        switch (outcome.kind) {
            case OutcomeKind::Skipped:   ++report.skipped; break;
            case OutcomeKind::Succeeded: ++report.succeeded; break;
            case OutcomeKind::Failed:    ++report.failed; break;
        }
    }

    // Report in catalog order rather than completion order
    std::unordered_map<std::string, size_t> position;
    for (size_t i = 0; i < total; ++i) {
        position.emplace(catalog.resources[i].dest, i);
    }
    report.failures = failures.records();
    std::stable_sort(report.failures.begin(), report.failures.end(),
                     [&position](const FailureRecord& a, const FailureRecord& b) {
                         return position[a.resource.dest] < position[b.resource.dest];
                     });

    if (!report.failures.empty()) {
        FailureReporter reporter(m_config.failedDir());
        report.reportPath = reporter.write(catalog.name, report.failures);
    }

    LOG_INFO("Finished {}: {} downloaded, {} already valid, {} failed",
             catalog.name, report.succeeded, report.skipped, report.failed);

    return report;
}

} // namespace bulkfetch::core::downloader
