/**
 * FileOrchestrator.cpp
 *
 * Per-resource download state machine.
 */

#include "FileOrchestrator.hpp"
#include "Errors.hpp"
#include "IntegrityVerifier.hpp"
#include "../Logger.hpp"
#include "../ThreadPool.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/PathUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <exception>
#include <future>
#include <vector>

namespace bulkfetch::core::downloader {

FileOrchestrator::FileOrchestrator(utils::HttpTransport& transport, const RunConfig& config,
                                   FailureSet& failures)
    : m_transport(transport)
    , m_config(config)
    , m_failures(failures)
    , m_chunkFetcher(transport, config.httpOptions())
    , m_streamFetcher(transport, config.httpOptions()) {
}

std::string FileOrchestrator::resourceUrl(const Resource& resource) const {
    return utils::PathUtils::joinUrl(m_config.mainUrl, resource.dest);
}

std::filesystem::path FileOrchestrator::destinationFor(const Resource& resource) const {
    auto path = utils::PathUtils::resolveUnder(m_config.downloadDir(), resource.dest);
    if (!path) {
        throw LocalIOError("refusing unsafe destination '" + resource.dest + "'");
    }
    return *path;
}

DownloadOutcome FileOrchestrator::run(const Resource& resource) const {
    try {
        return process(resource);
    } catch (const ConfigError&) {
        throw;
    } catch (const IntegrityMismatch& e) {
        LOG_WARN("Hash mismatch for {}. Expected {}, got {}", resource.dest, e.expected(), e.actual());
        m_failures.add(resource, e.what());
        return DownloadOutcome::failed(e.what());
    } catch (const DownloadError& e) {
        LOG_ERROR("Download of {} failed: {}", resource.dest, e.what());
        m_failures.add(resource, e.what());
        return DownloadOutcome::failed(e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_ERROR("Download of {} failed: {}", resource.dest, e.what());
        m_failures.add(resource, e.what());
        return DownloadOutcome::failed(e.what());
    } catch (const std::exception& e) {
        // Thread creation, allocation and other runtime failures stay with this file
        LOG_ERROR("Unexpected error while downloading {}: {}", resource.dest, e.what());
        m_failures.add(resource, std::string("unexpected error: ") + e.what());
        return DownloadOutcome::failed(std::string("unexpected error: ") + e.what());
    }
}

DownloadOutcome FileOrchestrator::process(const Resource& resource) const {
    const std::filesystem::path destination = destinationFor(resource);
    const std::string url = resourceUrl(resource);

    if (!utils::FileUtils::createDirectories(destination.parent_path())) {
        throw LocalIOError("cannot create " + destination.parent_path().string());
    }

    if (utils::FileUtils::fileExists(destination)) {
        bool valid = false;
        try {
            valid = IntegrityVerifier::matches(destination, resource.md5);
        } catch (const LocalIOError& e) {
            LOG_WARN("Cannot hash existing {}: {}", destination.string(), e.what());
        }
        if (valid) {
            LOG_INFO("File {} already exists and is valid. Skipping download.", resource.dest);
            return DownloadOutcome::skipped();
        }
        LOG_DEBUG("Existing {} does not match, downloading again", resource.dest);
    }

    if (m_config.useMultiConnection) {
        downloadChunked(url, destination);
    } else {
        downloadSingle(url, destination, resource.dest);
    }

    IntegrityVerifier::verify(destination, resource.md5);

    LOG_INFO("Downloaded {}", resource.dest);
    return DownloadOutcome::succeeded();
}

uint64_t FileOrchestrator::probeSize(const std::string& url) const {
    auto response = m_transport.head(url, m_config.httpOptions());
    if (!response.error.empty()) {
        throw TransferError("HEAD " + url + ": " + response.error);
    }
    if (!response.isSuccess()) {
        throw TransferError("HEAD " + url + ": HTTP " + std::to_string(response.statusCode));
    }
    if (response.contentLength < 0) {
        throw TransferError("HEAD " + url + ": no Content-Length, cannot split into ranges");
    }
    if (response.contentLength == 0) {
        throw TransferError("HEAD " + url + ": Content-Length is 0, nothing to split");
    }
    return static_cast<uint64_t>(response.contentLength);
}

void FileOrchestrator::downloadChunked(const std::string& url,
                                       const std::filesystem::path& destination) const {
    const uint64_t totalSize = probeSize(url);
    const std::vector<ByteRange> ranges = planRanges(totalSize, m_config.numConnections);

    if (!utils::FileUtils::createSized(destination, totalSize)) {
        throw LocalIOError("cannot allocate " + std::to_string(totalSize) + " bytes for " +
                           destination.string());
    }

    LOG_DEBUG("Downloading {} ({}) with {} connections", url,
              utils::StringUtils::formatBytes(static_cast<int64_t>(totalSize)), ranges.size());

    std::vector<std::future<void>> pending;
    pending.reserve(ranges.size());
    {
        ThreadPool pool(ranges.size());
        for (const auto& range : ranges) {
            pending.push_back(pool.submit([this, &url, &destination, range] {
                m_chunkFetcher.fetch(url, range, destination);
            }));
        }

        // Every chunk finishes before the file counts as fetched
        std::exception_ptr firstError;
        size_t done = 0;
        for (auto& future : pending) {
            try {
                future.get();
                ++done;
                LOG_TRACE("{}: {}/{} chunks", url, done, ranges.size());
            } catch (...) {
                if (!firstError) firstError = std::current_exception();
            }
        }
        if (firstError) {
            std::rethrow_exception(firstError);
        }
    }
}

void FileOrchestrator::downloadSingle(const std::string& url, const std::filesystem::path& destination,
                                      const std::string& label) const {
    constexpr uint64_t kLogStep = 4 * 1024 * 1024;
    uint64_t nextLog = kLogStep;

    m_streamFetcher.fetch(url, destination, [&](uint64_t downloaded, int64_t total) {
        if (downloaded < nextLog) return;
        nextLog = downloaded + kLogStep;
        if (total > 0) {
            LOG_DEBUG("{}: {} of {} ({})", label,
                      utils::StringUtils::formatBytes(static_cast<int64_t>(downloaded)),
                      utils::StringUtils::formatBytes(total),
                      utils::StringUtils::formatPercentage(static_cast<double>(downloaded) / total));
        } else {
            LOG_DEBUG("{}: {}", label, utils::StringUtils::formatBytes(static_cast<int64_t>(downloaded)));
        }
    });
}

} // namespace bulkfetch::core::downloader
