#pragma once

/**
 * FileOrchestrator.hpp
 *
 * Skip-or-download decision, fetch and verification for one resource.
 */

#include "Resource.hpp"
#include "RunConfig.hpp"
#include "FailureReporter.hpp"
#include "ChunkFetcher.hpp"
#include "StreamFetcher.hpp"
#include "../../utils/HttpClient.hpp"

#include <filesystem>
#include <string>

namespace bulkfetch::core::downloader {

/**
 * FileOrchestrator - drives one resource to a terminal outcome
 *
 * Flow:
 *   existing file with matching digest -> Skipped (no request is made)
 *   otherwise single-stream or chunked fetch -> verify -> Succeeded/Failed
 *
 * Transfer, integrity and local I/O errors become a Failed outcome and a
 * record in the shared FailureSet; they never escape run(). ConfigError
 * does escape, since it invalidates the whole run.
 *
 * run() may be called concurrently for different resources.
 */
class FileOrchestrator {
public:
    FileOrchestrator(utils::HttpTransport& transport, const RunConfig& config, FailureSet& failures);

    DownloadOutcome run(const Resource& resource) const;

    // mainUrl joined with the resource's dest
    std::string resourceUrl(const Resource& resource) const;

    // downloadDir joined with dest; throws LocalIOError for unsafe paths
    std::filesystem::path destinationFor(const Resource& resource) const;

private:
    DownloadOutcome process(const Resource& resource) const;

    // Size from a HEAD request; throws TransferError when unusable
    uint64_t probeSize(const std::string& url) const;

    void downloadChunked(const std::string& url, const std::filesystem::path& destination) const;
    void downloadSingle(const std::string& url, const std::filesystem::path& destination,
                        const std::string& label) const;

private:
    utils::HttpTransport& m_transport;
    const RunConfig& m_config;
    FailureSet& m_failures;

    ChunkFetcher m_chunkFetcher;
    StreamFetcher m_streamFetcher;
};

} // namespace bulkfetch::core::downloader
