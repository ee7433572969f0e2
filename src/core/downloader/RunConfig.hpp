#pragma once

/**
 * RunConfig.hpp
 *
 * Validated settings for one batch run.
 */

#include "../Config.hpp"
#include "../../utils/HttpClient.hpp"

#include <filesystem>
#include <string>

namespace bulkfetch::core::downloader {

/**
 * RunConfig - everything the engine needs to know about a run
 *
 * Built once before the run starts; the engine never prompts.
 */
struct RunConfig {
    // Resource URL = mainUrl + "/" + dest
    std::string mainUrl;

    // Names the download/<version> and failed/<version> directories
    std::string version;

    // Split each file into numConnections range requests
    bool useMultiConnection{false};
    int numConnections{4};

    // Files downloaded at the same time
    int maxConcurrentFiles{4};

    // Root of the download/ and failed/ trees
    std::filesystem::path baseDir;

    int timeoutSeconds{300};
    int connectTimeoutSeconds{10};
    std::string userAgent{"BulkFetch/1.0"};
    bool verifySSL{true};

    /**
     * Read the "downloads.*" and "paths.*" keys. An empty paths.baseDir
     * means the current directory at the time of the call.
     */
    static RunConfig fromConfig(const Config& config);

    /**
     * Throws ConfigError describing the first invalid field
     */
    void validate() const;

    std::filesystem::path downloadDir() const;
    std::filesystem::path failedDir() const;

    // Request defaults derived from the timeouts, user agent and SSL flag
    utils::HttpOptions httpOptions() const;
};

} // namespace bulkfetch::core::downloader
