/**
 * RunConfig.cpp
 */

#include "RunConfig.hpp"
#include "Errors.hpp"
#include "../../utils/PathUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace bulkfetch::core::downloader {

RunConfig RunConfig::fromConfig(const Config& config) {
    RunConfig run;
    run.useMultiConnection = config.get<bool>("downloads.useMultiConnection", false);
    run.numConnections = config.get<int>("downloads.numConnections", 4);
    run.maxConcurrentFiles = config.get<int>("downloads.maxConcurrentFiles", 4);
    run.timeoutSeconds = config.get<int>("downloads.timeoutSeconds", 300);
    run.connectTimeoutSeconds = config.get<int>("downloads.connectTimeoutSeconds", 10);
    run.userAgent = config.get<std::string>("downloads.userAgent", "BulkFetch/1.0");
    run.verifySSL = config.get<bool>("downloads.verifySSL", true);

    std::string baseDir = config.get<std::string>("paths.baseDir", "");
    run.baseDir = baseDir.empty() ? std::filesystem::current_path() : std::filesystem::path(baseDir);
    return run;
}

void RunConfig::validate() const {
    if (utils::StringUtils::trim(mainUrl).empty()) {
        throw ConfigError("main URL is empty");
    }
    if (!utils::StringUtils::isUrl(mainUrl)) {
        throw ConfigError("main URL must start with http:// or https://: " + mainUrl);
    }
    if (utils::StringUtils::trim(version).empty()) {
        throw ConfigError("version is empty");
    }
    if (version == "." || version == ".." ||
        version.find_first_of("/\\") != std::string::npos) {
        throw ConfigError("version must be a single directory name: " + version);
    }
    if (numConnections <= 0) {
        throw ConfigError("number of connections must be positive, got " +
                          std::to_string(numConnections));
    }
    if (maxConcurrentFiles <= 0) {
        throw ConfigError("maximum concurrent files must be positive, got " +
                          std::to_string(maxConcurrentFiles));
    }
    if (baseDir.empty()) {
        throw ConfigError("base directory is empty");
    }
}

std::filesystem::path RunConfig::downloadDir() const {
    return utils::PathUtils::getDownloadPath(baseDir, version);
}

std::filesystem::path RunConfig::failedDir() const {
    return utils::PathUtils::getFailedPath(baseDir, version);
}

utils::HttpOptions RunConfig::httpOptions() const {
    utils::HttpOptions options;
    options.timeoutSeconds = timeoutSeconds;
    options.connectTimeoutSeconds = connectTimeoutSeconds;
    options.userAgent = userAgent;
    options.verifySSL = verifySSL;
    return options;
}

} // namespace bulkfetch::core::downloader
