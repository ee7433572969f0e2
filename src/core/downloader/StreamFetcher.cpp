/**
 * StreamFetcher.cpp
 */

#include "StreamFetcher.hpp"
#include "Errors.hpp"
#include "../Logger.hpp"

#include <fstream>
#include <utility>

namespace bulkfetch::core::downloader {

StreamFetcher::StreamFetcher(utils::HttpTransport& transport, utils::HttpOptions options)
    : m_transport(transport)
    , m_options(std::move(options)) {
}

uint64_t StreamFetcher::fetch(const std::string& url, const std::filesystem::path& destination,
                              const StreamProgressCallback& progress) const {
    std::ofstream file(destination, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw LocalIOError("cannot open " + destination.string() + " for writing");
    }

    uint64_t written = 0;
    int64_t total = -1;
    bool writeFailed = false;

    utils::HttpOptions options = m_options;
    options.progressCallback = [&total](int64_t /*downloaded*/, int64_t announced) {
        if (announced > 0) total = announced;
    };

    auto response = m_transport.stream(url, [&](const char* data, size_t size) -> bool {
        file.write(data, static_cast<std::streamsize>(size));
        if (!file) {
            writeFailed = true;
            return false;
        }
        written += size;
        if (progress) {
            progress(written, total);
        }
        return true;
    }, options);

    file.close();

    if (writeFailed || file.fail()) {
        throw LocalIOError("write to " + destination.string() + " failed");
    }
    if (!response.error.empty()) {
        throw TransferError(url + ": " + response.error);
    }
    if (!response.isSuccess()) {
        throw TransferError(url + ": HTTP " + std::to_string(response.statusCode));
    }
    // Content-Length counts encoded bytes when the body was compressed
    bool identity = response.headers.count("content-encoding") == 0;
    if (identity && response.contentLength >= 0 &&
        written != static_cast<uint64_t>(response.contentLength)) {
        throw TransferError(url + ": expected " + std::to_string(response.contentLength) +
                            " bytes, got " + std::to_string(written));
    }

    LOG_DEBUG("Streamed {} bytes of {} to {}", written, url, destination.string());
    return written;
}

} // namespace bulkfetch::core::downloader
