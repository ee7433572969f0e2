/**
 * ChunkFetcher.cpp
 */

#include "ChunkFetcher.hpp"
#include "Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <utility>

namespace bulkfetch::core::downloader {

std::vector<ByteRange> planRanges(uint64_t totalSize, int connections) {
    if (totalSize == 0) {
        throw ConfigError("cannot split a resource of size 0");
    }
    if (connections <= 0) {
        throw ConfigError("number of connections must be positive, got " +
                          std::to_string(connections));
    }

    uint64_t count = static_cast<uint64_t>(connections);
    if (count > totalSize) count = totalSize;

    const uint64_t chunkSize = totalSize / count;

    std::vector<ByteRange> ranges;
    ranges.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        ranges.push_back({i * chunkSize, (i + 1) * chunkSize - 1});
    }
    ranges.back().end = totalSize - 1;
    return ranges;
}

ChunkFetcher::ChunkFetcher(utils::HttpTransport& transport, utils::HttpOptions options)
    : m_transport(transport)
    , m_options(std::move(options)) {
}

void ChunkFetcher::fetch(const std::string& url, const ByteRange& range,
                         const std::filesystem::path& destination) const {
    utils::PositionedFile file(destination);
    if (!file.isOpen()) {
        throw LocalIOError("cannot open " + destination.string() + ": " + file.lastError());
    }

    const uint64_t expected = range.length();
    uint64_t written = 0;
    bool overflow = false;
    bool writeFailed = false;

    utils::HttpOptions options = m_options;
    options.headers["Range"] = utils::HttpClient::rangeHeader(range.start, range.end);

    LOG_DEBUG("Fetching bytes {}-{} of {}", range.start, range.end, url);

    auto response = m_transport.stream(url, [&](const char* data, size_t size) -> bool {
        if (written + size > expected) {
            overflow = true;
            return false;
        }
        if (!file.writeAt(range.start + written, data, size)) {
            writeFailed = true;
            return false;
        }
        written += size;
        return true;
    }, options);

    if (writeFailed) {
        throw LocalIOError("write to " + destination.string() + " failed: " + file.lastError());
    }
    if (overflow) {
        throw TransferError("range " + options.headers["Range"] + " of " + url +
                            " returned more than " + std::to_string(expected) + " bytes");
    }
    if (!response.error.empty()) {
        throw TransferError("range " + options.headers["Range"] + " of " + url + ": " + response.error);
    }
    if (!response.isSuccess()) {
        throw TransferError("range " + options.headers["Range"] + " of " + url +
                            ": HTTP " + std::to_string(response.statusCode));
    }
    if (written != expected) {
        throw TransferError("range " + options.headers["Range"] + " of " + url + ": short read, got " +
                            std::to_string(written) + " of " + std::to_string(expected) + " bytes");
    }
}

} // namespace bulkfetch::core::downloader
