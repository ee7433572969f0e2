#pragma once

/**
 * ChunkFetcher.hpp
 *
 * Byte-range downloads written at their own offsets of a pre-sized file.
 */

#include "Resource.hpp"
#include "../../utils/HttpClient.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace bulkfetch::core::downloader {

/**
 * Split [0, totalSize-1] into contiguous inclusive ranges.
 *
 * Each range gets totalSize / connections bytes and the last one also
 * takes the remainder. When totalSize < connections only totalSize
 * one-byte ranges are produced, so no range is ever empty.
 * Throws ConfigError for totalSize == 0 or connections <= 0.
 */
std::vector<ByteRange> planRanges(uint64_t totalSize, int connections);

/**
 * ChunkFetcher - fetches one range of a resource
 *
 * Safe to use from several threads on the same destination: every call
 * opens its own descriptor and writes by absolute offset.
 */
class ChunkFetcher {
public:
    ChunkFetcher(utils::HttpTransport& transport, utils::HttpOptions options);

    /**
     * GET url with "Range: bytes=start-end" and write the body at
     * range.start of destination, which must already exist.
     *
     * The body must be exactly range.length() bytes. Throws TransferError
     * on a bad status, transport error, short or long body, and
     * LocalIOError when the destination cannot be opened or written.
     */
    void fetch(const std::string& url, const ByteRange& range,
               const std::filesystem::path& destination) const;

private:
    utils::HttpTransport& m_transport;
    utils::HttpOptions m_options;
};

} // namespace bulkfetch::core::downloader
