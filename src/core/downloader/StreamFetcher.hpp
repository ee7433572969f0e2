#pragma once

/**
 * StreamFetcher.hpp
 *
 * Whole-resource download over a single connection.
 */

#include "../../utils/HttpClient.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace bulkfetch::core::downloader {

/**
 * Progress of a single-stream download; total is -1 while unknown
 */
using StreamProgressCallback = std::function<void(uint64_t downloaded, int64_t total)>;

class StreamFetcher {
public:
    StreamFetcher(utils::HttpTransport& transport, utils::HttpOptions options);

    /**
     * GET url and write the body to destination in arrival order,
     * replacing whatever was there.
     * @return Number of bytes written
     *
     * Throws TransferError on transport errors, non-2xx status or a body
     * shorter than the announced Content-Length; LocalIOError when the
     * destination cannot be written.
     */
    uint64_t fetch(const std::string& url, const std::filesystem::path& destination,
                   const StreamProgressCallback& progress = nullptr) const;

private:
    utils::HttpTransport& m_transport;
    utils::HttpOptions m_options;
};

} // namespace bulkfetch::core::downloader
