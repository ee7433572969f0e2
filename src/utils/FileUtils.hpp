// BulkFetch - File Utilities
// File system operations used by the fetchers

#pragma once

#include <string>
#include <filesystem>
#include <cstdint>

namespace fs = std::filesystem;

namespace bulkfetch::utils {

/**
 * @brief File and directory utilities
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);

    // Create or truncate path and size it to exactly size bytes
    static bool createSized(const fs::path& path, uint64_t size);
};

/**
 * @brief Write-only file handle addressed by absolute offset.
 *
 * Every instance owns its own descriptor, so several instances on the same
 * path can write disjoint regions from different threads.
 */
class PositionedFile {
public:
    // Opens an existing file; isOpen() reports failure
    explicit PositionedFile(const fs::path& path);
    ~PositionedFile();

    PositionedFile(const PositionedFile&) = delete;
    PositionedFile& operator=(const PositionedFile&) = delete;

    bool isOpen() const;
    const std::string& lastError() const { return m_error; }

    // Writes all of data at offset; false on any error
    bool writeAt(uint64_t offset, const char* data, size_t size);

    void close();

private:
    fs::path m_path;
    std::string m_error;

#ifdef _WIN32
    void* m_handle{nullptr};
#else
    int m_fd{-1};
#endif
};

} // namespace bulkfetch::utils
