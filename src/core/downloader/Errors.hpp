#pragma once

/**
 * Errors.hpp
 *
 * Exception types raised by the download engine.
 */

#include <stdexcept>
#include <string>

namespace bulkfetch::core::downloader {

class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Catalog could not be fetched or parsed
class ManifestLoadError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Network failure, bad status, or a body of the wrong length
class TransferError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Downloaded content does not hash to the expected checksum
class IntegrityMismatch : public DownloadError {
public:
    IntegrityMismatch(const std::string& expected, const std::string& actual)
        : DownloadError("checksum mismatch: expected " + expected + ", got " + actual)
        , m_expected(expected)
        , m_actual(actual) {}

    const std::string& expected() const { return m_expected; }
    const std::string& actual() const { return m_actual; }

private:
    std::string m_expected;
    std::string m_actual;
};

// Local file could not be created, sized, read or written
class LocalIOError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Invalid run configuration; fatal to the whole run
class ConfigError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

} // namespace bulkfetch::core::downloader
