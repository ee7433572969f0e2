#pragma once

/**
 * IntegrityVerifier.hpp
 *
 * Checksums of local files against catalog digests.
 */

#include <filesystem>
#include <string>

namespace bulkfetch::core::downloader {

/**
 * The digest algorithm follows the expected digest's length:
 * 32 hex chars = MD5, 40 = SHA-1, 64 = SHA-256. Anything else is
 * treated as MD5 and will simply never match.
 */
class IntegrityVerifier {
public:
    /**
     * Lowercase hex digest of file in the algorithm implied by expected.
     * Throws LocalIOError when the file cannot be read.
     */
    static std::string digest(const std::filesystem::path& file, const std::string& expected);

    /**
     * Case-insensitive comparison of the file's digest with expected.
     * Throws LocalIOError when the file cannot be read.
     */
    static bool matches(const std::filesystem::path& file, const std::string& expected);

    /**
     * Throws IntegrityMismatch (or LocalIOError) unless the file matches
     */
    static void verify(const std::filesystem::path& file, const std::string& expected);
};

} // namespace bulkfetch::core::downloader
