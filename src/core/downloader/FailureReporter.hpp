#pragma once

/**
 * FailureReporter.hpp
 *
 * Collection and persistence of the resources that failed a run.
 */

#include "Resource.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bulkfetch::core::downloader {

/**
 * FailureSet - failure records shared by concurrent orchestrations
 *
 * All members are thread-safe.
 */
class FailureSet {
public:
    void add(const Resource& resource, std::string reason);

    // Copy of the records in insertion order
    std::vector<FailureRecord> records() const;

    bool empty() const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::vector<FailureRecord> m_records;
};

/**
 * FailureReporter - writes {"resource": [...]} under the run's failed/ dir
 */
class FailureReporter {
public:
    explicit FailureReporter(std::filesystem::path failedDir);

    /**
     * Write the report named catalogName, replacing an older one.
     * Does nothing and returns nullopt when failures is empty.
     * Throws LocalIOError when the directory or file cannot be written.
     */
    std::optional<std::filesystem::path> write(const std::string& catalogName,
                                               const std::vector<FailureRecord>& failures) const;

    // Report body; each entry has the catalog's dest/md5 fields
    static nlohmann::json toJson(const std::vector<FailureRecord>& failures);

private:
    std::filesystem::path m_failedDir;
};

} // namespace bulkfetch::core::downloader
