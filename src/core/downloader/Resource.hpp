#pragma once

/**
 * Resource.hpp
 *
 * Catalog entries and the per-resource results of a run.
 */

#include <string>
#include <vector>
#include <cstdint>
#include <utility>

namespace bulkfetch::core::downloader {

/**
 * Resource - one remote file of a catalog
 */
struct Resource {
    // Path relative to the download root and to the server's main URL
    std::string dest;

    // Expected hex digest (MD5 in the catalog format)
    std::string md5;

    bool operator==(const Resource& other) const {
        return dest == other.dest && md5 == other.md5;
    }
};

/**
 * Catalog - resources of one run plus the name used for its failure report
 */
struct Catalog {
    std::string name;
    std::vector<Resource> resources;
};

/**
 * Inclusive byte span of a remote resource
 */
struct ByteRange {
    uint64_t start{0};
    uint64_t end{0};

    uint64_t length() const { return end - start + 1; }

    bool operator==(const ByteRange& other) const {
        return start == other.start && end == other.end;
    }
};

/**
 * Terminal state of one resource in one run
 */
enum class OutcomeKind {
    Skipped,   // local file already matched the checksum
    Succeeded,
    Failed
};

struct DownloadOutcome {
    OutcomeKind kind{OutcomeKind::Failed};
    std::string reason; // set only for Failed

    static DownloadOutcome skipped() { return {OutcomeKind::Skipped, {}}; }
    static DownloadOutcome succeeded() { return {OutcomeKind::Succeeded, {}}; }
    static DownloadOutcome failed(std::string why) { return {OutcomeKind::Failed, std::move(why)}; }

    bool isSuccess() const { return kind != OutcomeKind::Failed; }
};

inline const char* toString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Skipped:   return "skipped";
        case OutcomeKind::Succeeded: return "succeeded";
        case OutcomeKind::Failed:    return "failed";
    }
    return "unknown";
}

/**
 * A resource that failed this run, with the reason
 */
struct FailureRecord {
    Resource resource;
    std::string reason;
};

} // namespace bulkfetch::core::downloader
