/**
 * FailureReporter.cpp
 */

#include "FailureReporter.hpp"
#include "Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/PathUtils.hpp"

#include <utility>

namespace bulkfetch::core::downloader {

// -- FailureSet --

void FailureSet::add(const Resource& resource, std::string reason) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.push_back({resource, std::move(reason)});
}

std::vector<FailureRecord> FailureSet::records() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

bool FailureSet::empty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.empty();
}

size_t FailureSet::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

// -- FailureReporter --

FailureReporter::FailureReporter(std::filesystem::path failedDir)
    : m_failedDir(std::move(failedDir)) {
}

nlohmann::json FailureReporter::toJson(const std::vector<FailureRecord>& failures) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& failure : failures) {
        entries.push_back({
            {"dest", failure.resource.dest},
            {"md5", failure.resource.md5}
        });
    }
    return {{"resource", entries}};
}

std::optional<std::filesystem::path> FailureReporter::write(
    const std::string& catalogName,
    const std::vector<FailureRecord>& failures
) const {
    if (failures.empty()) {
        return std::nullopt;
    }

    std::string fileName = utils::PathUtils::basename(catalogName);
    if (fileName.empty() || fileName == "." || fileName == "..") {
        fileName = "failed.json";
    }

    if (!utils::FileUtils::createDirectories(m_failedDir)) {
        throw LocalIOError("cannot create " + m_failedDir.string());
    }

    std::filesystem::path reportPath = m_failedDir / fileName;
    if (!utils::JsonUtils::writeFile(reportPath, toJson(failures), 4)) {
        throw LocalIOError("cannot write " + reportPath.string());
    }

    LOG_INFO("Failed resources logged in {}", reportPath.string());
    return reportPath;
}

} // namespace bulkfetch::core::downloader
