#pragma once

/**
 * CatalogLoader.hpp
 *
 * Loads a resource catalog from a URL or a local JSON file.
 *
 * Format:
 *   {"resource": [{"dest": "path/in/catalog", "md5": "<hex>"}, ...]}
 */

#include "Resource.hpp"
#include "../../utils/HttpClient.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace bulkfetch::core::downloader {

class CatalogLoader {
public:
    explicit CatalogLoader(utils::HttpTransport& transport, utils::HttpOptions options = {});

    /**
     * Dispatch on sourceType ("url" or "file", case-insensitive, trimmed).
     * Throws ConfigError for any other source type.
     */
    Catalog load(const std::string& sourceType, const std::string& location) const;

    // Throws ManifestLoadError on HTTP or parse errors
    Catalog fromUrl(const std::string& url) const;

    // Throws ManifestLoadError when the file is missing or malformed
    Catalog fromFile(const std::filesystem::path& path) const;

    /**
     * Build a catalog from an already parsed document.
     * Throws ManifestLoadError when "resource" is missing or an entry
     * lacks a string dest/md5.
     */
    static Catalog fromJson(const nlohmann::json& document, const std::string& name);

private:
    utils::HttpTransport& m_transport;
    utils::HttpOptions m_options;
};

} // namespace bulkfetch::core::downloader
