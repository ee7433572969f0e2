/**
 * CatalogLoader.cpp
 */

#include "CatalogLoader.hpp"
#include "Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/PathUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <utility>

namespace bulkfetch::core::downloader {

CatalogLoader::CatalogLoader(utils::HttpTransport& transport, utils::HttpOptions options)
    : m_transport(transport)
    , m_options(std::move(options)) {
}

Catalog CatalogLoader::load(const std::string& sourceType, const std::string& location) const {
    std::string type = utils::StringUtils::toLower(utils::StringUtils::trim(sourceType));
    if (type == "url") {
        return fromUrl(utils::StringUtils::trim(location));
    }
    if (type == "file") {
        return fromFile(utils::StringUtils::trim(location));
    }
    throw ConfigError("invalid catalog source '" + sourceType + "', expected 'url' or 'file'");
}

Catalog CatalogLoader::fromUrl(const std::string& url) const {
    LOG_INFO("Loading catalog from {}", url);

    auto response = m_transport.get(url, m_options);
    if (!response.error.empty()) {
        throw ManifestLoadError("cannot fetch catalog " + url + ": " + response.error);
    }
    if (!response.isSuccess()) {
        throw ManifestLoadError("cannot fetch catalog " + url + ": HTTP " +
                                std::to_string(response.statusCode));
    }

    auto document = utils::JsonUtils::parse(response.body);
    if (!document) {
        throw ManifestLoadError("catalog " + url + " is not valid JSON");
    }
    return fromJson(*document, utils::PathUtils::basename(url));
}

Catalog CatalogLoader::fromFile(const std::filesystem::path& path) const {
    LOG_INFO("Loading catalog from {}", path.string());

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ManifestLoadError("catalog file " + path.string() + " does not exist");
    }

    auto document = utils::JsonUtils::parseFile(path);
    if (!document) {
        throw ManifestLoadError("catalog " + path.string() + " is not valid JSON");
    }
    return fromJson(*document, path.filename().string());
}

Catalog CatalogLoader::fromJson(const nlohmann::json& document, const std::string& name) {
    if (!utils::JsonUtils::isArray(document, "resource")) {
        throw ManifestLoadError("catalog " + name + " has no \"resource\" array");
    }

    Catalog catalog;
    catalog.name = name;

    const auto& entries = document.at("resource");
    catalog.resources.reserve(entries.size());
    size_t index = 0;
    for (const auto& entry : entries) {
        if (!utils::JsonUtils::isString(entry, "dest") || !utils::JsonUtils::isString(entry, "md5")) {
            throw ManifestLoadError("catalog " + name + ": entry " + std::to_string(index) +
                                    " needs string \"dest\" and \"md5\" fields");
        }
        catalog.resources.push_back({
            entry.at("dest").get<std::string>(),
            entry.at("md5").get<std::string>()
        });
        ++index;
    }

    LOG_DEBUG("Catalog {} lists {} resources", name, catalog.resources.size());
    return catalog;
}

} // namespace bulkfetch::core::downloader
