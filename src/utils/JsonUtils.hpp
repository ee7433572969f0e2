// BulkFetch - JSON Utilities
// JSON parsing and serialization helpers

#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace bulkfetch::utils {

using json = nlohmann::json;

/**
 * @brief JSON utility functions
 */
class JsonUtils {
public:
    // Parsing
    static std::optional<json> parse(const std::string& str);
    static std::optional<json> parseFile(const std::filesystem::path& path);

    // Serialization
    static bool writeFile(const std::filesystem::path& path, const json& j, int indent = 4);

    // Type checking
    static bool isString(const json& j, const std::string& key);
    static bool isArray(const json& j, const std::string& key);
};

} // namespace bulkfetch::utils
