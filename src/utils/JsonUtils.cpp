/**
 * JsonUtils.cpp
 *
 * JSON parsing and serialization helpers.
 */

#include "JsonUtils.hpp"
#include <fstream>

namespace bulkfetch::utils {

// -- Parsing --

std::optional<json> JsonUtils::parse(const std::string& str) {
    try { return json::parse(str); }
    catch (const json::exception&) { return std::nullopt; }
}

std::optional<json> JsonUtils::parseFile(const std::filesystem::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) return std::nullopt;
        return json::parse(file);
    } catch (const json::exception&) { return std::nullopt; }
}

// -- Serialization --

// Truncates any existing file at path
bool JsonUtils::writeFile(const std::filesystem::path& path, const json& j, int indent) {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) return false;
        file << j.dump(indent) << '\n';
        file.flush();
        return static_cast<bool>(file);
    } catch (const std::exception&) { return false; }
}

// -- Type checking --

bool JsonUtils::isString(const json& j, const std::string& key) {
    return j.is_object() && j.contains(key) && j[key].is_string();
}

bool JsonUtils::isArray(const json& j, const std::string& key) {
    return j.is_object() && j.contains(key) && j[key].is_array();
}

} // namespace bulkfetch::utils
