#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace bulkfetch::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getDownloadPath(const fs::path& baseDir, const std::string& version) {
        return baseDir / "download" / version;
    }

    static fs::path getFailedPath(const fs::path& baseDir, const std::string& version) {
        return baseDir / "failed" / version;
    }

    static fs::path getLogsPath(const fs::path& baseDir) {
        return baseDir / "logs";
    }

    /**
     * Resolve a catalog-relative path under root.
     * Leading '/' is ignored. Empty paths and paths with ".." components
     * are refused.
     */
    static std::optional<fs::path> resolveUnder(const fs::path& root, const std::string& relative) {
        fs::path rel(stripLeadingSlashes(relative));
        if (rel.empty() || rel.is_absolute() || rel.has_root_name()) {
            return std::nullopt;
        }
        for (const auto& part : rel) {
            if (part == "..") return std::nullopt;
        }
        fs::path joined = (root / rel).lexically_normal();
        if (!joined.has_filename()) return std::nullopt;
        return joined;
    }

    // "<base>/<relative>" without doubling the separator
    static std::string joinUrl(const std::string& base, const std::string& relative) {
        std::string left = base;
        while (!left.empty() && left.back() == '/') left.pop_back();
        return left + "/" + stripLeadingSlashes(relative);
    }

    // Last path segment of a URL or filesystem path, query and fragment removed
    static std::string basename(const std::string& location) {
        std::string path = location;
        auto cut = path.find_first_of("?#");
        if (cut != std::string::npos) path.erase(cut);
        while (!path.empty() && (path.back() == '/' || path.back() == '\\')) path.pop_back();
        auto slash = path.find_last_of("/\\");
        return slash == std::string::npos ? path : path.substr(slash + 1);
    }

    static std::string stripLeadingSlashes(const std::string& path) {
        auto start = path.find_first_not_of('/');
        return start == std::string::npos ? "" : path.substr(start);
    }
};

} // namespace bulkfetch::utils
