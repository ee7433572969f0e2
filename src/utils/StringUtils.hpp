// BulkFetch - String Utilities
// String manipulation and formatting

#pragma once

#include <string>
#include <cstdint>

namespace bulkfetch::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);
    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

    // Search
    static bool startsWith(const std::string& str, const std::string& prefix);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatPercentage(double value, int precision = 1);

    // Validation
    static bool isUrl(const std::string& str);
};

} // namespace bulkfetch::utils
