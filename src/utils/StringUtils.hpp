// Hauler - String Utilities
// String manipulation and formatting

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hauler::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);

    // Splitting
    static std::vector<std::string> split(const std::string& str, char delimiter);

    // Search
    static bool contains(const std::string& str, const std::string& substr);
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);
    static bool iequals(const std::string& a, const std::string& b);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatPercentage(double value, int precision = 1);

    // UUID
    static std::string generateUUID();
    static bool isValidUUID(const std::string& str);

    // File names coming from the network
    static std::string sanitizeFileName(const std::string& name);
};

} // namespace hauler::utils
