// docfetch - String Utilities
// String manipulation and formatting

#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace docfetch::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);
    static std::string trim(const std::string& str, const std::string& chars);

    // Case conversion
    static std::string toLower(const std::string& str);
    static std::string toUpper(const std::string& str);

    // Search
    static bool contains(const std::string& str, const std::string& substr);
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatSeconds(double seconds, int precision = 2);

    /**
     * Make a name safe to use as a single path component.
     * Replaces < > : " | ? * \ / with '_', strips surrounding spaces and
     * dots, prefixes Windows device names with '_' and truncates to
     * maxLength characters keeping the extension.
     */
    static std::string sanitizeFileName(const std::string& name, size_t maxLength = 255);

    // Parsing (nullopt when the whole string is not a number)
    static std::optional<int64_t> parseLong(const std::string& str);
    static std::optional<double> parseDouble(const std::string& str);
};

} // namespace docfetch::utils
