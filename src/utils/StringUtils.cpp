/**
 * StringUtils.cpp
 *
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace docfetch::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    return trim(str, " \t\n\r\f\v");
}

std::string StringUtils::trim(const std::string& str, const std::string& chars) {
    auto start = str.find_first_not_of(chars);
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(chars);
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}


// -- Search --

bool StringUtils::contains(const std::string& str, const std::string& substr) {
    return str.find(substr) != std::string::npos;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatSeconds(double seconds, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << seconds;
    return oss.str();
}

// -- File names --

std::string StringUtils::sanitizeFileName(const std::string& name, size_t maxLength) {
    static const std::string invalid = "<>:\"|?*\\/";
    static const std::array<const char*, 22> reserved = {
        "CON", "PRN", "AUX", "NUL",
        "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
        "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
    };

    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        bool control = static_cast<unsigned char>(c) < 0x20;
        result += (control || invalid.find(c) != std::string::npos) ? '_' : c;
    }

    result = trim(result, " .");
    if (result.empty()) return result;

    auto dot = result.find('.');
    std::string stem = toUpper(result.substr(0, dot));
    if (std::find(reserved.begin(), reserved.end(), stem) != reserved.end()) {
        result = "_" + result;
    }

    if (result.size() > maxLength) {
        auto extPos = result.rfind('.');
        std::string ext = extPos == std::string::npos ? "" : result.substr(extPos);
        if (ext.size() < maxLength) {
            result = result.substr(0, maxLength - ext.size()) + ext;
        } else {
            result = result.substr(0, maxLength);
        }
    }

    return result;
}

// -- Parsing --

std::optional<int64_t> StringUtils::parseLong(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
    return static_cast<int64_t>(value);
}

std::optional<double> StringUtils::parseDouble(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
    return value;
}

} // namespace docfetch::utils
