/**
 * DownloadRequest.cpp
 *
 * Request validation and file name resolution.
 */

#include "DownloadRequest.hpp"
#include "../../utils/HttpClient.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <cctype>

namespace docfetch::core::downloader {

namespace {

constexpr const char* kFallbackName = "document.pdf";

bool inRange(double value, double min, double max) {
    // Written so that NaN is rejected
    return value >= min && value <= max;
}

std::string withPdfExtension(const std::string& name) {
    if (utils::StringUtils::endsWith(utils::StringUtils::toLower(name), ".pdf")) {
        return name;
    }
    return name + ".pdf";
}

} // namespace

std::optional<TransferFailure> DownloadRequest::validate() const {
    if (url.empty()) {
        return TransferFailure::configurationError("URL is required");
    }

    auto parsed = utils::HttpClient::parseUrl(url);
    if (!parsed) {
        return TransferFailure::configurationError("Invalid URL: " + url);
    }
    if (parsed->scheme != "http" && parsed->scheme != "https") {
        return TransferFailure::configurationError(
            "Unsupported URL scheme '" + parsed->scheme + "' (expected http or https)");
    }

    if (destinationDirectory.empty()) {
        return TransferFailure::configurationError("Destination directory is required");
    }

    if (maxRetries < kMinRetries || maxRetries > kMaxRetries) {
        return TransferFailure::configurationError(
            "maxRetries must be between 0 and 10 (got " + std::to_string(maxRetries) + ")");
    }

    if (!inRange(baseRetryDelaySeconds, kMinRetryDelay, kMaxRetryDelay)) {
        return TransferFailure::configurationError(
            "baseRetryDelaySeconds must be between 0.1 and 60.0 (got " +
            utils::StringUtils::formatSeconds(baseRetryDelaySeconds) + ")");
    }

    if (!inRange(timeoutSeconds, kMinTimeout, kMaxTimeout)) {
        return TransferFailure::configurationError(
            "timeoutSeconds must be between 5.0 and 300.0 (got " +
            utils::StringUtils::formatSeconds(timeoutSeconds) + ")");
    }

    if (expectedSha256) {
        const auto& digest = *expectedSha256;
        bool hex = std::all_of(digest.begin(), digest.end(),
                               [](unsigned char c) { return std::isxdigit(c) != 0; });
        if (digest.size() != 64 || !hex) {
            return TransferFailure::configurationError("expectedSha256 must be 64 hexadecimal characters");
        }
    }

    if (filename && utils::StringUtils::sanitizeFileName(*filename).empty()) {
        return TransferFailure::configurationError("Filename '" + *filename + "' is not usable");
    }

    return std::nullopt;
}

std::string DownloadRequest::resolveFileName(size_t maxLength) const {
    std::string name = filename ? *filename : fileNameFromUrl(url);
    std::string sanitized = utils::StringUtils::sanitizeFileName(withPdfExtension(name), maxLength);
    return sanitized.empty() ? kFallbackName : sanitized;
}

std::string DownloadRequest::fileNameFromUrl(const std::string& url) {
    auto parsed = utils::HttpClient::parseUrl(url);
    if (!parsed) {
        return kFallbackName;
    }

    std::string segment = parsed->path;
    auto slash = segment.rfind('/');
    if (slash != std::string::npos) {
        segment = segment.substr(slash + 1);
    }
    segment = utils::HttpClient::urlDecode(segment);

    std::string sanitized = utils::StringUtils::sanitizeFileName(segment);
    if (sanitized.empty()) {
        return kFallbackName;
    }
    return withPdfExtension(sanitized);
}

} // namespace docfetch::core::downloader
