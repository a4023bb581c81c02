#pragma once

/**
 * DownloadRequest.hpp
 *
 * Caller-supplied description of one logical download.
 */

#include "TransferFailure.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace docfetch::core::downloader {

/**
 * DownloadRequest - immutable input to DownloadEngine::run
 */
struct DownloadRequest {
    static constexpr int kMinRetries = 0;
    static constexpr int kMaxRetries = 10;
    static constexpr double kMinRetryDelay = 0.1;
    static constexpr double kMaxRetryDelay = 60.0;
    static constexpr double kMinTimeout = 5.0;
    static constexpr double kMaxTimeout = 300.0;

    // Absolute http(s) URL
    std::string url;

    // Existing, writable directory
    std::string destinationDirectory;

    // Target file name; derived from the URL when absent
    std::optional<std::string> filename;

    int maxRetries{3};
    double baseRetryDelaySeconds{5.0};
    double timeoutSeconds{30.0};

    // Expected SHA-256 (hex) of the complete file, optional
    std::optional<std::string> expectedSha256;

    DownloadRequest() = default;

    DownloadRequest(std::string url_, std::string destination_)
        : url(std::move(url_)), destinationDirectory(std::move(destination_)) {}

    /**
     * Check every field against its allowed range
     * @return The first problem found, or nullopt when the request is usable
     */
    std::optional<TransferFailure> validate() const;

    /**
     * Name of the final file: the given filename or one derived from the
     * URL, sanitized and carrying a .pdf extension
     * @param maxLength Longest name allowed, extension included
     */
    std::string resolveFileName(size_t maxLength = 255) const;

    /**
     * Derive a file name from the last path segment of a URL.
     * Falls back to "document.pdf" when the segment is empty or unsafe.
     */
    static std::string fileNameFromUrl(const std::string& url);
};

} // namespace docfetch::core::downloader
