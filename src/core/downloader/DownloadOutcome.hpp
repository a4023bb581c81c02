#pragma once

/**
 * DownloadOutcome.hpp
 *
 * Final result of one DownloadEngine::run call.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docfetch::core::downloader {

using json = nlohmann::json;

/**
 * DownloadOutcome - immutable once returned
 *
 * success == true  <=> localPath present, errorMessage absent
 * success == false <=> localPath absent, errorMessage present
 */
struct DownloadOutcome {
    bool success{false};
    std::optional<std::string> localPath;
    int64_t fileSizeBytes{0};
    int64_t bytesDownloaded{0};
    int attemptsUsed{0};
    int maxRetries{0};
    double downloadTimeSeconds{0.0};
    double totalTimeSeconds{0.0};
    double averageSpeedBytesPerSecond{0.0};
    bool resumed{false};
    std::optional<std::string> errorMessage;

    // Reported by the validator for accepted files
    std::optional<std::string> pdfVersion;
    std::vector<std::string> warnings;

    json toJson() const;

    /**
     * Multi-line, human-readable report of the run
     */
    std::string summary() const;
};

} // namespace docfetch::core::downloader
