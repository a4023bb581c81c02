/**
 * DownloadOutcome.cpp
 */

#include "DownloadOutcome.hpp"
#include "../../utils/StringUtils.hpp"

#include <sstream>

namespace docfetch::core::downloader {

json DownloadOutcome::toJson() const {
    json result = {
        {"success", success},
        {"local_path", localPath ? json(*localPath) : json(nullptr)},
        {"file_size", fileSizeBytes},
        {"bytes_downloaded", bytesDownloaded},
        {"attempts_used", attemptsUsed},
        {"max_retries", maxRetries},
        {"download_time", downloadTimeSeconds},
        {"total_time", totalTimeSeconds},
        {"average_speed", averageSpeedBytesPerSecond},
        {"resumed", resumed},
        {"error_message", errorMessage ? json(*errorMessage) : json(nullptr)}
    };

    if (pdfVersion) {
        result["pdf_version"] = *pdfVersion;
    }
    if (!warnings.empty()) {
        result["warnings"] = warnings;
    }
    return result;
}

std::string DownloadOutcome::summary() const {
    using utils::StringUtils;

    std::ostringstream out;
    if (success) {
        out << "PDF Download Successful\n\n"
            << "Local Path: " << localPath.value_or("") << "\n"
            << "File Size: " << fileSizeBytes << " bytes (" << StringUtils::formatBytes(fileSizeBytes) << ")\n"
            << "Attempts Used: " << attemptsUsed << "/" << (maxRetries + 1) << "\n"
            << "Download Time: " << StringUtils::formatSeconds(downloadTimeSeconds) << " seconds\n"
            << "Average Speed: " << StringUtils::formatBytes(static_cast<int64_t>(averageSpeedBytesPerSecond)) << "/s";
        if (resumed) {
            out << "\nResumed: yes";
        }
        if (pdfVersion) {
            out << "\nPDF Version: " << *pdfVersion;
        }
        for (const auto& warning : warnings) {
            out << "\nWarning: " << warning;
        }
    } else {
        out << "PDF Download Failed\n\n"
            << "Error: " << errorMessage.value_or("unknown error") << "\n"
            << "Attempts Used: " << attemptsUsed << "/" << (maxRetries + 1) << "\n"
            << "Total Time: " << StringUtils::formatSeconds(totalTimeSeconds) << " seconds\n\n"
            << "Suggestions:\n"
            << "- Check if the URL is accessible\n"
            << "- Verify the destination path exists and is writable\n"
            << "- Try again with increased retry count or delay";
    }
    return out.str();
}

} // namespace docfetch::core::downloader
