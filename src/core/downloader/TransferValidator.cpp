/**
 * TransferValidator.cpp
 */

#include "TransferValidator.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <array>
#include <cctype>

namespace docfetch::core::downloader {

namespace {

constexpr const char* kSignature = "%PDF-";
constexpr std::array<const char*, 9> kKnownVersions = {
    "1.0", "1.1", "1.2", "1.3", "1.4", "1.5", "1.6", "1.7", "2.0"
};

ValidationReport rejected(ValidationReport report, std::string error) {
    report.valid = false;
    report.error = std::move(error);
    return report;
}

} // namespace

TransferValidator::TransferValidator(ValidationOptions options)
    : m_options(options) {
}

std::optional<std::string> TransferValidator::signatureVersion(const std::string& head) {
    if (!utils::StringUtils::startsWith(head, kSignature)) {
        return std::nullopt;
    }

    std::string version;
    for (size_t i = 5; i < head.size() && version.size() < 3; ++i) {
        char c = head[i];
        if (std::isdigit(static_cast<unsigned char>(c)) || (c == '.' && version.size() == 1)) {
            version += c;
        } else {
            break;
        }
    }
    return version;
}

ValidationReport TransferValidator::validate(const std::filesystem::path& path,
                                             std::optional<int64_t> expectedLength,
                                             const std::optional<std::string>& expectedSha256) const {
    ValidationReport report;
    auto& log = Logger::instance();

    if (!utils::FileUtils::fileExists(path)) {
        return rejected(std::move(report), "File does not exist");
    }

    report.fileSize = utils::FileUtils::getFileSize(path);
    if (report.fileSize == 0) {
        return rejected(std::move(report), "File is empty");
    }

    if (expectedLength && *expectedLength != report.fileSize) {
        return rejected(std::move(report), "Size mismatch: expected " + std::to_string(*expectedLength) +
                                           " bytes, got " + std::to_string(report.fileSize));
    }

    if (report.fileSize < m_options.minimumSize) {
        return rejected(std::move(report), "File too small (" + std::to_string(report.fileSize) +
                                           " bytes), likely corrupted");
    }

    std::string head = utils::FileUtils::readHead(path, m_options.chunkSize);
    auto version = signatureVersion(head);
    if (!version) {
        return rejected(std::move(report), "Invalid PDF header - file may be corrupted or not a PDF");
    }
    if (!version->empty()) {
        report.pdfVersion = *version;
        bool known = false;
        for (const char* v : kKnownVersions) {
            if (*version == v) known = true;
        }
        if (!known) {
            report.warnings.push_back("Unrecognised PDF version " + *version);
        }
    } else {
        report.warnings.push_back("PDF version missing from header");
    }

    std::string tail = utils::FileUtils::readTail(path, m_options.chunkSize);
    if (!utils::StringUtils::contains(tail, "%%EOF")) {
        bool structured = utils::StringUtils::contains(tail, "trailer") ||
                          utils::StringUtils::contains(tail, "startxref") ||
                          utils::StringUtils::contains(tail, "xref");
        if (structured) {
            report.warnings.push_back("PDF appears to have proper structure but missing %%EOF marker");
        } else if (m_options.strictTrailer) {
            return rejected(std::move(report), "No valid PDF trailer found - file may be incomplete or corrupted");
        } else {
            report.warnings.push_back("No PDF trailer found");
        }
    }

    // Advisory only
    std::string sample = head + tail;
    if (!utils::StringUtils::contains(sample, " obj")) {
        report.warnings.push_back("No PDF objects found near file boundaries");
    }
    if (!utils::StringUtils::contains(tail, "xref")) {
        report.warnings.push_back("No cross-reference table found");
    }
    if (!utils::StringUtils::contains(sample, "/Root")) {
        report.warnings.push_back("No document catalog (/Root) reference found");
    }

    if (expectedSha256) {
        std::string actual = utils::HashUtils::sha256File(path.string());
        if (actual.empty()) {
            return rejected(std::move(report), "Could not compute SHA-256 checksum");
        }
        if (actual != utils::StringUtils::toLower(*expectedSha256)) {
            return rejected(std::move(report), "Checksum mismatch: expected " +
                                               utils::StringUtils::toLower(*expectedSha256) + ", got " + actual);
        }
        log.debug("SHA-256 verified: {}", actual);
    }

    for (const auto& warning : report.warnings) {
        log.debug("Validation warning: {}", warning);
    }

    report.valid = true;
    return report;
}

} // namespace docfetch::core::downloader
