#pragma once

/**
 * TransferValidator.hpp
 *
 * Integrity checks for a completed transfer before it becomes final.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace docfetch::core::downloader {

struct ValidationOptions {
    int64_t minimumSize{100};

    // A missing trailer rejects the file (true) or only warns (false)
    bool strictTrailer{true};

    // Bytes read from each end of the file
    size_t chunkSize{1024};
};

struct ValidationReport {
    bool valid{false};
    std::string error;
    int64_t fileSize{0};
    std::optional<std::string> pdfVersion;
    std::vector<std::string> warnings;
};

/**
 * TransferValidator - checks, in order:
 * declared length, minimum size, %PDF- signature, %%EOF trailer,
 * advisory structure markers, optional SHA-256.
 */
class TransferValidator {
public:
    explicit TransferValidator(ValidationOptions options = {});

    ValidationReport validate(const std::filesystem::path& path,
                              std::optional<int64_t> expectedLength,
                              const std::optional<std::string>& expectedSha256 = std::nullopt) const;

    /**
     * Version from a leading "%PDF-x.y" signature, nullopt when absent
     */
    static std::optional<std::string> signatureVersion(const std::string& head);

private:
    ValidationOptions m_options;
};

} // namespace docfetch::core::downloader
