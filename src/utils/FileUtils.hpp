// docfetch - File Utilities
// File system operations used by the download engine

#pragma once

#include <string>
#include <filesystem>
#include <cstdint>

namespace fs = std::filesystem;

namespace docfetch::utils {

/**
 * @brief File and directory utilities
 *
 * All functions report failure through their return value and never throw.
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);
    static bool directoryExists(const fs::path& path);
    static bool isWritableDirectory(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool deleteFile(const fs::path& path);
    static int64_t getFileSize(const fs::path& path);

    /**
     * Rename source onto destination, replacing it if present.
     * Atomic when both live on the same filesystem.
     * @param error Receives the failure description
     */
    static bool replaceFile(const fs::path& source, const fs::path& destination, std::string& error);

    // Read operations
    static std::string readChunk(const fs::path& path, int64_t offset, size_t size);
    static std::string readHead(const fs::path& path, size_t size);
    static std::string readTail(const fs::path& path, size_t size);

    // Path utilities
    static std::string absolutePath(const fs::path& path);
};

/**
 * @brief Removes a file on scope exit unless released
 */
class ScopedFileRemover {
public:
    explicit ScopedFileRemover(fs::path path) : m_path(std::move(path)) {}
    ~ScopedFileRemover() { if (m_armed) FileUtils::deleteFile(m_path); }

    ScopedFileRemover(const ScopedFileRemover&) = delete;
    ScopedFileRemover& operator=(const ScopedFileRemover&) = delete;

    void release() { m_armed = false; }

private:
    fs::path m_path;
    bool m_armed{true};
};

} // namespace docfetch::utils
