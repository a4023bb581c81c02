/**
 * FileUtils.cpp
 *
 * File system operations.
 */

#include "FileUtils.hpp"

#include <fstream>

#ifdef _WIN32
#include <io.h>
#define DOCFETCH_ACCESS _access
#define DOCFETCH_W_OK 2
#else
#include <unistd.h>
#define DOCFETCH_ACCESS access
#define DOCFETCH_W_OK W_OK
#endif

namespace docfetch::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool FileUtils::directoryExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool FileUtils::isWritableDirectory(const fs::path& path) {
    if (!directoryExists(path)) return false;
    return DOCFETCH_ACCESS(path.string().c_str(), DOCFETCH_W_OK) == 0;
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

int64_t FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<int64_t>(size);
}

bool FileUtils::replaceFile(const fs::path& source, const fs::path& destination, std::string& error) {
    std::error_code ec;
    fs::rename(source, destination, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    return true;
}

// -- Read operations --

std::string FileUtils::readChunk(const fs::path& path, int64_t offset, size_t size) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return "";
    file.seekg(offset);
    if (!file) return "";
    std::string data(size, '\0');
    file.read(data.data(), static_cast<std::streamsize>(size));
    data.resize(static_cast<size_t>(file.gcount()));
    return data;
}

std::string FileUtils::readHead(const fs::path& path, size_t size) {
    return readChunk(path, 0, size);
}

std::string FileUtils::readTail(const fs::path& path, size_t size) {
    int64_t total = getFileSize(path);
    int64_t offset = total > static_cast<int64_t>(size) ? total - static_cast<int64_t>(size) : 0;
    return readChunk(path, offset, size);
}

// -- Path utilities --

std::string FileUtils::absolutePath(const fs::path& path) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    return ec ? path.string() : absolute.lexically_normal().string();
}

} // namespace docfetch::utils
