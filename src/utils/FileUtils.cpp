/**
 * FileUtils.cpp
 * 
 * Non-throwing file system operations.
 */

#include "FileUtils.hpp"
#include "../core/Logger.hpp"

namespace lectern::utils {

// -- Directory operations --

bool FileUtils::ensureDirectory(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) return true;
    fs::create_directories(path, ec);
    if (ec) {
        LOG_ERROR("Cannot create directory {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

bool FileUtils::removeDirectoryRecursive(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        LOG_ERROR("Cannot remove directory {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

bool FileUtils::directoryExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::vector<fs::path> FileUtils::listDirectories(const fs::path& path) {
    std::vector<fs::path> dirs;
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        LOG_ERROR("Cannot read directory {}: {}", path.string(), ec.message());
        return dirs;
    }
    for (const auto& e : it) {
        std::error_code typeEc;
        if (e.is_directory(typeEc)) dirs.push_back(e.path());
    }
    return dirs;
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        LOG_ERROR("Error deleting file {}: {}", path.string(), ec.message());
        return false;
    }
    return removed;
}

int64_t FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<int64_t>(size);
}

bool FileUtils::truncateFile(const fs::path& path, uint64_t size) {
    std::error_code ec;
    fs::resize_file(path, size, ec);
    if (ec) {
        LOG_ERROR("Cannot truncate {} to {} bytes: {}", path.string(), size, ec.message());
        return false;
    }
    return true;
}

} // namespace lectern::utils
