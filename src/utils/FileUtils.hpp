// Lectern - File Utilities
// Non-throwing file system operations

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace lectern::utils {

/**
 * @brief File and directory utilities
 *
 * Every operation reports failure through its return value and logs the
 * underlying std::error_code; none of them throw.
 */
class FileUtils {
public:
    // Directory operations
    static bool ensureDirectory(const fs::path& path);
    static bool removeDirectoryRecursive(const fs::path& path);
    static bool directoryExists(const fs::path& path);
    static std::vector<fs::path> listDirectories(const fs::path& path);
    
    // File operations
    static bool fileExists(const fs::path& path);
    static bool deleteFile(const fs::path& path);
    static int64_t getFileSize(const fs::path& path);
    static bool truncateFile(const fs::path& path, uint64_t size);
};

} // namespace lectern::utils
