#pragma once

/**
 * DownloadStorage.hpp
 * 
 * On-disk layout of downloaded videos and the sweep of orphaned legacy
 * cache folders.
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lectern::core::downloader {

/**
 * DownloadStorage - Per-user videos folders
 * 
 * Layout:
 *   <documents>/<userId>_Files/<blockId>.<ext>   (user 0: <documents>/Files)
 * 
 * Filesystem failures are logged and reported through return values.
 */
class DownloadStorage {
public:
    /**
     * Constructor
     * @param documentsRoot Parent of the per-user videos folders
     * @param appSupportRoot Directory holding legacy cache folders
     */
    DownloadStorage(std::filesystem::path documentsRoot, std::filesystem::path appSupportRoot);
    
    /**
     * Build from the "paths" config section
     */
    static DownloadStorage fromConfig();
    
    /**
     * Folder name isolating a user's files
     */
    static std::string folderName(int64_t userId);
    
    /**
     * true for 32 hex digit names (legacy MD5-named cache folders)
     */
    static bool isLegacyCacheName(const std::string& name);
    
    /**
     * Get the user's videos folder, creating it on first use
     * @return Folder path, nullopt if it cannot be created
     */
    std::optional<std::filesystem::path> videosFolder(int64_t userId) const;
    
    /**
     * Location of a file inside the user's videos folder, creating the folder
     * @return File path, nullopt if the folder is unavailable or the name
     *         would resolve outside it
     */
    std::optional<std::filesystem::path> filePath(int64_t userId, const std::string& fileName) const;
    
    /**
     * Same location as filePath() without touching the filesystem
     */
    std::optional<std::filesystem::path> locateFile(int64_t userId, const std::string& fileName) const;
    
    /**
     * Delete files from the user's videos folder; missing files and names
     * resolving outside the folder are skipped
     * @return Number of files removed
     */
    size_t removeFiles(int64_t userId, const std::vector<std::string>& fileNames) const;
    
    /**
     * Delete every direct child folder of the app-support directory whose
     * name is a legacy cache name
     * @return Number of folders removed
     */
    size_t removeLegacyCacheFolders() const;
    
    const std::filesystem::path& getDocumentsRoot() const { return m_documentsRoot; }
    const std::filesystem::path& getAppSupportRoot() const { return m_appSupportRoot; }

private:
    std::filesystem::path m_documentsRoot;
    std::filesystem::path m_appSupportRoot;
};

} // namespace lectern::core::downloader
