/**
 * DownloadStorage.cpp
 */

#include "DownloadStorage.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/PathUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <regex>

namespace lectern::core::downloader {

using utils::FileUtils;
using utils::PathUtils;
using utils::StringUtils;

namespace {

// Joined path, nullopt if the name would resolve outside the folder
std::optional<std::filesystem::path> childOf(const std::filesystem::path& folder, const std::string& fileName) {
    if (!StringUtils::isPlainFileName(fileName)) {
        LOG_WARN("Refusing file name '{}' outside {}", fileName, folder.string());
        return std::nullopt;
    }
    
    auto file = folder / fileName;
    if (file.parent_path() != folder) {
        LOG_WARN("Refusing file name '{}' outside {}", fileName, folder.string());
        return std::nullopt;
    }
    return file;
}

} // namespace

DownloadStorage::DownloadStorage(std::filesystem::path documentsRoot, std::filesystem::path appSupportRoot)
    : m_documentsRoot(std::move(documentsRoot))
    , m_appSupportRoot(std::move(appSupportRoot)) {
}

DownloadStorage DownloadStorage::fromConfig() {
    auto& config = Config::instance();
    return DownloadStorage(
        PathUtils::resolve(config.get<std::string>("paths.documents", ""), PathUtils::getDocumentsPath()),
        PathUtils::resolve(config.get<std::string>("paths.appSupport", ""), PathUtils::getAppSupportPath())
    );
}

std::string DownloadStorage::folderName(int64_t userId) {
    if (userId != 0) {
        return std::to_string(userId) + "_Files";
    }
    return "Files";
}

bool DownloadStorage::isLegacyCacheName(const std::string& name) {
    static const std::regex md5Pattern("^[a-fA-F0-9]{32}$");
    return std::regex_match(name, md5Pattern);
}

std::optional<std::filesystem::path> DownloadStorage::videosFolder(int64_t userId) const {
    auto folder = m_documentsRoot / folderName(userId);
    if (!FileUtils::ensureDirectory(folder)) {
        return std::nullopt;
    }
    return folder;
}

std::optional<std::filesystem::path> DownloadStorage::filePath(int64_t userId, const std::string& fileName) const {
    auto file = locateFile(userId, fileName);
    if (!file || !videosFolder(userId)) {
        return std::nullopt;
    }
    return file;
}

std::optional<std::filesystem::path> DownloadStorage::locateFile(int64_t userId, const std::string& fileName) const {
    return childOf(m_documentsRoot / folderName(userId), fileName);
}

size_t DownloadStorage::removeFiles(int64_t userId, const std::vector<std::string>& fileNames) const {
    auto folder = m_documentsRoot / folderName(userId);
    if (!FileUtils::directoryExists(folder)) {
        return 0;
    }
    
    size_t removed = 0;
    for (const auto& name : fileNames) {
        if (name.empty()) continue;
        
        auto file = childOf(folder, name);
        if (file && FileUtils::fileExists(*file) && FileUtils::deleteFile(*file)) {
            LOG_DEBUG("Deleted file {}", file->string());
            ++removed;
        }
    }
    return removed;
}

size_t DownloadStorage::removeLegacyCacheFolders() const {
    if (!FileUtils::directoryExists(m_appSupportRoot)) {
        LOG_DEBUG("No app support directory at {}", m_appSupportRoot.string());
        return 0;
    }
    
    size_t removed = 0;
    for (const auto& folder : FileUtils::listDirectories(m_appSupportRoot)) {
        auto name = folder.filename().string();
        if (!isLegacyCacheName(name)) {
            continue;
        }
        
        if (FileUtils::removeDirectoryRecursive(folder)) {
            LOG_INFO("Deleted legacy cache folder {}", name);
            ++removed;
        }
    }
    return removed;
}

} // namespace lectern::core::downloader
