#pragma once

/**
 * JsonTaskStore.hpp
 * 
 * TaskStore persisted as a single JSON document.
 */

#include "TaskStore.hpp"

#include <filesystem>
#include <mutex>

namespace lectern::core::downloader {

/**
 * JsonTaskStore - File-backed task records
 * 
 * Features:
 * - Records of every user in one file, in insertion order
 * - Atomic rewrite (temporary file + rename) on each mutation
 * - Corrupt or unreadable file treated as empty
 */
class JsonTaskStore : public TaskStore {
public:
    /**
     * Constructor
     * @param filePath Location of the records file (created on first write)
     */
    explicit JsonTaskStore(std::filesystem::path filePath);
    
    ~JsonTaskStore() override = default;
    
    JsonTaskStore(const JsonTaskStore&) = delete;
    JsonTaskStore& operator=(const JsonTaskStore&) = delete;
    
    void setActiveUser(int64_t userId) override;
    std::vector<DownloadTask> getAllTasks(int64_t userId) override;
    std::vector<DownloadTask> getTasksForCourse(const std::string& courseId) override;
    std::optional<DownloadTask> getTask(const std::string& blockId) override;
    void upsertTasksFromBlocks(
        const std::vector<models::CourseBlock>& blocks,
        models::DownloadQuality quality
    ) override;
    void updateState(
        const std::string& id,
        DownloadState state,
        const std::optional<ResumeData>& resumeData
    ) override;
    void deleteTasks(const std::vector<std::string>& ids) override;
    
    const std::filesystem::path& getFilePath() const { return m_filePath; }

private:
    void loadLocked();
    void saveLocked() const;

private:
    std::filesystem::path m_filePath;
    std::vector<DownloadTask> m_records;
    int64_t m_activeUser{0};
    bool m_loaded{false};
    
    mutable std::mutex m_mutex;
};

} // namespace lectern::core::downloader
