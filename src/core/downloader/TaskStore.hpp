#pragma once

/**
 * TaskStore.hpp
 * 
 * Durable storage of download task records, scoped per user.
 * The store is the source of truth across process restarts; the download
 * manager keeps an in-memory cache of it.
 */

#include "DownloadTask.hpp"
#include "../models/CourseBlock.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lectern::core::downloader {

class TaskStore {
public:
    virtual ~TaskStore() = default;
    
    /**
     * Scope course and block lookups and upserts to a user
     */
    virtual void setActiveUser(int64_t userId) = 0;
    
    /**
     * All records of a user, in insertion order
     */
    virtual std::vector<DownloadTask> getAllTasks(int64_t userId) = 0;
    
    /**
     * Records of the active user for a course, in insertion order
     */
    virtual std::vector<DownloadTask> getTasksForCourse(const std::string& courseId) = 0;
    
    /**
     * Record of the active user for a block
     */
    virtual std::optional<DownloadTask> getTask(const std::string& blockId) = 0;
    
    /**
     * Append a Waiting record for every downloadable block not yet stored.
     * Existing records are left untouched.
     */
    virtual void upsertTasksFromBlocks(
        const std::vector<models::CourseBlock>& blocks,
        models::DownloadQuality quality
    ) = 0;
    
    /**
     * Update the coarse state of a record; no-op for unknown ids
     */
    virtual void updateState(
        const std::string& id,
        DownloadState state,
        const std::optional<ResumeData>& resumeData
    ) = 0;
    
    virtual void deleteTasks(const std::vector<std::string>& ids) = 0;
};

} // namespace lectern::core::downloader
