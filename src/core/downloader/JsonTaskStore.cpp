/**
 * JsonTaskStore.cpp
 */

#include "JsonTaskStore.hpp"
#include "../Logger.hpp"
#include "../../utils/JsonUtils.hpp"

#include <algorithm>

namespace lectern::core::downloader {

using utils::JsonUtils;

JsonTaskStore::JsonTaskStore(std::filesystem::path filePath)
    : m_filePath(std::move(filePath)) {
}

void JsonTaskStore::setActiveUser(int64_t userId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_activeUser = userId;
    LOG_DEBUG("Task store scoped to user {}", userId);
}

std::vector<DownloadTask> JsonTaskStore::getAllTasks(int64_t userId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    loadLocked();
    
    std::vector<DownloadTask> result;
    for (const auto& record : m_records) {
        if (record.userId == userId) {
            result.push_back(record);
        }
    }
    return result;
}

std::vector<DownloadTask> JsonTaskStore::getTasksForCourse(const std::string& courseId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    loadLocked();
    
    std::vector<DownloadTask> result;
    for (const auto& record : m_records) {
        if (record.userId == m_activeUser && record.courseId == courseId) {
            result.push_back(record);
        }
    }
    return result;
}

std::optional<DownloadTask> JsonTaskStore::getTask(const std::string& blockId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    loadLocked();
    
    auto it = std::find_if(m_records.begin(), m_records.end(),
        [&](const DownloadTask& record) {
            return record.userId == m_activeUser && record.blockId == blockId;
        });
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return *it;
}

void JsonTaskStore::upsertTasksFromBlocks(
    const std::vector<models::CourseBlock>& blocks,
    models::DownloadQuality quality
) {
    std::lock_guard<std::mutex> lock(m_mutex);
    loadLocked();
    
    size_t added = 0;
    for (const auto& block : blocks) {
        auto task = DownloadTask::fromBlock(block, m_activeUser, quality);
        if (!task) {
            continue;
        }
        
        bool exists = std::any_of(m_records.begin(), m_records.end(),
            [&](const DownloadTask& record) { return record.id == task->id; });
        if (exists) {
            continue;
        }
        
        m_records.push_back(std::move(*task));
        ++added;
    }
    
    if (added > 0) {
        saveLocked();
    }
}

void JsonTaskStore::updateState(
    const std::string& id,
    DownloadState state,
    const std::optional<ResumeData>& resumeData
) {
    std::lock_guard<std::mutex> lock(m_mutex);
    loadLocked();
    
    auto it = std::find_if(m_records.begin(), m_records.end(),
        [&](const DownloadTask& record) { return record.id == id; });
    if (it == m_records.end()) {
        LOG_DEBUG("State update for unknown task {} ignored", id);
        return;
    }
    
    it->state = state;
    it->resumeData = resumeData;
    saveLocked();
}

void JsonTaskStore::deleteTasks(const std::vector<std::string>& ids) {
    if (ids.empty()) return;
    
    std::lock_guard<std::mutex> lock(m_mutex);
    loadLocked();
    
    auto before = m_records.size();
    m_records.erase(
        std::remove_if(m_records.begin(), m_records.end(),
            [&](const DownloadTask& record) {
                return std::find(ids.begin(), ids.end(), record.id) != ids.end();
            }),
        m_records.end()
    );
    
    if (m_records.size() != before) {
        saveLocked();
    }
}

void JsonTaskStore::loadLocked() {
    if (m_loaded) return;
    m_loaded = true;
    
    std::error_code ec;
    if (!std::filesystem::exists(m_filePath, ec)) {
        return;
    }
    
    auto root = JsonUtils::parseFile(m_filePath);
    if (!root) {
        LOG_ERROR("Task store {} is unreadable, starting empty", m_filePath.string());
        return;
    }
    
    for (const auto& item : JsonUtils::getArray(*root, "tasks")) {
        if (!item.is_object()) continue;
        auto record = DownloadTask::fromJson(item);
        if (record.id.empty()) continue;
        m_records.push_back(std::move(record));
    }
    
    LOG_DEBUG("Loaded {} task records from {}", m_records.size(), m_filePath.string());
}

void JsonTaskStore::saveLocked() const {
    nlohmann::json tasks = nlohmann::json::array();
    for (const auto& record : m_records) {
        tasks.push_back(record.toJson());
    }
    
    nlohmann::json root = {
        {"version", 1},
        {"tasks", tasks}
    };
    
    if (!JsonUtils::writeFileAtomic(m_filePath, root)) {
        LOG_ERROR("Failed to write task store {}", m_filePath.string());
    }
}

} // namespace lectern::core::downloader
