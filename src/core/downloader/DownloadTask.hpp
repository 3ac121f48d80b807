#pragma once

/**
 * DownloadTask.hpp
 * 
 * One queued, active or completed video transfer for a user and a content
 * block, plus the persisted record format.
 */

#include "../models/CourseBlock.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lectern::core::downloader {

/**
 * Download task state
 */
enum class DownloadState {
    Waiting,
    InProgress,
    Finished
};

/**
 * Kind of content a task transfers
 */
enum class DownloadType {
    Video
};

std::string toString(DownloadState state);
DownloadState downloadStateFromString(const std::string& value);

std::string toString(DownloadType type);
DownloadType downloadTypeFromString(const std::string& value);

/**
 * Display order: in progress first, then waiting, then finished
 */
int displayOrder(DownloadState state);

using ResumeData = std::vector<uint8_t>;

/**
 * DownloadTask - Single download item
 */
struct DownloadTask {
    // "<userId>_<blockId>"
    std::string id;
    
    std::string courseId;
    std::string blockId;
    int64_t userId{0};
    
    // Source URL
    std::string url;
    
    // File name inside the user's videos folder
    std::string fileName;
    
    std::string displayName;
    
    // 0.0 - 1.0, not durable
    double progress{0.0};
    
    // Present only on a Waiting task interrupted mid-transfer
    std::optional<ResumeData> resumeData;
    
    DownloadState state{DownloadState::Waiting};
    DownloadType type{DownloadType::Video};
    
    // Expected size in bytes (0 = unknown)
    int64_t fileSize{0};
    
    double fileSizeInMb() const {
        return static_cast<double>(fileSize) / 1024.0 / 1024.0;
    }
    
    /**
     * Size formatted as "12.34MB"
     */
    std::string fileSizeInMbText() const;
    
    bool isFinished() const {
        return state == DownloadState::Finished;
    }
    
    /**
     * Build the deterministic task id
     */
    static std::string makeId(int64_t userId, const std::string& blockId);
    
    /**
     * Build a task for a content block at a quality
     * @return Task in Waiting state, or nullopt when the block has no video
     *         at that quality, no URL, no file extension in the URL, or an
     *         id that is not a plain file name
     */
    static std::optional<DownloadTask> fromBlock(
        const models::CourseBlock& block,
        int64_t userId,
        models::DownloadQuality quality
    );
    
    // Durable record
    nlohmann::json toJson() const;
    static DownloadTask fromJson(const nlohmann::json& j);
    
    bool operator==(const DownloadTask& other) const;
    bool operator!=(const DownloadTask& other) const { return !(*this == other); }
};

} // namespace lectern::core::downloader
