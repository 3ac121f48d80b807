/**
 * DownloadTask.cpp
 */

#include "DownloadTask.hpp"
#include "../../utils/JsonUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace lectern::core::downloader {

using utils::JsonUtils;
using utils::StringUtils;

std::string toString(DownloadState state) {
    switch (state) {
        case DownloadState::InProgress: return "inProgress";
        case DownloadState::Finished:   return "finished";
        case DownloadState::Waiting:
        default:                        return "waiting";
    }
}

DownloadState downloadStateFromString(const std::string& value) {
    if (value == "inProgress") return DownloadState::InProgress;
    if (value == "finished") return DownloadState::Finished;
    return DownloadState::Waiting;
}

std::string toString(DownloadType /*type*/) {
    return "video";
}

DownloadType downloadTypeFromString(const std::string& /*value*/) {
    return DownloadType::Video;
}

int displayOrder(DownloadState state) {
    switch (state) {
        case DownloadState::InProgress: return 1;
        case DownloadState::Waiting:    return 2;
        case DownloadState::Finished:
        default:                        return 3;
    }
}

std::string DownloadTask::fileSizeInMbText() const {
    return StringUtils::formatMegabytes(fileSize, 2);
}

std::string DownloadTask::makeId(int64_t userId, const std::string& blockId) {
    return std::to_string(userId) + "_" + blockId;
}

std::optional<DownloadTask> DownloadTask::fromBlock(
    const models::CourseBlock& block,
    int64_t userId,
    models::DownloadQuality quality
) {
    // The block id names the file inside the videos folder
    if (!block.encodedVideo || !StringUtils::isPlainFileName(block.id)) {
        return std::nullopt;
    }
    
    auto video = block.encodedVideo->video(quality);
    if (!video || video->url.empty()) {
        return std::nullopt;
    }
    
    auto extension = StringUtils::urlPathExtension(video->url);
    if (extension.empty()) {
        return std::nullopt;
    }
    
    DownloadTask task;
    task.id = makeId(userId, block.id);
    task.courseId = block.courseId;
    task.blockId = block.id;
    task.userId = userId;
    task.url = video->url;
    task.fileName = block.id + "." + extension;
    task.displayName = block.displayName;
    task.progress = 0.0;
    task.state = DownloadState::Waiting;
    task.type = DownloadType::Video;
    task.fileSize = video->fileSize.value_or(0);
    return task;
}

nlohmann::json DownloadTask::toJson() const {
    nlohmann::json j = {
        {"id", id},
        {"courseId", courseId},
        {"blockId", blockId},
        {"userId", userId},
        {"url", url},
        {"fileName", fileName},
        {"displayName", displayName},
        {"progress", progress},
        {"state", toString(state)},
        {"type", toString(type)},
        {"fileSize", fileSize}
    };
    if (resumeData) {
        j["resumeData"] = StringUtils::base64Encode(*resumeData);
    } else {
        j["resumeData"] = nullptr;
    }
    return j;
}

DownloadTask DownloadTask::fromJson(const nlohmann::json& j) {
    DownloadTask task;
    task.id = JsonUtils::getString(j, "id");
    task.courseId = JsonUtils::getString(j, "courseId");
    task.blockId = JsonUtils::getString(j, "blockId");
    task.userId = JsonUtils::getLong(j, "userId");
    task.url = JsonUtils::getString(j, "url");
    task.fileName = JsonUtils::getString(j, "fileName");
    task.displayName = JsonUtils::getString(j, "displayName");
    task.progress = JsonUtils::getDouble(j, "progress");
    task.state = downloadStateFromString(JsonUtils::getString(j, "state"));
    task.type = downloadTypeFromString(JsonUtils::getString(j, "type"));
    task.fileSize = JsonUtils::getLong(j, "fileSize");
    
    auto encoded = JsonUtils::getString(j, "resumeData");
    if (!encoded.empty()) {
        task.resumeData = StringUtils::base64Decode(encoded);
    }
    return task;
}

bool DownloadTask::operator==(const DownloadTask& other) const {
    return id == other.id
        && courseId == other.courseId
        && blockId == other.blockId
        && userId == other.userId
        && url == other.url
        && fileName == other.fileName
        && displayName == other.displayName
        && progress == other.progress
        && resumeData == other.resumeData
        && state == other.state
        && type == other.type
        && fileSize == other.fileSize;
}

} // namespace lectern::core::downloader
