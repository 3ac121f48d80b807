#include "CourseBlock.hpp"
#include "../Logger.hpp"
#include "../../utils/JsonUtils.hpp"

namespace lectern::models {

std::string toString(DownloadQuality quality) {
    switch (quality) {
        case DownloadQuality::Low:    return "360p";
        case DownloadQuality::Medium: return "540p";
        case DownloadQuality::High:   return "720p";
        case DownloadQuality::Auto:
        default:                      return "auto";
    }
}

DownloadQuality downloadQualityFromString(const std::string& value) {
    if (value == "360p") return DownloadQuality::Low;
    if (value == "540p") return DownloadQuality::Medium;
    if (value == "720p") return DownloadQuality::High;
    return DownloadQuality::Auto;
}

nlohmann::json VideoSource::toJson() const {
    nlohmann::json j = {
        {"url", url},
        {"streamPriority", streamPriority}
    };
    if (fileSize) {
        j["fileSize"] = *fileSize;
    } else {
        j["fileSize"] = nullptr;
    }
    return j;
}

VideoSource VideoSource::fromJson(const nlohmann::json& j) {
    VideoSource source;
    source.url = j.value("url", "");
    source.streamPriority = j.value("streamPriority", 0);
    if (j.contains("fileSize") && j["fileSize"].is_number_integer()) {
        source.fileSize = j["fileSize"].get<int64_t>();
    }
    return source;
}

std::optional<VideoSource> EncodedVideo::video(DownloadQuality quality) const {
    std::vector<const std::optional<VideoSource>*> order;
    
    switch (quality) {
        case DownloadQuality::High:
            order = {&desktopMp4, &mobileHigh, &mobileLow, &fallback, &hls};
            break;
        case DownloadQuality::Medium:
            order = {&mobileHigh, &mobileLow, &desktopMp4, &fallback, &hls};
            break;
        case DownloadQuality::Low:
        case DownloadQuality::Auto:
        default:
            order = {&mobileLow, &mobileHigh, &desktopMp4, &fallback, &hls};
            break;
    }
    
    for (const auto* candidate : order) {
        if (candidate->has_value()) {
            return **candidate;
        }
    }
    return std::nullopt;
}

namespace {

void putSource(nlohmann::json& j, const char* key, const std::optional<VideoSource>& source) {
    if (source) {
        j[key] = source->toJson();
    }
}

std::optional<VideoSource> takeSource(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_object()) {
        return VideoSource::fromJson(j[key]);
    }
    return std::nullopt;
}

} // namespace

nlohmann::json EncodedVideo::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    putSource(j, "fallback", fallback);
    putSource(j, "youtube", youtube);
    putSource(j, "desktopMp4", desktopMp4);
    putSource(j, "mobileHigh", mobileHigh);
    putSource(j, "mobileLow", mobileLow);
    putSource(j, "hls", hls);
    return j;
}

EncodedVideo EncodedVideo::fromJson(const nlohmann::json& j) {
    EncodedVideo video;
    video.fallback = takeSource(j, "fallback");
    video.youtube = takeSource(j, "youtube");
    video.desktopMp4 = takeSource(j, "desktopMp4");
    video.mobileHigh = takeSource(j, "mobileHigh");
    video.mobileLow = takeSource(j, "mobileLow");
    video.hls = takeSource(j, "hls");
    return video;
}

int64_t CourseBlock::projectedSize(DownloadQuality quality) const {
    if (!encodedVideo) return 0;
    auto source = encodedVideo->video(quality);
    if (!source || !source->fileSize) return 0;
    return *source->fileSize;
}

nlohmann::json CourseBlock::toJson() const {
    nlohmann::json j = {
        {"id", id},
        {"courseId", courseId},
        {"displayName", displayName}
    };
    if (encodedVideo) {
        j["encodedVideo"] = encodedVideo->toJson();
    }
    return j;
}

CourseBlock CourseBlock::fromJson(const nlohmann::json& j) {
    CourseBlock block;
    block.id = j.value("id", "");
    block.courseId = j.value("courseId", "");
    block.displayName = j.value("displayName", "");
    if (j.contains("encodedVideo") && j["encodedVideo"].is_object()) {
        block.encodedVideo = EncodedVideo::fromJson(j["encodedVideo"]);
    }
    return block;
}

std::vector<CourseBlock> loadCatalog(const std::filesystem::path& path) {
    std::vector<CourseBlock> blocks;
    
    auto root = utils::JsonUtils::parseFile(path);
    if (!root) {
        LOG_ERROR("Cannot read catalog {}", path.string());
        return blocks;
    }
    
    auto items = utils::JsonUtils::getArray(*root, "blocks");
    for (const auto& item : items) {
        if (!item.is_object()) continue;
        
        auto block = CourseBlock::fromJson(item);
        if (block.id.empty()) {
            LOG_WARN("Catalog {} has a block without id, skipped", path.string());
            continue;
        }
        blocks.push_back(std::move(block));
    }
    
    LOG_DEBUG("Loaded {} blocks from {}", blocks.size(), path.string());
    return blocks;
}

} // namespace lectern::models
