// Lectern - Course Catalog Models
// Content blocks and their encoded video renditions

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace lectern::models {

/**
 * Download quality chosen in the user settings
 */
enum class DownloadQuality {
    Auto,
    Low,     // 360p
    Medium,  // 540p
    High     // 720p
};

std::string toString(DownloadQuality quality);
DownloadQuality downloadQualityFromString(const std::string& value);

// One encoded rendition of a video block
struct VideoSource {
    std::string url;
    std::optional<int64_t> fileSize;
    int streamPriority = 0;
    
    nlohmann::json toJson() const;
    static VideoSource fromJson(const nlohmann::json& j);
};

// All renditions published for a video block
struct EncodedVideo {
    std::optional<VideoSource> fallback;
    std::optional<VideoSource> youtube;
    std::optional<VideoSource> desktopMp4;
    std::optional<VideoSource> mobileHigh;
    std::optional<VideoSource> mobileLow;
    std::optional<VideoSource> hls;
    
    /**
     * Pick the rendition to download for a quality setting.
     * YouTube renditions are never downloadable.
     * @return First available rendition in the quality's preference order
     */
    std::optional<VideoSource> video(DownloadQuality quality) const;
    
    nlohmann::json toJson() const;
    static EncodedVideo fromJson(const nlohmann::json& j);
};

// A content block of a course
struct CourseBlock {
    std::string id;
    std::string courseId;
    std::string displayName;
    std::optional<EncodedVideo> encodedVideo;
    
    /**
     * Projected download size at a quality, 0 when unknown
     */
    int64_t projectedSize(DownloadQuality quality) const;
    
    nlohmann::json toJson() const;
    static CourseBlock fromJson(const nlohmann::json& j);
};

/**
 * Load the blocks of a catalog file ({"blocks": [...]})
 * @param path Catalog JSON file
 * @return Blocks, empty if the file is missing or malformed
 */
std::vector<CourseBlock> loadCatalog(const std::filesystem::path& path);

} // namespace lectern::models
