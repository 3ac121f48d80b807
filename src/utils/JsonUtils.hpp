// Lectern - JSON Utilities
// JSON parsing and file helpers

#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace lectern::utils {

using json = nlohmann::json;

/**
 * @brief JSON utility functions
 */
class JsonUtils {
public:
    // Parsing
    static std::optional<json> parseFile(const std::filesystem::path& path);
    
    // Serialization
    /**
     * Write through a temporary sibling file renamed over the target,
     * so a crash never leaves a truncated document behind.
     */
    static bool writeFileAtomic(const std::filesystem::path& path, const json& j, int indent = 2);
    
    // Safe accessors
    static std::string getString(const json& j, const std::string& key, const std::string& defaultValue = "");
    static int64_t getLong(const json& j, const std::string& key, int64_t defaultValue = 0);
    static double getDouble(const json& j, const std::string& key, double defaultValue = 0.0);
    static json getArray(const json& j, const std::string& key, const json& defaultValue = json::array());
};

} // namespace lectern::utils
