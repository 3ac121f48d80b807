/**
 * JsonUtils.cpp
 * 
 * JSON parsing and file helpers.
 */

#include "JsonUtils.hpp"
#include <fstream>

namespace lectern::utils {

// -- Parsing --

std::optional<json> JsonUtils::parseFile(const std::filesystem::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) return std::nullopt;
        return json::parse(file);
    } catch (const json::exception&) { return std::nullopt; }
}

// -- Serialization --

bool JsonUtils::writeFileAtomic(const std::filesystem::path& path, const json& j, int indent) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) return false;
    }
    
    auto tmpPath = path;
    tmpPath += ".tmp";
    
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file.is_open()) return false;
        file << j.dump(indent);
        file.flush();
        if (!file) return false;
    }
    
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::filesystem::remove(tmpPath, ec);
        return false;
    }
    return true;
}

// -- Safe accessors --

std::string JsonUtils::getString(const json& j, const std::string& key, const std::string& defaultValue) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return defaultValue;
}

int64_t JsonUtils::getLong(const json& j, const std::string& key, int64_t defaultValue) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<int64_t>();
    return defaultValue;
}

double JsonUtils::getDouble(const json& j, const std::string& key, double defaultValue) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return defaultValue;
}

json JsonUtils::getArray(const json& j, const std::string& key, const json& defaultValue) {
    if (j.contains(key) && j[key].is_array()) return j[key];
    return defaultValue;
}

} // namespace lectern::utils
