#pragma once

/**
 * Config.hpp
 * 
 * Daemon settings stored as a JSON document.
 * Provides type-safe access to configuration values with defaults.
 */

#include "../utils/JsonUtils.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>
#include <string>

namespace lectern::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 * 
 * Manages daemon settings with:
 * - Type-safe getters with defaults
 * - File values merged over the built-in defaults
 * - Dot-notation keys ("downloads.wifiOnly")
 * 
 * Settings are read at use time, so a change made through set() applies to
 * the next decision that depends on it.
 */
class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }
    
    /**
     * Load configuration from file, merged over the defaults
     * @param path Path to config file
     * @return false if the file is missing, unreadable or not a JSON object
     */
    bool load(const std::filesystem::path& path) {
        auto document = utils::JsonUtils::parseFile(path);
        if (!document || !document->is_object()) {
            return false;
        }
        
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = defaults();
        m_config.merge_patch(*document);
        m_configPath = path;
        return true;
    }
    
    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::filesystem::path& path = {}) {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        auto savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }
        
        if (!utils::JsonUtils::writeFileAtomic(savePath, m_config, 4)) {
            return false;
        }
        m_configPath = savePath;
        return true;
    }
    
    /**
     * Reset to default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = defaults();
    }
    
    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.quality")
     * @param defaultValue Returned when the key is missing or has the wrong type
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Wrong type in the file
        }
        
        return defaultValue;
    }
    
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }

private:
    Config() : m_config(defaults()) {}
    
    ~Config() = default;
    
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    
    static json defaults() {
        return {
            {"version", 1},
            {"user", {
                {"id", 0}
            }},
            {"downloads", {
                {"wifiOnly", true},
                {"quality", "auto"},
                {"maxAttempts", 3},
                {"connectTimeoutMs", 10000},
                {"stallTimeoutSec", 30}
            }},
            {"network", {
                {"probeUrl", "https://www.google.com/generate_204"},
                {"probeIntervalMs", 5000},
                {"metered", false}
            }},
            {"paths", {
                {"data", ""},
                {"documents", ""},
                {"appSupport", ""}
            }},
            {"logging", {
                {"level", "info"}
            }}
        };
    }
    
    // "downloads.wifiOnly" -> "/downloads/wifiOnly"
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            pointer += c == '.' ? '/' : c;
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::filesystem::path m_configPath;
};

} // namespace lectern::core
