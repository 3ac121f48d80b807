#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace lectern::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
#if defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" : fs::current_path();
#else
        const char* xdg = std::getenv("XDG_DATA_HOME");
        if (xdg && *xdg) {
            return fs::path(xdg);
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
#endif
    }

    static fs::path getLecternPath() {
        return getAppDataPath() / "Lectern";
    }

    static fs::path getConfigPath() {
        return getLecternPath() / "config.json";
    }

    static fs::path getLogsPath() {
        return getLecternPath() / "logs";
    }

    // Durable task records
    static fs::path getDataPath() {
        return getLecternPath() / "data";
    }

    // Parent of the per-user videos folders
    static fs::path getDocumentsPath() {
        return getLecternPath() / "Documents";
    }

    // Legacy cache location, swept by --cleanup
    static fs::path getAppSupportPath() {
        return getLecternPath() / "Application Support";
    }

    /**
     * Use a configured override when present
     * @param configured Path from the config file, may be empty
     * @param fallback Default location
     */
    static fs::path resolve(const std::string& configured, const fs::path& fallback) {
        return configured.empty() ? fallback : fs::path(configured);
    }
};

} // namespace lectern::utils
