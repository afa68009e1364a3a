#pragma once
// =============================================================================
// Tether - System Configuration
// =============================================================================
// Process-level paths and settings: tool locations, logging, and where the
// persisted user settings (ConfigStore) live. Built once in main() and passed
// down; environment variables take precedence over defaults.
// =============================================================================

#include <string>
#include <cstdlib>
#include <unistd.h>
#include <pwd.h>

namespace tether::config {

struct SystemConfig {
    // Tool paths (empty = resolve app-local candidates, then PATH)
    std::string adb_path;
    std::string scrcpy_path;

    // Logging
    std::string log_directory;
    std::string log_filename = "tether.log";
    bool log_to_file = true;
    std::string log_level = "info";           // file sink
    std::string console_log_level = "warn";   // stderr sink

    // Persisted user settings (JSON)
    std::string config_path;

    // Application directory, searched before PATH for adb/scrcpy
    std::string app_directory;

    SystemConfig() {
        initDefaults();
    }

    std::string logFilePath() const { return log_directory + "/" + log_filename; }

private:
    void initDefaults();
};

/**
 * Get executable directory (for relative path resolution).
 */
inline std::string getExeDirectory() {
    char path[1024];
    ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
    if (len > 0) {
        path[len] = '\0';
        std::string exe_path(path);
        size_t pos = exe_path.find_last_of('/');
        return (pos != std::string::npos) ? exe_path.substr(0, pos) : ".";
    }
    return ".";
}

/**
 * Get user's data directory ($HOME/.tether).
 */
inline std::string getUserDataDirectory() {
    const char* home = getenv("HOME");
    if (!home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : "/tmp";
    }
    return std::string(home) + "/.tether";
}

inline void SystemConfig::initDefaults() {
    app_directory = getExeDirectory();
    log_directory = getUserDataDirectory();
    config_path = getUserDataDirectory() + "/config.json";
}

/**
 * Override config from environment variables.
 */
inline void applyEnvironmentOverrides(SystemConfig& config) {
    const char* val;

    if ((val = std::getenv("TETHER_ADB_PATH"))) config.adb_path = val;
    if ((val = std::getenv("TETHER_SCRCPY_PATH"))) config.scrcpy_path = val;
    if ((val = std::getenv("TETHER_LOG_DIR"))) config.log_directory = val;
    if ((val = std::getenv("TETHER_LOG_LEVEL"))) {
        config.log_level = val;
        config.console_log_level = val;
    }
    if ((val = std::getenv("TETHER_CONSOLE_LOG_LEVEL"))) config.console_log_level = val;
    if ((val = std::getenv("TETHER_CONFIG"))) config.config_path = val;
}

} // namespace tether::config
