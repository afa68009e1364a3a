#pragma once
// =============================================================================
// Tether - Persisted User Settings
// =============================================================================
// Flat JSON document (nlohmann/json) with per-field validation, change
// events and a debounced auto-save. One writer thread coalesces bursts of
// set() calls into a single write after the quiet period.
// =============================================================================

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "config_validators.hpp"
#include "event_bus.hpp"
#include "result.hpp"
#include "session_config.hpp"

namespace tether::config {

// Typed snapshot of the document
struct AppConfig {
    // Video
    std::string bitrate = "20";
    int framerate = 60;
    bool fullscreen_enabled = false;
    std::string video_resolution = "Original Device Resolution";
    bool no_control_enabled = false;

    // Audio
    std::string audio_source = "Audio Playback";

    // Connection
    bool auto_reconnect_enabled = false;
    int reconnect_max_attempts = 0;      // 0 = unlimited
    double reconnect_delay = 3.0;        // seconds
    bool skip_process_check = false;

    // Window (persisted for front ends)
    int window_width = 400;
    int window_height = 600;
    std::string theme = "light";

    // Devices
    std::string last_selected_device;
    double device_refresh_interval = 3.0;  // seconds

    // Advanced
    std::vector<std::string> additional_scrcpy_args;
};

class ConfigStore {
public:
    static constexpr const char* RESET_KEY = "__reset__";
    static constexpr std::chrono::milliseconds DEFAULT_AUTOSAVE_DELAY{1000};

    explicit ConfigStore(std::string path,
                         std::chrono::milliseconds autosave_delay = DEFAULT_AUTOSAVE_DELAY);
    ~ConfigStore();  // flushes a pending save

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    static nlohmann::json defaults();
    static bool isKnownKey(const std::string& key);

    // true when the file was read. Missing file, bad JSON: defaults.
    // Invalid fields keep their defaults; unknown keys are ignored.
    bool load();
    Result<void> save();
    void flush();

    // ValidationError (prior value kept) or unknown key.
    // Emits ConfigChangedEvent and schedules an auto-save when the value changes.
    Result<void> set(const std::string& key, const nlohmann::json& value);
    nlohmann::json get(const std::string& key) const;
    nlohmann::json document() const;
    AppConfig config() const;

    Result<void> validateField(const std::string& key, const nlohmann::json& value) const;
    std::map<std::string, std::string> validateAll() const;  // key -> message
    void addValidator(const std::string& key, Validator validator);

    // Back to defaults, notifies RESET_KEY. Not auto-saved.
    void resetToDefaults();
    Result<void> exportTo(const std::string& path) const;
    // Replaces the document; invalid / unknown fields fall back to defaults
    Result<void> importFrom(const std::string& path);

    SessionConfig sessionConfig(const std::string& device_id) const;
    Result<void> applySessionConfig(const SessionConfig& session);

    const std::string& path() const { return path_; }
    int writeCount() const;
    bool savePending() const;

    EventBus& events() { return events_; }

private:
    nlohmann::json sanitize(const nlohmann::json& raw, const char* origin) const;
    nlohmann::json normalize(const std::string& key, const nlohmann::json& value) const;
    Result<void> writeFile(const std::string& path, const nlohmann::json& doc) const;
    void scheduleSave();
    void writerLoop();

    std::string path_;
    std::chrono::milliseconds autosave_delay_;
    EventBus events_;

    mutable std::mutex mutex_;                      // values_, validators_
    nlohmann::json values_;
    std::map<std::string, Validator> validators_;

    std::mutex write_mutex_;                        // one writer of path_ at a time

    mutable std::mutex save_mutex_;
    std::condition_variable save_cv_;
    bool pending_ = false;
    bool shutdown_ = false;
    std::chrono::steady_clock::time_point deadline_;
    int write_count_ = 0;
    std::thread writer_;
};

} // namespace tether::config
