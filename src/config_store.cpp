#include "config_store.hpp"
#include "tether_log.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace tether::config {

namespace {

enum class FieldKind { Bool, Int, Real, Text, TextList, Bitrate };

struct FieldDef {
    const char* key;
    FieldKind kind;
    nlohmann::json default_value;
};

const std::vector<FieldDef>& fieldDefs() {
    static const std::vector<FieldDef> defs = {
        {"bitrate",                 FieldKind::Bitrate,  "20"},
        {"framerate",               FieldKind::Int,      60},
        {"fullscreen_enabled",      FieldKind::Bool,     false},
        {"video_resolution",        FieldKind::Text,     "Original Device Resolution"},
        {"no_control_enabled",      FieldKind::Bool,     false},
        {"audio_source",            FieldKind::Text,     "Audio Playback"},
        {"auto_reconnect_enabled",  FieldKind::Bool,     false},
        {"reconnect_max_attempts",  FieldKind::Int,      0},
        {"reconnect_delay",         FieldKind::Real,     3.0},
        {"skip_process_check",      FieldKind::Bool,     false},
        {"window_width",            FieldKind::Int,      400},
        {"window_height",           FieldKind::Int,      600},
        {"theme",                   FieldKind::Text,     "light"},
        {"last_selected_device",    FieldKind::Text,     ""},
        {"device_refresh_interval", FieldKind::Real,     3.0},
        {"additional_scrcpy_args",  FieldKind::TextList, nlohmann::json::array()},
    };
    return defs;
}

const FieldDef* findField(const std::string& key) {
    for (const auto& field : fieldDefs()) {
        if (key == field.key) return &field;
    }
    return nullptr;
}

std::map<std::string, Validator> defaultValidators() {
    std::map<std::string, Validator> v;
    v["bitrate"] = bitrate();
    v["framerate"] = intRange(1, 240);
    v["fullscreen_enabled"] = boolean();
    v["video_resolution"] = choice({"Original Device Resolution", "720p", "1080p", "4K"});
    v["no_control_enabled"] = boolean();
    v["audio_source"] = choice({"Audio Playback", "Microphone", "No audio"});
    v["auto_reconnect_enabled"] = boolean();
    v["reconnect_max_attempts"] = intRange(0, 100);
    v["reconnect_delay"] = realRange(0.1, 60.0);
    v["skip_process_check"] = boolean();
    v["window_width"] = intRange(300, 2000);
    v["window_height"] = intRange(400, 1500);
    v["theme"] = choice({"light", "dark"});
    v["last_selected_device"] = text();
    v["device_refresh_interval"] = realRange(0.5, 30.0);
    v["additional_scrcpy_args"] = textList();
    return v;
}

} // namespace

ConfigStore::ConfigStore(std::string path, std::chrono::milliseconds autosave_delay)
    : path_(std::move(path)),
      autosave_delay_(autosave_delay),
      values_(defaults()),
      validators_(defaultValidators()) {
    writer_ = std::thread(&ConfigStore::writerLoop, this);
}

ConfigStore::~ConfigStore() {
    flush();
    {
        std::lock_guard<std::mutex> lock(save_mutex_);
        shutdown_ = true;
    }
    save_cv_.notify_all();
    if (writer_.joinable()) writer_.join();
}

nlohmann::json ConfigStore::defaults() {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& field : fieldDefs()) doc[field.key] = field.default_value;
    return doc;
}

bool ConfigStore::isKnownKey(const std::string& key) {
    return findField(key) != nullptr;
}

// =============================================================================
// Validation
// =============================================================================

Result<void> ConfigStore::validateField(const std::string& key, const nlohmann::json& value) const {
    if (!isKnownKey(key)) {
        return Err<void>(ErrorKind::ValidationError, "Unknown configuration field: " + key);
    }
    Validator validator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = validators_.find(key);
        if (it != validators_.end()) validator = it->second;
    }
    if (!validator) return Ok();
    return validator(value);
}

std::map<std::string, std::string> ConfigStore::validateAll() const {
    std::map<std::string, std::string> errors;
    auto doc = document();
    for (const auto& field : fieldDefs()) {
        auto r = validateField(field.key, doc[field.key]);
        if (r.is_err()) errors[field.key] = r.error().message;
    }
    return errors;
}

void ConfigStore::addValidator(const std::string& key, Validator validator) {
    std::lock_guard<std::mutex> lock(mutex_);
    validators_[key] = std::move(validator);
}

// Stores numbers and bitrates in one canonical JSON type per field
nlohmann::json ConfigStore::normalize(const std::string& key, const nlohmann::json& value) const {
    const FieldDef* field = findField(key);
    if (!field) return value;

    double number = 0.0;
    switch (field->kind) {
        case FieldKind::Int:
            if (toNumber(value, number)) return static_cast<long long>(std::llround(number));
            break;
        case FieldKind::Real:
            if (toNumber(value, number)) return number;
            break;
        case FieldKind::Bitrate:
            if (value.is_number()) return formatBitrate(value.get<double>());
            if (value.is_string()) {
                double mbps;
                if (parseBitrate(value.get<std::string>(), mbps)) return formatBitrate(mbps);
            }
            break;
        default:
            break;
    }
    return value;
}

nlohmann::json ConfigStore::sanitize(const nlohmann::json& raw, const char* origin) const {
    nlohmann::json doc = defaults();
    for (auto it = raw.begin(); it != raw.end(); ++it) {
        if (!isKnownKey(it.key())) {
            TLOG_DEBUG("config", "Ignoring unknown %s field: %s", origin, it.key().c_str());
            continue;
        }
        auto valid = validateField(it.key(), it.value());
        if (valid.is_err()) {
            TLOG_WARN("config", "Invalid %s value for %s: %s, using default",
                      origin, it.key().c_str(), valid.error().message.c_str());
            continue;
        }
        doc[it.key()] = normalize(it.key(), it.value());
    }
    return doc;
}

// =============================================================================
// Load / Save
// =============================================================================

bool ConfigStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        TLOG_WARN("config", "%s not found, using defaults", path_.c_str());
        std::lock_guard<std::mutex> lock(mutex_);
        values_ = defaults();
        return false;
    }

    nlohmann::json raw;
    try {
        raw = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        TLOG_ERROR("config", "JSON parse error in %s: %s, using defaults", path_.c_str(), e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        values_ = defaults();
        return false;
    }

    if (!raw.is_object()) {
        TLOG_ERROR("config", "%s is not a JSON object, using defaults", path_.c_str());
        std::lock_guard<std::mutex> lock(mutex_);
        values_ = defaults();
        return false;
    }

    auto doc = sanitize(raw, "config");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        values_ = std::move(doc);
    }
    TLOG_INFO("config", "Loaded %s", path_.c_str());
    return true;
}

Result<void> ConfigStore::writeFile(const std::string& path, const nlohmann::json& doc) const {
    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Err<void>(ErrorKind::IoError,
                             "cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    // Write-then-rename so a crash never leaves a truncated file
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return Err<void>(ErrorKind::IoError, "cannot open " + tmp + " for writing");
        }
        out << doc.dump(4) << "\n";
        if (!out.good()) {
            return Err<void>(ErrorKind::IoError, "write failed: " + tmp);
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        return Err<void>(ErrorKind::IoError, "cannot replace " + path + ": " + ec.message());
    }
    return Ok();
}

Result<void> ConfigStore::save() {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    auto r = writeFile(path_, document());
    if (r.is_err()) {
        TLOG_ERROR("config", "Save failed: %s", r.error().message.c_str());
        return r;
    }
    {
        std::lock_guard<std::mutex> lock(save_mutex_);
        ++write_count_;
    }
    TLOG_DEBUG("config", "Saved %s", path_.c_str());
    return Ok();
}

void ConfigStore::flush() {
    {
        std::lock_guard<std::mutex> lock(save_mutex_);
        if (!pending_) return;
        pending_ = false;
    }
    auto r = save();
    if (r.is_err()) {
        TLOG_ERROR("config", "Flush failed: %s", r.error().message.c_str());
    }
}

int ConfigStore::writeCount() const {
    std::lock_guard<std::mutex> lock(save_mutex_);
    return write_count_;
}

bool ConfigStore::savePending() const {
    std::lock_guard<std::mutex> lock(save_mutex_);
    return pending_;
}

// =============================================================================
// Auto-save
// =============================================================================

void ConfigStore::scheduleSave() {
    {
        std::lock_guard<std::mutex> lock(save_mutex_);
        pending_ = true;
        deadline_ = std::chrono::steady_clock::now() + autosave_delay_;
    }
    save_cv_.notify_all();
}

void ConfigStore::writerLoop() {
    std::unique_lock<std::mutex> lock(save_mutex_);
    while (!shutdown_) {
        if (!pending_) {
            save_cv_.wait(lock, [this] { return pending_ || shutdown_; });
            continue;
        }
        if (std::chrono::steady_clock::now() < deadline_) {
            // A later set() may push the deadline out; re-check after waking
            save_cv_.wait_until(lock, deadline_);
            continue;
        }
        pending_ = false;
        lock.unlock();
        auto r = save();
        if (r.is_err()) {
            TLOG_ERROR("config", "Auto-save failed: %s", r.error().message.c_str());
        }
        lock.lock();
    }
}

// =============================================================================
// Access
// =============================================================================

Result<void> ConfigStore::set(const std::string& key, const nlohmann::json& value) {
    auto valid = validateField(key, value);
    if (valid.is_err()) {
        TLOG_WARN("config", "Invalid value for %s: %s", key.c_str(), valid.error().message.c_str());
        return valid;
    }

    auto normalized = normalize(key, value);
    bool changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = values_[key] != normalized;
        if (changed) values_[key] = normalized;
    }
    if (!changed) return Ok();

    TLOG_DEBUG("config", "%s = %s", key.c_str(), normalized.dump().c_str());
    ConfigChangedEvent ev;
    ev.key = key;
    events_.publish(ev);
    scheduleSave();
    return Ok();
}

nlohmann::json ConfigStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    return it != values_.end() ? *it : nlohmann::json();
}

nlohmann::json ConfigStore::document() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_;
}

AppConfig ConfigStore::config() const {
    auto doc = document();
    AppConfig c;
    c.bitrate = doc["bitrate"].get<std::string>();
    c.framerate = doc["framerate"].get<int>();
    c.fullscreen_enabled = doc["fullscreen_enabled"].get<bool>();
    c.video_resolution = doc["video_resolution"].get<std::string>();
    c.no_control_enabled = doc["no_control_enabled"].get<bool>();
    c.audio_source = doc["audio_source"].get<std::string>();
    c.auto_reconnect_enabled = doc["auto_reconnect_enabled"].get<bool>();
    c.reconnect_max_attempts = doc["reconnect_max_attempts"].get<int>();
    c.reconnect_delay = doc["reconnect_delay"].get<double>();
    c.skip_process_check = doc["skip_process_check"].get<bool>();
    c.window_width = doc["window_width"].get<int>();
    c.window_height = doc["window_height"].get<int>();
    c.theme = doc["theme"].get<std::string>();
    c.last_selected_device = doc["last_selected_device"].get<std::string>();
    c.device_refresh_interval = doc["device_refresh_interval"].get<double>();
    c.additional_scrcpy_args = doc["additional_scrcpy_args"].get<std::vector<std::string>>();
    return c;
}

void ConfigStore::resetToDefaults() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        values_ = defaults();
    }
    TLOG_INFO("config", "Reset to defaults");
    ConfigChangedEvent ev;
    ev.key = RESET_KEY;
    events_.publish(ev);
}

Result<void> ConfigStore::exportTo(const std::string& path) const {
    auto r = writeFile(path, document());
    if (r.is_ok()) TLOG_INFO("config", "Exported to %s", path.c_str());
    return r;
}

Result<void> ConfigStore::importFrom(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<void>(ErrorKind::IoError, "cannot open " + path);
    }

    nlohmann::json raw;
    try {
        raw = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        return Err<void>(ErrorKind::ValidationError, std::string("invalid JSON: ") + e.what());
    }
    if (!raw.is_object()) {
        return Err<void>(ErrorKind::ValidationError, path + " is not a JSON object");
    }

    auto doc = sanitize(raw, "imported");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        values_ = std::move(doc);
    }
    TLOG_INFO("config", "Imported %s", path.c_str());

    ConfigChangedEvent ev;
    ev.key = RESET_KEY;
    events_.publish(ev);
    scheduleSave();
    return Ok();
}

// =============================================================================
// Session mapping
// =============================================================================

SessionConfig ConfigStore::sessionConfig(const std::string& device_id) const {
    AppConfig c = config();

    SessionConfig s;
    s.device_id = device_id;
    double mbps;
    if (parseBitrate(c.bitrate, mbps)) s.bitrate_mbps = mbps;
    s.max_fps = c.framerate;
    s.fullscreen = c.fullscreen_enabled;
    AudioMode mode;
    if (audioModeFromDisplayName(c.audio_source, mode)) s.audio_mode = mode;
    s.no_control = c.no_control_enabled;
    s.max_size = maxSizeFromResolution(c.video_resolution);
    s.extra_args = c.additional_scrcpy_args;
    return s;
}

Result<void> ConfigStore::applySessionConfig(const SessionConfig& session) {
    std::string resolution;
    if (!resolutionFromMaxSize(session.max_size, resolution)) {
        return Err<void>(ErrorKind::ValidationError,
                         "video_resolution: no preset for max size " + std::to_string(session.max_size) +
                         " (use 0, 1280, 1920 or 3840)");
    }

    const std::pair<const char*, nlohmann::json> fields[] = {
        {"bitrate", formatBitrate(session.bitrate_mbps)},
        {"framerate", session.max_fps},
        {"fullscreen_enabled", session.fullscreen},
        {"audio_source", audioModeDisplayName(session.audio_mode)},
        {"no_control_enabled", session.no_control},
        {"video_resolution", resolution},
        {"additional_scrcpy_args", session.extra_args},
        {"last_selected_device", session.device_id},
    };

    // Validate everything first so a bad field leaves the store untouched
    for (const auto& [key, value] : fields) {
        auto r = validateField(key, value);
        if (r.is_err()) {
            return Err<void>(ErrorKind::ValidationError, std::string(key) + ": " + r.error().message);
        }
    }
    for (const auto& [key, value] : fields) {
        TETHER_TRY_VOID(set(key, value));
    }
    return Ok();
}

} // namespace tether::config
