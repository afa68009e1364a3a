#include "device_registry.hpp"
#include "tether_log.hpp"
#include <algorithm>

namespace tether {

DeviceRegistry::DeviceRegistry(AdbClient adb)
    : adb_(std::move(adb)) {}

DeviceRegistry::~DeviceRegistry() {
    stopMonitoring();
    if (monitor_thread_.joinable()) monitor_thread_.join();
}

// =============================================================================
// Polling
// =============================================================================

Result<std::vector<DeviceRecord>> DeviceRegistry::poll() {
    // Phase 1: I/O without the registry lock
    auto listed = TETHER_TRY(adb_.listDevices());

    std::map<std::string, std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names = name_cache_;
    }

    std::vector<DeviceRecord> fresh;
    for (const auto& line : listed) {
        DeviceRecord rec;
        rec.id = line.id;
        rec.status = line.status;
        rec.reachable = (line.status == "device");

        auto cached = names.find(line.id);
        if (cached != names.end()) {
            rec.display_name = cached->second;
        } else if (rec.reachable) {
            // Failed lookups are not cached and retried next poll
            if (auto name = adb_.deviceName(line.id)) {
                rec.display_name = *name;
                std::lock_guard<std::mutex> lock(mutex_);
                name_cache_[line.id] = *name;
            }
        }
        if (rec.display_name.empty()) rec.display_name = rec.id;

        fresh.push_back(std::move(rec));
    }
    return Ok(std::move(fresh));
}

void DeviceRegistry::apply(std::vector<DeviceRecord> fresh) {
    std::vector<std::string> connected;
    std::vector<std::string> disconnected;
    std::vector<std::string> reachable_ids;
    std::map<std::string, std::string> display_names;
    bool changed = false;

    // Phase 2: swap under lock, compute diff
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::map<std::string, DeviceRecord> next;
        for (auto& rec : fresh) next[rec.id] = std::move(rec);

        for (const auto& [id, rec] : next) {
            auto old = devices_.find(id);
            if (old == devices_.end() || old->second.status != rec.status) changed = true;

            bool was_reachable = old != devices_.end() && old->second.reachable;
            if (rec.reachable && !was_reachable) {
                connected.push_back(id);
                display_names[id] = rec.display_name;
            }
            if (!rec.reachable && was_reachable) disconnected.push_back(id);
            if (rec.reachable) reachable_ids.push_back(id);
        }
        for (const auto& [id, rec] : devices_) {
            if (next.count(id)) continue;
            changed = true;
            if (rec.reachable) disconnected.push_back(id);
        }

        devices_ = std::move(next);
    }

    if (!changed) return;

    // Phase 3: notify outside the lock, aggregate first
    TLOG_INFO("registry", "Devices changed: %zu reachable, +%zu -%zu",
              reachable_ids.size(), connected.size(), disconnected.size());

    DevicesChangedEvent changed_ev;
    changed_ev.device_ids = reachable_ids;
    events_.publish(changed_ev);

    for (const auto& id : connected) {
        TLOG_INFO("registry", "Device connected: %s (%s)", id.c_str(), display_names[id].c_str());
        DeviceConnectedEvent ev;
        ev.device_id = id;
        ev.display_name = display_names[id];
        events_.publish(ev);
    }
    for (const auto& id : disconnected) {
        TLOG_INFO("registry", "Device disconnected: %s", id.c_str());
        DeviceDisconnectedEvent ev;
        ev.device_id = id;
        events_.publish(ev);
    }
}

std::vector<DeviceRecord> DeviceRegistry::refresh() {
    std::lock_guard<std::mutex> cycle(refresh_mutex_);

    auto polled = poll();
    if (polled.is_err()) {
        TLOG_DEBUG("registry", "Poll failed, treating as no devices: %s",
                   polled.error().describe().c_str());
        apply({});
        return {};
    }

    auto records = polled.value();
    apply(std::move(polled).value());
    return records;
}

Result<std::vector<DeviceRecord>> DeviceRegistry::refreshChecked() {
    std::lock_guard<std::mutex> cycle(refresh_mutex_);

    auto polled = poll();
    if (polled.is_err()) {
        TLOG_WARN("registry", "Refresh failed: %s", polled.error().describe().c_str());
        return polled.error();
    }

    auto records = polled.value();
    apply(std::move(polled).value());
    return Ok(std::move(records));
}

// =============================================================================
// Background monitoring
// =============================================================================

void DeviceRegistry::startMonitoring(std::chrono::milliseconds interval) {
    if (running_.exchange(true)) {
        TLOG_DEBUG("registry", "Monitoring already active");
        return;
    }
    if (monitor_thread_.joinable() && monitor_thread_.get_id() == std::this_thread::get_id()) {
        // Restarted from a handler on the monitor thread: that loop keeps running
        interval_ = interval;
        TLOG_INFO("registry", "Monitoring resumed (interval %lld ms)", (long long)interval.count());
        return;
    }
    if (monitor_thread_.joinable()) monitor_thread_.join();  // previous loop, already told to stop

    interval_ = interval;
    monitor_thread_ = std::thread(&DeviceRegistry::monitorLoop, this);
    TLOG_INFO("registry", "Monitoring started (interval %lld ms)", (long long)interval.count());
}

void DeviceRegistry::stopMonitoring() {
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        if (!running_.exchange(false) && !monitor_thread_.joinable()) return;
    }
    cv_.notify_all();

    // Joining from a handler on the monitor thread itself would deadlock;
    // the next start/stop or the destructor joins it instead.
    if (monitor_thread_.joinable() && monitor_thread_.get_id() != std::this_thread::get_id()) {
        monitor_thread_.join();
        TLOG_INFO("registry", "Monitoring stopped");
    }
}

void DeviceRegistry::monitorLoop() {
    while (running_.load()) {
        refresh();

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
    }
}

// =============================================================================
// Queries
// =============================================================================

bool DeviceRegistry::isConnected(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(id);
    return it != devices_.end() && it->second.reachable;
}

std::vector<DeviceRecord> DeviceRegistry::devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceRecord> result;
    result.reserve(devices_.size());
    for (const auto& [id, rec] : devices_) result.push_back(rec);
    return result;
}

std::vector<std::string> DeviceRegistry::deviceIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, rec] : devices_) {
        if (rec.reachable) ids.push_back(id);
    }
    return ids;
}

std::optional<DeviceRecord> DeviceRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(id);
    if (it == devices_.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Selection
// =============================================================================

Result<void> DeviceRegistry::selectDevice(const std::string& id) {
    if (id.empty()) {
        return Err<void>(ErrorKind::ValidationError, "No device selected");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(id);
    if (it == devices_.end() || !it->second.reachable) {
        return Err<void>(ErrorKind::ValidationError, "Device " + id + " is not available");
    }
    selected_ = id;
    TLOG_INFO("registry", "Selected device: %s", id.c_str());
    return Ok();
}

std::string DeviceRegistry::selectedDevice() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return selected_;
}

void DeviceRegistry::clearSelection() {
    std::lock_guard<std::mutex> lock(mutex_);
    selected_.clear();
}

} // namespace tether
