#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "adb_client.hpp"
#include "event_bus.hpp"
#include "result.hpp"

namespace tether {

// =============================================================================
// DeviceRecord: one line of the most recent `adb devices` poll
// =============================================================================
struct DeviceRecord {
    std::string id;
    bool reachable = false;         // status == "device"
    std::string display_name;       // ro.product.model, falls back to id
    std::string status;             // raw adb status token

    // Identity is the id
    bool operator==(const DeviceRecord& o) const { return id == o.id; }
    bool operator!=(const DeviceRecord& o) const { return id != o.id; }
};

// =============================================================================
// DeviceRegistry: polled set of attached devices
// =============================================================================
// Events (events()):
//   DevicesChangedEvent      once per cycle in which the set changed
//   DeviceConnectedEvent     id became reachable
//   DeviceDisconnectedEvent  id stopped being reachable or vanished
// Handlers run on the refreshing thread and must not call refresh().
class DeviceRegistry {
public:
    explicit DeviceRegistry(AdbClient adb);
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Poll now. Failure is treated as "no devices" (never throws).
    std::vector<DeviceRecord> refresh();

    // Poll now, surfacing ToolUnavailable / Timeout to the caller.
    // On error the current set is left untouched.
    Result<std::vector<DeviceRecord>> refreshChecked();

    // --- Background polling ---
    void startMonitoring(std::chrono::milliseconds interval);
    void stopMonitoring();
    bool isMonitoring() const { return running_.load(); }

    // --- Queries (last-known set, never poll) ---
    bool isConnected(const std::string& id) const;
    std::vector<DeviceRecord> devices() const;
    std::vector<std::string> deviceIds() const;   // reachable only
    std::optional<DeviceRecord> find(const std::string& id) const;

    // --- Selection ---
    Result<void> selectDevice(const std::string& id);
    std::string selectedDevice() const;
    void clearSelection();

    EventBus& events() { return events_; }
    const AdbClient& adb() const { return adb_; }

private:
    Result<std::vector<DeviceRecord>> poll();
    void apply(std::vector<DeviceRecord> fresh);
    void monitorLoop();

    AdbClient adb_;
    EventBus events_;

    mutable std::mutex mutex_;
    std::map<std::string, DeviceRecord> devices_;         // id -> record
    std::map<std::string, std::string> name_cache_;       // id -> model
    std::string selected_;

    std::mutex refresh_mutex_;   // serializes whole refresh cycles

    std::thread monitor_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    std::chrono::milliseconds interval_{3000};
};

} // namespace tether
