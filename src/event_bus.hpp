// =============================================================================
// Tether - Event Bus
// =============================================================================
// Thread-safe, type-erased publish/subscribe event system.
// Each component owns one bus; listeners subscribe per event type.
// Usage:
//   auto sub = registry.events().subscribe<DeviceConnectedEvent>(
//       [](const DeviceConnectedEvent& e) { ... });
// =============================================================================
#pragma once
#include <functional>
#include <mutex>
#include <vector>
#include <unordered_map>
#include <typeindex>
#include <memory>
#include <optional>
#include <string>
#include <cstdint>
#include <algorithm>
#include "tether_log.hpp"
#include "session_config.hpp"

namespace tether {

// =============================================================================
// Event Types
// =============================================================================

struct Event {
    virtual ~Event() = default;
};

// Device presence (DeviceRegistry)
struct DevicesChangedEvent : Event {
    std::vector<std::string> device_ids;  // all reachable ids after the poll
};

struct DeviceConnectedEvent : Event {
    std::string device_id;
    std::string display_name;
};

struct DeviceDisconnectedEvent : Event {
    std::string device_id;
};

// Process lifecycle (ProcessOrchestrator)
struct ProcessStartedEvent : Event {
    SessionConfig config;
    int pid = -1;
};

struct ProcessStoppedEvent : Event {
    std::optional<int> exit_code;  // empty when the process never reported one
};

struct ProcessErrorEvent : Event {
    std::string message;
};

// Reconnect loop (ReconnectSupervisor)
struct ReconnectAttemptEvent : Event {
    std::string device_id;
    int attempt = 0;
};

struct ReconnectSuccessEvent : Event {
    std::string device_id;
    int attempts = 0;
};

// Persisted settings (ConfigStore)
struct ConfigChangedEvent : Event {
    std::string key;  // "__reset__" after resetToDefaults()
};

// =============================================================================
// SubscriptionHandle - RAII unsubscribe
// =============================================================================

class SubscriptionHandle {
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsub) : unsub_(std::move(unsub)) {}
    ~SubscriptionHandle() { if (unsub_) unsub_(); }

    SubscriptionHandle(SubscriptionHandle&& o) noexcept : unsub_(std::move(o.unsub_)) { o.unsub_ = nullptr; }
    SubscriptionHandle& operator=(SubscriptionHandle&& o) noexcept {
        if (unsub_) unsub_();
        unsub_ = std::move(o.unsub_);
        o.unsub_ = nullptr;
        return *this;
    }
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    void release() { unsub_ = nullptr; } // detach: lives as long as the bus

private:
    std::function<void()> unsub_;
};

// =============================================================================
// EventBus - Thread-safe publish/subscribe
// =============================================================================
// Handlers run on the publishing thread, outside the bus lock, so a handler
// may subscribe, unsubscribe or publish. A throwing handler is logged and the
// remaining handlers still run. Handles must not outlive the bus.

class EventBus {
public:
    using HandlerId = uint64_t;

    template<typename T>
    SubscriptionHandle subscribe(std::function<void(const T&)> handler) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::lock_guard<std::mutex> lock(mutex_);
        auto id = next_id_++;
        auto key = std::type_index(typeid(T));

        handlers_[key].push_back({id, [handler](const Event& e) {
            handler(static_cast<const T&>(e));
        }});

        TLOG_DEBUG("eventbus", "Subscribed handler %llu for %s",
                   (unsigned long long)id, typeid(T).name());

        return SubscriptionHandle([this, key, id]() {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(key);
            if (it != handlers_.end()) {
                auto& vec = it->second;
                vec.erase(std::remove_if(vec.begin(), vec.end(),
                    [id](const HandlerEntry& h) { return h.id == id; }), vec.end());
            }
        });
    }

    template<typename T>
    void publish(const T& event) {
        static_assert(std::is_base_of_v<Event, T>, "T must derive from Event");

        std::vector<HandlerEntry> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(T)));
            if (it != handlers_.end()) {
                snapshot = it->second;
            }
        }

        for (auto& entry : snapshot) {
            try {
                entry.fn(event);
            } catch (const std::exception& e) {
                TLOG_ERROR("eventbus", "Handler %llu threw: %s",
                           (unsigned long long)entry.id, e.what());
            } catch (...) {
                TLOG_ERROR("eventbus", "Handler %llu threw a non-std exception",
                           (unsigned long long)entry.id);
            }
        }
    }

    template<typename T>
    bool has_subscribers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(T)));
        return it != handlers_.end() && !it->second.empty();
    }

private:
    struct HandlerEntry {
        HandlerId id;
        std::function<void(const Event&)> fn;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<HandlerEntry>> handlers_;
    HandlerId next_id_ = 1;
};

} // namespace tether
