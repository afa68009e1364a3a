#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include "event_bus.hpp"
#include "result.hpp"

namespace tether {

// =============================================================================
// ReconnectSupervisor - retry loop after an unexpected child exit
// =============================================================================
// Per attempt: check the attempt limit, count the attempt, ask whether the
// device is present, and if so invoke the restart callback. Sleeps between
// attempts are cancellable waits, so stop() returns within one wait quantum.
//
// Events (events()): ReconnectAttemptEvent, ReconnectSuccessEvent
class ReconnectSupervisor {
public:
    enum class Phase { Idle, Polling, Attempting };

    struct Policy {
        bool enabled = false;
        int max_attempts = 0;                                 // 0 = unbounded
        std::chrono::milliseconds retry_delay{3000};
    };

    using PresenceFn = std::function<bool(const std::string& device_id)>;
    using RestartFn = std::function<Result<void>()>;
    using ExhaustedFn = std::function<void(int attempts)>;

    explicit ReconnectSupervisor(PresenceFn presence);
    ~ReconnectSupervisor();

    ReconnectSupervisor(const ReconnectSupervisor&) = delete;
    ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

    void setPolicy(const Policy& policy);
    Policy policy() const;

    // false when disabled or a loop is already active
    bool start(const std::string& device_id, RestartFn restart,
               ExhaustedFn on_exhausted = nullptr);

    // Cancel and join; attempt count is 0 afterwards
    void stop();

    bool isActive() const { return active_.load(); }
    Phase phase() const { return phase_.load(); }
    int attemptCount() const { return attempt_count_.load(); }

    EventBus& events() { return events_; }

private:
    void loop(std::string device_id, RestartFn restart, ExhaustedFn on_exhausted, Policy policy);
    bool sleepFor(std::chrono::milliseconds delay);  // false when cancelled
    bool cancelled();

    PresenceFn presence_;
    EventBus events_;

    mutable std::mutex mutex_;          // policy_, worker_
    Policy policy_;
    std::thread worker_;

    std::atomic<bool> active_{false};
    std::atomic<Phase> phase_{Phase::Idle};
    std::atomic<int> attempt_count_{0};

    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool cancel_ = false;
};

const char* reconnectPhaseName(ReconnectSupervisor::Phase p);

} // namespace tether
