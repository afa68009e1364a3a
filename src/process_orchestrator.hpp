#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>
#include "child_process.hpp"
#include "device_registry.hpp"
#include "event_bus.hpp"
#include "reconnect_supervisor.hpp"
#include "result.hpp"
#include "session_config.hpp"

namespace tether {

// =============================================================================
// ProcessOrchestrator - owns the single mirroring session
// =============================================================================
// Lifecycle:
//   Stopped -> Starting -> Running -> (child exits) -> Reconnecting -> Running
//                                  \-> Stopping -> Stopped
// Only one session may be Starting/Running/Reconnecting; a second
// startSession() is rejected, not queued.
//
// Events (events()): ProcessStartedEvent, ProcessStoppedEvent,
// ProcessErrorEvent, plus ReconnectAttemptEvent / ReconnectSuccessEvent
// forwarded from the supervisor.
class ProcessOrchestrator {
public:
    // Failed is reserved; every failure path settles in Stopped
    enum class State { Stopped, Starting, Running, Stopping, Reconnecting, Failed };

    struct Options {
        std::string scrcpy_path;        // empty: app-local candidates, then PATH
        std::string app_directory;
        std::chrono::milliseconds stop_timeout{ChildProcessHandle::DEFAULT_STOP_TIMEOUT};
        std::chrono::milliseconds watch_interval{250};
        bool skip_process_check = false;
        bool force_start = false;       // kill other instances instead of ExternalConflict

        // Defaults to ProcessScanner("scrcpy")
        std::function<std::vector<pid_t>()> scan_existing;
        std::function<int()> kill_existing;
    };

    ProcessOrchestrator(DeviceRegistry& registry, Options options);
    ~ProcessOrchestrator();

    ProcessOrchestrator(const ProcessOrchestrator&) = delete;
    ProcessOrchestrator& operator=(const ProcessOrchestrator&) = delete;

    // ValidationError, SessionAlreadyActive, ToolUnavailable, ExternalConflict, LaunchError
    Result<void> startSession(const SessionConfig& config);

    // Cancels reconnect, tears the child down, always ends Stopped.
    // TeardownFailed is reported after the transition.
    Result<void> stopSession();

    // Takes effect on the next unexpected exit
    void configureAutoReconnect(bool enabled, int max_attempts,
                                std::chrono::milliseconds retry_delay);

    void setSkipProcessCheck(bool skip);
    void setForceStart(bool force);

    State state() const;
    bool isRunning() const { return state() == State::Running; }
    std::optional<SessionConfig> currentConfig() const;
    std::optional<int> lastExitCode() const;
    pid_t childPid() const;
    int reconnectAttempts() const { return supervisor_.attemptCount(); }
    bool reconnectActive() const { return supervisor_.isActive(); }

    EventBus& events() { return events_; }

private:
    Result<std::string> resolveExecutable() const;
    Result<void> restartChild();
    void onReconnectExhausted(int attempts);
    void watchLoop();
    void handleUnexpectedExit(const std::shared_ptr<ChildProcessHandle>& child);
    void publishStopped(std::optional<int> exit_code);
    void publishError(const std::string& message);

    DeviceRegistry& registry_;
    EventBus events_;
    ReconnectSupervisor supervisor_;
    std::vector<SubscriptionHandle> forwards_;

    mutable std::mutex mutex_;                   // state_, config_, child_, options_
    State state_ = State::Stopped;
    std::optional<SessionConfig> config_;
    std::shared_ptr<ChildProcessHandle> child_;
    std::optional<int> last_exit_code_;
    Options options_;

    std::mutex op_mutex_;                        // serializes startSession/stopSession

    std::thread watch_thread_;
    std::atomic<bool> watching_{false};
    std::mutex watch_cv_mutex_;
    std::condition_variable watch_cv_;
};

const char* orchestratorStateName(ProcessOrchestrator::State s);

} // namespace tether
