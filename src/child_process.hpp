#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <sys/types.h>
#include "result.hpp"
#include "session_config.hpp"

namespace tether {

// =============================================================================
// ChildProcessHandle - one mirroring process bound to a SessionConfig
// =============================================================================
// The child runs in its own process group with stdin on /dev/null. A monitor
// thread reaps it as soon as it exits so isAlive()/exitCode() stay cheap.
class ChildProcessHandle {
public:
    enum class State {
        Stopped,   // nothing tracked
        Running,   // spawned, not yet reaped
        Exited     // terminated on its own, not yet stop()ped
    };

    static constexpr std::chrono::milliseconds DEFAULT_STOP_TIMEOUT{5000};
    static constexpr std::chrono::milliseconds KILL_GRACE{2000};

    explicit ChildProcessHandle(std::string executable);
    ~ChildProcessHandle();

    ChildProcessHandle(const ChildProcessHandle&) = delete;
    ChildProcessHandle& operator=(const ChildProcessHandle&) = delete;

    // AlreadyRunning unless Stopped (an Exited handle needs stop() first);
    // LaunchError on spawn failure
    Result<void> start(const SessionConfig& config);

    // SIGTERM, wait up to timeout, SIGKILL, wait KILL_GRACE.
    // Idempotent. The pid is untracked on return even when TeardownFailed.
    Result<void> stop(std::chrono::milliseconds timeout = DEFAULT_STOP_TIMEOUT);

    bool isAlive();                       // non-blocking
    std::optional<int> exitCode() const;  // exit status, or -signal
    State state();
    pid_t pid() const;

    const SessionConfig& config() const { return config_; }
    const std::string& executable() const { return executable_; }

private:
    void reap();                          // waitpid(WNOHANG)
    bool waitForExit(std::chrono::milliseconds timeout);
    void monitorLoop();
    void stopMonitor();

    std::string executable_;
    SessionConfig config_;

    mutable std::mutex mutex_;
    pid_t pid_ = -1;
    bool exited_ = false;
    std::optional<int> exit_code_;

    std::mutex stop_mutex_;               // serializes stop() callers

    std::thread monitor_thread_;
    std::atomic<bool> monitor_running_{false};
    std::mutex cv_mutex_;
    std::condition_variable cv_;
};

const char* childStateName(ChildProcessHandle::State s);

} // namespace tether
