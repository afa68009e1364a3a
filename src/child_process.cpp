#include "child_process.hpp"
#include "process_util.hpp"
#include "tether_log.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/wait.h>

namespace tether {

namespace {

constexpr std::chrono::milliseconds REAP_INTERVAL{20};
constexpr std::chrono::milliseconds MONITOR_INTERVAL{100};

void signalGroup(pid_t pid, int sig) {
    // Process group first so helpers spawned by the child go too
    if (::kill(-pid, sig) != 0) {
        ::kill(pid, sig);
    }
}

} // namespace

const char* childStateName(ChildProcessHandle::State s) {
    switch (s) {
        case ChildProcessHandle::State::Stopped: return "Stopped";
        case ChildProcessHandle::State::Running: return "Running";
        case ChildProcessHandle::State::Exited:  return "Exited";
    }
    return "?";
}

ChildProcessHandle::ChildProcessHandle(std::string executable)
    : executable_(std::move(executable)) {}

ChildProcessHandle::~ChildProcessHandle() {
    auto r = stop();
    if (r.is_err()) {
        TLOG_ERROR("child", "Teardown in destructor failed: %s", r.error().message.c_str());
    }
    stopMonitor();
}

// =============================================================================
// Start
// =============================================================================

Result<void> ChildProcessHandle::start(const SessionConfig& config) {
    std::lock_guard<std::mutex> stop_lock(stop_mutex_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pid_ > 0) {
            // An exited process still has to be released with stop()
            return Err<void>(ErrorKind::AlreadyRunning,
                             std::string(exited_ ? "process exited but not stopped" : "process already running") +
                             " (pid " + std::to_string(pid_) + ")");
        }
    }

    stopMonitor();

    std::vector<std::string> argv;
    argv.push_back(executable_);
    auto args = buildScrcpyArgs(config);
    argv.insert(argv.end(), args.begin(), args.end());

    TLOG_INFO("child", "Starting: %s", joinArgs(argv).c_str());

    auto spawned = spawnProcess(argv);
    if (spawned.is_err()) {
        TLOG_ERROR("child", "Launch failed: %s", spawned.error().message.c_str());
        return Err<void>(ErrorKind::LaunchError, spawned.error().message, spawned.error().code);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid_ = spawned.value();
        exited_ = false;
        exit_code_.reset();
        config_ = config;
    }

    monitor_running_ = true;
    monitor_thread_ = std::thread(&ChildProcessHandle::monitorLoop, this);

    TLOG_INFO("child", "Started pid %d for device %s", (int)spawned.value(), config.device_id.c_str());
    return Ok();
}

// =============================================================================
// Liveness
// =============================================================================

void ChildProcessHandle::reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || exited_) return;

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        exited_ = true;
        exit_code_ = decodeWaitStatus(status);
        TLOG_INFO("child", "pid %d exited with code %d", (int)pid_, *exit_code_);
    } else if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing more to learn
        exited_ = true;
        TLOG_WARN("child", "pid %d no longer a child", (int)pid_);
    }
}

bool ChildProcessHandle::isAlive() {
    reap();
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_ > 0 && !exited_;
}

std::optional<int> ChildProcessHandle::exitCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

ChildProcessHandle::State ChildProcessHandle::state() {
    reap();
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0) return State::Stopped;
    return exited_ ? State::Exited : State::Running;
}

pid_t ChildProcessHandle::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

bool ChildProcessHandle::waitForExit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        reap();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (exited_) return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(REAP_INTERVAL);
    }
}

void ChildProcessHandle::monitorLoop() {
    while (monitor_running_.load()) {
        reap();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (exited_ || pid_ <= 0) break;
        }
        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, MONITOR_INTERVAL, [this] { return !monitor_running_.load(); });
    }
}

void ChildProcessHandle::stopMonitor() {
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        monitor_running_ = false;
    }
    cv_.notify_all();
    if (monitor_thread_.joinable()) monitor_thread_.join();
}

// =============================================================================
// Stop
// =============================================================================

Result<void> ChildProcessHandle::stop(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> stop_lock(stop_mutex_);

    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid = pid_;
    }
    if (pid <= 0) return Ok();

    stopMonitor();

    bool gone = waitForExit(std::chrono::milliseconds(0));
    if (!gone) {
        TLOG_INFO("child", "Terminating pid %d", (int)pid);
        signalGroup(pid, SIGTERM);
        gone = waitForExit(timeout);
    }
    if (!gone) {
        TLOG_WARN("child", "pid %d ignored SIGTERM for %lld ms, killing",
                  (int)pid, (long long)timeout.count());
        signalGroup(pid, SIGKILL);
        gone = waitForExit(KILL_GRACE);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid_ = -1;
        exited_ = false;
    }

    if (!gone) {
        TLOG_ERROR("child", "pid %d survived SIGKILL", (int)pid);
        return Err<void>(ErrorKind::TeardownFailed,
                         "process " + std::to_string(pid) + " did not terminate");
    }
    return Ok();
}

} // namespace tether
