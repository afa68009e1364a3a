#include "process_orchestrator.hpp"
#include "process_scanner.hpp"
#include "process_util.hpp"
#include "tether_log.hpp"

namespace tether {

const char* orchestratorStateName(ProcessOrchestrator::State s) {
    switch (s) {
        case ProcessOrchestrator::State::Stopped:      return "Stopped";
        case ProcessOrchestrator::State::Starting:     return "Starting";
        case ProcessOrchestrator::State::Running:      return "Running";
        case ProcessOrchestrator::State::Stopping:     return "Stopping";
        case ProcessOrchestrator::State::Reconnecting: return "Reconnecting";
        case ProcessOrchestrator::State::Failed:       return "Failed";
    }
    return "?";
}

ProcessOrchestrator::ProcessOrchestrator(DeviceRegistry& registry, Options options)
    : registry_(registry),
      supervisor_([this](const std::string& id) { return registry_.isConnected(id); }),
      options_(std::move(options)) {
    if (!options_.scan_existing || !options_.kill_existing) {
        auto scanner = std::make_shared<ProcessScanner>("scrcpy");
        if (!options_.scan_existing) {
            options_.scan_existing = [scanner]() { return scanner->find(); };
        }
        if (!options_.kill_existing) {
            options_.kill_existing = [scanner]() { return scanner->killAll(); };
        }
    }

    forwards_.push_back(supervisor_.events().subscribe<ReconnectAttemptEvent>(
        [this](const ReconnectAttemptEvent& e) { events_.publish(e); }));
    forwards_.push_back(supervisor_.events().subscribe<ReconnectSuccessEvent>(
        [this](const ReconnectSuccessEvent& e) { events_.publish(e); }));

    watching_ = true;
    watch_thread_ = std::thread(&ProcessOrchestrator::watchLoop, this);
}

ProcessOrchestrator::~ProcessOrchestrator() {
    auto r = stopSession();
    if (r.is_err()) {
        TLOG_ERROR("orchestrator", "Shutdown teardown failed: %s", r.error().message.c_str());
    }

    {
        std::lock_guard<std::mutex> lock(watch_cv_mutex_);
        watching_ = false;
    }
    watch_cv_.notify_all();
    if (watch_thread_.joinable()) watch_thread_.join();
}

// =============================================================================
// Configuration
// =============================================================================

void ProcessOrchestrator::configureAutoReconnect(bool enabled, int max_attempts,
                                                 std::chrono::milliseconds retry_delay) {
    ReconnectSupervisor::Policy policy;
    policy.enabled = enabled;
    policy.max_attempts = max_attempts < 0 ? 0 : max_attempts;
    policy.retry_delay = retry_delay;
    supervisor_.setPolicy(policy);
    TLOG_INFO("orchestrator", "Auto-reconnect %s (max %d, delay %lld ms)",
              enabled ? "enabled" : "disabled", policy.max_attempts, (long long)retry_delay.count());
}

void ProcessOrchestrator::setSkipProcessCheck(bool skip) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.skip_process_check = skip;
}

void ProcessOrchestrator::setForceStart(bool force) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_.force_start = force;
}

ProcessOrchestrator::State ProcessOrchestrator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<SessionConfig> ProcessOrchestrator::currentConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::optional<int> ProcessOrchestrator::lastExitCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_exit_code_;
}

pid_t ProcessOrchestrator::childPid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return child_ ? child_->pid() : -1;
}

Result<std::string> ProcessOrchestrator::resolveExecutable() const {
    std::string configured;
    std::string app_dir;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        configured = options_.scrcpy_path;
        app_dir = options_.app_directory;
    }

    std::optional<std::string> found = configured.empty()
        ? findExecutable("scrcpy", scrcpyCandidates(app_dir))
        : findExecutable(configured);
    if (!found) {
        return Err<std::string>(ErrorKind::ToolUnavailable,
                                "scrcpy executable not found" +
                                (configured.empty() ? std::string() : ": " + configured));
    }
    return Ok(*found);
}

// =============================================================================
// Start / Stop
// =============================================================================

Result<void> ProcessOrchestrator::startSession(const SessionConfig& config) {
    std::unique_lock<std::mutex> op(op_mutex_);

    auto valid = validateSessionConfig(config);
    if (valid.is_err()) {
        TLOG_WARN("orchestrator", "Rejected config: %s", valid.error().message.c_str());
        return valid.error();
    }

    bool skip_check;
    bool force;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Stopped) {
            return Err<void>(ErrorKind::SessionAlreadyActive,
                             std::string("session already ") + orchestratorStateName(state_));
        }
        state_ = State::Starting;
        skip_check = options_.skip_process_check;
        force = options_.force_start;
    }

    auto fail = [this](Error e) -> Result<void> {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Stopped;
        return e;
    };

    auto exe = resolveExecutable();
    if (exe.is_err()) {
        TLOG_ERROR("orchestrator", "%s", exe.error().message.c_str());
        return fail(exe.error());
    }

    if (!skip_check) {
        auto existing = options_.scan_existing();
        if (!existing.empty()) {
            if (force) {
                int killed = options_.kill_existing();
                TLOG_INFO("orchestrator", "Force start: stopped %d existing instance(s)", killed);
            } else {
                TLOG_WARN("orchestrator", "Another scrcpy is running (%zu process(es))", existing.size());
                return fail(Error(ErrorKind::ExternalConflict,
                                   "Another scrcpy session is already running (found " +
                                   std::to_string(existing.size()) + " process(es))"));
            }
        }
    }

    auto child = std::make_shared<ChildProcessHandle>(exe.value());
    auto started = child->start(config);
    if (started.is_err()) {
        auto failed = fail(started.error());
        op.unlock();
        publishError(started.error().message);
        return failed;
    }

    pid_t pid = child->pid();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        child_ = std::move(child);
        config_ = config;
        last_exit_code_.reset();
        state_ = State::Running;
    }
    op.unlock();

    TLOG_INFO("orchestrator", "Session running for %s (pid %d)", config.device_id.c_str(), (int)pid);
    ProcessStartedEvent ev;
    ev.config = config;
    ev.pid = pid;
    events_.publish(ev);
    return Ok();
}

Result<void> ProcessOrchestrator::stopSession() {
    std::unique_lock<std::mutex> op(op_mutex_);

    std::chrono::milliseconds stop_timeout;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Stopped) return Ok();
        state_ = State::Stopping;
        stop_timeout = options_.stop_timeout;
    }

    // Never hold mutex_ here: the reconnect loop may be inside restartChild()
    supervisor_.stop();

    std::shared_ptr<ChildProcessHandle> child;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        child = std::move(child_);
    }

    Result<void> teardown = Ok();
    std::optional<int> exit_code;
    if (child) {
        teardown = child->stop(stop_timeout);
        exit_code = child->exitCode();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!exit_code) exit_code = last_exit_code_;
        last_exit_code_ = exit_code;
        config_.reset();
        state_ = State::Stopped;
    }
    op.unlock();

    TLOG_INFO("orchestrator", "Session stopped");
    if (teardown.is_err()) publishError(teardown.error().message);
    publishStopped(exit_code);
    return teardown;
}

// =============================================================================
// Unexpected exit handling
// =============================================================================

void ProcessOrchestrator::watchLoop() {
    while (watching_.load()) {
        {
            std::unique_lock<std::mutex> lock(watch_cv_mutex_);
            watch_cv_.wait_for(lock, options_.watch_interval, [this] { return !watching_.load(); });
        }
        if (!watching_.load()) break;

        std::shared_ptr<ChildProcessHandle> child;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::Running) continue;
            child = child_;
        }
        // A finishing reconnect loop still owns the transition
        if (!child || supervisor_.isActive()) continue;

        if (!child->isAlive()) handleUnexpectedExit(child);
    }
}

void ProcessOrchestrator::handleUnexpectedExit(const std::shared_ptr<ChildProcessHandle>& child) {
    // Held across the Reconnecting transition and supervisor start so a
    // concurrent stopSession() cannot slip in between and miss the loop
    std::unique_lock<std::mutex> op(op_mutex_);

    std::optional<int> exit_code = child->exitCode();
    bool reconnect;
    std::string device_id;
    std::shared_ptr<ChildProcessHandle> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Running || child_ != child) return;  // raced with stop/restart
        last_exit_code_ = exit_code;
        reconnect = supervisor_.policy().enabled && config_.has_value();
        if (reconnect) {
            device_id = config_->device_id;
            state_ = State::Reconnecting;
        } else {
            stale = std::move(child_);
            config_.reset();
            state_ = State::Stopped;
        }
    }

    TLOG_WARN("orchestrator", "scrcpy exited unexpectedly (code %d)%s",
              exit_code.value_or(-1), reconnect ? ", reconnecting" : "");

    if (reconnect) {
        bool started = supervisor_.start(
            device_id,
            [this]() { return restartChild(); },
            [this](int attempts) { onReconnectExhausted(attempts); });
        if (started) return;

        // Policy flipped between the check and the start
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Reconnecting) return;
        stale = std::move(child_);
        config_.reset();
        state_ = State::Stopped;
    }
    op.unlock();

    if (stale) {
        auto r = stale->stop();
        if (r.is_err()) publishError(r.error().message);
    }
    publishStopped(exit_code);
}

Result<void> ProcessOrchestrator::restartChild() {
    std::shared_ptr<ChildProcessHandle> stale;
    SessionConfig config;
    std::chrono::milliseconds stop_timeout;
    bool kill_others;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Reconnecting || !config_) {
            return Err<void>(ErrorKind::Other, "session is no longer reconnecting");
        }
        stale = child_;
        config = *config_;
        stop_timeout = options_.stop_timeout;
        kill_others = options_.force_start && !options_.skip_process_check;
    }

    if (stale) {
        auto r = stale->stop(stop_timeout);
        if (r.is_err()) {
            TLOG_ERROR("orchestrator", "Stale handle teardown failed: %s", r.error().message.c_str());
        }
    }

    if (kill_others && !options_.scan_existing().empty()) {
        options_.kill_existing();
    }

    auto exe = TETHER_TRY(resolveExecutable());

    auto fresh = std::make_shared<ChildProcessHandle>(exe);
    TETHER_TRY_VOID(fresh->start(config));

    bool installed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Reconnecting) {
            child_ = fresh;
            state_ = State::Running;
            installed = true;
        }
    }
    if (!installed) {
        // stopSession() won the race; do not leak the new process
        auto r = fresh->stop(stop_timeout);
        if (r.is_err()) publishError(r.error().message);
        return Err<void>(ErrorKind::Other, "session stopped during restart");
    }

    TLOG_INFO("orchestrator", "Restarted scrcpy for %s (pid %d)", config.device_id.c_str(), (int)fresh->pid());
    ProcessStartedEvent ev;
    ev.config = config;
    ev.pid = fresh->pid();
    events_.publish(ev);
    return Ok();
}

void ProcessOrchestrator::onReconnectExhausted(int attempts) {
    std::shared_ptr<ChildProcessHandle> stale;
    std::optional<int> exit_code;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Reconnecting) return;
        stale = std::move(child_);
        config_.reset();
        exit_code = last_exit_code_;
        state_ = State::Stopped;
    }

    TLOG_WARN("orchestrator", "Reconnect gave up after %d attempt(s)", attempts);
    if (stale) {
        auto r = stale->stop();
        if (r.is_err()) publishError(r.error().message);
    }
    publishStopped(exit_code);
}

// =============================================================================
// Events
// =============================================================================

void ProcessOrchestrator::publishStopped(std::optional<int> exit_code) {
    ProcessStoppedEvent ev;
    ev.exit_code = exit_code;
    events_.publish(ev);
}

void ProcessOrchestrator::publishError(const std::string& message) {
    ProcessErrorEvent ev;
    ev.message = message;
    events_.publish(ev);
}

} // namespace tether
