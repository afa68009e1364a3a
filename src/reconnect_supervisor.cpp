#include "reconnect_supervisor.hpp"
#include "tether_log.hpp"

namespace tether {

const char* reconnectPhaseName(ReconnectSupervisor::Phase p) {
    switch (p) {
        case ReconnectSupervisor::Phase::Idle:       return "Idle";
        case ReconnectSupervisor::Phase::Polling:    return "Polling";
        case ReconnectSupervisor::Phase::Attempting: return "Attempting";
    }
    return "?";
}

ReconnectSupervisor::ReconnectSupervisor(PresenceFn presence)
    : presence_(std::move(presence)) {}

ReconnectSupervisor::~ReconnectSupervisor() {
    stop();
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) worker_.join();
}

void ReconnectSupervisor::setPolicy(const Policy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    policy_ = policy;
    TLOG_DEBUG("reconnect", "Policy: enabled=%d max_attempts=%d delay=%lld ms",
               (int)policy.enabled, policy.max_attempts, (long long)policy.retry_delay.count());
}

ReconnectSupervisor::Policy ReconnectSupervisor::policy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_;
}

bool ReconnectSupervisor::start(const std::string& device_id, RestartFn restart,
                                ExhaustedFn on_exhausted) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!policy_.enabled) {
        TLOG_DEBUG("reconnect", "Auto-reconnect disabled, not starting");
        return false;
    }
    if (active_.exchange(true)) {
        TLOG_DEBUG("reconnect", "Reconnect loop already active");
        return false;
    }

    // A finished loop may still be joinable
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();  // restarted from our own exhaustion callback
        } else {
            worker_.join();
        }
    }

    {
        std::lock_guard<std::mutex> cv_lock(cv_mutex_);
        cancel_ = false;
    }
    attempt_count_ = 0;

    TLOG_INFO("reconnect", "Starting reconnect loop for %s (max %d, delay %lld ms)",
              device_id.c_str(), policy_.max_attempts, (long long)policy_.retry_delay.count());
    worker_ = std::thread(&ReconnectSupervisor::loop, this, device_id,
                          std::move(restart), std::move(on_exhausted), policy_);
    return true;
}

void ReconnectSupervisor::stop() {
    {
        std::lock_guard<std::mutex> cv_lock(cv_mutex_);
        cancel_ = true;
    }
    cv_.notify_all();

    std::thread to_join;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            to_join = std::move(worker_);
        }
    }
    if (to_join.joinable()) {
        to_join.join();
        TLOG_DEBUG("reconnect", "Reconnect loop joined");
    }

    attempt_count_ = 0;
    phase_ = Phase::Idle;
    active_ = false;
}

bool ReconnectSupervisor::cancelled() {
    std::lock_guard<std::mutex> lock(cv_mutex_);
    return cancel_;
}

bool ReconnectSupervisor::sleepFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(cv_mutex_);
    return !cv_.wait_for(lock, delay, [this] { return cancel_; });
}

void ReconnectSupervisor::loop(std::string device_id, RestartFn restart,
                               ExhaustedFn on_exhausted, Policy policy) {
    while (!cancelled()) {
        if (policy.max_attempts > 0 && attempt_count_.load() >= policy.max_attempts) {
            int attempts = attempt_count_.exchange(0);
            TLOG_WARN("reconnect", "Giving up on %s after %d attempts", device_id.c_str(), attempts);
            phase_ = Phase::Idle;
            active_ = false;
            if (on_exhausted) {
                try {
                    on_exhausted(attempts);
                } catch (const std::exception& e) {
                    TLOG_ERROR("reconnect", "Exhaustion handler threw: %s", e.what());
                }
            }
            return;
        }

        int attempt = ++attempt_count_;
        TLOG_INFO("reconnect", "Attempt %d for %s", attempt, device_id.c_str());

        ReconnectAttemptEvent attempt_ev;
        attempt_ev.device_id = device_id;
        attempt_ev.attempt = attempt;
        events_.publish(attempt_ev);

        phase_ = Phase::Polling;
        if (!presence_(device_id)) {
            TLOG_DEBUG("reconnect", "Device %s not present", device_id.c_str());
            if (!sleepFor(policy.retry_delay)) break;
            continue;
        }

        phase_ = Phase::Attempting;
        bool ok = false;
        try {
            auto r = restart();
            ok = r.is_ok();
            if (!ok) {
                TLOG_WARN("reconnect", "Restart failed: %s", r.error().describe().c_str());
            }
        } catch (const std::exception& e) {
            TLOG_ERROR("reconnect", "Restart threw: %s", e.what());
        }

        if (ok) {
            if (!cancelled()) {
                TLOG_INFO("reconnect", "Reconnected to %s after %d attempt(s)", device_id.c_str(), attempt);
                ReconnectSuccessEvent success_ev;
                success_ev.device_id = device_id;
                success_ev.attempts = attempt;
                events_.publish(success_ev);
            }
            attempt_count_ = 0;
            break;
        }

        phase_ = Phase::Polling;
        if (!sleepFor(policy.retry_delay)) break;
    }

    phase_ = Phase::Idle;
    active_ = false;
}

} // namespace tether
