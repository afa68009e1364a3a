// =============================================================================
// Tether - ReconnectSupervisor Tests
// =============================================================================

#include <gtest/gtest.h>
#include <atomic>
#include "reconnect_supervisor.hpp"
#include "test_helpers.hpp"

using namespace tether;
using namespace std::chrono_literals;
using tether::test::waitFor;

// =============================================================================
// Fixture: presence flag, restart counter and event recorder
// =============================================================================

class ReconnectSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        supervisor_ = std::make_unique<ReconnectSupervisor>(
            [this](const std::string& id) {
                presence_checks_++;
                return id == "ABC123" && present_.load();
            });
        subs_.push_back(supervisor_->events().subscribe<ReconnectAttemptEvent>(
            [this](const ReconnectAttemptEvent& e) {
                std::lock_guard<std::mutex> lock(mutex_);
                attempts_.push_back(e.attempt);
            }));
        subs_.push_back(supervisor_->events().subscribe<ReconnectSuccessEvent>(
            [this](const ReconnectSuccessEvent& e) {
                success_attempts_ = e.attempts;
                successes_++;
            }));
    }

    void TearDown() override {
        supervisor_->stop();
        subs_.clear();
        supervisor_.reset();
    }

    void enable(int max_attempts, std::chrono::milliseconds delay = 20ms) {
        ReconnectSupervisor::Policy policy;
        policy.enabled = true;
        policy.max_attempts = max_attempts;
        policy.retry_delay = delay;
        supervisor_->setPolicy(policy);
    }

    std::vector<int> attempts() {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

    std::unique_ptr<ReconnectSupervisor> supervisor_;
    std::vector<SubscriptionHandle> subs_;
    std::atomic<bool> present_{false};
    std::atomic<int> presence_checks_{0};
    std::atomic<int> successes_{0};
    std::atomic<int> success_attempts_{0};
    std::mutex mutex_;
    std::vector<int> attempts_;
};

// =============================================================================
// Policy
// =============================================================================

TEST_F(ReconnectSupervisorTest, DisabledPolicyDoesNotStart) {
    EXPECT_FALSE(supervisor_->start("ABC123", [] { return Result<void>(); }));
    EXPECT_FALSE(supervisor_->isActive());
    EXPECT_EQ(supervisor_->phase(), ReconnectSupervisor::Phase::Idle);
}

TEST_F(ReconnectSupervisorTest, SecondStartRejectedWhileActive) {
    enable(0, 1000ms);
    ASSERT_TRUE(supervisor_->start("ABC123", [] { return Result<void>(); }));
    EXPECT_TRUE(supervisor_->isActive());

    EXPECT_FALSE(supervisor_->start("ABC123", [] { return Result<void>(); }));
}

// =============================================================================
// Attempt accounting
// =============================================================================

TEST_F(ReconnectSupervisorTest, GivesUpAfterMaxAttempts) {
    enable(3);
    std::atomic<int> exhausted_with{-1};
    std::atomic<int> restarts{0};

    ASSERT_TRUE(supervisor_->start(
        "ABC123",
        [&] { restarts++; return Result<void>(); },
        [&](int n) { exhausted_with = n; }));

    ASSERT_TRUE(waitFor([&] { return exhausted_with.load() >= 0; }));

    EXPECT_EQ(exhausted_with.load(), 3);
    EXPECT_EQ(attempts(), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(restarts.load(), 0);  // device never came back
    EXPECT_EQ(successes_.load(), 0);
    EXPECT_TRUE(waitFor([&] { return !supervisor_->isActive(); }));
    EXPECT_EQ(supervisor_->attemptCount(), 0);
}

TEST_F(ReconnectSupervisorTest, RestartsAsSoonAsDeviceIsPresent) {
    enable(0);
    present_ = true;
    std::atomic<int> restarts{0};

    ASSERT_TRUE(supervisor_->start("ABC123", [&] { restarts++; return Result<void>(); }));

    ASSERT_TRUE(waitFor([&] { return successes_.load() == 1; }));
    EXPECT_EQ(restarts.load(), 1);
    EXPECT_EQ(success_attempts_.load(), 1);
    EXPECT_TRUE(waitFor([&] { return !supervisor_->isActive(); }));
    EXPECT_EQ(supervisor_->attemptCount(), 0);
}

TEST_F(ReconnectSupervisorTest, FailedRestartsCountAsAttempts) {
    enable(0);
    present_ = true;
    std::atomic<int> restarts{0};

    ASSERT_TRUE(supervisor_->start("ABC123", [&]() -> Result<void> {
        if (++restarts < 3) return Err<void>(ErrorKind::LaunchError, "device busy");
        return Ok();
    }));

    ASSERT_TRUE(waitFor([&] { return successes_.load() == 1; }));
    EXPECT_EQ(restarts.load(), 3);
    EXPECT_EQ(success_attempts_.load(), 3);
    EXPECT_EQ(attempts(), (std::vector<int>{1, 2, 3}));
}

TEST_F(ReconnectSupervisorTest, ThrowingRestartIsAFailedAttempt) {
    enable(2);
    present_ = true;
    std::atomic<int> exhausted_with{-1};

    ASSERT_TRUE(supervisor_->start(
        "ABC123",
        []() -> Result<void> { throw std::runtime_error("boom"); },
        [&](int n) { exhausted_with = n; }));

    ASSERT_TRUE(waitFor([&] { return exhausted_with.load() >= 0; }));
    EXPECT_EQ(exhausted_with.load(), 2);
}

TEST_F(ReconnectSupervisorTest, WaitsForDeviceToReturn) {
    enable(0);
    std::atomic<int> restarts{0};

    ASSERT_TRUE(supervisor_->start("ABC123", [&] { restarts++; return Result<void>(); }));

    ASSERT_TRUE(waitFor([&] { return attempts().size() >= 3; }));
    EXPECT_EQ(restarts.load(), 0);
    EXPECT_EQ(supervisor_->phase(), ReconnectSupervisor::Phase::Polling);

    present_ = true;
    ASSERT_TRUE(waitFor([&] { return successes_.load() == 1; }));
    EXPECT_EQ(restarts.load(), 1);
    EXPECT_GE(success_attempts_.load(), 3);
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(ReconnectSupervisorTest, StopCancelsPromptlyAndResetsCount) {
    enable(0, 10s);

    ASSERT_TRUE(supervisor_->start("ABC123", [] { return Result<void>(); }));
    ASSERT_TRUE(waitFor([&] { return supervisor_->attemptCount() == 1; }));

    auto start = std::chrono::steady_clock::now();
    supervisor_->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

    EXPECT_FALSE(supervisor_->isActive());
    EXPECT_EQ(supervisor_->attemptCount(), 0);
    EXPECT_EQ(supervisor_->phase(), ReconnectSupervisor::Phase::Idle);

    int checks = presence_checks_.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(presence_checks_.load(), checks);
}

TEST_F(ReconnectSupervisorTest, CanRestartAfterStop) {
    enable(0, 10s);
    ASSERT_TRUE(supervisor_->start("ABC123", [] { return Result<void>(); }));
    supervisor_->stop();

    present_ = true;
    enable(0, 20ms);
    ASSERT_TRUE(supervisor_->start("ABC123", [] { return Result<void>(); }));
    ASSERT_TRUE(waitFor([&] { return successes_.load() == 1; }));
}

TEST_F(ReconnectSupervisorTest, ExhaustionHandlerMayRestart) {
    enable(1);
    std::atomic<int> rounds{0};
    std::function<void(int)> on_exhausted;
    on_exhausted = [&](int) {
        if (++rounds < 2) {
            supervisor_->start("ABC123", [] { return Result<void>(); }, on_exhausted);
        }
    };

    ASSERT_TRUE(supervisor_->start("ABC123", [] { return Result<void>(); }, on_exhausted));
    ASSERT_TRUE(waitFor([&] { return rounds.load() == 2; }));
    EXPECT_TRUE(waitFor([&] { return !supervisor_->isActive(); }));
}

TEST(ReconnectPhaseNameTest, Names) {
    EXPECT_STREQ(reconnectPhaseName(ReconnectSupervisor::Phase::Idle), "Idle");
    EXPECT_STREQ(reconnectPhaseName(ReconnectSupervisor::Phase::Polling), "Polling");
    EXPECT_STREQ(reconnectPhaseName(ReconnectSupervisor::Phase::Attempting), "Attempting");
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
