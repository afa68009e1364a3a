// =============================================================================
// Tether - DeviceRegistry Unit Tests
// =============================================================================
// Set diffing, event order and selection, driven by a scripted adb.

#include <gtest/gtest.h>
#include <atomic>
#include "device_registry.hpp"
#include "test_helpers.hpp"

using namespace tether;
using tether::test::FakeAdb;
using tether::test::waitFor;

// =============================================================================
// Fixture: registry over FakeAdb with an event recorder
// =============================================================================

class DeviceRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_unique<DeviceRegistry>(fake_.client());
        auto& bus = registry_->events();
        subs_.push_back(bus.subscribe<DevicesChangedEvent>([this](const DevicesChangedEvent& e) {
            std::string ids;
            for (const auto& id : e.device_ids) ids += (ids.empty() ? "" : ",") + id;
            record("changed:" + ids);
        }));
        subs_.push_back(bus.subscribe<DeviceConnectedEvent>([this](const DeviceConnectedEvent& e) {
            record("connected:" + e.device_id);
        }));
        subs_.push_back(bus.subscribe<DeviceDisconnectedEvent>([this](const DeviceDisconnectedEvent& e) {
            record("disconnected:" + e.device_id);
        }));
    }

    void TearDown() override {
        subs_.clear();
        registry_.reset();
    }

    void record(const std::string& s) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        log_.push_back(s);
    }

    std::vector<std::string> takeLog() {
        std::lock_guard<std::mutex> lock(log_mutex_);
        auto out = std::move(log_);
        log_.clear();
        return out;
    }

    FakeAdb fake_;
    std::unique_ptr<DeviceRegistry> registry_;
    std::vector<SubscriptionHandle> subs_;
    std::mutex log_mutex_;
    std::vector<std::string> log_;
};

// =============================================================================
// Diffing
// =============================================================================

TEST_F(DeviceRegistryTest, InitialRefreshConnectsEveryReachableDevice) {
    fake_.setDevices({{"A", "device"}, {"B", "device"}});

    auto devices = registry_->refresh();

    EXPECT_EQ(devices.size(), 2u);
    EXPECT_EQ(takeLog(), (std::vector<std::string>{"changed:A,B", "connected:A", "connected:B"}));
}

TEST_F(DeviceRegistryTest, SwapEmitsAggregateThenConnectThenDisconnect) {
    fake_.setDevices({{"A", "device"}, {"B", "device"}});
    registry_->refresh();
    takeLog();

    fake_.setDevices({{"A", "device"}, {"C", "device"}});
    registry_->refresh();

    EXPECT_EQ(takeLog(), (std::vector<std::string>{"changed:A,C", "connected:C", "disconnected:B"}));
    EXPECT_TRUE(registry_->isConnected("A"));
    EXPECT_TRUE(registry_->isConnected("C"));
    EXPECT_FALSE(registry_->isConnected("B"));
}

TEST_F(DeviceRegistryTest, UnchangedSetIsSilent) {
    fake_.setDevices({{"A", "device"}});
    registry_->refresh();
    takeLog();

    registry_->refresh();
    registry_->refresh();

    EXPECT_TRUE(takeLog().empty());
}

TEST_F(DeviceRegistryTest, UnauthorizedDeviceIsListedButNotReachable) {
    fake_.setDevices({{"A", "unauthorized"}});
    registry_->refresh();

    EXPECT_EQ(takeLog(), (std::vector<std::string>{"changed:"}));
    EXPECT_FALSE(registry_->isConnected("A"));
    ASSERT_TRUE(registry_->find("A").has_value());
    EXPECT_EQ(registry_->find("A")->status, "unauthorized");
    EXPECT_TRUE(registry_->deviceIds().empty());

    // Accepting the RSA prompt makes it reachable
    fake_.setDevice("A", "device");
    registry_->refresh();
    EXPECT_EQ(takeLog(), (std::vector<std::string>{"changed:A", "connected:A"}));
}

TEST_F(DeviceRegistryTest, GoingOfflineDisconnects) {
    fake_.setDevices({{"A", "device"}});
    registry_->refresh();
    takeLog();

    fake_.setDevice("A", "offline");
    registry_->refresh();

    EXPECT_EQ(takeLog(), (std::vector<std::string>{"changed:", "disconnected:A"}));
    EXPECT_EQ(registry_->devices().size(), 1u);
}

TEST_F(DeviceRegistryTest, FailedRefreshMeansNoDevices) {
    fake_.setDevices({{"A", "device"}});
    registry_->refresh();
    takeLog();

    fake_.setFailure(Error(ErrorKind::Timeout, "'adb' timed out"));
    auto devices = registry_->refresh();

    EXPECT_TRUE(devices.empty());
    EXPECT_TRUE(registry_->devices().empty());
    EXPECT_EQ(takeLog(), (std::vector<std::string>{"changed:", "disconnected:A"}));
}

TEST_F(DeviceRegistryTest, CheckedRefreshSurfacesErrorAndKeepsSet) {
    fake_.setDevices({{"A", "device"}});
    registry_->refresh();
    takeLog();

    fake_.setFailure(Error(ErrorKind::ToolUnavailable, "cannot execute 'adb'"));
    auto result = registry_->refreshChecked();

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::ToolUnavailable);
    EXPECT_TRUE(registry_->isConnected("A"));
    EXPECT_TRUE(takeLog().empty());
}

// =============================================================================
// Display names
// =============================================================================

TEST_F(DeviceRegistryTest, DisplayNameFromModelWithIdFallback) {
    fake_.setModel("A", "Pixel 7");
    fake_.setDevices({{"A", "device"}, {"B", "device"}});

    registry_->refresh();

    EXPECT_EQ(registry_->find("A")->display_name, "Pixel 7");
    EXPECT_EQ(registry_->find("B")->display_name, "B");
}

TEST_F(DeviceRegistryTest, ModelLookupIsCached) {
    fake_.setModel("A", "Pixel 7");
    fake_.setDevices({{"A", "device"}});

    registry_->refresh();
    registry_->refresh();
    registry_->refresh();

    EXPECT_EQ(fake_.nameLookups(), 1);
}

TEST_F(DeviceRegistryTest, ConnectedEventCarriesDisplayName) {
    std::string name;
    auto sub = registry_->events().subscribe<DeviceConnectedEvent>(
        [&](const DeviceConnectedEvent& e) { name = e.display_name; });

    fake_.setModel("A", "Galaxy S23");
    fake_.setDevices({{"A", "device"}});
    registry_->refresh();

    EXPECT_EQ(name, "Galaxy S23");
}

// =============================================================================
// Selection
// =============================================================================

TEST_F(DeviceRegistryTest, SelectRequiresReachableDevice) {
    fake_.setDevices({{"A", "device"}, {"B", "offline"}});
    registry_->refresh();

    auto none = registry_->selectDevice("");
    ASSERT_TRUE(none.is_err());
    EXPECT_EQ(none.error().kind, ErrorKind::ValidationError);
    EXPECT_EQ(none.error().message, "No device selected");

    auto offline = registry_->selectDevice("B");
    ASSERT_TRUE(offline.is_err());
    EXPECT_EQ(offline.error().message, "Device B is not available");

    EXPECT_TRUE(registry_->selectDevice("A").is_ok());
    EXPECT_EQ(registry_->selectedDevice(), "A");

    registry_->clearSelection();
    EXPECT_TRUE(registry_->selectedDevice().empty());
}

// =============================================================================
// Background monitoring
// =============================================================================

TEST_F(DeviceRegistryTest, MonitoringPicksUpChanges) {
    registry_->startMonitoring(std::chrono::milliseconds(20));
    EXPECT_TRUE(registry_->isMonitoring());

    fake_.setDevice("A");
    EXPECT_TRUE(waitFor([&] { return registry_->isConnected("A"); }));

    fake_.removeDevice("A");
    EXPECT_TRUE(waitFor([&] { return !registry_->isConnected("A"); }));

    registry_->stopMonitoring();
    EXPECT_FALSE(registry_->isMonitoring());

    int calls = fake_.calls();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(fake_.calls(), calls);
}

TEST_F(DeviceRegistryTest, MonitoringCanRestart) {
    registry_->startMonitoring(std::chrono::milliseconds(20));
    registry_->startMonitoring(std::chrono::milliseconds(20));  // no-op
    registry_->stopMonitoring();
    registry_->stopMonitoring();  // idempotent

    fake_.setDevice("A");
    registry_->startMonitoring(std::chrono::milliseconds(20));
    EXPECT_TRUE(waitFor([&] { return registry_->isConnected("A"); }));
    registry_->stopMonitoring();
}

TEST_F(DeviceRegistryTest, StopFromHandlerDoesNotDeadlock) {
    std::atomic<bool> stopped{false};
    auto sub = registry_->events().subscribe<DeviceConnectedEvent>(
        [&](const DeviceConnectedEvent&) {
            registry_->stopMonitoring();
            stopped = true;
        });

    fake_.setDevice("A");
    registry_->startMonitoring(std::chrono::milliseconds(20));

    EXPECT_TRUE(waitFor([&] { return stopped.load(); }));
    EXPECT_FALSE(registry_->isMonitoring());
}

TEST_F(DeviceRegistryTest, RestartFromHandlerKeepsPolling) {
    std::atomic<int> restarts{0};
    auto sub = registry_->events().subscribe<DeviceConnectedEvent>(
        [&](const DeviceConnectedEvent&) {
            registry_->stopMonitoring();
            registry_->startMonitoring(std::chrono::milliseconds(20));
            ++restarts;
        });

    fake_.setDevice("A");
    registry_->startMonitoring(std::chrono::milliseconds(20));
    ASSERT_TRUE(waitFor([&] { return restarts.load() == 1; }));
    EXPECT_TRUE(registry_->isMonitoring());

    // The same loop still polls and reports new devices
    fake_.setDevice("B");
    EXPECT_TRUE(waitFor([&] { return restarts.load() == 2; }));
    EXPECT_TRUE(registry_->isConnected("B"));

    registry_->stopMonitoring();
    EXPECT_FALSE(registry_->isMonitoring());
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
