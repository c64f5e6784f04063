/*
 * test_device_discovery.cpp - Tests for DeviceDiscovery
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <thread>
#include <vector>

#include "common/fake_control_bridge.hpp"
#include "device/discovery/device_discovery.hpp"

using namespace simdeck::device;
using namespace simdeck::test;
using namespace testing;

class DeviceDiscoveryTest : public Test {
protected:
    void SetUp() override {
        bridge_ = std::make_shared<FakeControlBridge>();
        discovery_ = std::make_unique<DeviceDiscovery>(bridge_);
    }

    std::shared_ptr<FakeControlBridge> bridge_;
    std::unique_ptr<DeviceDiscovery> discovery_;
};

// ========== Listing ==========

TEST_F(DeviceDiscoveryTest, ListDevices_Empty) {
    auto devices = discovery_->listDevices();
    ASSERT_TRUE(devices.has_value());
    EXPECT_TRUE(devices->empty());
}

TEST_F(DeviceDiscoveryTest, ListDevices_KeepsBridgeOrder) {
    bridge_->addDevice(makeSimulator("B", "iPhone 15"));
    bridge_->addDevice(makeSimulator("A", "iPhone 14"));
    bridge_->addDevice(makeSimulator("C", "iPad Air"));

    auto devices = discovery_->listDevices();
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(devices->size(), 3u);
    EXPECT_EQ((*devices)[0].id, "B");
    EXPECT_EQ((*devices)[1].id, "A");
    EXPECT_EQ((*devices)[2].id, "C");
}

TEST_F(DeviceDiscoveryTest, ListDevices_DropsUnavailable) {
    auto gone = makeSimulator("X", "iPhone 8");
    gone.available = false;
    bridge_->addDevice(gone);
    bridge_->addDevice(makeSimulator("Y", "iPhone 15"));

    auto devices = discovery_->listDevices();
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(devices->size(), 1u);
    EXPECT_EQ(devices->front().id, "Y");
    EXPECT_TRUE(devices->front().available);
}

TEST_F(DeviceDiscoveryTest, ListDevices_FillsIdFromUdid) {
    auto dev = makeSimulator("U-1", "iPhone 15");
    dev.id.clear();
    bridge_->addDevice(dev);

    auto devices = discovery_->listDevices();
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(devices->size(), 1u);
    EXPECT_EQ(devices->front().id, "U-1");
    EXPECT_EQ(devices->front().udid, "U-1");
}

TEST_F(DeviceDiscoveryTest, ListDevices_DropsRecordWithoutName) {
    auto dev = makeSimulator("U-1", "");
    bridge_->addDevice(dev);

    auto devices = discovery_->listDevices();
    ASSERT_TRUE(devices.has_value());
    EXPECT_TRUE(devices->empty());
}

// ========== Failures ==========

TEST_F(DeviceDiscoveryTest, ListDevices_BridgeFailure) {
    bridge_->failOperation("listDevices",
                           BridgeError::unreachable("xcrun not found"));

    auto devices = discovery_->listDevices();
    ASSERT_FALSE(devices.has_value());
    EXPECT_EQ(devices.error().code, DeviceErrorCode::DeviceDiscoveryFailed);
    EXPECT_THAT(devices.error().message, HasSubstr("xcrun not found"));
    EXPECT_EQ(devices.error().details["bridge"], "fake");
}

TEST_F(DeviceDiscoveryTest, ListDevices_NoCaching) {
    bridge_->addDevice(makeSimulator("A", "iPhone 15"));
    ASSERT_TRUE(discovery_->listDevices().has_value());

    bridge_->addDevice(makeSimulator("B", "iPhone 14"));
    auto devices = discovery_->listDevices();
    ASSERT_TRUE(devices.has_value());
    EXPECT_EQ(devices->size(), 2u);
    EXPECT_EQ(bridge_->callCount("listDevices"), 2);
}

// ========== Concurrency ==========

TEST_F(DeviceDiscoveryTest, ListDevices_ConcurrentCallers) {
    bridge_->addDevice(makeSimulator("A", "iPhone 15"));
    bridge_->addDevice(makeSimulator("B", "iPhone 14"));

    constexpr int kThreads = 5;
    constexpr int kCallsPerThread = 10;
    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kCallsPerThread; ++i) {
                auto devices = discovery_->listDevices();
                if (devices && devices->size() == 2) {
                    ++successes;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(successes.load(), kThreads * kCallsPerThread);
    EXPECT_EQ(bridge_->callCount("listDevices"), kThreads * kCallsPerThread);
}
