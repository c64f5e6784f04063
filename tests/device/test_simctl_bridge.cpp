/*
 * test_simctl_bridge.cpp - Tests for SimctlBridge command construction
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>

#include "common/mock_command_runner.hpp"
#include "device/bridge/simctl_bridge.hpp"

using namespace simdeck::device;
using namespace simdeck::test;
using namespace testing;

using Argv = std::vector<std::string>;

namespace {

constexpr const char* kListJson = R"({"devices": {
    "com.apple.CoreSimulator.SimRuntime.iOS-17-4": [
        {"udid": "U1", "name": "iPhone 15", "state": "Booted",
         "isAvailable": true}
    ]}})";

}  // namespace

class SimctlBridgeTest : public Test {
protected:
    void SetUp() override {
        runner_ = std::make_shared<StrictMock<MockCommandRunner>>();
        SimctlBridgeOptions options;
        options.xcrunPath = "/usr/bin/xcrun";
        options.idbPath = "idb";
        bridge_ = std::make_unique<SimctlBridge>(runner_, options);
    }

    std::shared_ptr<StrictMock<MockCommandRunner>> runner_;
    std::unique_ptr<SimctlBridge> bridge_;
};

// ========== Lifecycle ==========

TEST_F(SimctlBridgeTest, ListDevices_RunsSimctlJson) {
    EXPECT_CALL(*runner_, run(ElementsAre("/usr/bin/xcrun", "simctl", "list",
                                          "devices", "--json"),
                              _))
        .WillOnce(Return(okResult(kListJson)));

    auto devices = bridge_->listDevices();
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(devices->size(), 1u);
    EXPECT_EQ(devices->front().udid, "U1");
}

TEST_F(SimctlBridgeTest, ListDevices_XcrunMissing) {
    EXPECT_CALL(*runner_, run(_, _)).WillOnce(Return(launchFailedResult()));

    auto devices = bridge_->listDevices();
    ASSERT_FALSE(devices.has_value());
    EXPECT_EQ(devices.error().kind, BridgeError::Kind::Unreachable);
}

TEST_F(SimctlBridgeTest, Boot_Argv) {
    EXPECT_CALL(*runner_,
                run(ElementsAre("/usr/bin/xcrun", "simctl", "boot", "U1"), _))
        .WillOnce(Return(okResult()));
    EXPECT_TRUE(bridge_->boot("U1").has_value());
}

TEST_F(SimctlBridgeTest, Boot_InvalidDeviceIsNotFound) {
    EXPECT_CALL(*runner_, run(_, _))
        .WillOnce(Return(failResult(
            148, "An error was encountered processing the command "
                 "(domain=com.apple.CoreSimulator.SimError, code=404):\n"
                 "Invalid device: U9\n")));

    auto booted = bridge_->boot("U9");
    ASSERT_FALSE(booted.has_value());
    EXPECT_EQ(booted.error().kind, BridgeError::Kind::NotFound);
}

TEST_F(SimctlBridgeTest, Shutdown_OtherFailureIsCommandFailed) {
    EXPECT_CALL(*runner_, run(ElementsAre("/usr/bin/xcrun", "simctl",
                                          "shutdown", "U1"),
                              _))
        .WillOnce(Return(failResult(1, "Unable to shutdown device")));

    auto done = bridge_->shutdown("U1");
    ASSERT_FALSE(done.has_value());
    EXPECT_EQ(done.error().kind, BridgeError::Kind::CommandFailed);
    EXPECT_THAT(done.error().message, HasSubstr("Unable to shutdown device"));
}

TEST_F(SimctlBridgeTest, Timeout_IsCommandFailed) {
    EXPECT_CALL(*runner_, run(_, _)).WillOnce(Return(timedOutResult()));

    auto done = bridge_->boot("U1");
    ASSERT_FALSE(done.has_value());
    EXPECT_EQ(done.error().kind, BridgeError::Kind::CommandFailed);
}

TEST_F(SimctlBridgeTest, GetState_FromList) {
    EXPECT_CALL(*runner_, run(_, _))
        .WillRepeatedly(Return(okResult(kListJson)));

    auto state = bridge_->getState("U1");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(*state, DeviceState::Booted);

    auto missing = bridge_->getState("U2");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, BridgeError::Kind::NotFound);
}

// ========== Capture and input ==========

TEST_F(SimctlBridgeTest, Screenshot_ReportsFileSize) {
    auto path = (std::filesystem::temp_directory_path() /
                 "simdeck_test_simctl_shot.png")
                    .string();
    EXPECT_CALL(*runner_, run(ElementsAre("/usr/bin/xcrun", "simctl", "io",
                                          "U1", "screenshot", "--type=png",
                                          path),
                              _))
        .WillOnce([path](const Argv&, std::chrono::milliseconds) {
            std::ofstream(path, std::ios::binary) << std::string(100, 'x');
            return okResult();
        });

    auto size = bridge_->captureScreenshot("U1", path, ImageFormat::Png);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 100u);
    std::filesystem::remove(path);
}

TEST_F(SimctlBridgeTest, Screenshot_MissingFileIsInvalidOutput) {
    auto path = (std::filesystem::temp_directory_path() /
                 "simdeck_test_never_written.jpeg")
                    .string();
    std::filesystem::remove(path);
    EXPECT_CALL(*runner_, run(_, _)).WillOnce(Return(okResult()));

    auto size = bridge_->captureScreenshot("U1", path, ImageFormat::Jpeg);
    ASSERT_FALSE(size.has_value());
    EXPECT_EQ(size.error().kind, BridgeError::Kind::InvalidOutput);
}

TEST_F(SimctlBridgeTest, Tap_UsesIdb) {
    EXPECT_CALL(*runner_, run(ElementsAre("idb", "ui", "tap", "--udid", "U1",
                                          "100", "200"),
                              _))
        .WillOnce(Return(okResult()));
    EXPECT_TRUE(bridge_->tap("U1", 100, 200).has_value());
}

TEST_F(SimctlBridgeTest, TypeText_PassesTextAsOneArgument) {
    EXPECT_CALL(*runner_, run(ElementsAre("idb", "ui", "text", "--udid", "U1",
                                          "hello 'quoted' world"),
                              _))
        .WillOnce(Return(okResult()));
    EXPECT_TRUE(bridge_->typeText("U1", "hello 'quoted' world").has_value());
}

TEST_F(SimctlBridgeTest, Swipe_DurationInSeconds) {
    EXPECT_CALL(*runner_, run(ElementsAre("idb", "ui", "swipe", "--udid", "U1",
                                          "--duration", "0.250", "10", "20",
                                          "30", "40"),
                              _))
        .WillOnce(Return(okResult()));
    EXPECT_TRUE(bridge_->swipe("U1", {10, 20, 30, 40, 250}).has_value());
}

TEST_F(SimctlBridgeTest, PressButton_Mapping) {
    InSequence seq;
    EXPECT_CALL(*runner_, run(ElementsAre("idb", "ui", "button", "--udid", "U1",
                                          "HOME"),
                              _))
        .WillOnce(Return(okResult()));
    EXPECT_CALL(*runner_, run(ElementsAre("idb", "ui", "button", "--udid", "U1",
                                          "LOCK"),
                              _))
        .WillOnce(Return(okResult()));
    EXPECT_CALL(*runner_,
                run(ElementsAre("idb", "ui", "key", "--udid", "U1", "128"), _))
        .WillOnce(Return(okResult()));
    EXPECT_CALL(*runner_,
                run(ElementsAre("idb", "ui", "key", "--udid", "U1", "129"), _))
        .WillOnce(Return(okResult()));

    EXPECT_TRUE(
        bridge_->pressButton("U1", HardwareButton::Home).has_value());
    EXPECT_TRUE(
        bridge_->pressButton("U1", HardwareButton::Power).has_value());
    EXPECT_TRUE(
        bridge_->pressButton("U1", HardwareButton::VolumeUp).has_value());
    EXPECT_TRUE(
        bridge_->pressButton("U1", HardwareButton::VolumeDown).has_value());
}

TEST_F(SimctlBridgeTest, IdbMissing_IsUnreachable) {
    EXPECT_CALL(*runner_, run(_, _)).WillOnce(Return(launchFailedResult()));

    auto tapped = bridge_->tap("U1", 1, 1);
    ASSERT_FALSE(tapped.has_value());
    EXPECT_EQ(tapped.error().kind, BridgeError::Kind::Unreachable);
    EXPECT_THAT(tapped.error().message, HasSubstr("idb"));
}

// ========== Apps ==========

TEST_F(SimctlBridgeTest, LaunchApp_ParsesPid) {
    EXPECT_CALL(*runner_, run(ElementsAre("/usr/bin/xcrun", "simctl", "launch",
                                          "U1", "com.apple.Preferences"),
                              _))
        .WillOnce(Return(okResult("com.apple.Preferences: 4321\n")));

    auto pid = bridge_->launchApp("U1", "com.apple.Preferences");
    ASSERT_TRUE(pid.has_value());
    EXPECT_EQ(*pid, 4321);
}

TEST_F(SimctlBridgeTest, LaunchApp_UnparseableOutput) {
    EXPECT_CALL(*runner_, run(_, _)).WillOnce(Return(okResult("launched")));

    auto pid = bridge_->launchApp("U1", "com.example.App");
    ASSERT_FALSE(pid.has_value());
    EXPECT_EQ(pid.error().kind, BridgeError::Kind::InvalidOutput);
}

TEST_F(SimctlBridgeTest, TerminateApp_Argv) {
    EXPECT_CALL(*runner_, run(ElementsAre("/usr/bin/xcrun", "simctl",
                                          "terminate", "U1", "com.example.App"),
                              _))
        .WillOnce(Return(okResult()));
    EXPECT_TRUE(bridge_->terminateApp("U1", "com.example.App").has_value());
}

TEST_F(SimctlBridgeTest, InstallApp_ReadsBundleIdThenInstalls) {
    InSequence seq;
    EXPECT_CALL(*runner_, run(ElementsAre("plutil", "-extract",
                                          "CFBundleIdentifier", "raw", "-o",
                                          "-", "/apps/Demo.app/Info.plist"),
                              _))
        .WillOnce(Return(okResult("com.example.Demo\n")));
    EXPECT_CALL(*runner_, run(ElementsAre("/usr/bin/xcrun", "simctl",
                                          "install", "U1", "/apps/Demo.app"),
                              _))
        .WillOnce(Return(okResult()));

    auto bundleId = bridge_->installApp("U1", "/apps/Demo.app");
    ASSERT_TRUE(bundleId.has_value());
    EXPECT_EQ(*bundleId, "com.example.Demo");
}

TEST_F(SimctlBridgeTest, InstallApp_NoPlistIsInvalidOutput) {
    EXPECT_CALL(*runner_, run(ElementsAre("plutil", _, _, _, _, _, _), _))
        .WillOnce(Return(failResult(1, "file does not exist")));

    auto bundleId = bridge_->installApp("U1", "/apps/Missing.app");
    ASSERT_FALSE(bundleId.has_value());
    EXPECT_EQ(bundleId.error().kind, BridgeError::Kind::InvalidOutput);
}

TEST_F(SimctlBridgeTest, ForegroundApp_FromLaunchctl) {
    EXPECT_CALL(*runner_, run(ElementsAre("/usr/bin/xcrun", "simctl", "spawn",
                                          "U1", "launchctl", "list"),
                              _))
        .WillOnce(Return(okResult(
            "77\t0\tUIKitApplication:com.example.App[ab12][rb-legacy]\n")));

    auto app = bridge_->foregroundApp("U1");
    ASSERT_TRUE(app.has_value());
    ASSERT_TRUE(app->has_value());
    EXPECT_EQ((*app)->bundleId, "com.example.App");
    EXPECT_EQ((*app)->pid, 77);
}
