/*
 * lifecycle_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device Lifecycle Manager - lookup, boot/shutdown and device
operations on top of discovery and a control bridge

**************************************************/

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "device/bridge/control_bridge.hpp"
#include "device/common/device_result.hpp"
#include "device/discovery/device_discovery.hpp"
#include "device/poller/state_poller.hpp"
#include "device/types.hpp"

namespace simdeck::device {

/**
 * @brief How boot/shutdown should wait for the terminal state
 */
struct WaitOptions {
    bool wait{true};       ///< false returns as soon as the bridge accepts
    int timeoutSec{60};    ///< Whole seconds, only used when waiting
};

struct LifecycleOptions {
    std::chrono::milliseconds pollInterval{kDefaultPollInterval};
};

/**
 * @class LifecycleManager
 * @brief Resolves devices and drives their lifecycle.
 *
 * The manager is responsible for:
 * - Exact lookup by id and name/OS-version lookup with a booted-first
 *   tie-break
 * - Idempotent boot and shutdown (state is checked before the bridge is
 *   asked to do anything)
 * - Turning the bridge's fire-and-forget transitions into bounded waits
 * - Mapping every bridge failure onto a DeviceErrorCode
 *
 * Every operation re-runs discovery; the manager keeps no device state and
 * holds no locks. Two processes booting the same device may race.
 */
class LifecycleManager {
public:
    explicit LifecycleManager(std::shared_ptr<ControlBridge> bridge,
                              LifecycleOptions options = {});

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    // ==================== Lookup ====================

    [[nodiscard]] auto listDevices() const
        -> DeviceResult<std::vector<Device>>;

    /**
     * @brief Exact match on id (== udid)
     * @return DeviceNotFound with details.device_id when absent
     */
    [[nodiscard]] auto getDevice(const std::string& deviceId) const
        -> DeviceResult<Device>;

    /**
     * @brief Find a device by name and, if non-empty, OS version
     *
     * When several match, the first Booted one wins; otherwise the first in
     * discovery order.
     * @return DeviceNotFound with details.name and details.os_version
     */
    [[nodiscard]] auto findDeviceByNameAndOSVersion(
        const std::string& name, const std::string& osVersion) const
        -> DeviceResult<Device>;

    /**
     * @brief One bridge query for the current state
     */
    [[nodiscard]] auto getDeviceState(const std::string& deviceId) const
        -> DeviceResult<DeviceState>;

    // ==================== Lifecycle ====================

    /**
     * @brief Boot a simulator; a no-op returning boot_time_ms == 0 if it is
     * already Booted
     */
    auto bootSimulator(const std::string& deviceId,
                       const WaitOptions& options = {})
        -> DeviceResult<BootResult>;

    /**
     * @brief Shut a simulator down; a no-op if it is already Shutdown
     */
    auto shutdownSimulator(const std::string& deviceId,
                           const WaitOptions& options = {})
        -> DeviceResult<ShutdownResult>;

    // ==================== Capture and input ====================

    auto captureScreenshot(const std::string& deviceId,
                           const std::string& path, ImageFormat format)
        -> DeviceResult<ScreenshotResult>;

    auto tap(const std::string& deviceId, int x, int y)
        -> DeviceResult<TapResult>;

    auto typeText(const std::string& deviceId, const std::string& text)
        -> DeviceResult<TextInputResult>;

    auto swipe(const std::string& deviceId, const SwipeGesture& gesture)
        -> DeviceResult<SwipeResult>;

    auto pressButton(const std::string& deviceId, HardwareButton button)
        -> DeviceResult<ButtonResult>;

    // ==================== Apps ====================

    auto launchApp(const std::string& deviceId, const std::string& bundleId)
        -> DeviceResult<AppLaunchResult>;

    auto terminateApp(const std::string& deviceId,
                      const std::string& bundleId)
        -> DeviceResult<AppTerminateResult>;

    auto installApp(const std::string& deviceId, const std::string& appPath)
        -> DeviceResult<AppInstallResult>;

    /**
     * @brief Device record plus foreground app and optional screenshot
     *
     * Foreground app and screenshot are best effort on a booted device;
     * asking for a screenshot of a device that is not booted fails with
     * DeviceNotBooted.
     */
    auto getSnapshot(const std::string& deviceId,
                     const std::string& screenshotPath = "")
        -> DeviceResult<DeviceSnapshot>;

private:
    [[nodiscard]] auto requireBooted(const std::string& deviceId) const
        -> DeviceResult<Device>;

    [[nodiscard]] auto makePoller() const -> StatePoller;

    std::shared_ptr<ControlBridge> bridge_;
    DeviceDiscovery discovery_;
    LifecycleOptions options_;
};

}  // namespace simdeck::device
