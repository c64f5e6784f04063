/*
 * simctl_bridge.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Control bridge backed by the local xcrun simctl, idb and plutil
tools

**************************************************/

#ifndef SIMDECK_DEVICE_BRIDGE_SIMCTL_BRIDGE_HPP
#define SIMDECK_DEVICE_BRIDGE_SIMCTL_BRIDGE_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "control_bridge.hpp"
#include "utils/process/process_runner.hpp"

namespace simdeck::device {

/**
 * @brief Tool locations and limits for SimctlBridge
 */
struct SimctlBridgeOptions {
    std::string xcrunPath{"xcrun"};
    std::string idbPath{"idb"};
    std::string plutilPath{"plutil"};
    std::chrono::milliseconds commandTimeout{std::chrono::seconds{120}};
};

/**
 * @brief Drives local simulators by spawning one tool process per call
 *
 * Lifecycle, screenshots and apps go through `xcrun simctl`; touch, text
 * and hardware buttons go through `idb ui`.
 */
class SimctlBridge : public ControlBridge {
public:
    SimctlBridge(std::shared_ptr<utils::CommandRunner> runner,
                 SimctlBridgeOptions options = {});

    [[nodiscard]] auto name() const -> std::string override;

    auto listDevices() -> BridgeResult<std::vector<Device>> override;
    auto boot(const std::string& udid) -> BridgeResult<void> override;
    auto shutdown(const std::string& udid) -> BridgeResult<void> override;
    auto getState(const std::string& udid)
        -> BridgeResult<DeviceState> override;

    auto captureScreenshot(const std::string& udid, const std::string& path,
                           ImageFormat format)
        -> BridgeResult<std::uint64_t> override;
    auto tap(const std::string& udid, int x, int y)
        -> BridgeResult<void> override;
    auto typeText(const std::string& udid, const std::string& text)
        -> BridgeResult<void> override;
    auto swipe(const std::string& udid, const SwipeGesture& gesture)
        -> BridgeResult<void> override;
    auto pressButton(const std::string& udid, HardwareButton button)
        -> BridgeResult<void> override;

    auto launchApp(const std::string& udid, const std::string& bundleId)
        -> BridgeResult<int> override;
    auto terminateApp(const std::string& udid, const std::string& bundleId)
        -> BridgeResult<void> override;
    auto installApp(const std::string& udid, const std::string& appPath)
        -> BridgeResult<std::string> override;
    auto foregroundApp(const std::string& udid)
        -> BridgeResult<std::optional<ForegroundApp>> override;

private:
    auto runSimctl(std::vector<std::string> args)
        -> BridgeResult<utils::CommandResult>;
    auto runIdb(const std::string& udid, std::vector<std::string> args)
        -> BridgeResult<void>;
    auto run(std::vector<std::string> argv)
        -> BridgeResult<utils::CommandResult>;

    std::shared_ptr<utils::CommandRunner> runner_;
    SimctlBridgeOptions options_;
};

}  // namespace simdeck::device

#endif  // SIMDECK_DEVICE_BRIDGE_SIMCTL_BRIDGE_HPP
