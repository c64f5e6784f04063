/*
 * lifecycle_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device Lifecycle Manager implementation

**************************************************/

#include "lifecycle_manager.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

#include "utils/time_utils.hpp"

namespace simdeck::device {

namespace {

using Clock = std::chrono::steady_clock;

auto elapsedMs(Clock::time_point start) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                                 start)
        .count();
}

/**
 * @brief Map a bridge failure on an existing device
 *
 * NotFound and Unreachable keep their own codes; anything else becomes
 * `fallback`.
 */
auto mapBridgeError(const std::string& deviceId, const BridgeError& err,
                    DeviceError fallback) -> DeviceError {
    switch (err.kind) {
        case BridgeError::Kind::NotFound:
            return error::deviceNotFound(deviceId);
        case BridgeError::Kind::Unreachable:
            return error::deviceUnreachable(deviceId, err.message);
        default:
            return fallback;
    }
}

}  // namespace

LifecycleManager::LifecycleManager(std::shared_ptr<ControlBridge> bridge,
                                   LifecycleOptions options)
    : bridge_(bridge), discovery_(std::move(bridge)), options_(options) {
    spdlog::debug("LifecycleManager: using bridge {} (poll every {}ms)",
                  bridge_->name(), options_.pollInterval.count());
}

// ==================== Lookup ====================

auto LifecycleManager::listDevices() const
    -> DeviceResult<std::vector<Device>> {
    return discovery_.listDevices();
}

auto LifecycleManager::getDevice(const std::string& deviceId) const
    -> DeviceResult<Device> {
    auto devices = discovery_.listDevices();
    if (!devices) {
        return std::unexpected(devices.error());
    }
    auto it = std::find_if(devices->begin(), devices->end(),
                           [&](const Device& d) { return d.id == deviceId; });
    if (it == devices->end()) {
        return std::unexpected(error::deviceNotFound(deviceId));
    }
    return std::move(*it);
}

auto LifecycleManager::findDeviceByNameAndOSVersion(
    const std::string& name, const std::string& osVersion) const
    -> DeviceResult<Device> {
    auto devices = discovery_.listDevices();
    if (!devices) {
        return std::unexpected(devices.error());
    }

    std::vector<Device> candidates;
    for (auto& dev : *devices) {
        if (dev.name != name) {
            continue;
        }
        if (!osVersion.empty() && dev.osVersion != osVersion) {
            continue;
        }
        candidates.push_back(std::move(dev));
    }

    if (candidates.empty()) {
        return std::unexpected(error::deviceNotFoundByName(name, osVersion));
    }

    auto booted = std::find_if(
        candidates.begin(), candidates.end(),
        [](const Device& d) { return d.state == DeviceState::Booted; });
    auto& chosen = booted != candidates.end() ? *booted : candidates.front();
    spdlog::debug("LifecycleManager: '{}' matched {} device(s), chose {} ({})",
                  name, candidates.size(), chosen.id,
                  deviceStateToString(chosen.state));
    return std::move(chosen);
}

auto LifecycleManager::getDeviceState(const std::string& deviceId) const
    -> DeviceResult<DeviceState> {
    auto state = bridge_->getState(deviceId);
    if (!state) {
        const auto& err = state.error();
        switch (err.kind) {
            case BridgeError::Kind::NotFound:
                return std::unexpected(error::deviceNotFound(deviceId));
            case BridgeError::Kind::Unreachable:
                return std::unexpected(
                    error::deviceUnreachable(deviceId, err.message));
            default: {
                auto internal = error::internalError(
                    "Failed to read device state: " + err.message);
                internal.details["device_id"] = deviceId;
                return std::unexpected(std::move(internal));
            }
        }
    }
    return *state;
}

auto LifecycleManager::makePoller() const -> StatePoller {
    return StatePoller(
        [this](const std::string& id) { return getDeviceState(id); },
        [this](const std::string& id) { return getDevice(id); },
        options_.pollInterval);
}

// ==================== Lifecycle ====================

auto LifecycleManager::bootSimulator(const std::string& deviceId,
                                     const WaitOptions& options)
    -> DeviceResult<BootResult> {
    auto device = getDevice(deviceId);
    if (!device) {
        return std::unexpected(device.error());
    }
    auto state = getDeviceState(deviceId);
    if (!state) {
        return std::unexpected(state.error());
    }
    if (*state == DeviceState::Booted) {
        spdlog::info("LifecycleManager: {} is already booted", deviceId);
        device->state = DeviceState::Booted;
        return BootResult{std::move(*device), 0};
    }

    const auto start = Clock::now();
    if (auto accepted = bridge_->boot(deviceId); !accepted) {
        spdlog::error("LifecycleManager: boot of {} rejected: {}", deviceId,
                      accepted.error().message);
        if (accepted.error().kind == BridgeError::Kind::NotFound) {
            return std::unexpected(error::deviceNotFound(deviceId));
        }
        return std::unexpected(
            error::bootFailed(deviceId, accepted.error().message));
    }

    if (!options.wait) {
        device->state = DeviceState::Booting;
        return BootResult{std::move(*device), elapsedMs(start)};
    }

    auto outcome = makePoller().pollForBootCompletion(deviceId,
                                                      options.timeoutSec);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    auto bootTime = elapsedMs(start);
    spdlog::info("LifecycleManager: {} booted in {}ms", deviceId, bootTime);
    return BootResult{std::move(outcome->device), bootTime};
}

auto LifecycleManager::shutdownSimulator(const std::string& deviceId,
                                         const WaitOptions& options)
    -> DeviceResult<ShutdownResult> {
    auto device = getDevice(deviceId);
    if (!device) {
        return std::unexpected(device.error());
    }
    auto state = getDeviceState(deviceId);
    if (!state) {
        return std::unexpected(state.error());
    }
    if (*state == DeviceState::Shutdown) {
        spdlog::info("LifecycleManager: {} is already shut down", deviceId);
        device->state = DeviceState::Shutdown;
        return ShutdownResult{std::move(*device), 0,
                              "Simulator is already shut down"};
    }

    const auto start = Clock::now();
    if (auto accepted = bridge_->shutdown(deviceId); !accepted) {
        spdlog::error("LifecycleManager: shutdown of {} rejected: {}",
                      deviceId, accepted.error().message);
        if (accepted.error().kind == BridgeError::Kind::NotFound) {
            return std::unexpected(error::deviceNotFound(deviceId));
        }
        return std::unexpected(
            error::shutdownFailed(deviceId, accepted.error().message));
    }

    if (!options.wait) {
        device->state = DeviceState::ShuttingDown;
        return ShutdownResult{std::move(*device), elapsedMs(start),
                              "Simulator shutdown initiated"};
    }

    auto outcome = makePoller().pollForShutdownCompletion(deviceId,
                                                          options.timeoutSec);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    return ShutdownResult{std::move(outcome->device), elapsedMs(start),
                          "Simulator shutdown successfully"};
}

auto LifecycleManager::requireBooted(const std::string& deviceId) const
    -> DeviceResult<Device> {
    auto device = getDevice(deviceId);
    if (!device) {
        return std::unexpected(device.error());
    }
    if (device->state != DeviceState::Booted) {
        return std::unexpected(error::deviceNotBooted(
            deviceId, deviceStateToString(device->state)));
    }
    return device;
}

// ==================== Capture and input ====================

auto LifecycleManager::captureScreenshot(const std::string& deviceId,
                                         const std::string& path,
                                         ImageFormat format)
    -> DeviceResult<ScreenshotResult> {
    if (path.empty()) {
        return std::unexpected(error::pathError(path, "empty output path"));
    }
    auto device = requireBooted(deviceId);
    if (!device) {
        return std::unexpected(device.error());
    }

    auto size = bridge_->captureScreenshot(device->udid, path, format);
    if (!size) {
        return std::unexpected(mapBridgeError(
            deviceId, size.error(),
            error::screenshotFailed(deviceId, size.error().message)));
    }
    return ScreenshotResult{path, format, *size, deviceId,
                            utils::nowRfc3339()};
}

auto LifecycleManager::tap(const std::string& deviceId, int x, int y)
    -> DeviceResult<TapResult> {
    if (x < 0 || y < 0) {
        return std::unexpected(error::invalidCoordinates(
            std::format("Coordinates must be non-negative: x={}, y={}", x, y),
            {{"x", x}, {"y", y}}));
    }
    auto device = requireBooted(deviceId);
    if (!device) {
        return std::unexpected(device.error());
    }
    if (auto done = bridge_->tap(device->udid, x, y); !done) {
        return std::unexpected(
            mapBridgeError(deviceId, done.error(),
                           error::uiActionFailed("tap", done.error().message,
                                                 {{"x", x}, {"y", y}})));
    }
    return TapResult{deviceId, x, y, utils::nowRfc3339()};
}

auto LifecycleManager::typeText(const std::string& deviceId,
                                const std::string& text)
    -> DeviceResult<TextInputResult> {
    if (text.empty()) {
        return std::unexpected(error::textRequired());
    }
    auto device = requireBooted(deviceId);
    if (!device) {
        return std::unexpected(device.error());
    }
    if (auto done = bridge_->typeText(device->udid, text); !done) {
        return std::unexpected(mapBridgeError(
            deviceId, done.error(),
            error::uiActionFailed("text", done.error().message)));
    }
    return TextInputResult{deviceId, text, utils::nowRfc3339()};
}

auto LifecycleManager::swipe(const std::string& deviceId,
                             const SwipeGesture& gesture)
    -> DeviceResult<SwipeResult> {
    if (gesture.startX < 0 || gesture.startY < 0 || gesture.endX < 0 ||
        gesture.endY < 0) {
        return std::unexpected(error::invalidCoordinates(
            std::format("Coordinates must be non-negative: start=({}, {}), "
                        "end=({}, {})",
                        gesture.startX, gesture.startY, gesture.endX,
                        gesture.endY),
            {{"start_x", gesture.startX},
             {"start_y", gesture.startY},
             {"end_x", gesture.endX},
             {"end_y", gesture.endY}}));
    }
    if (gesture.durationMs <= 0) {
        return std::unexpected(error::invalidCoordinates(
            std::format("Duration must be positive: {}ms", gesture.durationMs),
            {{"duration_ms", gesture.durationMs}}));
    }
    auto device = requireBooted(deviceId);
    if (!device) {
        return std::unexpected(device.error());
    }
    if (auto done = bridge_->swipe(device->udid, gesture); !done) {
        return std::unexpected(mapBridgeError(
            deviceId, done.error(),
            error::uiActionFailed("swipe", done.error().message)));
    }
    return SwipeResult{deviceId, gesture, utils::nowRfc3339()};
}

auto LifecycleManager::pressButton(const std::string& deviceId,
                                   HardwareButton button)
    -> DeviceResult<ButtonResult> {
    auto device = requireBooted(deviceId);
    if (!device) {
        return std::unexpected(device.error());
    }
    if (auto done = bridge_->pressButton(device->udid, button); !done) {
        return std::unexpected(mapBridgeError(
            deviceId, done.error(),
            error::uiActionFailed(
                "button", done.error().message,
                {{"button", hardwareButtonToString(button)}})));
    }
    return ButtonResult{deviceId, button, utils::nowRfc3339()};
}

// ==================== Apps ====================

auto LifecycleManager::launchApp(const std::string& deviceId,
                                 const std::string& bundleId)
    -> DeviceResult<AppLaunchResult> {
    if (bundleId.empty()) {
        return std::unexpected(error::appNotFound("no bundle id given"));
    }
    auto device = requireBooted(deviceId);
    if (!device) {
        return std::unexpected(device.error());
    }
    auto pid = bridge_->launchApp(device->udid, bundleId);
    if (!pid) {
        return std::unexpected(mapBridgeError(
            deviceId, pid.error(),
            error::appLaunchFailed(bundleId, pid.error().message)));
    }
    spdlog::info("LifecycleManager: launched {} on {} (pid {})", bundleId,
                 deviceId, *pid);
    return AppLaunchResult{std::move(*device), bundleId, *pid};
}

auto LifecycleManager::terminateApp(const std::string& deviceId,
                                    const std::string& bundleId)
    -> DeviceResult<AppTerminateResult> {
    if (bundleId.empty()) {
        return std::unexpected(error::appNotFound("no bundle id given"));
    }
    auto device = getDevice(deviceId);
    if (!device) {
        return std::unexpected(device.error());
    }
    if (auto done = bridge_->terminateApp(device->udid, bundleId); !done) {
        return std::unexpected(mapBridgeError(
            deviceId, done.error(),
            error::appTerminateFailed(bundleId, done.error().message)));
    }
    return AppTerminateResult{std::move(*device), bundleId};
}

auto LifecycleManager::installApp(const std::string& deviceId,
                                  const std::string& appPath)
    -> DeviceResult<AppInstallResult> {
    if (appPath.empty()) {
        return std::unexpected(error::appNotFound("no app path given"));
    }
    auto device = getDevice(deviceId);
    if (!device) {
        return std::unexpected(device.error());
    }

    const auto start = Clock::now();
    auto bundleId = bridge_->installApp(device->udid, appPath);
    if (!bundleId) {
        const auto& err = bundleId.error();
        if (err.kind == BridgeError::Kind::InvalidOutput) {
            auto notFound = error::appNotFound(appPath);
            notFound.details["reason"] = err.message;
            return std::unexpected(std::move(notFound));
        }
        auto internal = error::internalError("Failed to install " + appPath +
                                             ": " + err.message);
        internal.details["app_path"] = appPath;
        return std::unexpected(mapBridgeError(deviceId, err, internal));
    }
    return AppInstallResult{std::move(*device), appPath, *bundleId,
                            elapsedMs(start)};
}

auto LifecycleManager::getSnapshot(const std::string& deviceId,
                                   const std::string& screenshotPath)
    -> DeviceResult<DeviceSnapshot> {
    auto device = getDevice(deviceId);
    if (!device) {
        return std::unexpected(device.error());
    }

    DeviceSnapshot snapshot;
    snapshot.device = *device;
    if (device->state != DeviceState::Booted) {
        if (!screenshotPath.empty()) {
            return std::unexpected(error::deviceNotBooted(
                deviceId, deviceStateToString(device->state)));
        }
        return snapshot;
    }

    auto app = bridge_->foregroundApp(device->udid);
    if (app) {
        snapshot.foregroundApp = *app;
    } else {
        spdlog::warn("LifecycleManager: no foreground app for {}: {}",
                     deviceId, app.error().message);
    }

    if (!screenshotPath.empty()) {
        auto shot = bridge_->captureScreenshot(device->udid, screenshotPath,
                                               ImageFormat::Png);
        if (shot) {
            snapshot.screenshot =
                ScreenshotResult{screenshotPath, ImageFormat::Png, *shot,
                                 deviceId, utils::nowRfc3339()};
        } else {
            spdlog::warn("LifecycleManager: screenshot of {} failed: {}",
                         deviceId, shot.error().message);
        }
    }
    return snapshot;
}

}  // namespace simdeck::device
