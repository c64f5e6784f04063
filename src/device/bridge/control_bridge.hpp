/*
 * control_bridge.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Control bridge abstraction, the only seam between lifecycle
orchestration and the mechanism that actually drives a device

*************************************************/

#ifndef SIMDECK_DEVICE_BRIDGE_CONTROL_BRIDGE_HPP
#define SIMDECK_DEVICE_BRIDGE_CONTROL_BRIDGE_HPP

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "device/types.hpp"

namespace simdeck::device {

/**
 * @brief Opaque execution failure reported by a bridge primitive
 *
 * Callers branch on `kind` only; `message` is for humans and logs.
 */
struct BridgeError {
    enum class Kind {
        NotFound,       ///< The addressed device does not exist
        Unreachable,    ///< The control mechanism itself cannot be reached
        CommandFailed,  ///< The mechanism ran and reported a failure
        InvalidOutput   ///< The mechanism's output could not be understood
    };

    Kind kind{Kind::CommandFailed};
    std::string message;

    [[nodiscard]] static auto notFound(std::string msg) -> BridgeError {
        return {Kind::NotFound, std::move(msg)};
    }
    [[nodiscard]] static auto unreachable(std::string msg) -> BridgeError {
        return {Kind::Unreachable, std::move(msg)};
    }
    [[nodiscard]] static auto commandFailed(std::string msg) -> BridgeError {
        return {Kind::CommandFailed, std::move(msg)};
    }
    [[nodiscard]] static auto invalidOutput(std::string msg) -> BridgeError {
        return {Kind::InvalidOutput, std::move(msg)};
    }
};

template <typename T>
using BridgeResult = std::expected<T, BridgeError>;

/**
 * @brief Primitive operations every control mechanism must provide
 *
 * Implementations: SimctlBridge (local tools), RemoteBridge (simdeck on
 * another host over ssh). Boot and shutdown only need to be *accepted*;
 * completion is observed by sampling getState().
 */
class ControlBridge {
public:
    virtual ~ControlBridge() = default;

    ControlBridge(const ControlBridge&) = delete;
    ControlBridge& operator=(const ControlBridge&) = delete;

    // ==================== Identity ====================

    /**
     * @brief Short name used in logs (e.g. "simctl", "remote:mac-mini")
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    // ==================== Lifecycle ====================

    /**
     * @brief Enumerate devices in the mechanism's native order
     *
     * Unavailable devices may be included; filtering is the caller's job.
     */
    virtual auto listDevices() -> BridgeResult<std::vector<Device>> = 0;

    virtual auto boot(const std::string& udid) -> BridgeResult<void> = 0;

    virtual auto shutdown(const std::string& udid) -> BridgeResult<void> = 0;

    virtual auto getState(const std::string& udid)
        -> BridgeResult<DeviceState> = 0;

    // ==================== Capture and input ====================

    /**
     * @brief Write a screenshot to `path`
     * @return Size of the written file in bytes
     */
    virtual auto captureScreenshot(const std::string& udid,
                                   const std::string& path,
                                   ImageFormat format)
        -> BridgeResult<std::uint64_t> = 0;

    virtual auto tap(const std::string& udid, int x, int y)
        -> BridgeResult<void> = 0;

    virtual auto typeText(const std::string& udid, const std::string& text)
        -> BridgeResult<void> = 0;

    virtual auto swipe(const std::string& udid, const SwipeGesture& gesture)
        -> BridgeResult<void> = 0;

    virtual auto pressButton(const std::string& udid, HardwareButton button)
        -> BridgeResult<void> = 0;

    // ==================== Apps ====================

    /**
     * @return Process id of the launched app
     */
    virtual auto launchApp(const std::string& udid,
                           const std::string& bundleId) -> BridgeResult<int> = 0;

    virtual auto terminateApp(const std::string& udid,
                              const std::string& bundleId)
        -> BridgeResult<void> = 0;

    /**
     * @return Bundle identifier of the installed app
     */
    virtual auto installApp(const std::string& udid,
                            const std::string& appPath)
        -> BridgeResult<std::string> = 0;

    /**
     * @return std::nullopt when no app is in the foreground
     */
    virtual auto foregroundApp(const std::string& udid)
        -> BridgeResult<std::optional<ForegroundApp>> = 0;

protected:
    ControlBridge() = default;
};

}  // namespace simdeck::device

#endif  // SIMDECK_DEVICE_BRIDGE_CONTROL_BRIDGE_HPP
