/*
 * device_error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Closed set of device error codes and the error record that is
reported to callers

**************************************************/

#ifndef SIMDECK_DEVICE_COMMON_DEVICE_ERROR_HPP
#define SIMDECK_DEVICE_COMMON_DEVICE_ERROR_HPP

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace simdeck::device {

/// Insertion-ordered so that output keys keep the order they were written in
using json = nlohmann::ordered_json;

/**
 * @brief Error codes reported by every simdeck operation
 *
 * The set is closed: every failure is mapped onto exactly one of these
 * before it leaves the command layer.
 */
enum class DeviceErrorCode {
    DeviceNotFound,
    DeviceUnreachable,
    DeviceNotBooted,
    DeviceRequired,
    AppNotFound,
    AppLaunchFailed,
    AppTerminateFailed,
    UIActionFailed,
    InvalidCoordinates,
    TextRequired,
    SimulatorTimeout,
    BootFailed,
    ShutdownFailed,
    ScreenshotFailed,
    InvalidFormat,
    PathError,
    DeviceDiscoveryFailed,
    InternalError
};

/**
 * @brief Convert error code to its wire name (e.g. "DEVICE_NOT_FOUND")
 */
[[nodiscard]] inline auto deviceErrorCodeToString(DeviceErrorCode code)
    -> std::string {
    switch (code) {
        case DeviceErrorCode::DeviceNotFound:
            return "DEVICE_NOT_FOUND";
        case DeviceErrorCode::DeviceUnreachable:
            return "DEVICE_UNREACHABLE";
        case DeviceErrorCode::DeviceNotBooted:
            return "DEVICE_NOT_BOOTED";
        case DeviceErrorCode::DeviceRequired:
            return "DEVICE_REQUIRED";
        case DeviceErrorCode::AppNotFound:
            return "APP_NOT_FOUND";
        case DeviceErrorCode::AppLaunchFailed:
            return "APP_LAUNCH_FAILED";
        case DeviceErrorCode::AppTerminateFailed:
            return "APP_TERMINATE_FAILED";
        case DeviceErrorCode::UIActionFailed:
            return "UI_ACTION_FAILED";
        case DeviceErrorCode::InvalidCoordinates:
            return "INVALID_COORDINATES";
        case DeviceErrorCode::TextRequired:
            return "TEXT_REQUIRED";
        case DeviceErrorCode::SimulatorTimeout:
            return "SIMULATOR_TIMEOUT";
        case DeviceErrorCode::BootFailed:
            return "BOOT_FAILED";
        case DeviceErrorCode::ShutdownFailed:
            return "SHUTDOWN_FAILED";
        case DeviceErrorCode::ScreenshotFailed:
            return "SCREENSHOT_FAILED";
        case DeviceErrorCode::InvalidFormat:
            return "INVALID_FORMAT";
        case DeviceErrorCode::PathError:
            return "PATH_ERROR";
        case DeviceErrorCode::DeviceDiscoveryFailed:
            return "DEVICE_DISCOVERY_FAILED";
        case DeviceErrorCode::InternalError:
            return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

/**
 * @brief Parse a wire name back into an error code
 * @return std::nullopt if the name is not part of the closed set
 */
[[nodiscard]] inline auto deviceErrorCodeFromString(std::string_view name)
    -> std::optional<DeviceErrorCode> {
    static constexpr DeviceErrorCode kAll[] = {
        DeviceErrorCode::DeviceNotFound,
        DeviceErrorCode::DeviceUnreachable,
        DeviceErrorCode::DeviceNotBooted,
        DeviceErrorCode::DeviceRequired,
        DeviceErrorCode::AppNotFound,
        DeviceErrorCode::AppLaunchFailed,
        DeviceErrorCode::AppTerminateFailed,
        DeviceErrorCode::UIActionFailed,
        DeviceErrorCode::InvalidCoordinates,
        DeviceErrorCode::TextRequired,
        DeviceErrorCode::SimulatorTimeout,
        DeviceErrorCode::BootFailed,
        DeviceErrorCode::ShutdownFailed,
        DeviceErrorCode::ScreenshotFailed,
        DeviceErrorCode::InvalidFormat,
        DeviceErrorCode::PathError,
        DeviceErrorCode::DeviceDiscoveryFailed,
        DeviceErrorCode::InternalError};
    for (auto code : kAll) {
        if (deviceErrorCodeToString(code) == name) {
            return code;
        }
    }
    return std::nullopt;
}

/**
 * @brief Device error structure with detailed information
 *
 * Created exactly where a failure is detected and never mutated after it
 * has been handed to a caller.
 */
struct DeviceError {
    DeviceErrorCode code{DeviceErrorCode::InternalError};
    std::string message;
    json details = json::object();

    DeviceError() = default;

    explicit DeviceError(DeviceErrorCode errorCode,
                         std::string errorMessage = "",
                         json errorDetails = json::object())
        : code(errorCode),
          message(std::move(errorMessage)),
          details(std::move(errorDetails)) {}

    /**
     * @brief Get formatted error string
     */
    [[nodiscard]] auto toString() const -> std::string {
        std::string result =
            "[" + deviceErrorCodeToString(code) + "] " + message;
        if (!details.empty()) {
            result += " " + details.dump(-1, ' ', false,
                                         json::error_handler_t::replace);
        }
        return result;
    }

    /**
     * @brief Convert to the "error" member of the result envelope
     *
     * `details` is omitted when empty.
     */
    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["code"] = deviceErrorCodeToString(code);
        j["message"] = message;
        if (!details.empty()) {
            j["details"] = details;
        }
        return j;
    }

    /**
     * @brief Create from JSON; unknown codes become InternalError
     */
    static auto fromJson(const json& j) -> DeviceError {
        DeviceError err;
        err.code = deviceErrorCodeFromString(j.value("code", ""))
                       .value_or(DeviceErrorCode::InternalError);
        err.message = j.value("message", "");
        if (j.contains("details") && j["details"].is_object()) {
            err.details = j["details"];
        }
        return err;
    }

    auto operator==(const DeviceError& other) const -> bool = default;
};

// Convenient factory functions
namespace error {

inline auto deviceNotFound(const std::string& deviceId) -> DeviceError {
    return DeviceError(DeviceErrorCode::DeviceNotFound,
                       "Device not found: " + deviceId,
                       {{"device_id", deviceId}});
}

inline auto deviceNotFoundByName(const std::string& name,
                                 const std::string& osVersion) -> DeviceError {
    std::string msg = "No device named '" + name + "'";
    if (!osVersion.empty()) {
        msg += " with OS version " + osVersion;
    }
    return DeviceError(DeviceErrorCode::DeviceNotFound, msg,
                       {{"name", name}, {"os_version", osVersion}});
}

inline auto deviceUnreachable(const std::string& deviceId,
                              const std::string& reason) -> DeviceError {
    return DeviceError(DeviceErrorCode::DeviceUnreachable,
                       "Device unreachable: " + reason,
                       {{"device_id", deviceId}});
}

inline auto deviceNotBooted(const std::string& deviceId,
                            const std::string& state) -> DeviceError {
    return DeviceError(DeviceErrorCode::DeviceNotBooted,
                       "Device is not booted (current state: " + state + ")",
                       {{"device_id", deviceId}, {"state", state}});
}

inline auto deviceRequired() -> DeviceError {
    return DeviceError(DeviceErrorCode::DeviceRequired,
                       "A device must be specified with --device");
}

inline auto bootFailed(const std::string& deviceId, const std::string& reason)
    -> DeviceError {
    return DeviceError(DeviceErrorCode::BootFailed,
                       "Failed to boot simulator: " + reason,
                       {{"device_id", deviceId}, {"reason", reason}});
}

inline auto shutdownFailed(const std::string& deviceId,
                           const std::string& reason) -> DeviceError {
    return DeviceError(DeviceErrorCode::ShutdownFailed,
                       "Failed to shut down simulator: " + reason,
                       {{"device_id", deviceId}, {"reason", reason}});
}

/**
 * @brief The wait for a terminal state ran out of time
 *
 * Carries both the budget and the time actually spent so a caller can
 * decide whether to retry with a longer timeout.
 */
inline auto simulatorTimeout(const std::string& deviceId, int timeoutSec,
                             double elapsedSec, const std::string& targetState,
                             const std::string& lastState) -> DeviceError {
    return DeviceError(DeviceErrorCode::SimulatorTimeout,
                       "Device " + deviceId + " did not reach " +
                           targetState + " within " +
                           std::to_string(timeoutSec) + "s",
                       {{"device_id", deviceId},
                        {"timeout_sec", timeoutSec},
                        {"elapsed_sec", elapsedSec},
                        {"target_state", targetState},
                        {"last_state", lastState}});
}

inline auto discoveryFailed(const std::string& reason) -> DeviceError {
    return DeviceError(DeviceErrorCode::DeviceDiscoveryFailed,
                       "Device discovery failed: " + reason);
}

inline auto invalidCoordinates(const std::string& msg,
                               json details) -> DeviceError {
    return DeviceError(DeviceErrorCode::InvalidCoordinates, msg,
                       std::move(details));
}

inline auto textRequired() -> DeviceError {
    return DeviceError(DeviceErrorCode::TextRequired,
                       "Text to type must not be empty");
}

inline auto uiActionFailed(const std::string& action,
                           const std::string& reason,
                           json details = json::object())
    -> DeviceError {
    details["action"] = action;
    return DeviceError(DeviceErrorCode::UIActionFailed,
                       action + " failed: " + reason, std::move(details));
}

inline auto screenshotFailed(const std::string& deviceId,
                             const std::string& reason) -> DeviceError {
    return DeviceError(DeviceErrorCode::ScreenshotFailed,
                       "Failed to capture screenshot: " + reason,
                       {{"device_id", deviceId}});
}

inline auto invalidFormat(const std::string& format) -> DeviceError {
    return DeviceError(DeviceErrorCode::InvalidFormat,
                       "Unsupported image format: " + format,
                       {{"format", format},
                        {"supported", json::array({"png", "jpeg"})}});
}

inline auto pathError(const std::string& path, const std::string& reason)
    -> DeviceError {
    return DeviceError(DeviceErrorCode::PathError,
                       "Invalid output path: " + reason, {{"path", path}});
}

inline auto appNotFound(const std::string& what) -> DeviceError {
    return DeviceError(DeviceErrorCode::AppNotFound, "App not found: " + what,
                       {{"app", what}});
}

inline auto appLaunchFailed(const std::string& bundleId,
                            const std::string& reason) -> DeviceError {
    return DeviceError(DeviceErrorCode::AppLaunchFailed,
                       "Failed to launch " + bundleId + ": " + reason,
                       {{"bundle_id", bundleId}});
}

inline auto appTerminateFailed(const std::string& bundleId,
                               const std::string& reason) -> DeviceError {
    return DeviceError(DeviceErrorCode::AppTerminateFailed,
                       "Failed to terminate " + bundleId + ": " + reason,
                       {{"bundle_id", bundleId}});
}

inline auto internalError(const std::string& msg) -> DeviceError {
    return DeviceError(DeviceErrorCode::InternalError, msg);
}

}  // namespace error

}  // namespace simdeck::device

#endif  // SIMDECK_DEVICE_COMMON_DEVICE_ERROR_HPP
