/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device records, lifecycle states and operation results

**************************************************/

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "common/device_error.hpp"

namespace simdeck::device {

/**
 * @brief Lifecycle state reported by the control mechanism
 *
 * Booted and Shutdown are terminal, the rest are transitional.
 */
enum class DeviceState { Creating, Booting, Booted, ShuttingDown, Shutdown };

[[nodiscard]] auto deviceStateToString(DeviceState state) -> std::string;

/**
 * @brief Parse a state name; accepts simctl's "Shutting Down" spelling
 */
[[nodiscard]] auto deviceStateFromString(std::string_view text)
    -> std::optional<DeviceState>;

[[nodiscard]] inline auto isTerminal(DeviceState state) -> bool {
    return state == DeviceState::Booted || state == DeviceState::Shutdown;
}

enum class DeviceType { Simulator, RealDevice };

[[nodiscard]] auto deviceTypeToString(DeviceType type) -> std::string;
[[nodiscard]] auto deviceTypeFromString(std::string_view text)
    -> std::optional<DeviceType>;

enum class DeviceLocation { Local, Remote };

[[nodiscard]] auto deviceLocationToString(DeviceLocation location)
    -> std::string;

/**
 * @brief One controllable unit as returned by discovery
 *
 * `id` and `udid` always carry the same value. Records are snapshots: a
 * fresh one is fetched rather than updating an existing one.
 */
struct Device {
    std::string id;
    std::string name;
    DeviceState state{DeviceState::Shutdown};
    DeviceType type{DeviceType::Simulator};
    std::string osVersion;
    std::string udid;
    bool available{true};
    std::optional<DeviceLocation> location;  ///< Set by the bridge
    std::string remoteHost;                  ///< Only for remote devices

    [[nodiscard]] auto toJson() const -> json;

    /**
     * @throws DeviceException if state or type are not recognised
     */
    static auto fromJson(const json& j) -> Device;

    auto operator==(const Device& other) const -> bool = default;
};

struct BootResult {
    Device device;
    std::int64_t bootTimeMs{0};

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["device"] = device.toJson();
        j["boot_time_ms"] = bootTimeMs;
        return j;
    }

    static auto fromJson(const json& j) -> BootResult {
        BootResult r;
        r.device = Device::fromJson(j.at("device"));
        r.bootTimeMs = j.value("boot_time_ms", std::int64_t{0});
        return r;
    }

    auto operator==(const BootResult& other) const -> bool = default;
};

struct ShutdownResult {
    Device device;
    std::int64_t shutdownTimeMs{0};
    std::string message;

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["device"] = device.toJson();
        j["shutdown_time_ms"] = shutdownTimeMs;
        j["message"] = message;
        return j;
    }

    static auto fromJson(const json& j) -> ShutdownResult {
        ShutdownResult r;
        r.device = Device::fromJson(j.at("device"));
        r.shutdownTimeMs = j.value("shutdown_time_ms", std::int64_t{0});
        r.message = j.value("message", "");
        return r;
    }

    auto operator==(const ShutdownResult& other) const -> bool = default;
};

// ==================== UI and capture ====================

enum class ImageFormat { Png, Jpeg };

[[nodiscard]] auto imageFormatToString(ImageFormat format) -> std::string;
[[nodiscard]] auto imageFormatFromString(std::string_view text)
    -> std::optional<ImageFormat>;

enum class HardwareButton { Home, Power, VolumeUp, VolumeDown };

[[nodiscard]] auto hardwareButtonToString(HardwareButton button)
    -> std::string;

/**
 * @brief Parse a button name (case-insensitive, e.g. "volume_up")
 */
[[nodiscard]] auto hardwareButtonFromString(std::string_view text)
    -> std::optional<HardwareButton>;

struct SwipeGesture {
    int startX{0};
    int startY{0};
    int endX{0};
    int endY{0};
    int durationMs{300};
};

struct ScreenshotResult {
    std::string path;
    ImageFormat format{ImageFormat::Png};
    std::uint64_t sizeBytes{0};
    std::string deviceId;
    std::string timestamp;

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["path"] = path;
        j["format"] = imageFormatToString(format);
        j["size_bytes"] = sizeBytes;
        j["device_id"] = deviceId;
        j["timestamp"] = timestamp;
        return j;
    }
};

struct TapResult {
    std::string deviceId;
    int x{0};
    int y{0};
    std::string timestamp;

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["device_id"] = deviceId;
        j["x"] = x;
        j["y"] = y;
        j["timestamp"] = timestamp;
        return j;
    }
};

struct TextInputResult {
    std::string deviceId;
    std::string text;
    std::string timestamp;

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["device_id"] = deviceId;
        j["text"] = text;
        j["length"] = text.size();
        j["timestamp"] = timestamp;
        return j;
    }
};

struct SwipeResult {
    std::string deviceId;
    SwipeGesture gesture;
    std::string timestamp;

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["device_id"] = deviceId;
        j["start_x"] = gesture.startX;
        j["start_y"] = gesture.startY;
        j["end_x"] = gesture.endX;
        j["end_y"] = gesture.endY;
        j["duration_ms"] = gesture.durationMs;
        j["timestamp"] = timestamp;
        return j;
    }
};

struct ButtonResult {
    std::string deviceId;
    HardwareButton button{HardwareButton::Home};
    std::string timestamp;

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["device_id"] = deviceId;
        j["button"] = hardwareButtonToString(button);
        j["timestamp"] = timestamp;
        return j;
    }
};

// ==================== Apps ====================

struct ForegroundApp {
    std::string bundleId;
    int pid{0};

    [[nodiscard]] auto toJson() const -> json {
        return json{{"bundle_id", bundleId}, {"pid", pid}};
    }

    static auto fromJson(const json& j) -> ForegroundApp {
        return {j.value("bundle_id", ""), j.value("pid", 0)};
    }

    auto operator==(const ForegroundApp& other) const -> bool = default;
};

struct AppLaunchResult {
    Device device;
    std::string bundleId;
    int pid{0};

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["device"] = device.toJson();
        j["bundle_id"] = bundleId;
        j["pid"] = pid;
        j["state"] = "running";
        j["message"] = "App launched successfully";
        return j;
    }
};

struct AppTerminateResult {
    Device device;
    std::string bundleId;

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["device"] = device.toJson();
        j["bundle_id"] = bundleId;
        j["message"] = "App terminated successfully";
        return j;
    }
};

struct AppInstallResult {
    Device device;
    std::string appPath;
    std::string bundleId;
    std::int64_t installTimeMs{0};

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["device"] = device.toJson();
        j["app_path"] = appPath;
        j["bundle_id"] = bundleId;
        j["install_time_ms"] = installTimeMs;
        j["message"] = "App installed successfully";
        return j;
    }
};

/**
 * @brief Everything an agent needs to orient itself on one device
 */
struct DeviceSnapshot {
    Device device;
    std::optional<ForegroundApp> foregroundApp;
    std::optional<ScreenshotResult> screenshot;

    [[nodiscard]] auto toJson() const -> json {
        json j;
        j["device"] = device.toJson();
        j["runtime"] = "iOS " + device.osVersion;
        j["foreground_app"] =
            foregroundApp ? foregroundApp->toJson() : json(nullptr);
        if (screenshot) {
            j["screenshot"] = screenshot->toJson();
        }
        return j;
    }
};

}  // namespace simdeck::device
