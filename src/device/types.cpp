/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <cctype>

#include "common/device_exceptions.hpp"

namespace simdeck::device {

namespace {

auto toUpper(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

}  // namespace

auto deviceStateToString(DeviceState state) -> std::string {
    switch (state) {
        case DeviceState::Creating:
            return "Creating";
        case DeviceState::Booting:
            return "Booting";
        case DeviceState::Booted:
            return "Booted";
        case DeviceState::ShuttingDown:
            return "ShuttingDown";
        case DeviceState::Shutdown:
            return "Shutdown";
    }
    return "Shutdown";
}

auto deviceStateFromString(std::string_view text)
    -> std::optional<DeviceState> {
    if (text == "Creating") return DeviceState::Creating;
    if (text == "Booting") return DeviceState::Booting;
    if (text == "Booted") return DeviceState::Booted;
    if (text == "ShuttingDown" || text == "Shutting Down")
        return DeviceState::ShuttingDown;
    if (text == "Shutdown") return DeviceState::Shutdown;
    return std::nullopt;
}

auto deviceTypeToString(DeviceType type) -> std::string {
    return type == DeviceType::RealDevice ? "physical" : "simulator";
}

auto deviceTypeFromString(std::string_view text) -> std::optional<DeviceType> {
    if (text == "simulator") return DeviceType::Simulator;
    if (text == "physical" || text == "real-device")
        return DeviceType::RealDevice;
    return std::nullopt;
}

auto deviceLocationToString(DeviceLocation location) -> std::string {
    return location == DeviceLocation::Remote ? "remote" : "local";
}

auto Device::toJson() const -> json {
    json j;
    j["id"] = id;
    j["name"] = name;
    j["state"] = deviceStateToString(state);
    j["type"] = deviceTypeToString(type);
    j["os_version"] = osVersion;
    j["udid"] = udid;
    j["available"] = available;
    if (location) {
        j["location"] = deviceLocationToString(*location);
    }
    if (!remoteHost.empty()) {
        j["remote_host"] = remoteHost;
    }
    return j;
}

auto Device::fromJson(const json& j) -> Device {
    Device dev;
    dev.id = j.value("id", "");
    dev.name = j.value("name", "");
    dev.osVersion = j.value("os_version", "");
    dev.udid = j.value("udid", dev.id);
    dev.available = j.value("available", true);

    auto stateName = j.value("state", "");
    auto state = deviceStateFromString(stateName);
    if (!state) {
        throw DeviceException("Unknown device state: " + stateName);
    }
    dev.state = *state;

    auto typeName = j.value("type", "simulator");
    auto type = deviceTypeFromString(typeName);
    if (!type) {
        throw DeviceException("Unknown device type: " + typeName);
    }
    dev.type = *type;

    if (j.contains("location")) {
        dev.location = j["location"].get<std::string>() == "remote"
                           ? DeviceLocation::Remote
                           : DeviceLocation::Local;
    }
    dev.remoteHost = j.value("remote_host", "");
    return dev;
}

auto imageFormatToString(ImageFormat format) -> std::string {
    return format == ImageFormat::Jpeg ? "jpeg" : "png";
}

auto imageFormatFromString(std::string_view text)
    -> std::optional<ImageFormat> {
    if (text == "png") return ImageFormat::Png;
    if (text == "jpeg") return ImageFormat::Jpeg;
    return std::nullopt;
}

auto hardwareButtonToString(HardwareButton button) -> std::string {
    switch (button) {
        case HardwareButton::Home:
            return "HOME";
        case HardwareButton::Power:
            return "POWER";
        case HardwareButton::VolumeUp:
            return "VOLUME_UP";
        case HardwareButton::VolumeDown:
            return "VOLUME_DOWN";
    }
    return "HOME";
}

auto hardwareButtonFromString(std::string_view text)
    -> std::optional<HardwareButton> {
    auto upper = toUpper(text);
    if (upper == "HOME") return HardwareButton::Home;
    if (upper == "POWER") return HardwareButton::Power;
    if (upper == "VOLUME_UP") return HardwareButton::VolumeUp;
    if (upper == "VOLUME_DOWN") return HardwareButton::VolumeDown;
    return std::nullopt;
}

}  // namespace simdeck::device
