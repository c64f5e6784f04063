/*
 * simctl_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "simctl_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

#include <spdlog/spdlog.h>

namespace simdeck::device::simctl {

namespace {

constexpr std::string_view kIosPrefix = "iOS-";
constexpr std::string_view kUIKitPrefix = "UIKitApplication:";

auto parseInt(std::string_view text) -> std::optional<int> {
    int value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

auto normalizeOsVersion(std::string_view runtime) -> std::string {
    std::size_t start = 0;
    while (start <= runtime.size()) {
        auto end = runtime.find('.', start);
        if (end == std::string_view::npos) {
            end = runtime.size();
        }
        auto part = runtime.substr(start, end - start);
        if (part.starts_with(kIosPrefix) && part.size() > kIosPrefix.size()) {
            std::string version(part.substr(kIosPrefix.size()));
            std::replace(version.begin(), version.end(), '-', '.');
            if (std::isdigit(static_cast<unsigned char>(version.front()))) {
                return version;
            }
        }
        start = end + 1;
    }
    return "unknown";
}

auto parseDeviceList(std::string_view output)
    -> BridgeResult<std::vector<Device>> {
    json doc;
    try {
        doc = json::parse(output);
    } catch (const json::parse_error& e) {
        return std::unexpected(BridgeError::invalidOutput(
            std::string("Failed to parse simctl output: ") + e.what()));
    }

    if (!doc.is_object() || !doc.contains("devices") ||
        !doc["devices"].is_object()) {
        return std::unexpected(BridgeError::invalidOutput(
            "simctl output has no \"devices\" object"));
    }

    std::vector<Device> devices;
    for (const auto& [runtime, entries] : doc["devices"].items()) {
        if (!entries.is_array()) {
            spdlog::warn("simctl: runtime {} is not a device list, skipping",
                         runtime);
            continue;
        }
        const auto osVersion = normalizeOsVersion(runtime);

        for (const auto& entry : entries) {
            if (!entry.is_object()) {
                continue;
            }
            auto udid = entry.value("udid", "");
            auto stateName = entry.value("state", "");
            auto state = deviceStateFromString(stateName);
            if (udid.empty() || !state) {
                spdlog::warn("simctl: skipping entry (udid='{}', state='{}')",
                             udid, stateName);
                continue;
            }

            Device dev;
            dev.id = udid;
            dev.udid = udid;
            dev.name = entry.value("name", "");
            dev.state = *state;
            dev.type = DeviceType::Simulator;
            dev.osVersion = osVersion;
            dev.available = entry.value("isAvailable", false);
            dev.location = DeviceLocation::Local;
            devices.push_back(std::move(dev));
        }
    }
    return devices;
}

auto parseLaunchPid(std::string_view output) -> std::optional<int> {
    auto colon = output.rfind(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    return parseInt(trim(output.substr(colon + 1)));
}

auto parseForegroundApp(std::string_view output)
    -> std::optional<ForegroundApp> {
    std::istringstream stream{std::string(output)};
    std::string line;
    while (std::getline(stream, line)) {
        std::string_view view(line);
        auto labelPos = view.find(kUIKitPrefix);
        if (labelPos == std::string_view::npos) {
            continue;
        }
        auto firstTab = view.find('\t');
        if (firstTab == std::string_view::npos) {
            continue;
        }
        auto pid = parseInt(trim(view.substr(0, firstTab)));
        if (!pid || *pid <= 0) {
            continue;
        }
        auto label = view.substr(labelPos + kUIKitPrefix.size());
        auto bracket = label.find('[');
        return ForegroundApp{std::string(trim(label.substr(0, bracket))),
                             *pid};
    }
    return std::nullopt;
}

}  // namespace simdeck::device::simctl
