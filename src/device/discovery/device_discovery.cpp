/*
 * device_discovery.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_discovery.hpp"

#include <spdlog/spdlog.h>

namespace simdeck::device {

DeviceDiscovery::DeviceDiscovery(std::shared_ptr<ControlBridge> bridge)
    : bridge_(std::move(bridge)) {}

auto DeviceDiscovery::listDevices() const
    -> DeviceResult<std::vector<Device>> {
    auto raw = bridge_->listDevices();
    if (!raw) {
        spdlog::error("DeviceDiscovery: {} failed: {}", bridge_->name(),
                      raw.error().message);
        auto err = error::discoveryFailed(raw.error().message);
        err.details["bridge"] = bridge_->name();
        return std::unexpected(std::move(err));
    }

    std::vector<Device> devices;
    devices.reserve(raw->size());
    std::size_t unavailable = 0;
    for (auto& dev : *raw) {
        if (dev.id.empty()) {
            dev.id = dev.udid;
        }
        if (dev.udid.empty()) {
            dev.udid = dev.id;
        }
        if (dev.id.empty() || dev.name.empty()) {
            spdlog::warn("DeviceDiscovery: dropping record without id/name");
            continue;
        }
        if (!dev.available) {
            ++unavailable;
            continue;
        }
        devices.push_back(std::move(dev));
    }

    spdlog::debug("DeviceDiscovery: {} usable devices ({} unavailable)",
                  devices.size(), unavailable);
    return devices;
}

}  // namespace simdeck::device
