/*
 * device_discovery.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device discovery over a control bridge

**************************************************/

#ifndef SIMDECK_DEVICE_DISCOVERY_DEVICE_DISCOVERY_HPP
#define SIMDECK_DEVICE_DISCOVERY_DEVICE_DISCOVERY_HPP

#include <memory>
#include <vector>

#include "device/bridge/control_bridge.hpp"
#include "device/common/device_result.hpp"

namespace simdeck::device {

/**
 * @brief Produces the validated roster of usable devices
 *
 * Every call asks the bridge afresh; nothing is cached. Devices flagged
 * unavailable are dropped here so no consumer has to filter again.
 * Read-only, so concurrent calls are safe whenever the bridge's are.
 */
class DeviceDiscovery {
public:
    explicit DeviceDiscovery(std::shared_ptr<ControlBridge> bridge);

    /**
     * @brief List usable devices in the bridge's native order
     * @return Devices with available == true, or DeviceDiscoveryFailed
     */
    [[nodiscard]] auto listDevices() const
        -> DeviceResult<std::vector<Device>>;

private:
    std::shared_ptr<ControlBridge> bridge_;
};

}  // namespace simdeck::device

#endif  // SIMDECK_DEVICE_DISCOVERY_DEVICE_DISCOVERY_HPP
