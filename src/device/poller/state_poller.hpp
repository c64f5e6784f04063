/*
 * state_poller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Bounded synchronous wait for a device to reach a terminal
lifecycle state

**************************************************/

#ifndef SIMDECK_DEVICE_POLLER_STATE_POLLER_HPP
#define SIMDECK_DEVICE_POLLER_STATE_POLLER_HPP

#include <chrono>
#include <functional>
#include <string>

#include "device/common/device_result.hpp"
#include "device/types.hpp"

namespace simdeck::device {

inline constexpr std::chrono::milliseconds kDefaultPollInterval{500};

/**
 * @brief Outcome of a successful wait
 */
struct PollOutcome {
    Device device;                     ///< Full snapshot re-fetched on success
    std::chrono::milliseconds elapsed{0};
    int samples{0};                    ///< Number of state queries made
};

/**
 * @brief Samples a device's state until it reaches a target or time runs out
 *
 * The loop is single-threaded: query, check the deadline, sleep at most
 * one interval (clamped to what is left of the budget), repeat. The first
 * query happens immediately and one final query happens at the deadline.
 * Expiry only stops the wait; the underlying transition keeps running.
 */
class StatePoller {
public:
    using StateFn =
        std::function<DeviceResult<DeviceState>(const std::string& deviceId)>;
    using DeviceFn =
        std::function<DeviceResult<Device>(const std::string& deviceId)>;

    StatePoller(StateFn stateFn, DeviceFn deviceFn,
                std::chrono::milliseconds interval = kDefaultPollInterval);

    /**
     * @brief Wait for `target`
     * @param timeoutSec Budget in whole seconds; <= 0 samples exactly once
     * @return The device snapshot, a SimulatorTimeout error, or the first
     *         error returned by a state query
     */
    auto pollForState(const std::string& deviceId, DeviceState target,
                      int timeoutSec) -> DeviceResult<PollOutcome>;

    auto pollForBootCompletion(const std::string& deviceId, int timeoutSec)
        -> DeviceResult<PollOutcome> {
        return pollForState(deviceId, DeviceState::Booted, timeoutSec);
    }

    auto pollForShutdownCompletion(const std::string& deviceId, int timeoutSec)
        -> DeviceResult<PollOutcome> {
        return pollForState(deviceId, DeviceState::Shutdown, timeoutSec);
    }

    [[nodiscard]] auto interval() const -> std::chrono::milliseconds {
        return interval_;
    }

private:
    StateFn stateFn_;
    DeviceFn deviceFn_;
    std::chrono::milliseconds interval_;
};

}  // namespace simdeck::device

#endif  // SIMDECK_DEVICE_POLLER_STATE_POLLER_HPP
