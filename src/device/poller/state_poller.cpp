/*
 * state_poller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "state_poller.hpp"

#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

namespace simdeck::device {

StatePoller::StatePoller(StateFn stateFn, DeviceFn deviceFn,
                         std::chrono::milliseconds interval)
    : stateFn_(std::move(stateFn)),
      deviceFn_(std::move(deviceFn)),
      interval_(interval.count() > 0 ? interval : kDefaultPollInterval) {}

auto StatePoller::pollForState(const std::string& deviceId, DeviceState target,
                               int timeoutSec) -> DeviceResult<PollOutcome> {
    using Clock = std::chrono::steady_clock;

    const auto start = Clock::now();
    const auto deadline = start + std::chrono::seconds(std::max(timeoutSec, 0));
    auto elapsedSince = [&start](Clock::time_point now) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now -
                                                                     start);
    };

    int samples = 0;
    DeviceState last = DeviceState::Shutdown;
    for (;;) {
        auto state = stateFn_(deviceId);
        ++samples;
        if (!state) {
            return std::unexpected(state.error());
        }
        last = *state;
        spdlog::debug("StatePoller: {} is {} (sample {})", deviceId,
                      deviceStateToString(last), samples);

        if (last == target) {
            auto device = deviceFn_(deviceId);
            if (!device) {
                return std::unexpected(device.error());
            }
            return PollOutcome{std::move(*device), elapsedSince(Clock::now()),
                               samples};
        }

        auto now = Clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                  now);
        std::this_thread::sleep_for(std::min(interval_, remaining));
    }

    auto elapsed = elapsedSince(Clock::now());
    spdlog::warn("StatePoller: {} still {} after {}ms (wanted {})", deviceId,
                 deviceStateToString(last), elapsed.count(),
                 deviceStateToString(target));
    return std::unexpected(error::simulatorTimeout(
        deviceId, timeoutSec, static_cast<double>(elapsed.count()) / 1000.0,
        deviceStateToString(target), deviceStateToString(last)));
}

}  // namespace simdeck::device
