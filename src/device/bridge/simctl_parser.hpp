/*
 * simctl_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Parsers for the output of xcrun simctl and launchctl

**************************************************/

#ifndef SIMDECK_DEVICE_BRIDGE_SIMCTL_PARSER_HPP
#define SIMDECK_DEVICE_BRIDGE_SIMCTL_PARSER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "control_bridge.hpp"

namespace simdeck::device::simctl {

/**
 * @brief Turn a CoreSimulator runtime identifier into a dotted version
 *
 * "com.apple.CoreSimulator.SimRuntime.iOS-17-4" becomes "17.4". Anything
 * without an "iOS-<digits>" component yields "unknown".
 */
[[nodiscard]] auto normalizeOsVersion(std::string_view runtime) -> std::string;

/**
 * @brief Parse `xcrun simctl list devices --json`
 *
 * Devices are returned in document order, runtime by runtime, including
 * those flagged unavailable. Entries without a udid or with an unknown
 * state are skipped with a warning.
 */
[[nodiscard]] auto parseDeviceList(std::string_view output)
    -> BridgeResult<std::vector<Device>>;

/**
 * @brief Parse the pid out of `simctl launch` output ("<bundle>: <pid>")
 */
[[nodiscard]] auto parseLaunchPid(std::string_view output)
    -> std::optional<int>;

/**
 * @brief Find the running UIKit application in `launchctl list` output
 *
 * Lines look like "1234\t0\tUIKitApplication:com.apple.Preferences[a1b2][rb-legacy]".
 * Lines with "-" in the pid column are not running.
 */
[[nodiscard]] auto parseForegroundApp(std::string_view output)
    -> std::optional<ForegroundApp>;

}  // namespace simdeck::device::simctl

#endif  // SIMDECK_DEVICE_BRIDGE_SIMCTL_PARSER_HPP
