/*
 * simctl_bridge.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "simctl_bridge.hpp"

#include <filesystem>
#include <format>

#include <spdlog/spdlog.h>

#include "simctl_parser.hpp"

namespace simdeck::device {

namespace {

// HID keyboard usage codes understood by `idb ui key`
constexpr int kHidVolumeUp = 128;
constexpr int kHidVolumeDown = 129;

auto describeFailure(const std::string& tool,
                     const utils::CommandResult& result) -> std::string {
    std::string detail = result.errorOutput.empty() ? result.output
                                                    : result.errorOutput;
    while (!detail.empty() &&
           (detail.back() == '\n' || detail.back() == ' ')) {
        detail.pop_back();
    }
    return std::format("{} exited with code {}{}{}", tool, result.exitCode,
                       detail.empty() ? "" : ": ", detail);
}

auto isInvalidDevice(const utils::CommandResult& result) -> bool {
    return result.errorOutput.find("Invalid device") != std::string::npos;
}

}  // namespace

SimctlBridge::SimctlBridge(std::shared_ptr<utils::CommandRunner> runner,
                           SimctlBridgeOptions options)
    : runner_(std::move(runner)), options_(std::move(options)) {}

auto SimctlBridge::name() const -> std::string { return "simctl"; }

auto SimctlBridge::run(std::vector<std::string> argv)
    -> BridgeResult<utils::CommandResult> {
    const auto tool = argv.front();
    auto result = runner_->run(argv, options_.commandTimeout);
    if (result.launchFailed) {
        return std::unexpected(BridgeError::unreachable(
            std::format("{} could not be started: {}", tool,
                        result.errorOutput)));
    }
    if (result.timedOut) {
        return std::unexpected(BridgeError::commandFailed(std::format(
            "{} did not finish within {}ms", tool,
            options_.commandTimeout.count())));
    }
    if (result.exitCode != 0) {
        if (isInvalidDevice(result)) {
            return std::unexpected(
                BridgeError::notFound(describeFailure(tool, result)));
        }
        return std::unexpected(
            BridgeError::commandFailed(describeFailure(tool, result)));
    }
    return result;
}

auto SimctlBridge::runSimctl(std::vector<std::string> args)
    -> BridgeResult<utils::CommandResult> {
    std::vector<std::string> argv{options_.xcrunPath, "simctl"};
    argv.insert(argv.end(), std::make_move_iterator(args.begin()),
                std::make_move_iterator(args.end()));
    return run(std::move(argv));
}

auto SimctlBridge::runIdb(const std::string& udid,
                          std::vector<std::string> args) -> BridgeResult<void> {
    std::vector<std::string> argv{options_.idbPath, "ui"};
    argv.push_back(std::move(args.front()));
    argv.insert(argv.end(), {"--udid", udid});
    argv.insert(argv.end(), std::make_move_iterator(args.begin() + 1),
                std::make_move_iterator(args.end()));
    auto result = run(std::move(argv));
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

// ==================== Lifecycle ====================

auto SimctlBridge::listDevices() -> BridgeResult<std::vector<Device>> {
    auto result = runSimctl({"list", "devices", "--json"});
    if (!result) {
        return std::unexpected(result.error());
    }
    return simctl::parseDeviceList(result->output);
}

auto SimctlBridge::boot(const std::string& udid) -> BridgeResult<void> {
    spdlog::info("SimctlBridge: booting {}", udid);
    auto result = runSimctl({"boot", udid});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

auto SimctlBridge::shutdown(const std::string& udid) -> BridgeResult<void> {
    spdlog::info("SimctlBridge: shutting down {}", udid);
    auto result = runSimctl({"shutdown", udid});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

auto SimctlBridge::getState(const std::string& udid)
    -> BridgeResult<DeviceState> {
    auto devices = listDevices();
    if (!devices) {
        return std::unexpected(devices.error());
    }
    for (const auto& dev : *devices) {
        if (dev.udid == udid) {
            return dev.state;
        }
    }
    return std::unexpected(
        BridgeError::notFound("No simulator with udid " + udid));
}

// ==================== Capture and input ====================

auto SimctlBridge::captureScreenshot(const std::string& udid,
                                     const std::string& path,
                                     ImageFormat format)
    -> BridgeResult<std::uint64_t> {
    auto result = runSimctl({"io", udid, "screenshot",
                             "--type=" + imageFormatToString(format), path});
    if (!result) {
        return std::unexpected(result.error());
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(BridgeError::invalidOutput(
            std::format("Screenshot not found at {} after capture: {}", path,
                        ec.message())));
    }
    return static_cast<std::uint64_t>(size);
}

auto SimctlBridge::tap(const std::string& udid, int x, int y)
    -> BridgeResult<void> {
    return runIdb(udid, {"tap", std::to_string(x), std::to_string(y)});
}

auto SimctlBridge::typeText(const std::string& udid, const std::string& text)
    -> BridgeResult<void> {
    return runIdb(udid, {"text", text});
}

auto SimctlBridge::swipe(const std::string& udid, const SwipeGesture& gesture)
    -> BridgeResult<void> {
    return runIdb(udid, {"swipe", "--duration",
                         std::format("{:.3f}", gesture.durationMs / 1000.0),
                         std::to_string(gesture.startX),
                         std::to_string(gesture.startY),
                         std::to_string(gesture.endX),
                         std::to_string(gesture.endY)});
}

auto SimctlBridge::pressButton(const std::string& udid, HardwareButton button)
    -> BridgeResult<void> {
    switch (button) {
        case HardwareButton::Home:
            return runIdb(udid, {"button", "HOME"});
        case HardwareButton::Power:
            return runIdb(udid, {"button", "LOCK"});
        case HardwareButton::VolumeUp:
            return runIdb(udid, {"key", std::to_string(kHidVolumeUp)});
        case HardwareButton::VolumeDown:
            return runIdb(udid, {"key", std::to_string(kHidVolumeDown)});
    }
    return std::unexpected(BridgeError::commandFailed("Unsupported button"));
}

// ==================== Apps ====================

auto SimctlBridge::launchApp(const std::string& udid,
                             const std::string& bundleId)
    -> BridgeResult<int> {
    auto result = runSimctl({"launch", udid, bundleId});
    if (!result) {
        return std::unexpected(result.error());
    }
    auto pid = simctl::parseLaunchPid(result->output);
    if (!pid) {
        return std::unexpected(BridgeError::invalidOutput(
            "Could not read pid from simctl launch output: " +
            result->output));
    }
    return *pid;
}

auto SimctlBridge::terminateApp(const std::string& udid,
                                const std::string& bundleId)
    -> BridgeResult<void> {
    auto result = runSimctl({"terminate", udid, bundleId});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

auto SimctlBridge::installApp(const std::string& udid,
                              const std::string& appPath)
    -> BridgeResult<std::string> {
    auto plist = (std::filesystem::path(appPath) / "Info.plist").string();
    auto bundle = run({options_.plutilPath, "-extract", "CFBundleIdentifier",
                       "raw", "-o", "-", plist});
    if (!bundle) {
        return std::unexpected(BridgeError::invalidOutput(
            "Could not read bundle identifier: " + bundle.error().message));
    }
    std::string bundleId = bundle->output;
    while (!bundleId.empty() &&
           (bundleId.back() == '\n' || bundleId.back() == '\r')) {
        bundleId.pop_back();
    }
    if (bundleId.empty()) {
        return std::unexpected(
            BridgeError::invalidOutput("Empty CFBundleIdentifier in " + plist));
    }

    auto result = runSimctl({"install", udid, appPath});
    if (!result) {
        return std::unexpected(result.error());
    }
    return bundleId;
}

auto SimctlBridge::foregroundApp(const std::string& udid)
    -> BridgeResult<std::optional<ForegroundApp>> {
    auto result = runSimctl({"spawn", udid, "launchctl", "list"});
    if (!result) {
        return std::unexpected(result.error());
    }
    return simctl::parseForegroundApp(result->output);
}

}  // namespace simdeck::device
