/*
 * remote_bridge.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "remote_bridge.hpp"

#include <charconv>
#include <format>

#include <spdlog/spdlog.h>

#include "server/envelope.hpp"

namespace simdeck::device {

namespace {

// ssh reserves this exit status for its own failures
constexpr int kSshFailureExitCode = 255;
constexpr int kCommandNotFoundExitCode = 127;

auto toBridgeError(const DeviceError& err) -> BridgeError {
    auto message = deviceErrorCodeToString(err.code) + ": " + err.message;
    switch (err.code) {
        case DeviceErrorCode::DeviceNotFound:
            return BridgeError::notFound(std::move(message));
        case DeviceErrorCode::DeviceUnreachable:
        case DeviceErrorCode::DeviceDiscoveryFailed:
            return BridgeError::unreachable(std::move(message));
        default:
            return BridgeError::commandFailed(std::move(message));
    }
}

template <typename T>
auto readField(const json& result, const char* key) -> BridgeResult<T> {
    if (!result.is_object() || !result.contains(key)) {
        return std::unexpected(BridgeError::invalidOutput(
            std::format("Remote result has no \"{}\" field", key)));
    }
    try {
        return result[key].get<T>();
    } catch (const json::exception& e) {
        return std::unexpected(BridgeError::invalidOutput(
            std::format("Remote field \"{}\" is malformed: {}", key,
                        e.what())));
    }
}

auto ignoreValue(const BridgeResult<json>& result) -> BridgeResult<void> {
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

}  // namespace

auto parseRemoteEndpoint(const std::string& hostPort, int defaultPort)
    -> DeviceResult<RemoteEndpoint> {
    auto invalid = [&hostPort](const std::string& reason) {
        return std::unexpected(DeviceError(DeviceErrorCode::InternalError,
                                           "Invalid remote host: " + reason,
                                           {{"remote_host", hostPort}}));
    };

    RemoteEndpoint endpoint;
    endpoint.port = defaultPort;

    auto colon = hostPort.rfind(':');
    endpoint.host = hostPort.substr(0, colon);
    if (colon != std::string::npos) {
        auto portText = std::string_view(hostPort).substr(colon + 1);
        int port = 0;
        auto [ptr, ec] = std::from_chars(
            portText.data(), portText.data() + portText.size(), port);
        if (ec != std::errc() || ptr != portText.data() + portText.size() ||
            port <= 0 || port > 65535) {
            return invalid("bad port '" + std::string(portText) + "'");
        }
        endpoint.port = port;
    }
    if (endpoint.host.empty()) {
        return invalid("empty host name");
    }
    // ssh would read it as an option
    if (endpoint.host.front() == '-') {
        return invalid("host name starts with '-'");
    }
    return endpoint;
}

auto shellQuote(const std::string& arg) -> std::string {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

RemoteBridge::RemoteBridge(std::shared_ptr<utils::CommandRunner> runner,
                           RemoteEndpoint endpoint, RemoteBridgeOptions options)
    : runner_(std::move(runner)),
      endpoint_(std::move(endpoint)),
      options_(std::move(options)) {}

auto RemoteBridge::name() const -> std::string {
    return "remote:" + endpoint_.toString();
}

auto RemoteBridge::buildCommand(const std::vector<std::string>& args) const
    -> std::vector<std::string> {
    std::string remoteCmd = shellQuote(options_.remoteBinary);
    for (const auto& arg : args) {
        remoteCmd += ' ';
        remoteCmd += shellQuote(arg);
    }
    return {options_.sshPath,
            "-p",
            std::to_string(endpoint_.port),
            "-o",
            "BatchMode=yes",
            "-o",
            "ConnectTimeout=" + std::to_string(options_.connectTimeoutSec),
            endpoint_.host,
            remoteCmd};
}

auto RemoteBridge::execute(const std::vector<std::string>& args)
    -> BridgeResult<json> {
    auto result = runner_->run(buildCommand(args), options_.commandTimeout);

    if (result.launchFailed) {
        return std::unexpected(BridgeError::unreachable(
            "ssh could not be started: " + result.errorOutput));
    }
    if (result.timedOut) {
        return std::unexpected(BridgeError::unreachable(std::format(
            "No answer from {} within {}ms", endpoint_.toString(),
            options_.commandTimeout.count())));
    }
    if (result.exitCode == kSshFailureExitCode) {
        return std::unexpected(BridgeError::unreachable(std::format(
            "ssh to {} failed: {}", endpoint_.toString(),
            result.errorOutput)));
    }

    auto envelope = server::Envelope::parse(result.output);
    if (!envelope) {
        if (result.exitCode == kCommandNotFoundExitCode) {
            return std::unexpected(BridgeError::unreachable(std::format(
                "{} is not installed on {}", options_.remoteBinary,
                endpoint_.host)));
        }
        return std::unexpected(
            BridgeError::invalidOutput(envelope.error().message));
    }
    if (!envelope->success) {
        spdlog::debug("RemoteBridge: {} reported {}", endpoint_.toString(),
                      envelope->error->toString());
        return std::unexpected(toBridgeError(*envelope->error));
    }
    return envelope->result;
}

// ==================== Lifecycle ====================

auto RemoteBridge::listDevices() -> BridgeResult<std::vector<Device>> {
    auto result = execute({"devices"});
    if (!result) {
        return std::unexpected(result.error());
    }
    auto entries = readField<json>(*result, "devices");
    if (!entries) {
        return std::unexpected(entries.error());
    }
    if (!entries->is_array()) {
        return std::unexpected(
            BridgeError::invalidOutput("Remote \"devices\" is not a list"));
    }

    std::vector<Device> devices;
    for (const auto& entry : *entries) {
        try {
            auto dev = Device::fromJson(entry);
            dev.location = DeviceLocation::Remote;
            dev.remoteHost = endpoint_.toString();
            devices.push_back(std::move(dev));
        } catch (const std::exception& e) {
            return std::unexpected(BridgeError::invalidOutput(
                std::string("Malformed remote device: ") + e.what()));
        }
    }
    return devices;
}

auto RemoteBridge::boot(const std::string& udid) -> BridgeResult<void> {
    spdlog::info("RemoteBridge: booting {} on {}", udid, endpoint_.toString());
    return ignoreValue(
        execute({"simulator", "boot", "--device", udid, "--wait=false"}));
}

auto RemoteBridge::shutdown(const std::string& udid) -> BridgeResult<void> {
    spdlog::info("RemoteBridge: shutting down {} on {}", udid,
                 endpoint_.toString());
    return ignoreValue(
        execute({"simulator", "shutdown", "--device", udid, "--wait=false"}));
}

auto RemoteBridge::getState(const std::string& udid)
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
    return std::unexpected(BridgeError::notFound(
        std::format("No device {} on {}", udid, endpoint_.toString())));
}

// ==================== Capture and input ====================

auto RemoteBridge::captureScreenshot(const std::string& udid,
                                     const std::string& path,
                                     ImageFormat format)
    -> BridgeResult<std::uint64_t> {
    auto result = execute({"screenshot", "--device", udid, "--output", path,
                           "--format", imageFormatToString(format)});
    if (!result) {
        return std::unexpected(result.error());
    }
    return readField<std::uint64_t>(*result, "size_bytes");
}

auto RemoteBridge::tap(const std::string& udid, int x, int y)
    -> BridgeResult<void> {
    return ignoreValue(execute({"io", "tap", "--device", udid, "--x",
                                std::to_string(x), "--y", std::to_string(y)}));
}

auto RemoteBridge::typeText(const std::string& udid, const std::string& text)
    -> BridgeResult<void> {
    return ignoreValue(
        execute({"io", "text", "--device", udid, "--text", text}));
}

auto RemoteBridge::swipe(const std::string& udid, const SwipeGesture& gesture)
    -> BridgeResult<void> {
    return ignoreValue(execute(
        {"io", "swipe", "--device", udid, "--start-x",
         std::to_string(gesture.startX), "--start-y",
         std::to_string(gesture.startY), "--end-x",
         std::to_string(gesture.endX), "--end-y", std::to_string(gesture.endY),
         "--duration", std::to_string(gesture.durationMs)}));
}

auto RemoteBridge::pressButton(const std::string& udid, HardwareButton button)
    -> BridgeResult<void> {
    return ignoreValue(execute({"io", "button", "--device", udid, "--button",
                                hardwareButtonToString(button)}));
}

// ==================== Apps ====================

auto RemoteBridge::launchApp(const std::string& udid,
                             const std::string& bundleId)
    -> BridgeResult<int> {
    auto result =
        execute({"app", "launch", "--device", udid, "--bundle", bundleId});
    if (!result) {
        return std::unexpected(result.error());
    }
    return readField<int>(*result, "pid");
}

auto RemoteBridge::terminateApp(const std::string& udid,
                                const std::string& bundleId)
    -> BridgeResult<void> {
    return ignoreValue(
        execute({"app", "terminate", "--device", udid, "--bundle", bundleId}));
}

auto RemoteBridge::installApp(const std::string& udid,
                              const std::string& appPath)
    -> BridgeResult<std::string> {
    auto result =
        execute({"app", "install", "--device", udid, "--app", appPath});
    if (!result) {
        return std::unexpected(result.error());
    }
    return readField<std::string>(*result, "bundle_id");
}

auto RemoteBridge::foregroundApp(const std::string& udid)
    -> BridgeResult<std::optional<ForegroundApp>> {
    auto result = execute({"state", "--device", udid});
    if (!result) {
        return std::unexpected(result.error());
    }
    auto app = readField<json>(*result, "foreground_app");
    if (!app) {
        return std::unexpected(app.error());
    }
    if (app->is_null()) {
        return std::optional<ForegroundApp>{};
    }
    return std::optional<ForegroundApp>{ForegroundApp::fromJson(*app)};
}

}  // namespace simdeck::device
