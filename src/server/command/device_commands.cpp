#include "device_commands.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

#include "device/network/tailscale_discovery.hpp"
#include "utils/time_utils.hpp"

namespace simdeck::server {

using device::DeviceResult;

namespace {

auto listDevices(const CommandContext& ctx) -> DeviceResult<json> {
    auto devices = ctx.manager.listDevices();
    if (!devices) {
        return std::unexpected(devices.error());
    }

    json list = json::array();
    for (const auto& dev : *devices) {
        list.push_back(dev.toJson());
    }
    json result = {{"devices", std::move(list)}};

    if (ctx.args.getBool("include-remote").value_or(false)) {
        device::TailscaleDiscovery tailscale(
            ctx.runner, ctx.config.remote.tailscalePath,
            std::chrono::seconds(ctx.config.remote.connectTimeoutSec));
        auto hosts = tailscale.listHosts();
        if (hosts) {
            json remoteHosts = json::array();
            for (const auto& host : *hosts) {
                remoteHosts.push_back(host.toJson());
            }
            result["remote_hosts"] = std::move(remoteHosts);
        } else {
            spdlog::warn("Skipping tailnet hosts: {}", hosts.error().message);
        }
    }
    return result;
}

auto bootSimulator(const CommandContext& ctx) -> DeviceResult<json> {
    auto deviceId = ctx.deviceId();
    if (deviceId.empty()) {
        auto name = ctx.args.getString("name").value_or("");
        if (name.empty()) {
            return std::unexpected(device::DeviceError(
                device::DeviceErrorCode::DeviceRequired,
                "Simulator name or device ID is required (use --name or "
                "--device)"));
        }
        auto osVersion = ctx.args.getString("os-version").value_or("");
        auto found = ctx.manager.findDeviceByNameAndOSVersion(name, osVersion);
        if (!found) {
            return std::unexpected(found.error());
        }
        deviceId = found->id;
    }

    device::WaitOptions options;
    options.wait = ctx.args.getBool("wait").value_or(true);
    options.timeoutSec = ctx.args.getInt("timeout").value_or(
        ctx.config.lifecycle.bootTimeoutSec);
    return toJsonResult(ctx.manager.bootSimulator(deviceId, options));
}

auto shutdownSimulator(const CommandContext& ctx) -> DeviceResult<json> {
    auto deviceId = ctx.requireDevice();
    if (!deviceId) {
        return std::unexpected(deviceId.error());
    }

    device::WaitOptions options;
    options.wait = ctx.args.getBool("wait").value_or(true);
    options.timeoutSec = ctx.args.getInt("timeout").value_or(
        ctx.config.lifecycle.shutdownTimeoutSec);
    return toJsonResult(ctx.manager.shutdownSimulator(*deviceId, options));
}

auto deviceState(const CommandContext& ctx) -> DeviceResult<json> {
    auto deviceId = ctx.requireDevice();
    if (!deviceId) {
        return std::unexpected(deviceId.error());
    }

    std::string screenshotPath;
    if (ctx.args.getBool("include-screenshot").value_or(false)) {
        screenshotPath =
            "/tmp/state-screenshot-" +
            utils::fileTimestamp(std::chrono::system_clock::now()) + ".png";
    }
    return toJsonResult(ctx.manager.getSnapshot(*deviceId, screenshotPath));
}

}  // namespace

void registerDeviceCommands(CommandDispatcher& dispatcher) {
    dispatcher.registerCommand("devices.list", listDevices);
    dispatcher.registerCommand("simulator.boot", bootSimulator);
    dispatcher.registerCommand("simulator.shutdown", shutdownSimulator);
    dispatcher.registerCommand("state", deviceState);
}

}  // namespace simdeck::server
