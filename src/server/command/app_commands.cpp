#include "app_commands.hpp"

#include <filesystem>

namespace simdeck::server {

using device::DeviceResult;

namespace {

auto launchApp(const CommandContext& ctx) -> DeviceResult<json> {
    auto deviceId = ctx.requireDevice();
    if (!deviceId) {
        return std::unexpected(deviceId.error());
    }
    auto bundleId = ctx.args.getString("bundle").value_or("");
    return toJsonResult(ctx.manager.launchApp(*deviceId, bundleId));
}

auto terminateApp(const CommandContext& ctx) -> DeviceResult<json> {
    auto deviceId = ctx.requireDevice();
    if (!deviceId) {
        return std::unexpected(deviceId.error());
    }
    auto bundleId = ctx.args.getString("bundle").value_or("");
    return toJsonResult(ctx.manager.terminateApp(*deviceId, bundleId));
}

auto installApp(const CommandContext& ctx) -> DeviceResult<json> {
    auto deviceId = ctx.requireDevice();
    if (!deviceId) {
        return std::unexpected(deviceId.error());
    }
    auto appPath = ctx.args.getString("app").value_or("");

    // A remote install refers to a bundle on the remote machine
    if (!appPath.empty() && !ctx.isRemote()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(appPath, ec)) {
            auto err = device::error::appNotFound(appPath);
            err.details["reason"] = "app bundle directory does not exist";
            return std::unexpected(std::move(err));
        }
    }
    return toJsonResult(ctx.manager.installApp(*deviceId, appPath));
}

}  // namespace

void registerAppCommands(CommandDispatcher& dispatcher) {
    dispatcher.registerCommand("app.launch", launchApp);
    dispatcher.registerCommand("app.terminate", terminateApp);
    dispatcher.registerCommand("app.install", installApp);
}

}  // namespace simdeck::server
