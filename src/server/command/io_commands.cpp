#include "io_commands.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <initializer_list>
#include <vector>

#include "utils/time_utils.hpp"

namespace simdeck::server {

using device::DeviceResult;

namespace {

/**
 * @brief Read integer options that must all be present
 */
auto requireCoordinates(const CommandContext& ctx,
                        std::initializer_list<const char*> names)
    -> DeviceResult<std::vector<int>> {
    std::vector<int> values;
    json missing = json::array();
    for (const char* name : names) {
        auto value = ctx.args.getInt(name);
        if (!value) {
            missing.push_back(std::string("--") + name);
            continue;
        }
        values.push_back(*value);
    }
    if (!missing.empty()) {
        return std::unexpected(device::error::invalidCoordinates(
            "Missing coordinates: " + missing.dump(),
            {{"missing", std::move(missing)}}));
    }
    return values;
}

auto captureScreenshot(const CommandContext& ctx) -> DeviceResult<json> {
    auto deviceId = ctx.requireDevice();
    if (!deviceId) {
        return std::unexpected(deviceId.error());
    }

    auto formatName = ctx.args.getString("format").value_or("png");
    auto format = device::imageFormatFromString(formatName);
    if (!format) {
        return std::unexpected(device::error::invalidFormat(formatName));
    }

    auto output = ctx.args.getString("output").value_or("");
    if (output.empty()) {
        output = defaultScreenshotPath(*format);
    }

    // The file lands on the remote machine when forwarding over ssh
    if (!ctx.isRemote()) {
        auto parent = std::filesystem::path(output).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return std::unexpected(device::error::pathError(
                    output,
                    "failed to create output directory: " + ec.message()));
            }
        }
    }

    return toJsonResult(
        ctx.manager.captureScreenshot(*deviceId, output, *format));
}

auto tap(const CommandContext& ctx) -> DeviceResult<json> {
    auto deviceId = ctx.requireDevice();
    if (!deviceId) {
        return std::unexpected(deviceId.error());
    }
    auto coords = requireCoordinates(ctx, {"x", "y"});
    if (!coords) {
        return std::unexpected(coords.error());
    }
    return toJsonResult(
        ctx.manager.tap(*deviceId, (*coords)[0], (*coords)[1]));
}

auto typeText(const CommandContext& ctx) -> DeviceResult<json> {
    auto deviceId = ctx.requireDevice();
    if (!deviceId) {
        return std::unexpected(deviceId.error());
    }
    auto text = ctx.args.getString("text").value_or("");
    return toJsonResult(ctx.manager.typeText(*deviceId, text));
}

auto swipe(const CommandContext& ctx) -> DeviceResult<json> {
    auto deviceId = ctx.requireDevice();
    if (!deviceId) {
        return std::unexpected(deviceId.error());
    }
    auto coords =
        requireCoordinates(ctx, {"start-x", "start-y", "end-x", "end-y"});
    if (!coords) {
        return std::unexpected(coords.error());
    }

    device::SwipeGesture gesture;
    gesture.startX = (*coords)[0];
    gesture.startY = (*coords)[1];
    gesture.endX = (*coords)[2];
    gesture.endY = (*coords)[3];
    gesture.durationMs = ctx.args.getInt("duration").value_or(300);
    return toJsonResult(ctx.manager.swipe(*deviceId, gesture));
}

auto pressButton(const CommandContext& ctx) -> DeviceResult<json> {
    auto deviceId = ctx.requireDevice();
    if (!deviceId) {
        return std::unexpected(deviceId.error());
    }

    auto name = ctx.args.getString("button").value_or("");
    auto button = device::hardwareButtonFromString(name);
    if (!button) {
        auto reason =
            name.empty() ? std::string("button type is required (use --button)")
                         : std::format("invalid button type: {}", name);
        return std::unexpected(device::error::uiActionFailed(
            "button", reason,
            {{"button", name},
             {"supported",
              json::array({"HOME", "POWER", "VOLUME_UP", "VOLUME_DOWN"})}}));
    }
    return toJsonResult(ctx.manager.pressButton(*deviceId, *button));
}

}  // namespace

auto defaultScreenshotPath(device::ImageFormat format) -> std::string {
    auto ext = format == device::ImageFormat::Jpeg ? "jpg" : "png";
    return std::format("/tmp/screenshot-{}.{}",
                       utils::fileTimestamp(std::chrono::system_clock::now()),
                       ext);
}

void registerIoCommands(CommandDispatcher& dispatcher) {
    dispatcher.registerCommand("screenshot.capture", captureScreenshot);
    dispatcher.registerCommand("io.tap", tap);
    dispatcher.registerCommand("io.text", typeText);
    dispatcher.registerCommand("io.swipe", swipe);
    dispatcher.registerCommand("io.button", pressButton);
}

}  // namespace simdeck::server
