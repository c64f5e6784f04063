/*
 * remote_bridge.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Control bridge that forwards every primitive to a simdeck
installation on another machine over ssh

**************************************************/

#ifndef SIMDECK_DEVICE_BRIDGE_REMOTE_BRIDGE_HPP
#define SIMDECK_DEVICE_BRIDGE_REMOTE_BRIDGE_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "control_bridge.hpp"
#include "device/common/device_result.hpp"
#include "utils/process/process_runner.hpp"

namespace simdeck::device {

/**
 * @brief ssh destination of a remote simdeck
 */
struct RemoteEndpoint {
    std::string host;
    int port{22};

    /**
     * @brief "host:port" form used in Device::remoteHost
     */
    [[nodiscard]] auto toString() const -> std::string {
        return host + ":" + std::to_string(port);
    }

    auto operator==(const RemoteEndpoint& other) const -> bool = default;
};

/**
 * @brief Parse "host" or "host:port"; the port defaults to 22
 */
[[nodiscard]] auto parseRemoteEndpoint(const std::string& hostPort,
                                       int defaultPort = 22)
    -> DeviceResult<RemoteEndpoint>;

/**
 * @brief Quote one argument for a POSIX shell ('it'\''s')
 */
[[nodiscard]] auto shellQuote(const std::string& arg) -> std::string;

struct RemoteBridgeOptions {
    std::string sshPath{"ssh"};
    std::string remoteBinary{"simdeck"};
    int connectTimeoutSec{10};
    std::chrono::milliseconds commandTimeout{std::chrono::seconds{180}};
};

/**
 * @brief Runs `ssh -p <port> <host> simdeck <args...>` and reads back the
 * remote result envelope
 *
 * Boot and shutdown are forwarded with --wait=false so that the local
 * poller owns the wait, exactly as with a local bridge.
 */
class RemoteBridge : public ControlBridge {
public:
    RemoteBridge(std::shared_ptr<utils::CommandRunner> runner,
                 RemoteEndpoint endpoint, RemoteBridgeOptions options = {});

    [[nodiscard]] auto name() const -> std::string override;

    [[nodiscard]] auto endpoint() const -> const RemoteEndpoint& {
        return endpoint_;
    }

    auto listDevices() -> BridgeResult<std::vector<Device>> override;
    auto boot(const std::string& udid) -> BridgeResult<void> override;
    auto shutdown(const std::string& udid) -> BridgeResult<void> override;
    auto getState(const std::string& udid)
        -> BridgeResult<DeviceState> override;

    auto captureScreenshot(const std::string& udid, const std::string& path,
                           ImageFormat format)
        -> BridgeResult<std::uint64_t> override;
    auto tap(const std::string& udid, int x, int y)
        -> BridgeResult<void> override;
    auto typeText(const std::string& udid, const std::string& text)
        -> BridgeResult<void> override;
    auto swipe(const std::string& udid, const SwipeGesture& gesture)
        -> BridgeResult<void> override;
    auto pressButton(const std::string& udid, HardwareButton button)
        -> BridgeResult<void> override;

    auto launchApp(const std::string& udid, const std::string& bundleId)
        -> BridgeResult<int> override;
    auto terminateApp(const std::string& udid, const std::string& bundleId)
        -> BridgeResult<void> override;
    auto installApp(const std::string& udid, const std::string& appPath)
        -> BridgeResult<std::string> override;
    auto foregroundApp(const std::string& udid)
        -> BridgeResult<std::optional<ForegroundApp>> override;

    /**
     * @brief The full ssh argv for a remote simdeck invocation
     */
    [[nodiscard]] auto buildCommand(const std::vector<std::string>& args) const
        -> std::vector<std::string>;

private:
    /**
     * @brief Run a remote command and return the "result" member of its
     * success envelope
     */
    auto execute(const std::vector<std::string>& args) -> BridgeResult<json>;

    std::shared_ptr<utils::CommandRunner> runner_;
    RemoteEndpoint endpoint_;
    RemoteBridgeOptions options_;
};

}  // namespace simdeck::device

#endif  // SIMDECK_DEVICE_BRIDGE_REMOTE_BRIDGE_HPP
