/*
 * tailscale_discovery.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Lists tailnet machines that may run a remote simdeck

**************************************************/

#ifndef SIMDECK_DEVICE_NETWORK_TAILSCALE_DISCOVERY_HPP
#define SIMDECK_DEVICE_NETWORK_TAILSCALE_DISCOVERY_HPP

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "device/common/device_result.hpp"
#include "utils/process/process_runner.hpp"

namespace simdeck::device {

/**
 * @brief A machine on the tailnet; usable as `--remote-host`
 */
struct RemoteHost {
    std::string name;
    std::string hostname;
    std::string dnsName;
    std::string tailscaleIp;  ///< First address reported by tailscale
    std::string os;
    bool online{false};
    bool self{false};         ///< The machine running this command

    [[nodiscard]] auto toJson() const -> json;

    bool operator==(const RemoteHost&) const = default;
};

/**
 * @brief Parse `tailscale status --json`
 *
 * Self comes first and is always online; peers follow sorted by name.
 * Entries without a tailnet address are skipped.
 */
[[nodiscard]] auto parseTailscaleStatus(std::string_view output)
    -> DeviceResult<std::vector<RemoteHost>>;

class TailscaleDiscovery {
public:
    explicit TailscaleDiscovery(
        std::shared_ptr<utils::CommandRunner> runner,
        std::string tailscalePath = "tailscale",
        std::chrono::milliseconds timeout = std::chrono::seconds(10));

    /**
     * @brief Run tailscale and parse its status
     * @return DeviceDiscoveryFailed if tailscale is missing or fails
     */
    [[nodiscard]] auto listHosts() const
        -> DeviceResult<std::vector<RemoteHost>>;

private:
    std::shared_ptr<utils::CommandRunner> runner_;
    std::string tailscalePath_;
    std::chrono::milliseconds timeout_;
};

}  // namespace simdeck::device

#endif  // SIMDECK_DEVICE_NETWORK_TAILSCALE_DISCOVERY_HPP
