/*
 * tailscale_discovery.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "tailscale_discovery.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace simdeck::device {

namespace {

auto hostFromPeer(const json& peer, bool self) -> std::optional<RemoteHost> {
    if (!peer.is_object()) {
        return std::nullopt;
    }
    auto ips = peer.find("TailscaleIPs");
    if (ips == peer.end() || !ips->is_array() || ips->empty() ||
        !ips->front().is_string()) {
        return std::nullopt;
    }

    RemoteHost host;
    host.hostname = peer.value("HostName", "");
    host.name = host.hostname;
    host.dnsName = peer.value("DNSName", "");
    host.os = peer.value("OS", "");
    host.tailscaleIp = ips->front().get<std::string>();
    host.online = self || peer.value("Online", false);
    host.self = self;
    return host;
}

}  // namespace

auto RemoteHost::toJson() const -> json {
    return {{"name", name},         {"hostname", hostname},
            {"dns_name", dnsName},  {"tailscale_ip", tailscaleIp},
            {"os", os},             {"online", online},
            {"self", self}};
}

auto parseTailscaleStatus(std::string_view output)
    -> DeviceResult<std::vector<RemoteHost>> {
    json status;
    try {
        status = json::parse(output);
    } catch (const json::parse_error& e) {
        return std::unexpected(error::discoveryFailed(
            std::string("cannot parse tailscale status: ") + e.what()));
    }
    if (!status.is_object()) {
        return std::unexpected(
            error::discoveryFailed("tailscale status is not an object"));
    }

    std::vector<RemoteHost> hosts;
    if (auto self = status.find("Self"); self != status.end()) {
        if (auto host = hostFromPeer(*self, true)) {
            hosts.push_back(std::move(*host));
        }
    }

    std::vector<RemoteHost> peers;
    if (auto peer = status.find("Peer");
        peer != status.end() && peer->is_object()) {
        for (const auto& [key, value] : peer->items()) {
            if (auto host = hostFromPeer(value, false)) {
                peers.push_back(std::move(*host));
            } else {
                spdlog::debug("TailscaleDiscovery: skipping peer {}", key);
            }
        }
    }
    std::sort(peers.begin(), peers.end(),
              [](const RemoteHost& a, const RemoteHost& b) {
                  return a.name < b.name;
              });
    hosts.insert(hosts.end(), std::make_move_iterator(peers.begin()),
                 std::make_move_iterator(peers.end()));
    return hosts;
}

TailscaleDiscovery::TailscaleDiscovery(
    std::shared_ptr<utils::CommandRunner> runner, std::string tailscalePath,
    std::chrono::milliseconds timeout)
    : runner_(std::move(runner)),
      tailscalePath_(std::move(tailscalePath)),
      timeout_(timeout) {}

auto TailscaleDiscovery::listHosts() const
    -> DeviceResult<std::vector<RemoteHost>> {
    auto result = runner_->run({tailscalePath_, "status", "--json"}, timeout_);
    if (result.launchFailed) {
        return std::unexpected(error::discoveryFailed(
            "tailscale is not installed or not in PATH"));
    }
    if (!result.ok()) {
        auto reason = result.timedOut ? std::string("timed out")
                                      : result.errorOutput;
        return std::unexpected(
            error::discoveryFailed("tailscale status failed: " + reason));
    }

    auto hosts = parseTailscaleStatus(result.output);
    if (hosts) {
        spdlog::debug("TailscaleDiscovery: {} host(s) on the tailnet",
                      hosts->size());
    }
    return hosts;
}

}  // namespace simdeck::device
