/*
 * test_tailscale_discovery.cpp - Tests for tailnet host discovery
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "common/mock_command_runner.hpp"
#include "device/network/tailscale_discovery.hpp"

using namespace simdeck::device;
using namespace simdeck::test;
using namespace testing;

namespace {

constexpr const char* kStatusJson = R"({
  "Version": "1.70.0",
  "Self": {
    "HostName": "laptop",
    "DNSName": "laptop.tail1234.ts.net.",
    "OS": "linux",
    "TailscaleIPs": ["100.64.0.1", "fd7a:115c:a1e0::1"],
    "Online": false
  },
  "Peer": {
    "nodekey:bbb": {
      "HostName": "mac-mini",
      "DNSName": "mac-mini.tail1234.ts.net.",
      "OS": "macOS",
      "TailscaleIPs": ["100.64.0.7"],
      "Online": true
    },
    "nodekey:aaa": {
      "HostName": "build-mac",
      "DNSName": "build-mac.tail1234.ts.net.",
      "OS": "macOS",
      "TailscaleIPs": ["100.64.0.9"],
      "Online": false
    },
    "nodekey:ccc": {
      "HostName": "no-address",
      "OS": "iOS",
      "TailscaleIPs": null
    }
  }
})";

}  // namespace

// ========== Parsing ==========

TEST(TailscaleStatusTest, Parse_SelfFirstThenPeersByName) {
    auto hosts = parseTailscaleStatus(kStatusJson);
    ASSERT_TRUE(hosts.has_value());
    ASSERT_EQ(hosts->size(), 3u);

    EXPECT_EQ((*hosts)[0].name, "laptop");
    EXPECT_TRUE((*hosts)[0].self);
    EXPECT_TRUE((*hosts)[0].online);
    EXPECT_EQ((*hosts)[0].tailscaleIp, "100.64.0.1");

    EXPECT_EQ((*hosts)[1].name, "build-mac");
    EXPECT_FALSE((*hosts)[1].online);
    EXPECT_EQ((*hosts)[2].name, "mac-mini");
    EXPECT_TRUE((*hosts)[2].online);
    EXPECT_EQ((*hosts)[2].dnsName, "mac-mini.tail1234.ts.net.");
    EXPECT_EQ((*hosts)[2].os, "macOS");
}

TEST(TailscaleStatusTest, Parse_ToJsonKeys) {
    auto hosts = parseTailscaleStatus(kStatusJson);
    ASSERT_TRUE(hosts.has_value());
    auto j = hosts->back().toJson();
    EXPECT_EQ(j["tailscale_ip"], "100.64.0.7");
    EXPECT_EQ(j["dns_name"], "mac-mini.tail1234.ts.net.");
    EXPECT_EQ(j["self"], false);
}

TEST(TailscaleStatusTest, Parse_NoPeers) {
    auto hosts = parseTailscaleStatus(
        R"({"Self": {"HostName": "solo", "TailscaleIPs": ["100.64.0.2"]}})");
    ASSERT_TRUE(hosts.has_value());
    ASSERT_EQ(hosts->size(), 1u);
    EXPECT_EQ(hosts->front().name, "solo");
}

TEST(TailscaleStatusTest, Parse_Malformed) {
    auto garbage = parseTailscaleStatus("not json at all");
    ASSERT_FALSE(garbage.has_value());
    EXPECT_EQ(garbage.error().code, DeviceErrorCode::DeviceDiscoveryFailed);

    auto array = parseTailscaleStatus("[]");
    ASSERT_FALSE(array.has_value());
    EXPECT_EQ(array.error().code, DeviceErrorCode::DeviceDiscoveryFailed);
}

// ========== Running tailscale ==========

TEST(TailscaleDiscoveryTest, ListHosts_RunsStatusJson) {
    auto runner = std::make_shared<StrictMock<MockCommandRunner>>();
    EXPECT_CALL(*runner, run(ElementsAre("/opt/bin/tailscale", "status",
                                         "--json"),
                             _))
        .WillOnce(Return(okResult(kStatusJson)));

    TailscaleDiscovery discovery(runner, "/opt/bin/tailscale");
    auto hosts = discovery.listHosts();
    ASSERT_TRUE(hosts.has_value());
    EXPECT_EQ(hosts->size(), 3u);
}

TEST(TailscaleDiscoveryTest, ListHosts_NotInstalled) {
    auto runner = std::make_shared<StrictMock<MockCommandRunner>>();
    EXPECT_CALL(*runner, run(_, _)).WillOnce(Return(launchFailedResult()));

    TailscaleDiscovery discovery(runner);
    auto hosts = discovery.listHosts();
    ASSERT_FALSE(hosts.has_value());
    EXPECT_EQ(hosts.error().code, DeviceErrorCode::DeviceDiscoveryFailed);
    EXPECT_THAT(hosts.error().message, HasSubstr("not installed"));
}

TEST(TailscaleDiscoveryTest, ListHosts_DaemonStopped) {
    auto runner = std::make_shared<StrictMock<MockCommandRunner>>();
    EXPECT_CALL(*runner, run(_, _))
        .WillOnce(Return(failResult(1, "Tailscale is stopped.")));

    TailscaleDiscovery discovery(runner);
    auto hosts = discovery.listHosts();
    ASSERT_FALSE(hosts.has_value());
    EXPECT_THAT(hosts.error().message, HasSubstr("Tailscale is stopped."));
}
