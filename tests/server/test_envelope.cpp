/*
 * test_envelope.cpp - Tests for the command result envelope
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "device/types.hpp"
#include "server/envelope.hpp"

using namespace simdeck::device;
using namespace simdeck::server;
using namespace testing;

namespace {

auto keysOf(const json& j) -> std::vector<std::string> {
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) {
        keys.push_back(it.key());
    }
    return keys;
}

}  // namespace

// ========== Construction ==========

TEST(EnvelopeTest, Success_KeyOrder) {
    auto env = Envelope::makeSuccess("io.tap", json{{"x", 1}});
    auto j = env.toJson();
    EXPECT_THAT(keysOf(j),
                ElementsAre("success", "action", "result", "timestamp"));
    EXPECT_TRUE(j["success"].get<bool>());
    EXPECT_EQ(j["action"], "io.tap");
    EXPECT_EQ(j["result"]["x"], 1);
    EXPECT_THAT(j["timestamp"].get<std::string>(),
                MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:"
                             "[0-9]{2}Z"));
}

TEST(EnvelopeTest, Error_KeyOrder) {
    auto env =
        Envelope::makeError("simulator.boot", error::deviceNotFound("X"));
    auto j = env.toJson();
    EXPECT_THAT(keysOf(j),
                ElementsAre("success", "action", "error", "timestamp"));
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_EQ(j["error"]["code"], "DEVICE_NOT_FOUND");
    EXPECT_EQ(j["error"]["details"]["device_id"], "X");
    EXPECT_FALSE(j.contains("result"));
}

TEST(EnvelopeTest, DumpCompact) {
    auto env = Envelope::makeSuccess("state", json::object());
    auto text = env.dump(-1);
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_THAT(text, StartsWith("{\"success\":true,\"action\":\"state\""));
}

TEST(EnvelopeTest, FromResult) {
    DeviceResult<TapResult> ok = TapResult{"A", 3, 4, "t"};
    auto success = Envelope::fromResult("io.tap", ok);
    EXPECT_TRUE(success.success);
    EXPECT_EQ(success.result["device_id"], "A");
    EXPECT_EQ(success.result["y"], 4);

    DeviceResult<TapResult> bad = std::unexpected(error::deviceRequired());
    auto failure = Envelope::fromResult("io.tap", bad);
    EXPECT_FALSE(failure.success);
    ASSERT_TRUE(failure.error.has_value());
    EXPECT_EQ(failure.error->code, DeviceErrorCode::DeviceRequired);
}

// ========== Parsing ==========

TEST(EnvelopeTest, FromJson_Success) {
    auto env = Envelope::fromJson(json::parse(
        R"({"success":true,"action":"io.text","result":{"length":2},)"
        R"("timestamp":"2024-12-01T08:30:00Z"})"));
    EXPECT_TRUE(env.success);
    EXPECT_EQ(env.action, "io.text");
    EXPECT_EQ(env.result["length"], 2);
    EXPECT_EQ(env.timestamp, "2024-12-01T08:30:00Z");
    EXPECT_FALSE(env.error.has_value());
}

TEST(EnvelopeTest, FromJson_Error) {
    auto env = Envelope::fromJson(json::parse(
        R"({"success":false,"action":"io.tap",)"
        R"("error":{"code":"DEVICE_NOT_BOOTED","message":"off"}})"));
    ASSERT_TRUE(env.error.has_value());
    EXPECT_EQ(env.error->code, DeviceErrorCode::DeviceNotBooted);
    EXPECT_EQ(env.error->message, "off");
}

TEST(EnvelopeTest, FromJson_Rejects) {
    EXPECT_THROW(Envelope::fromJson(json::array()), DeviceException);
    EXPECT_THROW(Envelope::fromJson(json{{"action", "x"}, {"result", 1}}),
                 DeviceException);
    EXPECT_THROW(
        Envelope::fromJson(json{{"success", "yes"}, {"action", "x"}}),
        DeviceException);
    // Both payloads
    EXPECT_THROW(Envelope::fromJson(json{{"success", true},
                                         {"action", "x"},
                                         {"result", 1},
                                         {"error", json::object()}}),
                 DeviceException);
    // Neither payload
    EXPECT_THROW(
        Envelope::fromJson(json{{"success", true}, {"action", "x"}}),
        DeviceException);
    // Flag contradicts payload
    EXPECT_THROW(Envelope::fromJson(json{{"success", false},
                                         {"action", "x"},
                                         {"result", 1}}),
                 DeviceException);
}

TEST(EnvelopeTest, Parse_NotJson) {
    auto env = Envelope::parse("ssh: connect to host refused");
    ASSERT_FALSE(env.has_value());
    EXPECT_EQ(env.error().code, DeviceErrorCode::InternalError);
    EXPECT_THAT(env.error().message, StartsWith("Envelope is not valid JSON"));
}

TEST(EnvelopeTest, Parse_MalformedEnvelope) {
    auto env = Envelope::parse(R"({"hello":"world"})");
    ASSERT_FALSE(env.has_value());
    EXPECT_EQ(env.error().code, DeviceErrorCode::InternalError);
}

TEST(EnvelopeTest, Parse_OwnOutput) {
    auto original =
        Envelope::makeError("app.launch", error::appNotFound("com.x"));
    auto parsed = Envelope::parse(original.dump());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->action, "app.launch");
    ASSERT_TRUE(parsed->error.has_value());
    EXPECT_EQ(*parsed->error, *original.error);
    EXPECT_EQ(parsed->timestamp, original.timestamp);
}

TEST(EnvelopeTest, Parse_BootResultRoundTrip) {
    BootResult boot;
    boot.device.id = "d1";
    boot.device.udid = "d1";
    boot.device.name = "iPhone 15";
    boot.device.state = DeviceState::Booted;
    boot.device.osVersion = "17.4";
    boot.device.location = DeviceLocation::Remote;
    boot.device.remoteHost = "mac-mini";
    boot.bootTimeMs = 2150;

    auto original = Envelope::makeSuccess("simulator.boot", boot.toJson());
    auto parsed = Envelope::parse(original.dump());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->success);
    EXPECT_EQ(parsed->action, "simulator.boot");
    EXPECT_EQ(BootResult::fromJson(parsed->result), boot);
}

TEST(EnvelopeTest, Parse_ShutdownResultRoundTrip) {
    ShutdownResult shutdown;
    shutdown.device.id = "d1";
    shutdown.device.udid = "d1";
    shutdown.device.name = "iPhone 15";
    shutdown.device.state = DeviceState::Shutdown;
    shutdown.device.osVersion = "17.4";
    shutdown.shutdownTimeMs = 0;
    shutdown.message = "Device already shut down";

    auto original =
        Envelope::makeSuccess("simulator.shutdown", shutdown.toJson());
    auto parsed = Envelope::parse(original.dump(-1));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->action, "simulator.shutdown");
    EXPECT_EQ(ShutdownResult::fromJson(parsed->result), shutdown);
}

// ========== Invalid UTF-8 ==========

TEST(EnvelopeTest, Dump_InvalidUtf8IsReplaced) {
    TextInputResult typed{"A", "caf\xe9", "2024-12-01T08:30:00Z"};
    auto env = Envelope::makeSuccess("io.text", typed.toJson());

    std::string text;
    ASSERT_NO_THROW(text = env.dump(-1));
    auto j = json::parse(text);
    EXPECT_EQ(j["result"]["text"], "caf\xef\xbf\xbd");
    EXPECT_NO_THROW(env.dump());
}

TEST(EnvelopeTest, Dump_InvalidUtf8InErrorDetails) {
    auto err = error::deviceNotFound("\xff\xfe");
    auto env = Envelope::makeError("state", err);
    EXPECT_NO_THROW(env.dump());
    EXPECT_NO_THROW(err.toString());
}
