/*
 * envelope.cpp - Command Result Envelope
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "envelope.hpp"

#include "utils/time_utils.hpp"

namespace simdeck::server {

using device::DeviceError;
using device::DeviceException;

auto Envelope::makeSuccess(std::string action, json result) -> Envelope {
    Envelope env;
    env.success = true;
    env.action = std::move(action);
    env.result = std::move(result);
    env.timestamp = utils::nowRfc3339();
    return env;
}

auto Envelope::makeError(std::string action, DeviceError error) -> Envelope {
    Envelope env;
    env.success = false;
    env.action = std::move(action);
    env.error = std::move(error);
    env.timestamp = utils::nowRfc3339();
    return env;
}

auto Envelope::toJson() const -> json {
    json j;
    j["success"] = success;
    j["action"] = action;
    if (success) {
        j["result"] = result;
    } else {
        j["error"] = error ? error->toJson()
                           : device::error::internalError("Unknown error")
                                 .toJson();
    }
    j["timestamp"] = timestamp;
    return j;
}

auto Envelope::fromJson(const json& j) -> Envelope {
    if (!j.is_object() || !j.contains("success") ||
        !j["success"].is_boolean() || !j.contains("action")) {
        throw DeviceException("Not a result envelope");
    }

    Envelope env;
    env.success = j["success"].get<bool>();
    env.action = j["action"].get<std::string>();
    env.timestamp = j.value("timestamp", "");

    const bool hasResult = j.contains("result");
    const bool hasError = j.contains("error");
    if (hasResult == hasError) {
        throw DeviceException(
            "Envelope must carry exactly one of result or error");
    }
    if (env.success != hasResult) {
        throw DeviceException("Envelope success flag contradicts its payload");
    }

    if (hasResult) {
        env.result = j["result"];
    } else {
        env.error = DeviceError::fromJson(j["error"]);
    }
    return env;
}

auto Envelope::parse(std::string_view text) -> device::DeviceResult<Envelope> {
    return device::tryExecute([&]() -> device::DeviceResult<Envelope> {
        json doc;
        try {
            doc = json::parse(text);
        } catch (const json::parse_error& e) {
            return std::unexpected(device::error::internalError(
                std::string("Envelope is not valid JSON: ") + e.what()));
        }
        return fromJson(doc);
    });
}

}  // namespace simdeck::server
