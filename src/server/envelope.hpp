/*
 * envelope.hpp - Command Result Envelope
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SIMDECK_SERVER_ENVELOPE_HPP
#define SIMDECK_SERVER_ENVELOPE_HPP

#include <optional>
#include <string>
#include <string_view>

#include "device/common/device_result.hpp"

namespace simdeck::server {

using json = device::json;

/**
 * @brief Uniform success/error wrapper returned by every command
 *
 * Serialized as {"success", "action", "result" | "error", "timestamp"} in
 * that key order, with exactly one of result/error present.
 */
struct Envelope {
    bool success{false};
    std::string action;
    json result;
    std::optional<device::DeviceError> error;
    std::string timestamp;  ///< RFC3339 UTC

    /**
     * @brief Creates a success envelope stamped with the current time
     */
    static auto makeSuccess(std::string action, json result) -> Envelope;

    /**
     * @brief Creates an error envelope stamped with the current time
     */
    static auto makeError(std::string action, device::DeviceError error)
        -> Envelope;

    /**
     * @brief Wrap a device result, serializing the value with toJson()
     */
    template <typename T>
    static auto fromResult(std::string action,
                           const device::DeviceResult<T>& outcome)
        -> Envelope {
        if (outcome) {
            return makeSuccess(std::move(action), outcome->toJson());
        }
        return makeError(std::move(action), outcome.error());
    }

    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Serialize; invalid UTF-8 in any string becomes U+FFFD
     */
    [[nodiscard]] auto dump(int indent = 2) const -> std::string {
        return toJson().dump(indent, ' ', false,
                             json::error_handler_t::replace);
    }

    /**
     * @throws device::DeviceException if the object is not a well-formed
     * envelope
     */
    static auto fromJson(const json& j) -> Envelope;

    /**
     * @brief Parse envelope text, e.g. the stdout of a remote simdeck
     */
    static auto parse(std::string_view text) -> device::DeviceResult<Envelope>;
};

}  // namespace simdeck::server

#endif  // SIMDECK_SERVER_ENVELOPE_HPP
