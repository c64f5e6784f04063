/*
 * device_exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device exception hierarchy carrying a DeviceError

**************************************************/

#ifndef SIMDECK_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP
#define SIMDECK_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "device_error.hpp"

namespace simdeck::device {

/**
 * @brief Base exception class for all device-related exceptions
 */
class DeviceException : public std::runtime_error {
public:
    explicit DeviceException(
        const std::string& message,
        DeviceErrorCode code = DeviceErrorCode::InternalError)
        : std::runtime_error(message), error_(code, message) {}

    explicit DeviceException(const DeviceError& error)
        : std::runtime_error(error.toString()), error_(error) {}

    [[nodiscard]] auto error() const noexcept -> const DeviceError& {
        return error_;
    }

    [[nodiscard]] auto code() const noexcept -> DeviceErrorCode {
        return error_.code;
    }

protected:
    DeviceError error_;
};

}  // namespace simdeck::device

#endif  // SIMDECK_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP
