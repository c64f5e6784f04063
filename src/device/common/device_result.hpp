/*
 * device_result.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device operation result types using std::expected

**************************************************/

#ifndef SIMDECK_DEVICE_COMMON_DEVICE_RESULT_HPP
#define SIMDECK_DEVICE_COMMON_DEVICE_RESULT_HPP

#include <expected>
#include <functional>
#include <type_traits>

#include "device_error.hpp"
#include "device_exceptions.hpp"

namespace simdeck::device {

/**
 * @brief Result type for device operations
 *
 * Uses std::expected to represent either a successful value or an error.
 */
template <typename T>
using DeviceResult = std::expected<T, DeviceError>;

/**
 * @brief Run a function returning DeviceResult<T> and convert any exception
 * it throws into an error result
 */
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> std::invoke_result_t<F> {
    try {
        return std::invoke(std::forward<F>(func));
    } catch (const DeviceException& e) {
        return std::unexpected(e.error());
    } catch (const std::exception& e) {
        return std::unexpected(
            DeviceError(DeviceErrorCode::InternalError, e.what()));
    }
}

}  // namespace simdeck::device

#endif  // SIMDECK_DEVICE_COMMON_DEVICE_RESULT_HPP
