/*
 * common.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Aggregate header for the device error and result types

**************************************************/

#ifndef SIMDECK_DEVICE_COMMON_HPP
#define SIMDECK_DEVICE_COMMON_HPP

// Error codes and error structures
#include "device_error.hpp"

// Exception hierarchy
#include "device_exceptions.hpp"

// Result types using std::expected
#include "device_result.hpp"

#endif  // SIMDECK_DEVICE_COMMON_HPP
