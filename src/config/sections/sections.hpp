/*
 * sections.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Aggregated header for all configuration sections

**************************************************/

#ifndef SIMDECK_CONFIG_SECTIONS_HPP
#define SIMDECK_CONFIG_SECTIONS_HPP

#include "device_config.hpp"
#include "logging_config.hpp"
#include "server_config.hpp"

#endif  // SIMDECK_CONFIG_SECTIONS_HPP
