/**
 * @file config.hpp
 * @brief Main aggregated header for the simdeck config library.
 *
 * @par Usage Example:
 * @code
 * #include "config/config.hpp"
 *
 * using namespace simdeck::config;
 *
 * // Defaults, then --config / $SIMDECK_CONFIG / ~/.config/simdeck
 * auto config = loadConfig(args.getString("config").value_or(""));
 *
 * // Command line overrides are applied to the returned value
 * config.logging.level = "debug";
 * @endcode
 *
 * @date 2024-12
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef SIMDECK_CONFIG_HPP
#define SIMDECK_CONFIG_HPP

#include "config_loader.hpp"
#include "core/config_section.hpp"
#include "core/exception.hpp"
#include "sections/sections.hpp"

#endif  // SIMDECK_CONFIG_HPP
