/*
 * log_setup.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: spdlog configuration for one CLI invocation

**************************************************/

#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace simdeck::logging {

inline constexpr std::string_view kDefaultLoggerName = "simdeck";

/**
 * @brief Map a config level onto spdlog's
 */
[[nodiscard]] auto toSpdlogLevel(config::LogLevel level) noexcept
    -> spdlog::level::level_enum;

/**
 * @brief Build the `simdeck` logger and install it as spdlog's default
 *
 * The console sink writes to stderr: stdout carries the JSON envelope and
 * nothing else. A rotating file sink is added when `config.file` is set.
 * Calling this again replaces the previous default logger.
 *
 * @throws config::InvalidConfigException for an unknown level
 * @throws spdlog::spdlog_ex if the log file cannot be opened
 */
auto initialize(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Flush and drop every registered logger
 */
void shutdown() noexcept;

}  // namespace simdeck::logging
