/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Configuration Exception Types

**************************************************/

#ifndef SIMDECK_CONFIG_CORE_EXCEPTION_HPP
#define SIMDECK_CONFIG_CORE_EXCEPTION_HPP

#include <stdexcept>
#include <string>

namespace simdeck::config {

/**
 * @brief Base exception for configuration errors
 *
 * `key()` names the offending setting ("lifecycle.pollIntervalMs") or the
 * file that could not be read; it may be empty.
 */
class ConfigException : public std::runtime_error {
public:
    explicit ConfigException(const std::string& message,
                             std::string key = "")
        : std::runtime_error(key.empty() ? message : key + ": " + message),
          key_(std::move(key)) {}

    [[nodiscard]] auto key() const noexcept -> const std::string& {
        return key_;
    }

private:
    std::string key_;
};

/**
 * @brief A value has the wrong type or is out of range
 */
class InvalidConfigException : public ConfigException {
    using ConfigException::ConfigException;
};

/**
 * @brief A configuration file could not be read or parsed
 */
class ConfigIOException : public ConfigException {
    using ConfigException::ConfigException;
};

}  // namespace simdeck::config

#endif  // SIMDECK_CONFIG_CORE_EXCEPTION_HPP
