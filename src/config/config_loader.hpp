/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Per-invocation configuration: defaults, an optional JSON file
and command line overrides

**************************************************/

#ifndef SIMDECK_CONFIG_CONFIG_LOADER_HPP
#define SIMDECK_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>
#include <optional>
#include <string>

#include "sections/sections.hpp"

namespace simdeck::config {

/// Environment variable naming a config file
inline constexpr const char* kConfigEnvVar = "SIMDECK_CONFIG";

/**
 * @brief Complete configuration of one invocation
 *
 * Built once in main and passed by reference; nothing reads it through a
 * global.
 */
struct SimdeckConfig {
    LoggingConfig logging;
    ControlConfig control;
    LifecycleConfig lifecycle;
    RemoteConfig remote;
    OutputConfig output;

    [[nodiscard]] json toJson() const;

    /**
     * @brief Read every known section; unknown top-level keys are ignored
     * @throws InvalidConfigException
     */
    [[nodiscard]] static SimdeckConfig fromJson(const json& j);

    bool operator==(const SimdeckConfig&) const = default;
};

/**
 * @brief Read and validate a configuration file
 * @throws ConfigIOException if the file cannot be opened or is not JSON
 * @throws InvalidConfigException if a value is invalid
 */
[[nodiscard]] auto loadConfigFile(const std::filesystem::path& path)
    -> SimdeckConfig;

/**
 * @brief Pick the file to load
 *
 * An explicit path wins, then $SIMDECK_CONFIG, then
 * ~/.config/simdeck/config.json when it exists.
 */
[[nodiscard]] auto resolveConfigPath(const std::string& explicitPath)
    -> std::optional<std::filesystem::path>;

/**
 * @brief Defaults merged with the resolved file, if any
 */
[[nodiscard]] auto loadConfig(const std::string& explicitPath = "")
    -> SimdeckConfig;

}  // namespace simdeck::config

#endif  // SIMDECK_CONFIG_CONFIG_LOADER_HPP
