/*
 * device_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Control tool and lifecycle timing configuration

**************************************************/

#ifndef SIMDECK_CONFIG_SECTIONS_DEVICE_CONFIG_HPP
#define SIMDECK_CONFIG_SECTIONS_DEVICE_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace simdeck::config {

/**
 * @brief External tools driven by the local bridge
 */
struct ControlConfig : ConfigSection<ControlConfig> {
    static constexpr std::string_view PATH = "control";

    std::string xcrunPath{"xcrun"};
    std::string idbPath{"idb"};
    std::string plutilPath{"plutil"};
    int commandTimeoutSec{120};  ///< Per tool invocation

    [[nodiscard]] json serialize() const {
        return {{"xcrunPath", xcrunPath},
                {"idbPath", idbPath},
                {"plutilPath", plutilPath},
                {"commandTimeoutSec", commandTimeoutSec}};
    }

    [[nodiscard]] static ControlConfig deserialize(const json& j) {
        ControlConfig cfg;
        cfg.xcrunPath = j.value("xcrunPath", cfg.xcrunPath);
        cfg.idbPath = j.value("idbPath", cfg.idbPath);
        cfg.plutilPath = j.value("plutilPath", cfg.plutilPath);
        cfg.commandTimeoutSec =
            j.value("commandTimeoutSec", cfg.commandTimeoutSec);
        return cfg;
    }

    void validate() const {
        if (xcrunPath.empty()) {
            invalid("xcrunPath", "must not be empty");
        }
        if (idbPath.empty()) {
            invalid("idbPath", "must not be empty");
        }
        if (plutilPath.empty()) {
            invalid("plutilPath", "must not be empty");
        }
        if (commandTimeoutSec <= 0) {
            invalid("commandTimeoutSec", "must be positive");
        }
    }
};

/**
 * @brief Boot/shutdown wait defaults
 */
struct LifecycleConfig : ConfigSection<LifecycleConfig> {
    static constexpr std::string_view PATH = "lifecycle";

    int pollIntervalMs{500};
    int bootTimeoutSec{60};
    int shutdownTimeoutSec{60};

    [[nodiscard]] json serialize() const {
        return {{"pollIntervalMs", pollIntervalMs},
                {"bootTimeoutSec", bootTimeoutSec},
                {"shutdownTimeoutSec", shutdownTimeoutSec}};
    }

    [[nodiscard]] static LifecycleConfig deserialize(const json& j) {
        LifecycleConfig cfg;
        cfg.pollIntervalMs = j.value("pollIntervalMs", cfg.pollIntervalMs);
        cfg.bootTimeoutSec = j.value("bootTimeoutSec", cfg.bootTimeoutSec);
        cfg.shutdownTimeoutSec =
            j.value("shutdownTimeoutSec", cfg.shutdownTimeoutSec);
        return cfg;
    }

    void validate() const {
        if (pollIntervalMs <= 0) {
            invalid("pollIntervalMs", "must be positive");
        }
        if (bootTimeoutSec < 0) {
            invalid("bootTimeoutSec", "must not be negative");
        }
        if (shutdownTimeoutSec < 0) {
            invalid("shutdownTimeoutSec", "must not be negative");
        }
    }
};

}  // namespace simdeck::config

#endif  // SIMDECK_CONFIG_SECTIONS_DEVICE_CONFIG_HPP
