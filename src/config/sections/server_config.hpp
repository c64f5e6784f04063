/*
 * server_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Remote execution and output configuration

**************************************************/

#ifndef SIMDECK_CONFIG_SECTIONS_SERVER_CONFIG_HPP
#define SIMDECK_CONFIG_SECTIONS_SERVER_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace simdeck::config {

/**
 * @brief How commands are forwarded to a simdeck on another machine
 */
struct RemoteConfig : ConfigSection<RemoteConfig> {
    static constexpr std::string_view PATH = "remote";

    std::string sshPath{"ssh"};
    std::string remoteBinary{"simdeck"};  ///< Looked up on the remote PATH
    int defaultPort{22};
    int connectTimeoutSec{10};
    int commandTimeoutSec{180};
    std::string tailscalePath{"tailscale"};

    [[nodiscard]] json serialize() const {
        return {{"sshPath", sshPath},
                {"remoteBinary", remoteBinary},
                {"defaultPort", defaultPort},
                {"connectTimeoutSec", connectTimeoutSec},
                {"commandTimeoutSec", commandTimeoutSec},
                {"tailscalePath", tailscalePath}};
    }

    [[nodiscard]] static RemoteConfig deserialize(const json& j) {
        RemoteConfig cfg;
        cfg.sshPath = j.value("sshPath", cfg.sshPath);
        cfg.remoteBinary = j.value("remoteBinary", cfg.remoteBinary);
        cfg.defaultPort = j.value("defaultPort", cfg.defaultPort);
        cfg.connectTimeoutSec =
            j.value("connectTimeoutSec", cfg.connectTimeoutSec);
        cfg.commandTimeoutSec =
            j.value("commandTimeoutSec", cfg.commandTimeoutSec);
        cfg.tailscalePath = j.value("tailscalePath", cfg.tailscalePath);
        return cfg;
    }

    void validate() const {
        if (sshPath.empty()) {
            invalid("sshPath", "must not be empty");
        }
        if (remoteBinary.empty()) {
            invalid("remoteBinary", "must not be empty");
        }
        if (defaultPort < 1 || defaultPort > 65535) {
            invalid("defaultPort", "must be between 1 and 65535");
        }
        if (connectTimeoutSec <= 0) {
            invalid("connectTimeoutSec", "must be positive");
        }
        if (commandTimeoutSec <= 0) {
            invalid("commandTimeoutSec", "must be positive");
        }
    }
};

/**
 * @brief Envelope rendering on stdout
 */
struct OutputConfig : ConfigSection<OutputConfig> {
    static constexpr std::string_view PATH = "output";

    int indent{2};  ///< -1 prints the envelope on a single line

    [[nodiscard]] json serialize() const { return {{"indent", indent}}; }

    [[nodiscard]] static OutputConfig deserialize(const json& j) {
        OutputConfig cfg;
        cfg.indent = j.value("indent", cfg.indent);
        return cfg;
    }

    void validate() const {
        if (indent < -1 || indent > 8) {
            invalid("indent", "must be between -1 and 8");
        }
    }
};

}  // namespace simdeck::config

#endif  // SIMDECK_CONFIG_SECTIONS_SERVER_CONFIG_HPP
