/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Logging configuration

**************************************************/

#ifndef SIMDECK_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define SIMDECK_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "../core/config_section.hpp"

namespace simdeck::config {

/**
 * @brief Log level enumeration
 */
enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, Off };

[[nodiscard]] inline std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "warn";
}

/**
 * @brief Parse a level name; accepts the usual aliases
 */
[[nodiscard]] inline std::optional<LogLevel> logLevelFromString(
    const std::string& str) {
    if (str == "trace") return LogLevel::Trace;
    if (str == "debug") return LogLevel::Debug;
    if (str == "info") return LogLevel::Info;
    if (str == "warn" || str == "warning") return LogLevel::Warn;
    if (str == "error" || str == "err") return LogLevel::Error;
    if (str == "critical" || str == "fatal") return LogLevel::Critical;
    if (str == "off" || str == "none") return LogLevel::Off;
    return std::nullopt;
}

/**
 * @brief Logging configuration
 *
 * Console output always goes to stderr; `file` adds a size-rotated log file.
 *
 * @example
 * ```json
 * "logging": {
 *     "level": "info",
 *     "file": "/tmp/simdeck.log",
 *     "maxFileSize": 10485760,
 *     "maxFiles": 3
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view PATH = "logging";

    std::string level{"warn"};        ///< Console and file level
    std::string file;                 ///< Empty disables the file sink
    std::size_t maxFileSize{10 * 1024 * 1024};
    std::size_t maxFiles{3};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};

    [[nodiscard]] json serialize() const {
        return {{"level", level},
                {"file", file},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles},
                {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.file = j.value("file", cfg.file);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        cfg.pattern = j.value("pattern", cfg.pattern);
        return cfg;
    }

    void validate() const {
        if (!logLevelFromString(level)) {
            invalid("level", "unknown log level '" + level + "'");
        }
        if (maxFileSize < 1024) {
            invalid("maxFileSize", "must be at least 1024 bytes");
        }
        if (maxFiles == 0) {
            invalid("maxFiles", "must be at least 1");
        }
    }
};

}  // namespace simdeck::config

#endif  // SIMDECK_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
