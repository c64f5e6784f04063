/*
 * log_setup.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: spdlog configuration for one CLI invocation

**************************************************/

#include "log_setup.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace simdeck::logging {

auto toSpdlogLevel(config::LogLevel level) noexcept
    -> spdlog::level::level_enum {
    using config::LogLevel;
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::warn;
}

auto initialize(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    auto level = config::logLevelFromString(config.level);
    if (!level) {
        throw config::InvalidConfigException(
            "unknown log level '" + config.level + "'", "logging.level");
    }
    const auto spdLevel = toSpdlogLevel(*level);

    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(spdLevel);
    consoleSink->set_pattern(config.pattern);
    sinks.push_back(consoleSink);

    if (!config.file.empty()) {
        auto parent = std::filesystem::path(config.file).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, config.maxFileSize, config.maxFiles);
        fileSink->set_level(spdLevel);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [pid %P] %v");
        sinks.push_back(fileSink);
    }

    spdlog::drop(std::string(kDefaultLoggerName));
    auto logger = std::make_shared<spdlog::logger>(
        std::string(kDefaultLoggerName), sinks.begin(), sinks.end());
    logger->set_level(spdLevel);
    logger->flush_on(spdlog::level::err);

    spdlog::set_default_logger(logger);
    spdlog::debug("Logging initialized at level {}", config.level);
    return logger;
}

void shutdown() noexcept {
    spdlog::shutdown();
}

}  // namespace simdeck::logging
