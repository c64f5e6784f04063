/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include <spdlog/spdlog.h>

namespace simdeck::config {

namespace {

template <typename Section>
void readSection(const json& root, Section& target) {
    const std::string key(Section::PATH);
    if (auto it = root.find(key); it != root.end() && !it->is_null()) {
        target = Section::fromJson(*it);
    }
}

}  // namespace

json SimdeckConfig::toJson() const {
    return {{std::string(LoggingConfig::PATH), logging.toJson()},
            {std::string(ControlConfig::PATH), control.toJson()},
            {std::string(LifecycleConfig::PATH), lifecycle.toJson()},
            {std::string(RemoteConfig::PATH), remote.toJson()},
            {std::string(OutputConfig::PATH), output.toJson()}};
}

SimdeckConfig SimdeckConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw InvalidConfigException("top level must be an object");
    }
    SimdeckConfig config;
    readSection(j, config.logging);
    readSection(j, config.control);
    readSection(j, config.lifecycle);
    readSection(j, config.remote);
    readSection(j, config.output);
    return config;
}

auto loadConfigFile(const std::filesystem::path& path) -> SimdeckConfig {
    std::ifstream in(path);
    if (!in) {
        throw ConfigIOException("cannot open file", path.string());
    }

    json root;
    try {
        root = json::parse(in, nullptr, true, true);
    } catch (const json::parse_error& e) {
        throw ConfigIOException(e.what(), path.string());
    }

    auto config = SimdeckConfig::fromJson(root);
    spdlog::debug("Config: loaded {}", path.string());
    return config;
}

auto resolveConfigPath(const std::string& explicitPath)
    -> std::optional<std::filesystem::path> {
    if (!explicitPath.empty()) {
        return std::filesystem::path(explicitPath);
    }
    if (const char* env = std::getenv(kConfigEnvVar);
        env != nullptr && *env != '\0') {
        return std::filesystem::path(env);
    }
    if (const char* home = std::getenv("HOME");
        home != nullptr && *home != '\0') {
        auto candidate = std::filesystem::path(home) / ".config" / "simdeck" /
                         "config.json";
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

auto loadConfig(const std::string& explicitPath) -> SimdeckConfig {
    auto path = resolveConfigPath(explicitPath);
    if (!path) {
        return SimdeckConfig{};
    }
    return loadConfigFile(*path);
}

}  // namespace simdeck::config
