/*
 * application.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "application.hpp"

#include <chrono>
#include <optional>

#include <spdlog/spdlog.h>

#include "config/config.hpp"
#include "device/bridge/remote_bridge.hpp"
#include "device/bridge/simctl_bridge.hpp"
#include "device/manager/lifecycle_manager.hpp"
#include "logging/log_setup.hpp"
#include "server/command.hpp"

namespace simdeck::cli {

namespace {

constexpr const char* kCliAction = "cli";

void writeEnvelope(std::ostream& out, const server::Envelope& envelope,
                   int indent) {
    out << envelope.dump(indent) << '\n';
    out.flush();
}

auto makeBridge(const config::SimdeckConfig& config,
                std::shared_ptr<utils::CommandRunner> runner,
                const std::optional<device::RemoteEndpoint>& remote)
    -> std::shared_ptr<device::ControlBridge> {
    if (remote) {
        device::RemoteBridgeOptions options;
        options.sshPath = config.remote.sshPath;
        options.remoteBinary = config.remote.remoteBinary;
        options.connectTimeoutSec = config.remote.connectTimeoutSec;
        options.commandTimeout =
            std::chrono::seconds(config.remote.commandTimeoutSec);
        return std::make_shared<device::RemoteBridge>(std::move(runner),
                                                      *remote, options);
    }

    device::SimctlBridgeOptions options;
    options.xcrunPath = config.control.xcrunPath;
    options.idbPath = config.control.idbPath;
    options.plutilPath = config.control.plutilPath;
    options.commandTimeout =
        std::chrono::seconds(config.control.commandTimeoutSec);
    return std::make_shared<device::SimctlBridge>(std::move(runner), options);
}

}  // namespace

Application::Application(std::shared_ptr<utils::CommandRunner> runner)
    : runner_(std::move(runner)) {}

auto Application::run(const std::vector<std::string>& args, std::ostream& out)
    -> int {
    const int defaultIndent = config::OutputConfig{}.indent;

    // Until the configuration is known: warnings only, on stderr
    logging::initialize(config::LoggingConfig{});

    CommandLine parser;
    try {
        parser.parse(args);
    } catch (const device::DeviceException& e) {
        writeEnvelope(out, server::Envelope::makeError(kCliAction, e.error()),
                      defaultIndent);
        return 1;
    }

    if (parser.helpRequested()) {
        out << CommandLine::help();
        return 0;
    }
    if (parser.getBool("version").value_or(false)) {
        writeEnvelope(out,
                      server::Envelope::makeSuccess(
                          "version", {{"version", SIMDECK_VERSION}}),
                      defaultIndent);
        return 0;
    }

    config::SimdeckConfig config;
    try {
        config = config::loadConfig(parser.getString("config").value_or(""));
        if (parser.getBool("verbose").value_or(false)) {
            config.logging.level = "debug";
        }
        if (auto level = parser.getString("log-level")) {
            config.logging.level = *level;
        }
        config.logging.validate();
        logging::initialize(config.logging);
    } catch (const config::ConfigException& e) {
        auto err = device::error::internalError(
            std::string("Invalid configuration: ") + e.what());
        if (!e.key().empty()) {
            err.details["key"] = e.key();
        }
        writeEnvelope(out, server::Envelope::makeError(kCliAction, err),
                      defaultIndent);
        return 1;
    } catch (const spdlog::spdlog_ex& e) {
        writeEnvelope(
            out,
            server::Envelope::makeError(
                kCliAction, device::error::internalError(
                                std::string("Cannot set up logging: ") +
                                e.what())),
            defaultIndent);
        return 1;
    }
    const int indent = config.output.indent;

    server::CommandDispatcher dispatcher;
    server::registerAllCommands(dispatcher);

    const auto& path = parser.path();
    auto action = dispatcher.resolve(path);
    if (!action) {
        std::string command;
        for (const auto& word : path) {
            command += command.empty() ? word : " " + word;
        }
        auto err = device::error::internalError(
            command.empty() ? "No command given (try --help)"
                            : "Unknown command: " + command);
        writeEnvelope(out, server::Envelope::makeError(kCliAction, err),
                      indent);
        return 1;
    }

    std::optional<device::RemoteEndpoint> remote;
    if (auto hostPort = parser.getString("remote-host")) {
        auto endpoint = device::parseRemoteEndpoint(
            *hostPort, config.remote.defaultPort);
        if (!endpoint) {
            writeEnvelope(
                out, server::Envelope::makeError(*action, endpoint.error()),
                indent);
            return 1;
        }
        remote = *endpoint;
    }

    auto bridge = makeBridge(config, runner_, remote);
    device::LifecycleOptions lifecycleOptions;
    lifecycleOptions.pollInterval =
        std::chrono::milliseconds(config.lifecycle.pollIntervalMs);
    device::LifecycleManager manager(bridge, lifecycleOptions);

    server::CommandContext context{config, parser, manager, runner_, remote};
    auto envelope = dispatcher.dispatch(*action, context);
    if (!envelope.success) {
        spdlog::info("{} failed: {}", *action, envelope.error->toString());
    }
    writeEnvelope(out, envelope, indent);
    return envelope.success ? 0 : 1;
}

}  // namespace simdeck::cli
