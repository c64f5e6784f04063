/*
 * command_line.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_line.hpp"

#include <any>
#include <exception>
#include <format>

#include <spdlog/spdlog.h>

#include "device/common/device_exceptions.hpp"

namespace simdeck::cli {

namespace {

using ArgType = atom::utils::ArgumentParser::ArgType;

enum class OptionKind { String, Integer, Boolean, Switch };

struct OptionSpec {
    const char* name;
    OptionKind kind;
    const char* defaultValue;  // nullptr: no default
    const char* help;
    std::vector<std::string> aliases;
};

const std::vector<OptionSpec>& options() {
    static const std::vector<OptionSpec> kOptions = {
        // Global
        {"device", OptionKind::String, nullptr, "Device ID to target", {"d"}},
        {"remote-host", OptionKind::String, nullptr,
         "Forward the command over ssh to HOST[:PORT]", {}},
        {"config", OptionKind::String, nullptr, "Path to a JSON config file",
         {}},
        {"verbose", OptionKind::Switch, nullptr, "Debug logging on stderr",
         {"v"}},
        {"log-level", OptionKind::String, nullptr,
         "trace, debug, info, warn, error, critical or off", {}},
        {"version", OptionKind::Switch, nullptr, "Print the version", {}},

        // devices
        {"include-remote", OptionKind::Switch, nullptr,
         "Also list machines on the tailnet", {}},

        // simulator
        {"name", OptionKind::String, nullptr, "Simulator name to boot", {}},
        {"os-version", OptionKind::String, nullptr,
         "OS version filter, e.g. 17.4", {}},
        {"wait", OptionKind::Boolean, "true",
         "Wait for boot/shutdown to complete", {}},
        {"timeout", OptionKind::Integer, nullptr, "Wait timeout in seconds",
         {}},

        // state / screenshot
        {"include-screenshot", OptionKind::Switch, nullptr,
         "Add a screenshot to the state snapshot", {}},
        {"output", OptionKind::String, nullptr,
         "Screenshot path (default: timestamped file in /tmp)", {"o"}},
        {"format", OptionKind::String, "png", "Screenshot format: png or jpeg",
         {}},

        // io
        {"x", OptionKind::Integer, nullptr, "Tap X", {}},
        {"y", OptionKind::Integer, nullptr, "Tap Y", {}},
        {"text", OptionKind::String, nullptr, "Text to type", {"t"}},
        {"start-x", OptionKind::Integer, nullptr, "Swipe start X", {}},
        {"start-y", OptionKind::Integer, nullptr, "Swipe start Y", {}},
        {"end-x", OptionKind::Integer, nullptr, "Swipe end X", {}},
        {"end-y", OptionKind::Integer, nullptr, "Swipe end Y", {}},
        {"duration", OptionKind::Integer, "300",
         "Swipe duration in milliseconds", {}},
        {"button", OptionKind::String, nullptr,
         "HOME, POWER, VOLUME_UP or VOLUME_DOWN", {"b"}},

        // app
        {"bundle", OptionKind::String, nullptr, "Bundle ID of the app", {}},
        {"app", OptionKind::String, nullptr,
         "Path to the .app bundle to install", {}},
    };
    return kOptions;
}

auto defaultOf(const OptionSpec& spec) -> std::any {
    if (spec.defaultValue == nullptr) {
        return {};
    }
    switch (spec.kind) {
        case OptionKind::Integer:
            return std::stoi(spec.defaultValue);
        case OptionKind::Boolean:
            return std::string(spec.defaultValue) == "true";
        default:
            return std::string(spec.defaultValue);
    }
}

auto argTypeOf(OptionKind kind) -> ArgType {
    switch (kind) {
        case OptionKind::Integer:
            return ArgType::INTEGER;
        case OptionKind::Boolean:
            return ArgType::BOOLEAN;
        default:
            return ArgType::STRING;
    }
}

auto isHelp(const std::string& token) -> bool {
    return token == "--help" || token == "-h";
}

}  // namespace

CommandLine::CommandLine() : parser_("simdeck") {
    for (const auto& spec : options()) {
        if (spec.kind == OptionKind::Switch) {
            parser_.addFlag(spec.name, spec.help, spec.aliases);
            switches_.insert(spec.name);
        } else {
            parser_.addArgument(spec.name, argTypeOf(spec.kind), false,
                                defaultOf(spec), spec.help, spec.aliases);
        }
    }
}

void CommandLine::parse(const std::vector<std::string>& args) {
    for (const auto& token : args) {
        if (isHelp(token)) {
            help_ = true;
            return;
        }
    }

    std::size_t i = 0;
    for (; i < args.size() && !args[i].starts_with("-"); ++i) {
        path_.push_back(args[i]);
    }

    std::vector<std::string> argv{"simdeck"};
    for (; i < args.size(); ++i) {
        const auto& token = args[i];
        auto eq = token.find('=');
        if (token.starts_with("--") && eq != std::string::npos) {
            argv.push_back(token.substr(0, eq));
            argv.push_back(token.substr(eq + 1));
        } else {
            argv.push_back(token);
        }
    }

    try {
        parser_.parse(static_cast<int>(argv.size()), argv);
    } catch (const std::exception& e) {
        spdlog::debug("Command line rejected: {}", e.what());
        throw device::DeviceException(device::error::internalError(
            std::string("Invalid command line: ") + e.what()));
    }
}

auto CommandLine::getString(const std::string& name) const
    -> std::optional<std::string> {
    return parser_.get<std::string>(name);
}

auto CommandLine::getInt(const std::string& name) const
    -> std::optional<int> {
    return parser_.get<int>(name);
}

auto CommandLine::getBool(const std::string& name) const
    -> std::optional<bool> {
    if (switches_.contains(name)) {
        return parser_.getFlag(name);
    }
    return parser_.get<bool>(name);
}

auto CommandLine::help() -> std::string {
    std::string out = "Usage: simdeck <command> [options]\n\n";
    out +=
        "Control iOS simulators and devices. Every command prints one JSON "
        "object.\n\nCommands:\n"
        "  devices | simulator boot|shutdown | state | screenshot\n"
        "  io tap|text|swipe|button | app launch|terminate|install\n";
    out += "\nOptions:\n";
    out += std::format("  {:<24} {}\n", "--help, -h", "Print this help");
    for (const auto& spec : options()) {
        std::string names = std::string("--") + spec.name;
        for (const auto& alias : spec.aliases) {
            names += ", -" + alias;
        }
        out += std::format("  {:<24} {}", names, spec.help);
        if (spec.defaultValue != nullptr) {
            out += std::format(" (default: {})", spec.defaultValue);
        }
        out += "\n";
    }
    return out;
}

}  // namespace simdeck::cli
