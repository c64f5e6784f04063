/*
 * command_line.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: simdeck's options on top of atom's argument parser

**************************************************/

#ifndef SIMDECK_CLI_COMMAND_LINE_HPP
#define SIMDECK_CLI_COMMAND_LINE_HPP

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "atom/utils/argsview.hpp"

namespace simdeck::cli {

/**
 * @brief The parsed command line of one invocation
 *
 * The leading bare words form the command path ("simulator boot"); the
 * options after them are handed to atom::utils::ArgumentParser. Besides the
 * forms atom accepts (`--name value`, `-n value`), `--name=value` is split
 * into two tokens first. Switches such as `--verbose` take no value; the
 * `--wait` boolean does (`--wait false`).
 *
 * One instance parses exactly once.
 */
class CommandLine {
public:
    CommandLine();

    CommandLine(const CommandLine&) = delete;
    CommandLine& operator=(const CommandLine&) = delete;

    /**
     * @brief Parse the arguments that follow the program name
     * @throws device::DeviceException (INTERNAL_ERROR) if atom rejects an
     *         option or a value
     */
    void parse(const std::vector<std::string>& args);

    [[nodiscard]] auto path() const -> const std::vector<std::string>& {
        return path_;
    }

    /**
     * @brief --help or -h was given; nothing else was parsed
     */
    [[nodiscard]] auto helpRequested() const -> bool { return help_; }

    [[nodiscard]] auto getString(const std::string& name) const
        -> std::optional<std::string>;
    [[nodiscard]] auto getInt(const std::string& name) const
        -> std::optional<int>;

    /**
     * @brief Value of a boolean option or switch; switches read false when
     *        absent
     */
    [[nodiscard]] auto getBool(const std::string& name) const
        -> std::optional<bool>;

    /**
     * @brief Usage text listing every option with its default
     */
    [[nodiscard]] static auto help() -> std::string;

private:
    atom::utils::ArgumentParser parser_;
    std::set<std::string> switches_;
    std::vector<std::string> path_;
    bool help_{false};
};

}  // namespace simdeck::cli

#endif  // SIMDECK_CLI_COMMAND_LINE_HPP
