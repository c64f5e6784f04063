/*
 * process_runner.hpp
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SIMDECK_UTILS_PROCESS_PROCESS_RUNNER_HPP
#define SIMDECK_UTILS_PROCESS_PROCESS_RUNNER_HPP

#include <chrono>
#include <string>
#include <vector>

namespace simdeck::utils {

/**
 * @brief Result of a command execution
 */
struct CommandResult {
    int exitCode{-1};
    std::string output;
    std::string errorOutput;
    bool timedOut{false};      ///< Killed after the timeout expired
    bool launchFailed{false};  ///< Pipes, fork or exec failed

    [[nodiscard]] auto ok() const -> bool {
        return !timedOut && !launchFailed && exitCode == 0;
    }
};

/**
 * @brief Execute a program directly (no shell) and capture its output
 * @param argv Program followed by its arguments; argv[0] is looked up in PATH
 * @param timeout Maximum execution time; the child is killed afterwards
 * @return CommandResult with exit code and output
 */
CommandResult executeCommand(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout =
                                 std::chrono::seconds{120});

/**
 * @brief Render argv for log messages
 */
[[nodiscard]] auto joinCommand(const std::vector<std::string>& argv)
    -> std::string;

/**
 * @brief Seam between the bridges and process creation
 *
 * Bridges receive a runner instead of forking themselves so tests can
 * script tool output.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual auto run(const std::vector<std::string>& argv,
                     std::chrono::milliseconds timeout) -> CommandResult = 0;
};

/**
 * @brief CommandRunner that spawns real processes via executeCommand()
 */
class ProcessRunner : public CommandRunner {
public:
    auto run(const std::vector<std::string>& argv,
             std::chrono::milliseconds timeout) -> CommandResult override;
};

}  // namespace simdeck::utils

#endif
