/*
 * application.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: One simdeck invocation: argv in, one JSON envelope out

**************************************************/

#ifndef SIMDECK_CLI_APPLICATION_HPP
#define SIMDECK_CLI_APPLICATION_HPP

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "command_line.hpp"
#include "utils/process/process_runner.hpp"

#ifndef SIMDECK_VERSION
#define SIMDECK_VERSION "0.1.0"
#endif

namespace simdeck::cli {

/**
 * @brief Runs one command end to end
 *
 * Order of work: parse argv, load configuration (defaults, file, then
 * command line overrides), configure logging, pick the local or ssh bridge,
 * dispatch. Every outcome, including argv and config errors, is written to
 * `out` as exactly one envelope; logs never go there.
 */
class Application {
public:
    explicit Application(std::shared_ptr<utils::CommandRunner> runner);

    /**
     * @param args argv without the program name
     * @return Process exit code: 0 on success, 1 on any error
     */
    auto run(const std::vector<std::string>& args, std::ostream& out) -> int;

private:
    std::shared_ptr<utils::CommandRunner> runner_;
};

}  // namespace simdeck::cli

#endif  // SIMDECK_CLI_APPLICATION_HPP
