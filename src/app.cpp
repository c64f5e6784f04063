/**
 * @file app.cpp
 * @brief Entry point of the simdeck command line tool
 *
 * Prints exactly one JSON envelope on stdout and exits 0 on success, 1 on
 * any error. Logs go to stderr and, if configured, a rotating file.
 */

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/application.hpp"
#include "logging/log_setup.hpp"
#include "utils/process/process_runner.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    simdeck::cli::Application app(
        std::make_shared<simdeck::utils::ProcessRunner>());
    int code = app.run(args, std::cout);

    simdeck::logging::shutdown();
    return code;
}
