/*
 * process_runner.cpp
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "process_runner.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace simdeck::utils {

namespace {

constexpr int kTimeoutExitCode = -2;
constexpr int kExecFailedExitCode = 127;

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

}  // namespace

CommandResult executeCommand(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout) {
    CommandResult result;
    if (argv.empty()) {
        result.launchFailed = true;
        result.errorOutput = "Empty command";
        return result;
    }

    std::array<int, 2> stdoutPipe{-1, -1};
    std::array<int, 2> stderrPipe{-1, -1};

    if (pipe(stdoutPipe.data()) != 0) {
        result.launchFailed = true;
        result.errorOutput = "Failed to create pipes";
        return result;
    }
    if (pipe(stderrPipe.data()) != 0) {
        closeFd(stdoutPipe[0]);
        closeFd(stdoutPipe[1]);
        result.launchFailed = true;
        result.errorOutput = "Failed to create pipes";
        return result;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        for (auto* fd : {&stdoutPipe[0], &stdoutPipe[1], &stderrPipe[0],
                         &stderrPipe[1]}) {
            closeFd(*fd);
        }
        result.launchFailed = true;
        result.errorOutput = "Failed to fork";
        return result;
    }

    if (pid == 0) {
        // Child process
        close(stdoutPipe[0]);
        close(stderrPipe[0]);
        dup2(stdoutPipe[1], STDOUT_FILENO);
        dup2(stderrPipe[1], STDERR_FILENO);
        close(stdoutPipe[1]);
        close(stderrPipe[1]);

        execvp(cargv[0], cargv.data());

        const char* reason = std::strerror(errno);
        const char prefix[] = "exec failed: ";
        [[maybe_unused]] auto w1 =
            write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
        [[maybe_unused]] auto w2 =
            write(STDERR_FILENO, reason, std::strlen(reason));
        _exit(kExecFailedExitCode);
    }

    // Parent process
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    // Both pipes are drained together so a chatty stderr cannot block the
    // child while we wait on stdout.
    std::array<pollfd, 2> fds{{{stdoutPipe[0], POLLIN, 0},
                               {stderrPipe[0], POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&result.output, &result.errorOutput};
    std::array<char, 4096> buffer{};
    int openPipes = 2;
    bool killChild = false;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (openPipes > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                             deadline - std::chrono::steady_clock::now())
                             .count();
        if (remaining <= 0) {
            result.timedOut = true;
            killChild = true;
            break;
        }

        int rc = poll(fds.data(), fds.size(), static_cast<int>(remaining));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll() failed while running {}: {}", argv[0],
                          std::strerror(errno));
            result.errorOutput += "poll failed: ";
            result.errorOutput += std::strerror(errno);
            killChild = true;
            break;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t bytesRead = read(fds[i].fd, buffer.data(), buffer.size());
            if (bytesRead > 0) {
                sinks[i]->append(buffer.data(),
                                 static_cast<std::size_t>(bytesRead));
            } else if (bytesRead == 0 || errno != EINTR) {
                closeFd(fds[i].fd);
                --openPipes;
            }
        }
    }

    closeFd(fds[0].fd);
    closeFd(fds[1].fd);

    // Nobody reads the pipes any more; the child must not outlive us
    if (killChild) {
        if (result.timedOut) {
            spdlog::warn("Command timed out after {}ms, killing: {}",
                         timeout.count(), joinCommand(argv));
        }
        kill(pid, SIGKILL);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (result.timedOut) {
        result.exitCode = kTimeoutExitCode;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    } else {
        result.exitCode = -1;
    }
    result.launchFailed = !result.timedOut &&
                          result.exitCode == kExecFailedExitCode &&
                          result.errorOutput.starts_with("exec failed");
    return result;
}

auto joinCommand(const std::vector<std::string>& argv) -> std::string {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

auto ProcessRunner::run(const std::vector<std::string>& argv,
                        std::chrono::milliseconds timeout) -> CommandResult {
    spdlog::debug("Running: {}", joinCommand(argv));
    auto result = executeCommand(argv, timeout);
    spdlog::debug("Exit code {} ({} bytes stdout, {} bytes stderr)",
                  result.exitCode, result.output.size(),
                  result.errorOutput.size());
    return result;
}

}  // namespace simdeck::utils
