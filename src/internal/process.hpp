#pragma once

#include "litmus/format.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace litmus::internal {

    using namespace litmus::literals;

    struct process_result {
        int exit_code{-1};
        // stdout and stderr, interleaved as written
        std::string output{};
    };

    inline process_result run_process(
            const std::vector<std::string>& args,
            const std::filesystem::path& cwd,
            const std::map<std::string, std::string>& env = {}) {
        if (args.empty()) {
            throw std::invalid_argument("run_process requires a command");
        }

        // close-on-exec; dup2 clears the flag on the child's redirected descriptors
        int pipe_fds[2];
#if LITMUS_PLATFORM_MACOS
        if (::pipe(pipe_fds) != 0 || ::fcntl(pipe_fds[0], F_SETFD, FD_CLOEXEC) != 0 ||
            ::fcntl(pipe_fds[1], F_SETFD, FD_CLOEXEC) != 0) {
#else
        if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
#endif
            throw std::runtime_error("pipe failed");
        }

        auto pid = ::fork();
        if (pid < 0) {
            ::close(pipe_fds[0]);
            ::close(pipe_fds[1]);
            throw std::runtime_error("fork failed");
        }

        if (pid == 0) {
            ::close(pipe_fds[0]);
            if (::dup2(pipe_fds[1], STDOUT_FILENO) < 0) {
                _exit(127);
            }
            if (::dup2(pipe_fds[1], STDERR_FILENO) < 0) {
                _exit(127);
            }
            ::close(pipe_fds[1]);

            if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
                _exit(127);
            }
            for (const auto& [key, value] : env) {
                if (::setenv(key.c_str(), value.c_str(), 1) != 0) {
                    _exit(127);
                }
            }

            std::vector<char*> argv{};
            argv.reserve(args.size() + 1U);
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        ::close(pipe_fds[1]);

        process_result result{};
        char buffer[4096];
        while (true) {
            auto n = ::read(pipe_fds[0], buffer, sizeof(buffer));
            if (n > 0) {
                result.output.append(buffer, static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            break;
        }
        ::close(pipe_fds[0]);

        int status = 0;
        if (::waitpid(pid, &status, 0) < 0) {
            throw std::runtime_error("waitpid failed for {}"_format(args.front()));
        }

        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
        else {
            result.exit_code = 1;
        }
        return result;
    }

}  // namespace litmus::internal
