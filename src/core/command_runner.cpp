/**
 * @file command_runner.cpp
 * @brief Implementation of run_backend_command
 */

#include "kcenon/vfs_transfer/core/command_runner.h"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <sys/wait.h>

#include "kcenon/vfs_transfer/core/logging.h"

namespace kcenon::vfs_transfer {

auto make_command_failure(std::string_view remote,
                          std::string_view command,
                          int exit_code,
                          std::string error_output) -> error {
    std::string message = std::string(remote) + " command '" + std::string(command) +
                          "' finished with non-zero return code " +
                          std::to_string(exit_code) + ": " + error_output;
    return error{error_code::remote_command_failed, std::move(message),
                 command_failure_details{std::string(remote), std::string(command), exit_code,
                                         std::move(error_output)}};
}

auto run_backend_command(std::string_view remote, std::string_view command)
    -> result<std::string> {
    // Subshell so stderr of every part of a compound command is captured.
    std::string shell_command = "(" + std::string(command) + "\n) 2>&1";

    VFS_LOG_DEBUG(log_category::command,
                  std::string(remote) + ": running '" + std::string(command) + "'");

    FILE* pipe = ::popen(shell_command.c_str(), "r");
    if (pipe == nullptr) {
        return unexpected(error{error_code::internal_error,
                                "Failed to start '" + std::string(command) +
                                    "': " + std::strerror(errno)});
    }

    std::string output;
    std::array<char, 4096> buffer{};
    std::size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.append(buffer.data(), n);
    }

    int status = ::pclose(pipe);
    if (status == -1) {
        return unexpected(error{error_code::internal_error,
                                "Failed to wait for '" + std::string(command) +
                                    "': " + std::strerror(errno)});
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    if (exit_code != 0) {
        VFS_LOG_DEBUG(log_category::command,
                      std::string(remote) + ": '" + std::string(command) +
                          "' exited with " + std::to_string(exit_code));
        return unexpected(make_command_failure(remote, command, exit_code, std::move(output)));
    }
    return output;
}

}  // namespace kcenon::vfs_transfer
