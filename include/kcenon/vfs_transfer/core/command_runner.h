/**
 * @file command_runner.h
 * @brief Running external tools on behalf of a backend
 */

#ifndef KCENON_VFS_TRANSFER_CORE_COMMAND_RUNNER_H
#define KCENON_VFS_TRANSFER_CORE_COMMAND_RUNNER_H

#include <string>
#include <string_view>

#include "kcenon/vfs_transfer/core/types.h"

namespace kcenon::vfs_transfer {

/**
 * @brief Run a shell command and capture its combined stdout/stderr
 *
 * @param remote Name of the backend running the command, used in the error
 * @param command Command line passed to /bin/sh
 * @return Captured output on exit status 0; otherwise remote_command_failed
 *         with command_failure_details
 */
[[nodiscard]] auto run_backend_command(std::string_view remote, std::string_view command)
    -> result<std::string>;

/**
 * @brief Build the error for a command that exited with a non-zero status
 */
[[nodiscard]] auto make_command_failure(std::string_view remote,
                                        std::string_view command,
                                        int exit_code,
                                        std::string error_output) -> error;

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_CORE_COMMAND_RUNNER_H
