/**
 * @file vfs_transfer.h
 * @brief Main header for vfs_transfer_system library
 * @version 0.1.0
 *
 * This is the primary include file for the vfs_transfer_system library.
 * Include this header to access the backend contract and the transfer
 * entry points.
 *
 * @code
 * #include <kcenon/vfs_transfer/vfs_transfer.h>
 *
 * using namespace kcenon::vfs_transfer;
 *
 * auto local = make_filesystem<local_filesystem>(filesystem_config{});
 * if (!local) {
 *     std::cerr << local.error().message << "\n";
 *     return 1;
 * }
 *
 * transfer_orchestrator orchestrator(*local.value(), local.value());
 * auto result = orchestrator.download(path_info::local("/srv/data"),
 *                                     path_info::local("/tmp/data"));
 * @endcode
 */

#ifndef KCENON_VFS_TRANSFER_VFS_TRANSFER_H
#define KCENON_VFS_TRANSFER_VFS_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/vfs_transfer/core/types.h"
#include "kcenon/vfs_transfer/core/cancellation_token.h"
#include "kcenon/vfs_transfer/core/command_runner.h"
#include "kcenon/vfs_transfer/core/logging.h"

// Backends
#include "kcenon/vfs_transfer/fs/capability.h"
#include "kcenon/vfs_transfer/fs/capability_gate.h"
#include "kcenon/vfs_transfer/fs/filesystem.h"
#include "kcenon/vfs_transfer/fs/filesystem_config.h"
#include "kcenon/vfs_transfer/fs/lazy_sequence.h"
#include "kcenon/vfs_transfer/fs/local_filesystem.h"
#include "kcenon/vfs_transfer/fs/path_info.h"

// Progress
#include "kcenon/vfs_transfer/progress/callback_istream.h"
#include "kcenon/vfs_transfer/progress/progress_callback.h"
#include "kcenon/vfs_transfer/progress/progress_indicator.h"

// Transfers
#include "kcenon/vfs_transfer/transfer/directory_scheduler.h"
#include "kcenon/vfs_transfer/transfer/file_materializer.h"
#include "kcenon/vfs_transfer/transfer/transfer_orchestrator.h"
#include "kcenon/vfs_transfer/transfer/transfer_types.h"

// Adapters
#include "kcenon/vfs_transfer/adapters/thread_pool_adapter.h"

namespace kcenon::vfs_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_VFS_TRANSFER_H
