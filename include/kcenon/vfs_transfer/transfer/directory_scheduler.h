/**
 * @file directory_scheduler.h
 * @brief Concurrent, all-or-nothing download of a directory tree
 */

#ifndef KCENON_VFS_TRANSFER_TRANSFER_DIRECTORY_SCHEDULER_H
#define KCENON_VFS_TRANSFER_TRANSFER_DIRECTORY_SCHEDULER_H

#include <cstddef>
#include <memory>
#include <optional>

#include "kcenon/vfs_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/vfs_transfer/core/types.h"
#include "kcenon/vfs_transfer/fs/filesystem.h"
#include "kcenon/vfs_transfer/fs/local_filesystem.h"
#include "kcenon/vfs_transfer/progress/progress_callback.h"

namespace kcenon::vfs_transfer {

struct directory_transfer_options {
    std::optional<std::size_t> jobs;        ///< Worker limit (default: backend jobs())
    progress_callback* callback = nullptr;  ///< Receives one update per finished file
    bool no_progress_bar = false;
};

/**
 * @brief Outcome of a successful directory download
 */
struct directory_transfer_summary {
    std::size_t files_total = 0;
    std::size_t workers = 0;
};

/**
 * @brief Fans a directory download out over a bounded set of workers
 *
 * Files come from the backend's walk_files() listing, one cursor shared by
 * all workers. Each file goes through a file_materializer to
 * destination / relative path. Workers check a cancellation token before
 * starting each file and report outcomes through a completion channel in
 * the order they finish.
 *
 * The first failure (including a listing error) cancels all files not yet
 * started; the call then waits for files in flight and returns that failure.
 * Later failures are logged at debug level and otherwise discarded.
 *
 * An empty source directory is not an error: the destination directory is
 * created and the call succeeds.
 */
class directory_scheduler {
public:
    directory_scheduler(filesystem& backend,
                        std::shared_ptr<local_filesystem> local,
                        std::shared_ptr<adapters::worker_pool_interface> pool = nullptr);

    [[nodiscard]] auto download(const path_info& from,
                                const path_info& to,
                                const directory_transfer_options& options = {})
        -> result<directory_transfer_summary>;

private:
    filesystem& backend_;
    std::shared_ptr<local_filesystem> local_;
    std::shared_ptr<adapters::worker_pool_interface> pool_;
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_TRANSFER_DIRECTORY_SCHEDULER_H
