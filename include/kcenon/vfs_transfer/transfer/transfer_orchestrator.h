/**
 * @file transfer_orchestrator.h
 * @brief upload/download entry points of a backend
 */

#ifndef KCENON_VFS_TRANSFER_TRANSFER_TRANSFER_ORCHESTRATOR_H
#define KCENON_VFS_TRANSFER_TRANSFER_TRANSFER_ORCHESTRATOR_H

#include <chrono>
#include <istream>
#include <memory>

#include "kcenon/vfs_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/vfs_transfer/core/types.h"
#include "kcenon/vfs_transfer/fs/filesystem.h"
#include "kcenon/vfs_transfer/fs/local_filesystem.h"
#include "kcenon/vfs_transfer/transfer/transfer_types.h"

namespace kcenon::vfs_transfer {

/**
 * @brief Moves content between the local disk and one backend
 *
 * Classifies each request (single file, directory, stream), enforces the
 * scheme rules and dispatches to the matching backend primitive:
 *
 * - upload() of a local file goes to put_file(), of a stream to
 *   upload_stream(). The destination must live on the backend.
 * - download() from the backend goes to the atomic file materializer, or to
 *   the directory scheduler when the source is a directory. A destination on
 *   the same (non-local) backend becomes a server-side copy().
 *
 * Crossing two different remote backends is not handled here and returns
 * unsupported_transfer. Without a caller callback every call shows a
 * progress indicator for its own duration.
 *
 * @code
 * auto local = std::make_shared<local_filesystem>();
 * transfer_orchestrator orchestrator(backend, local);
 *
 * auto result = orchestrator.download(
 *     path_info("s3", "bucket/dataset"),
 *     path_info::local("/data/dataset"),
 *     {.jobs = 8});
 * if (!result) {
 *     std::cerr << result.error().message << "\n";
 * }
 * @endcode
 *
 * Holds no per-call state; concurrent calls are allowed as far as the
 * backend allows them.
 */
class transfer_orchestrator {
public:
    /**
     * @param backend Backend both ends are checked against
     * @param local Local backend used for materialization
     * @param pool Shared worker pool for directory downloads (nullptr = one
     *             pool per directory download)
     */
    transfer_orchestrator(filesystem& backend,
                          std::shared_ptr<local_filesystem> local,
                          std::shared_ptr<adapters::worker_pool_interface> pool = nullptr);

    /**
     * @brief Upload a local file to the backend
     */
    [[nodiscard]] auto upload(const path_info& source,
                              const path_info& destination,
                              const upload_options& options = {}) -> result<void>;

    /**
     * @brief Upload the remaining content of a stream to the backend
     *
     * Every byte the backend reads from @p source is reported to the
     * progress callback.
     */
    [[nodiscard]] auto upload(std::istream& source,
                              const path_info& destination,
                              const upload_options& options = {}) -> result<void>;

    /**
     * @brief Download a file or directory
     */
    [[nodiscard]] auto download(const path_info& source,
                                const path_info& destination,
                                const download_options& options = {}) -> result<void>;

    /**
     * @brief Download a single file without probing for a directory
     */
    [[nodiscard]] auto download_file(const path_info& source,
                                     const path_info& destination,
                                     const download_options& options = {}) -> result<void>;

    [[nodiscard]] auto backend() const noexcept -> filesystem& { return backend_; }

private:
    [[nodiscard]] auto check_upload_destination(const path_info& destination) const
        -> result<void>;
    [[nodiscard]] auto check_capability(capability action) const -> result<void>;

    auto finish(const transfer_descriptor& descriptor,
                std::chrono::steady_clock::time_point start,
                result<void> outcome) const -> result<void>;

    filesystem& backend_;
    std::shared_ptr<local_filesystem> local_;
    std::shared_ptr<adapters::worker_pool_interface> pool_;
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_TRANSFER_TRANSFER_ORCHESTRATOR_H
