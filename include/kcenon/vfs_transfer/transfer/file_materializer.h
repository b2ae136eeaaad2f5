/**
 * @file file_materializer.h
 * @brief All-or-nothing download of a single file
 */

#ifndef KCENON_VFS_TRANSFER_TRANSFER_FILE_MATERIALIZER_H
#define KCENON_VFS_TRANSFER_TRANSFER_FILE_MATERIALIZER_H

#include <memory>
#include <optional>
#include <string>

#include "kcenon/vfs_transfer/core/types.h"
#include "kcenon/vfs_transfer/fs/filesystem.h"
#include "kcenon/vfs_transfer/fs/local_filesystem.h"
#include "kcenon/vfs_transfer/progress/progress_callback.h"

namespace kcenon::vfs_transfer {

struct materialize_options {
    std::optional<std::string> label;       ///< Default: source name
    progress_callback* callback = nullptr;  ///< nullptr = scoped byte indicator
    bool no_progress_bar = false;
};

/**
 * @brief Downloads one file so the destination is never seen half-written
 *
 * The backend writes into a temporary file next to the destination, which is
 * renamed onto the destination only after the download succeeded. On failure
 * the temporary file is removed and the destination keeps its prior state
 * (absent, or the previous content).
 */
class file_materializer {
public:
    file_materializer(filesystem& backend, std::shared_ptr<local_filesystem> local);

    [[nodiscard]] auto materialize(const path_info& from,
                                   const path_info& to,
                                   const materialize_options& options = {}) -> result<void>;

private:
    void discard_temporary(const path_info& tmp);

    filesystem& backend_;
    std::shared_ptr<local_filesystem> local_;
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_TRANSFER_FILE_MATERIALIZER_H
