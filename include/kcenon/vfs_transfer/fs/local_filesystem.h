/**
 * @file local_filesystem.h
 * @brief Backend for the local disk
 */

#ifndef KCENON_VFS_TRANSFER_FS_LOCAL_FILESYSTEM_H
#define KCENON_VFS_TRANSFER_FS_LOCAL_FILESYSTEM_H

#include "kcenon/vfs_transfer/fs/filesystem.h"

namespace kcenon::vfs_transfer {

/**
 * @brief Local disk backend (scheme "local")
 *
 * Implements the whole contract. move() is a rename(2), so it is atomic
 * within one volume; across volumes it falls back to copy and remove.
 * copy() writes a colocated temporary file and renames it into place.
 *
 * The transfer core owns one instance explicitly for materializing
 * downloads; pass the same instance to every component that needs it.
 */
class local_filesystem final : public filesystem {
public:
    explicit local_filesystem(filesystem_config config = {});
    ~local_filesystem() override;

    [[nodiscard]] static auto traits() -> const backend_traits&;

    /**
     * @brief MD5 hex digest of a file, or of a directory listing with ".dir" appended
     */
    [[nodiscard]] auto checksum(const path_info& path) const -> result<std::string> override;
    [[nodiscard]] auto info(const path_info& path) const -> result<resource_info> override;
    [[nodiscard]] auto exists(const path_info& path) const -> result<bool> override;

    [[nodiscard]] auto isdir(const path_info& path) const -> bool override;
    [[nodiscard]] auto isfile(const path_info& path) const -> bool override;
    [[nodiscard]] auto isexec(const path_info& path) const -> bool override;
    [[nodiscard]] auto iscopy(const path_info& path) const -> bool override;
    [[nodiscard]] auto is_empty(const path_info& path) const -> bool override;

    [[nodiscard]] auto walk(const path_info& root) const
        -> result<lazy_sequence<walk_entry>> override;
    [[nodiscard]] auto walk_files(const path_info& root) const
        -> result<lazy_sequence<path_info>> override;
    [[nodiscard]] auto ls(const path_info& path, bool detail = false) const
        -> result<std::vector<resource_info>> override;
    [[nodiscard]] auto find(const path_info& path,
                            bool detail = false,
                            std::optional<std::string> prefix = std::nullopt) const
        -> result<std::vector<resource_info>> override;
    [[nodiscard]] auto open(const path_info& path, open_mode mode) const
        -> result<std::unique_ptr<std::iostream>> override;

    [[nodiscard]] auto remove(const path_info& path) -> result<void> override;
    [[nodiscard]] auto makedirs(const path_info& path) -> result<void> override;
    [[nodiscard]] auto copy(const path_info& from, const path_info& to) -> result<void> override;
    [[nodiscard]] auto move(const path_info& from, const path_info& to) -> result<void> override;
    [[nodiscard]] auto symlink(const path_info& from, const path_info& to)
        -> result<void> override;
    [[nodiscard]] auto hardlink(const path_info& from, const path_info& to)
        -> result<void> override;
    [[nodiscard]] auto reflink(const path_info& from, const path_info& to)
        -> result<void> override;

    [[nodiscard]] auto get_file(const path_info& from,
                                const path_info& to_local,
                                progress_callback& callback) -> result<void> override;
    [[nodiscard]] auto put_file(const path_info& from_local,
                                const path_info& to,
                                progress_callback& callback) -> result<void> override;
    [[nodiscard]] auto upload_stream(std::istream& stream,
                                     const path_info& to,
                                     std::optional<uint64_t> size_hint,
                                     progress_callback& callback) -> result<void> override;

private:
    [[nodiscard]] auto copy_file_with_progress(const path_info& from,
                                               const path_info& to,
                                               progress_callback& callback) -> result<void>;
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_FS_LOCAL_FILESYSTEM_H
