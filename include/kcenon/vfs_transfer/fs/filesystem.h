/**
 * @file filesystem.h
 * @brief Capability contract every storage backend implements
 */

#ifndef KCENON_VFS_TRANSFER_FS_FILESYSTEM_H
#define KCENON_VFS_TRANSFER_FS_FILESYSTEM_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/vfs_transfer/core/types.h"
#include "kcenon/vfs_transfer/fs/capability.h"
#include "kcenon/vfs_transfer/fs/filesystem_config.h"
#include "kcenon/vfs_transfer/fs/lazy_sequence.h"
#include "kcenon/vfs_transfer/fs/path_info.h"
#include "kcenon/vfs_transfer/progress/progress_callback.h"

namespace kcenon::vfs_transfer {

enum class entry_type {
    file,
    directory,
    other
};

/**
 * @brief Metadata of one resource, as returned by info(), ls() and find()
 */
struct resource_info {
    path_info path;
    entry_type type = entry_type::file;
    uint64_t size = 0;
    bool is_exec = false;

    [[nodiscard]] auto is_directory() const noexcept -> bool {
        return type == entry_type::directory;
    }
};

enum class open_mode {
    read,
    write
};

/**
 * @brief Base class of every storage backend
 *
 * Declares the full set of operations a backend may implement. Each one has
 * a default for backends that omit it:
 *
 * - checksum(), info(), exists(): not_implemented. Every backend has to
 *   override these; hitting the default is a programming error.
 * - isdir(), isexec(), iscopy(), is_empty(): false.
 * - isfile(): true.
 * - Optional actions (walk, ls, copy, get_file, ...): action_not_supported,
 *   naming the action and the scheme. Callers may branch on it.
 * - move(): copy() followed by remove(). Not atomic; backends with a native
 *   move override it.
 *
 * Backends also advertise what they implement through the capability flags
 * of their backend_traits, so callers can check before calling.
 *
 * A backend instance holds no per-transfer state; any number of transfers
 * may use it concurrently.
 */
class filesystem {
public:
    static constexpr std::string_view checksum_dir_suffix = ".dir";

    filesystem(filesystem_config config, const backend_traits& traits);
    virtual ~filesystem();

    filesystem(const filesystem&) = delete;
    auto operator=(const filesystem&) -> filesystem& = delete;

    [[nodiscard]] auto scheme() const noexcept -> const std::string& { return traits_.scheme; }
    [[nodiscard]] auto traits() const noexcept -> const backend_traits& { return traits_; }
    [[nodiscard]] auto config() const noexcept -> const filesystem_config& { return config_; }

    /**
     * @brief Worker limit for transfers (config value or type default)
     */
    [[nodiscard]] auto jobs() const noexcept -> std::size_t { return jobs_; }

    /**
     * @brief Worker limit for checksum computation
     */
    [[nodiscard]] auto checksum_jobs() const noexcept -> std::size_t { return checksum_jobs_; }

    [[nodiscard]] auto capabilities() const noexcept -> capability { return traits_.capabilities; }
    [[nodiscard]] auto supports(capability flag) const noexcept -> bool {
        return traits_.supports(flag);
    }

    // Required queries
    [[nodiscard]] virtual auto checksum(const path_info& path) const -> result<std::string>;
    [[nodiscard]] virtual auto info(const path_info& path) const -> result<resource_info>;
    [[nodiscard]] virtual auto exists(const path_info& path) const -> result<bool>;

    // Queries with safe defaults
    [[nodiscard]] virtual auto isdir(const path_info& path) const -> bool;
    [[nodiscard]] virtual auto isfile(const path_info& path) const -> bool;
    [[nodiscard]] virtual auto isexec(const path_info& path) const -> bool;
    [[nodiscard]] virtual auto iscopy(const path_info& path) const -> bool;
    [[nodiscard]] virtual auto is_empty(const path_info& path) const -> bool;

    [[nodiscard]] auto getsize(const path_info& path) const -> result<uint64_t>;

    /**
     * @brief Whether a checksum names a directory listing rather than a file
     */
    [[nodiscard]] static auto is_dir_hash(std::string_view hash) noexcept -> bool;

    // Listing
    [[nodiscard]] virtual auto walk(const path_info& root) const
        -> result<lazy_sequence<walk_entry>>;
    [[nodiscard]] virtual auto walk_files(const path_info& root) const
        -> result<lazy_sequence<path_info>>;
    [[nodiscard]] virtual auto ls(const path_info& path, bool detail = false) const
        -> result<std::vector<resource_info>>;
    [[nodiscard]] virtual auto find(const path_info& path,
                                    bool detail = false,
                                    std::optional<std::string> prefix = std::nullopt) const
        -> result<std::vector<resource_info>>;

    [[nodiscard]] virtual auto open(const path_info& path, open_mode mode) const
        -> result<std::unique_ptr<std::iostream>>;

    // Mutations
    [[nodiscard]] virtual auto remove(const path_info& path) -> result<void>;
    [[nodiscard]] virtual auto makedirs(const path_info& path) -> result<void>;
    [[nodiscard]] virtual auto copy(const path_info& from, const path_info& to) -> result<void>;
    [[nodiscard]] virtual auto move(const path_info& from, const path_info& to) -> result<void>;
    [[nodiscard]] virtual auto symlink(const path_info& from, const path_info& to)
        -> result<void>;
    [[nodiscard]] virtual auto hardlink(const path_info& from, const path_info& to)
        -> result<void>;
    [[nodiscard]] virtual auto reflink(const path_info& from, const path_info& to)
        -> result<void>;

    // Transfer primitives
    /**
     * @brief Download a single file into a local path
     */
    [[nodiscard]] virtual auto get_file(const path_info& from,
                                        const path_info& to_local,
                                        progress_callback& callback) -> result<void>;

    /**
     * @brief Upload a single local file
     */
    [[nodiscard]] virtual auto put_file(const path_info& from_local,
                                        const path_info& to,
                                        progress_callback& callback) -> result<void>;

    /**
     * @brief Upload the contents of a stream
     *
     * Byte progress is reported by the stream itself when the caller wraps it
     * in a callback_istream; the callback here only receives the size hint.
     */
    [[nodiscard]] virtual auto upload_stream(std::istream& stream,
                                             const path_info& to,
                                             std::optional<uint64_t> size_hint,
                                             progress_callback& callback) -> result<void>;

protected:
    [[nodiscard]] auto unsupported(capability action) const -> unexpected;
    [[nodiscard]] auto unsupported(std::string_view action) const -> unexpected;

private:
    filesystem_config config_;
    const backend_traits& traits_;
    std::size_t jobs_;
    std::size_t checksum_jobs_;
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_FS_FILESYSTEM_H
