/**
 * @file path_info.h
 * @brief Scheme-qualified location of a file or directory on a backend
 */

#ifndef KCENON_VFS_TRANSFER_FS_PATH_INFO_H
#define KCENON_VFS_TRANSFER_FS_PATH_INFO_H

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

#include "kcenon/vfs_transfer/core/types.h"

namespace kcenon::vfs_transfer {

/**
 * @brief Immutable (scheme, path) pair
 *
 * Paths always use '/' as separator. Duplicate separators and a trailing
 * separator are removed on construction, so two instances naming the same
 * resource compare equal.
 *
 * @code
 * auto root = path_info("s3", "bucket/data");
 * auto child = root / "images/cat.png";    // s3://bucket/data/images/cat.png
 * child.name();                            // "cat.png"
 * child.relative_to(root).value();         // "images/cat.png"
 * @endcode
 */
class path_info {
public:
    static constexpr std::string_view local_scheme = "local";

    path_info() = default;
    path_info(std::string scheme, std::string path);

    /**
     * @brief Locate a path on the local filesystem
     */
    [[nodiscard]] static auto local(const std::filesystem::path& path) -> path_info;

    /**
     * @brief Parse "scheme://path"; anything without a scheme is local
     */
    [[nodiscard]] static auto from_url(std::string_view url) -> path_info;

    [[nodiscard]] auto scheme() const noexcept -> const std::string& { return scheme_; }
    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }
    [[nodiscard]] auto is_local() const noexcept -> bool { return scheme_ == local_scheme; }

    /**
     * @brief Final path component ("" for a root)
     */
    [[nodiscard]] auto name() const -> std::string;

    /**
     * @brief Resource one level up; a root is its own parent
     */
    [[nodiscard]] auto parent() const -> path_info;

    /**
     * @brief Path of this resource relative to an ancestor
     * @return invalid_file_path if @p ancestor is not a proper ancestor
     */
    [[nodiscard]] auto relative_to(const path_info& ancestor) const -> result<std::string>;

    [[nodiscard]] auto is_under(const path_info& ancestor) const -> bool;

    /**
     * @brief Printable URL: "scheme://path", or the bare path for local
     */
    [[nodiscard]] auto url() const -> std::string;

    /**
     * @brief Native path; meaningful for local resources only
     */
    [[nodiscard]] auto native() const -> std::filesystem::path {
        return std::filesystem::path(path_);
    }

    /**
     * @brief Join a relative path below this resource
     */
    [[nodiscard]] auto operator/(std::string_view relative) const -> path_info;

    [[nodiscard]] auto operator==(const path_info& other) const -> bool {
        return scheme_ == other.scheme_ && path_ == other.path_;
    }
    [[nodiscard]] auto operator!=(const path_info& other) const -> bool {
        return !(*this == other);
    }
    [[nodiscard]] auto operator<(const path_info& other) const -> bool {
        return scheme_ != other.scheme_ ? scheme_ < other.scheme_ : path_ < other.path_;
    }

private:
    std::string scheme_;
    std::string path_;
};

/**
 * @brief Unique temporary name next to @p target: "<name>.<16 hex>.tmp"
 *
 * Being in the same directory as the target, it can be renamed onto it.
 */
[[nodiscard]] auto temporary_sibling(const path_info& target) -> path_info;

inline auto operator<<(std::ostream& os, const path_info& info) -> std::ostream& {
    return os << info.url();
}

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_FS_PATH_INFO_H
