/**
 * @file capability.h
 * @brief Capability flags and static per-backend declarations
 */

#ifndef KCENON_VFS_TRANSFER_FS_CAPABILITY_H
#define KCENON_VFS_TRANSFER_FS_CAPABILITY_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::vfs_transfer {

/**
 * @brief Optional operations a backend may provide
 */
enum class capability : uint32_t {
    none = 0,
    get_file = 1u << 0,
    put_file = 1u << 1,
    upload_stream = 1u << 2,
    copy = 1u << 3,
    move = 1u << 4,
    remove = 1u << 5,
    makedirs = 1u << 6,
    walk = 1u << 7,
    walk_files = 1u << 8,
    ls = 1u << 9,
    find = 1u << 10,
    open = 1u << 11,
    symlink = 1u << 12,
    hardlink = 1u << 13,
    reflink = 1u << 14,
};

[[nodiscard]] constexpr auto operator|(capability a, capability b) noexcept
    -> capability {
    return static_cast<capability>(static_cast<uint32_t>(a) |
                                   static_cast<uint32_t>(b));
}

[[nodiscard]] constexpr auto operator&(capability a, capability b) noexcept
    -> capability {
    return static_cast<capability>(static_cast<uint32_t>(a) &
                                   static_cast<uint32_t>(b));
}

constexpr auto operator|=(capability& a, capability b) noexcept -> capability& {
    a = a | b;
    return a;
}

[[nodiscard]] constexpr auto has_capability(capability set, capability flag) noexcept
    -> bool {
    return flag != capability::none &&
           (static_cast<uint32_t>(set) & static_cast<uint32_t>(flag)) ==
               static_cast<uint32_t>(flag);
}

/**
 * @brief Every capability flag, for backends that implement the whole contract
 */
inline constexpr capability all_capabilities =
    capability::get_file | capability::put_file | capability::upload_stream |
    capability::copy | capability::move | capability::remove |
    capability::makedirs | capability::walk | capability::walk_files |
    capability::ls | capability::find | capability::open |
    capability::symlink | capability::hardlink | capability::reflink;

/**
 * @brief Action name of a single capability, as used in error messages
 */
[[nodiscard]] constexpr auto to_string(capability flag) -> const char* {
    switch (flag) {
        case capability::none: return "none";
        case capability::get_file: return "get_file";
        case capability::put_file: return "put_file";
        case capability::upload_stream: return "upload_stream";
        case capability::copy: return "copy";
        case capability::move: return "move";
        case capability::remove: return "remove";
        case capability::makedirs: return "makedirs";
        case capability::walk: return "walk";
        case capability::walk_files: return "walk_files";
        case capability::ls: return "ls";
        case capability::find: return "find";
        case capability::open: return "open";
        case capability::symlink: return "symlink";
        case capability::hardlink: return "hardlink";
        case capability::reflink: return "reflink";
        default: return "unknown";
    }
}

/**
 * @brief External dependency a backend needs at runtime
 */
struct backend_dependency {
    std::string package;  ///< Package name reported to the user
    std::string library;  ///< Shared library probed by the resolver (e.g. "libssh2.so.1")
};

/**
 * @brief Default worker count: four per hardware thread
 */
[[nodiscard]] inline auto default_jobs_count() -> std::size_t {
    auto cpus = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return 4 * std::max<std::size_t>(1, cpus);
}

/**
 * @brief Default checksum worker count: half the hardware threads, clamped to [1, 4]
 */
[[nodiscard]] inline auto default_checksum_jobs_count() -> std::size_t {
    auto cpus = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return std::max<std::size_t>(1, std::min<std::size_t>(4, cpus / 2));
}

/**
 * @brief Static declaration of a backend type
 *
 * Each backend exposes one through a static traits() function returning a
 * function-local static, so the declaration is fixed when the type is defined.
 */
struct backend_traits {
    std::string scheme;
    std::vector<backend_dependency> dependencies;
    capability capabilities = capability::none;
    std::size_t default_jobs = default_jobs_count();
    std::size_t default_checksum_jobs = default_checksum_jobs_count();

    [[nodiscard]] auto supports(capability flag) const noexcept -> bool {
        return has_capability(capabilities, flag);
    }
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_FS_CAPABILITY_H
