/**
 * @file transfer_types.h
 * @brief Options and per-call records of upload/download requests
 */

#ifndef KCENON_VFS_TRANSFER_TRANSFER_TRANSFER_TYPES_H
#define KCENON_VFS_TRANSFER_TRANSFER_TRANSFER_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "kcenon/vfs_transfer/core/logging.h"
#include "kcenon/vfs_transfer/fs/path_info.h"
#include "kcenon/vfs_transfer/progress/progress_callback.h"

namespace kcenon::vfs_transfer {

/**
 * @brief Options for transfer_orchestrator::upload()
 */
struct upload_options {
    std::optional<uint64_t> total;        ///< Size hint for the progress display
    std::optional<std::string> label;     ///< Display label (default: source name)
    progress_callback* callback = nullptr;  ///< Caller-owned; nullptr = scoped indicator
    bool no_progress_bar = false;
};

/**
 * @brief Options for transfer_orchestrator::download()
 *
 * For directory downloads the callback, when given, receives one update per
 * completed file instead of byte counts.
 */
struct download_options {
    std::optional<std::string> label;
    progress_callback* callback = nullptr;
    bool no_progress_bar = false;
    std::optional<std::size_t> jobs;  ///< Worker limit (default: backend jobs())
    bool file_only = false;           ///< Skip the directory probe
};

enum class transfer_direction {
    upload,
    download
};

[[nodiscard]] constexpr auto to_string(transfer_direction direction) -> const char* {
    switch (direction) {
        case transfer_direction::upload: return "upload";
        case transfer_direction::download: return "download";
        default: return "unknown";
    }
}

/**
 * @brief Ephemeral record of one upload/download call
 *
 * Built at the start of the call and dropped at its end; only used to
 * describe the transfer in logs.
 */
struct transfer_descriptor {
    transfer_direction direction = transfer_direction::download;
    std::string source;              ///< URL, or "<stream>" for stream uploads
    path_info destination;
    std::optional<uint64_t> total;
    bool has_callback = false;
    std::optional<std::string> label;
    bool is_directory = false;

    [[nodiscard]] auto to_log_context(const std::string& scheme) const -> transfer_log_context {
        transfer_log_context ctx;
        ctx.source = source;
        ctx.destination = destination.url();
        ctx.scheme = scheme;
        ctx.label = label;
        ctx.kind = is_directory ? "directory" : "file";
        ctx.progress = has_callback ? "callback" : "indicator";
        ctx.total_bytes = total;
        return ctx;
    }
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_TRANSFER_TRANSFER_TYPES_H
