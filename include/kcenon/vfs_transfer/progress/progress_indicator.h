/**
 * @file progress_indicator.h
 * @brief Terminal progress indicator shared by transfer workers
 */

#ifndef KCENON_VFS_TRANSFER_PROGRESS_PROGRESS_INDICATOR_H
#define KCENON_VFS_TRANSFER_PROGRESS_PROGRESS_INDICATOR_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "kcenon/vfs_transfer/fs/path_info.h"
#include "kcenon/vfs_transfer/progress/progress_callback.h"

namespace kcenon::vfs_transfer {

class filesystem;

enum class progress_unit {
    bytes,
    files
};

/**
 * @brief Options of a progress_indicator
 */
struct progress_indicator_options {
    std::string label;
    std::optional<uint64_t> total;
    progress_unit unit = progress_unit::bytes;
    bool disable = false;                       ///< Count, but render nothing
    std::chrono::milliseconds refresh_interval{100};
    std::ostream* output = nullptr;             ///< nullptr = std::cerr
};

/**
 * @brief Counts progress and renders it to a terminal
 *
 * Scoped: the destructor closes the indicator, so it is finalized on every
 * exit path of the transfer that created it. Counters are atomic and
 * update() may be called from many threads at once.
 *
 * @code
 * progress_indicator bar({.label = "data.csv", .total = size});
 * auto callback = bar.as_callback();
 * backend.get_file(from, tmp, *callback);
 * @endcode
 */
class progress_indicator {
public:
    explicit progress_indicator(progress_indicator_options options = {});
    ~progress_indicator();

    progress_indicator(const progress_indicator&) = delete;
    auto operator=(const progress_indicator&) -> progress_indicator& = delete;

    void update(uint64_t increment);
    void set_total(std::optional<uint64_t> total);

    /**
     * @brief Render the final state and stop accepting output
     *
     * Idempotent. Updates after close() are still counted.
     */
    void close();

    [[nodiscard]] auto completed() const noexcept -> uint64_t { return completed_.load(); }
    [[nodiscard]] auto total() const -> std::optional<uint64_t>;
    [[nodiscard]] auto label() const -> const std::string& { return options_.label; }
    [[nodiscard]] auto unit() const noexcept -> progress_unit { return options_.unit; }
    [[nodiscard]] auto is_disabled() const noexcept -> bool { return options_.disable; }
    [[nodiscard]] auto is_closed() const noexcept -> bool { return closed_.load(); }

    /**
     * @brief Callback feeding this indicator
     *
     * The callback must not outlive the indicator.
     */
    [[nodiscard]] auto as_callback() -> std::unique_ptr<progress_callback>;

    /**
     * @brief Callback that asks @p fs for the size of @p path when a backend
     *        reports an unknown total
     */
    [[nodiscard]] auto as_callback(const filesystem& fs, path_info path)
        -> std::unique_ptr<progress_callback>;

    /**
     * @brief Human-readable byte count ("1.5 MiB")
     */
    [[nodiscard]] static auto format_bytes(uint64_t bytes) -> std::string;

private:
    void render(bool final_line);
    [[nodiscard]] auto format_amount(uint64_t amount) const -> std::string;

    progress_indicator_options options_;
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> total_{0};
    std::atomic<bool> has_total_{false};
    std::atomic<bool> closed_{false};

    std::mutex render_mutex_;
    std::chrono::steady_clock::time_point last_render_;
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_PROGRESS_PROGRESS_INDICATOR_H
