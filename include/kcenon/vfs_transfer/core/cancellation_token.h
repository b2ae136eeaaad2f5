/**
 * @file cancellation_token.h
 * @brief Cooperative cancellation flag shared by transfer workers
 */

#ifndef KCENON_VFS_TRANSFER_CORE_CANCELLATION_TOKEN_H
#define KCENON_VFS_TRANSFER_CORE_CANCELLATION_TOKEN_H

#include <atomic>

namespace kcenon::vfs_transfer {

/**
 * @brief One-way flag: once cancelled, stays cancelled
 *
 * Workers poll it before starting each unit of work; work already running
 * is never interrupted.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    cancellation_token(const cancellation_token&) = delete;
    auto operator=(const cancellation_token&) -> cancellation_token& = delete;

    /**
     * @return true if this call tripped the token
     */
    auto cancel() noexcept -> bool {
        bool expected = false;
        return cancelled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_CORE_CANCELLATION_TOKEN_H
