/**
 * @file progress_callback.h
 * @brief Byte-count progress reporting protocol
 */

#ifndef KCENON_VFS_TRANSFER_PROGRESS_PROGRESS_CALLBACK_H
#define KCENON_VFS_TRANSFER_PROGRESS_PROGRESS_CALLBACK_H

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

namespace kcenon::vfs_transfer {

/**
 * @brief Receives progress events while a transfer runs
 *
 * Backends call relative_update() with the number of units moved since the
 * previous call, and may announce the total once it is known. Passing
 * std::nullopt to set_size() asks the callback to work the total out itself,
 * if it can.
 *
 * Implementations must tolerate calls from several worker threads.
 */
class progress_callback {
public:
    virtual ~progress_callback() = default;

    virtual void relative_update(uint64_t increment) = 0;

    virtual void set_size(std::optional<uint64_t> total) { (void)total; }
};

/**
 * @brief Callback that discards every update
 */
class no_op_callback final : public progress_callback {
public:
    void relative_update(uint64_t) override {}
};

/**
 * @brief Callback forwarding updates to plain functions
 */
class function_callback final : public progress_callback {
public:
    using update_fn = std::function<void(uint64_t)>;
    using size_fn = std::function<void(std::optional<uint64_t>)>;

    explicit function_callback(update_fn on_update, size_fn on_size = nullptr)
        : on_update_(std::move(on_update)), on_size_(std::move(on_size)) {}

    void relative_update(uint64_t increment) override {
        if (on_update_) {
            on_update_(increment);
        }
    }

    void set_size(std::optional<uint64_t> total) override {
        if (on_size_) {
            on_size_(total);
        }
    }

private:
    update_fn on_update_;
    size_fn on_size_;
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_PROGRESS_PROGRESS_CALLBACK_H
