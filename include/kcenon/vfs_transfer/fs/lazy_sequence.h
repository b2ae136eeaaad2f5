/**
 * @file lazy_sequence.h
 * @brief Lazy, restartable sequences for backend listings
 */

#ifndef KCENON_VFS_TRANSFER_FS_LAZY_SEQUENCE_H
#define KCENON_VFS_TRANSFER_FS_LAZY_SEQUENCE_H

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "kcenon/vfs_transfer/core/types.h"
#include "kcenon/vfs_transfer/fs/path_info.h"

namespace kcenon::vfs_transfer {

/**
 * @brief Single pass over a sequence
 *
 * next() yields the following item, std::nullopt once exhausted, or an error
 * if the underlying listing failed. A cursor is not thread-safe.
 */
template <typename T>
class sequence_cursor {
public:
    virtual ~sequence_cursor() = default;

    [[nodiscard]] virtual auto next() -> result<std::optional<T>> = 0;
};

/**
 * @brief Cursor driven by a generator function
 */
template <typename T>
class function_cursor final : public sequence_cursor<T> {
public:
    using generator = std::function<result<std::optional<T>>()>;

    explicit function_cursor(generator gen) : gen_(std::move(gen)) {}

    [[nodiscard]] auto next() -> result<std::optional<T>> override {
        if (done_) {
            return std::optional<T>{};
        }
        auto item = gen_();
        if (!item || !item.value()) {
            done_ = true;
        }
        return item;
    }

private:
    generator gen_;
    bool done_ = false;
};

/**
 * @brief Sequence that never holds its items, only a way to produce them
 *
 * Every open() starts a fresh pass, so checking emptiness or counting items
 * leaves later passes unaffected and the whole listing never has to be kept
 * in memory.
 */
template <typename T>
class lazy_sequence {
public:
    using cursor_factory = std::function<std::unique_ptr<sequence_cursor<T>>()>;

    lazy_sequence() : lazy_sequence(empty()) {}

    explicit lazy_sequence(cursor_factory factory) : factory_(std::move(factory)) {}

    /**
     * @brief Sequence over a fixed list of items
     */
    [[nodiscard]] static auto from_vector(std::vector<T> items) -> lazy_sequence {
        auto shared = std::make_shared<const std::vector<T>>(std::move(items));
        return lazy_sequence([shared]() -> std::unique_ptr<sequence_cursor<T>> {
            auto index = std::make_shared<std::size_t>(0);
            return std::make_unique<function_cursor<T>>(
                [shared, index]() -> result<std::optional<T>> {
                    if (*index >= shared->size()) {
                        return std::optional<T>{};
                    }
                    return std::optional<T>((*shared)[(*index)++]);
                });
        });
    }

    [[nodiscard]] static auto empty() -> lazy_sequence {
        return from_vector({});
    }

    /**
     * @brief Start a new pass over the sequence
     */
    [[nodiscard]] auto open() const -> std::unique_ptr<sequence_cursor<T>> {
        return factory_();
    }

    [[nodiscard]] auto is_empty() const -> result<bool> {
        auto cursor = open();
        auto first = cursor->next();
        if (!first) {
            return unexpected(first.error());
        }
        return !first.value().has_value();
    }

    [[nodiscard]] auto count() const -> result<std::size_t> {
        auto cursor = open();
        std::size_t n = 0;
        for (;;) {
            auto item = cursor->next();
            if (!item) {
                return unexpected(item.error());
            }
            if (!item.value()) {
                return n;
            }
            ++n;
        }
    }

    [[nodiscard]] auto collect() const -> result<std::vector<T>> {
        auto cursor = open();
        std::vector<T> items;
        for (;;) {
            auto item = cursor->next();
            if (!item) {
                return unexpected(item.error());
            }
            if (!item.value()) {
                return items;
            }
            items.push_back(std::move(*item.value()));
        }
    }

private:
    cursor_factory factory_;
};

/**
 * @brief One directory visited by a top-down walk
 */
struct walk_entry {
    path_info root;
    std::vector<std::string> dirs;   ///< Names of subdirectories of root
    std::vector<std::string> files;  ///< Names of files in root
};

/**
 * @brief Flatten a walk into the files it visits
 */
[[nodiscard]] inline auto files_of(lazy_sequence<walk_entry> walk) -> lazy_sequence<path_info> {
    return lazy_sequence<path_info>(
        [walk = std::move(walk)]() -> std::unique_ptr<sequence_cursor<path_info>> {
            std::shared_ptr<sequence_cursor<walk_entry>> dirs = walk.open();
            auto pending = std::make_shared<std::deque<path_info>>();
            return std::make_unique<function_cursor<path_info>>(
                [dirs, pending]() -> result<std::optional<path_info>> {
                    while (pending->empty()) {
                        auto entry = dirs->next();
                        if (!entry) {
                            return unexpected(entry.error());
                        }
                        if (!entry.value()) {
                            return std::optional<path_info>{};
                        }
                        for (const auto& file : entry.value()->files) {
                            pending->push_back(entry.value()->root / file);
                        }
                    }
                    auto next = std::move(pending->front());
                    pending->pop_front();
                    return std::optional<path_info>(std::move(next));
                });
        });
}

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_FS_LAZY_SEQUENCE_H
