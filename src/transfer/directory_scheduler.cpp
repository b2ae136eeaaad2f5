/**
 * @file directory_scheduler.cpp
 * @brief Implementation of directory_scheduler
 */

#include "kcenon/vfs_transfer/transfer/directory_scheduler.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <vector>

#include "kcenon/vfs_transfer/core/cancellation_token.h"
#include "kcenon/vfs_transfer/core/logging.h"
#include "kcenon/vfs_transfer/progress/progress_indicator.h"
#include "kcenon/vfs_transfer/transfer/file_materializer.h"

namespace kcenon::vfs_transfer {

namespace {

enum class outcome_kind {
    file_done,
    file_failed,
    worker_exit
};

struct worker_outcome {
    outcome_kind kind = outcome_kind::worker_exit;
    std::optional<path_info> file;
    std::optional<error> failure;
};

/**
 * @brief Multi-producer, single-consumer queue of worker outcomes
 */
class completion_channel {
public:
    void push(worker_outcome outcome) {
        // Notify under the lock: the consumer may destroy the channel as soon
        // as it has seen the last message.
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(outcome));
        ready_.notify_one();
    }

    [[nodiscard]] auto pop() -> worker_outcome {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return !queue_.empty(); });
        auto outcome = std::move(queue_.front());
        queue_.pop_front();
        return outcome;
    }

private:
    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<worker_outcome> queue_;
};

/**
 * @brief Listing cursor shared by all workers
 */
class shared_listing {
public:
    explicit shared_listing(std::unique_ptr<sequence_cursor<path_info>> cursor)
        : cursor_(std::move(cursor)) {}

    [[nodiscard]] auto next() -> result<std::optional<path_info>> {
        std::lock_guard<std::mutex> lock(mutex_);
        return cursor_->next();
    }

private:
    std::mutex mutex_;
    std::unique_ptr<sequence_cursor<path_info>> cursor_;
};

auto failed(std::optional<path_info> file, error err) -> worker_outcome {
    return worker_outcome{outcome_kind::file_failed, std::move(file), std::move(err)};
}

}  // namespace

directory_scheduler::directory_scheduler(filesystem& backend,
                                         std::shared_ptr<local_filesystem> local,
                                         std::shared_ptr<adapters::worker_pool_interface> pool)
    : backend_(backend), local_(std::move(local)), pool_(std::move(pool)) {}

auto directory_scheduler::download(const path_info& from,
                                   const path_info& to,
                                   const directory_transfer_options& options)
    -> result<directory_transfer_summary> {
    auto start_time = std::chrono::steady_clock::now();

    auto listing = backend_.walk_files(from);
    if (!listing) {
        return unexpected(listing.error());
    }
    const auto& files = listing.value();

    auto counted = files.count();
    if (!counted) {
        return unexpected(counted.error());
    }
    const std::size_t total = counted.value();

    if (total == 0) {
        VFS_LOG_DEBUG(log_category::scheduler,
                      "'" + from.url() + "' has no files, creating '" + to.url() + "'");
        auto created = local_->makedirs(to);
        if (!created) {
            return unexpected(created.error());
        }
        return directory_transfer_summary{};
    }

    std::size_t limit = options.jobs.value_or(backend_.jobs());
    if (limit == 0) {
        limit = 1;
    }
    const std::size_t workers = std::min(limit, total);

    transfer_log_context ctx;
    ctx.source = from.url();
    ctx.destination = to.url();
    ctx.scheme = backend_.scheme();
    ctx.files_total = total;
    VFS_LOG_INFO_CTX(log_category::scheduler,
                     "Directory download started with " + std::to_string(workers) + " workers",
                     ctx);

    progress_indicator indicator(progress_indicator_options{
        "Downloading directory",
        total,
        progress_unit::files,
        options.no_progress_bar || options.callback != nullptr,
    });
    auto indicator_callback = indicator.as_callback();
    progress_callback& files_callback =
        options.callback != nullptr ? *options.callback : *indicator_callback;

    auto pool = pool_ ? pool_ : adapters::worker_pool_factory::create(workers, "vfs_directory");

    cancellation_token token;
    completion_channel channel;
    shared_listing shared(files.open());
    file_materializer materializer(backend_, local_);

    auto transfer_one = [&](const path_info& file) -> result<void> {
        auto relative = file.relative_to(from);
        if (!relative) {
            return unexpected(relative.error());
        }
        materialize_options per_file;
        per_file.no_progress_bar = true;
        try {
            return materializer.materialize(file, to / relative.value(), per_file);
        } catch (const std::exception& e) {
            return unexpected(error{error_code::transfer_failed,
                                    "'" + file.url() + "': " + e.what()});
        } catch (...) {
            return unexpected(error{error_code::transfer_failed,
                                    "'" + file.url() + "': unknown exception"});
        }
    };

    // Cancel before queueing: no sibling may start a file while the failure
    // waits for the consumer.
    auto report_failure = [&](std::optional<path_info> file, error err) {
        token.cancel();
        channel.push(failed(std::move(file), std::move(err)));
    };

    auto worker_loop = [&]() {
        try {
            while (!token.is_cancelled()) {
                auto next = shared.next();
                if (!next) {
                    report_failure(std::nullopt, next.error());
                    break;
                }
                if (!next.value()) {
                    break;
                }

                const path_info& file = *next.value();
                auto outcome = transfer_one(file);
                if (!outcome) {
                    report_failure(file, outcome.error());
                    break;
                }
                channel.push(worker_outcome{outcome_kind::file_done, file, std::nullopt});
            }
        } catch (const std::exception& e) {
            report_failure(std::nullopt, error{error_code::transfer_failed,
                                               "listing '" + from.url() + "': " + e.what()});
        } catch (...) {
            report_failure(std::nullopt,
                           error{error_code::transfer_failed,
                                 "listing '" + from.url() + "': unknown exception"});
        }
        channel.push(worker_outcome{});
    };

    std::vector<std::future<void>> futures;
    std::vector<std::atomic<bool>> started(workers);
    futures.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        bool rejected = false;
        try {
            futures.push_back(pool->submit([&, i]() {
                started[i].store(true);
                worker_loop();
            }));
            rejected = futures.back().wait_for(std::chrono::seconds(0)) ==
                           std::future_status::ready &&
                       !started[i].load();
        } catch (const std::exception& e) {
            VFS_LOG_ERROR(log_category::scheduler,
                          std::string("Failed to start worker: ") + e.what());
            rejected = true;
        }
        if (rejected) {
            report_failure(std::nullopt, error{error_code::transfer_failed,
                                               "worker pool rejected a transfer worker"});
            channel.push(worker_outcome{});
        }
    }

    std::optional<error> first_failure;
    std::size_t completed = 0;
    std::size_t exited = 0;
    while (exited < workers) {
        auto outcome = channel.pop();
        switch (outcome.kind) {
            case outcome_kind::file_done:
                ++completed;
                files_callback.relative_update(1);
                break;
            case outcome_kind::file_failed:
                if (!first_failure) {
                    first_failure = outcome.failure;
                    VFS_LOG_DEBUG(log_category::scheduler,
                                  "Cancelling remaining files after failure: " +
                                      outcome.failure->message);
                } else {
                    VFS_LOG_DEBUG(log_category::scheduler,
                                  "Discarding later failure: " + outcome.failure->message);
                }
                break;
            case outcome_kind::worker_exit:
                ++exited;
                break;
        }
    }

    for (auto& future : futures) {
        future.wait();
    }

    ctx.files_completed = completed;
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time)
            .count());

    if (first_failure) {
        ctx.error_message = first_failure->message;
        VFS_LOG_ERROR_CTX(log_category::scheduler, "Directory download failed", ctx);
        return unexpected(std::move(*first_failure));
    }

    VFS_LOG_INFO_CTX(log_category::scheduler, "Directory download completed", ctx);
    return directory_transfer_summary{completed, workers};
}

}  // namespace kcenon::vfs_transfer
