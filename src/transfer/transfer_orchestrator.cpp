/**
 * @file transfer_orchestrator.cpp
 * @brief Implementation of transfer_orchestrator
 */

#include "kcenon/vfs_transfer/transfer/transfer_orchestrator.h"

#include "kcenon/vfs_transfer/core/logging.h"
#include "kcenon/vfs_transfer/progress/callback_istream.h"
#include "kcenon/vfs_transfer/progress/progress_indicator.h"
#include "kcenon/vfs_transfer/transfer/directory_scheduler.h"
#include "kcenon/vfs_transfer/transfer/file_materializer.h"

namespace kcenon::vfs_transfer {

namespace {

auto unsupported_transfer(const std::string& what) -> unexpected {
    return unexpected(error{error_code::unsupported_transfer, what});
}

}  // namespace

transfer_orchestrator::transfer_orchestrator(filesystem& backend,
                                             std::shared_ptr<local_filesystem> local,
                                             std::shared_ptr<adapters::worker_pool_interface> pool)
    : backend_(backend), local_(std::move(local)), pool_(std::move(pool)) {}

auto transfer_orchestrator::check_capability(capability action) const -> result<void> {
    if (!backend_.supports(action)) {
        return unexpected(make_action_not_supported(to_string(action), backend_.scheme()));
    }
    return {};
}

auto transfer_orchestrator::check_upload_destination(const path_info& destination) const
    -> result<void> {
    if (destination.scheme() != backend_.scheme()) {
        return unsupported_transfer("cannot upload to '" + destination.url() + "' through the " +
                                    backend_.scheme() + " backend");
    }
    return {};
}

auto transfer_orchestrator::finish(const transfer_descriptor& descriptor,
                                   std::chrono::steady_clock::time_point start,
                                   result<void> outcome) const -> result<void> {
    auto ctx = descriptor.to_log_context(backend_.scheme());
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start)
            .count());

    const std::string verb = to_string(descriptor.direction);
    if (!outcome) {
        ctx.error_message = outcome.error().message;
        VFS_LOG_ERROR_CTX(log_category::transfer, verb + " failed", ctx);
    } else {
        VFS_LOG_INFO_CTX(log_category::transfer, verb + " completed", ctx);
    }
    return outcome;
}

auto transfer_orchestrator::upload(const path_info& source,
                                   const path_info& destination,
                                   const upload_options& options) -> result<void> {
    auto start = std::chrono::steady_clock::now();

    if (auto supported = check_capability(capability::put_file); !supported) {
        return supported;
    }
    if (auto checked = check_upload_destination(destination); !checked) {
        return checked;
    }
    if (!source.is_local()) {
        return unsupported_transfer("cannot upload '" + source.url() +
                                    "': only local files can be uploaded");
    }

    transfer_descriptor descriptor;
    descriptor.direction = transfer_direction::upload;
    descriptor.source = source.url();
    descriptor.destination = destination;
    descriptor.total = options.total;
    descriptor.has_callback = options.callback != nullptr;
    descriptor.label = options.label.value_or(source.name());

    auto ctx = descriptor.to_log_context(backend_.scheme());
    VFS_LOG_DEBUG_CTX(log_category::transfer, "upload started", ctx);

    if (options.callback != nullptr) {
        return finish(descriptor, start,
                      backend_.put_file(source, destination, *options.callback));
    }

    auto total = options.total;
    if (!total) {
        auto size = local_->getsize(source);
        if (size) {
            total = size.value();
        }
    }

    progress_indicator indicator(progress_indicator_options{
        *descriptor.label,
        total,
        progress_unit::bytes,
        options.no_progress_bar,
    });
    auto callback = indicator.as_callback();
    return finish(descriptor, start, backend_.put_file(source, destination, *callback));
}

auto transfer_orchestrator::upload(std::istream& source,
                                   const path_info& destination,
                                   const upload_options& options) -> result<void> {
    auto start = std::chrono::steady_clock::now();

    if (auto supported = check_capability(capability::upload_stream); !supported) {
        return supported;
    }
    if (auto checked = check_upload_destination(destination); !checked) {
        return checked;
    }

    transfer_descriptor descriptor;
    descriptor.direction = transfer_direction::upload;
    descriptor.source = "<stream>";
    descriptor.destination = destination;
    descriptor.total = options.total;
    descriptor.has_callback = options.callback != nullptr;
    descriptor.label = options.label.value_or(destination.name());

    auto ctx = descriptor.to_log_context(backend_.scheme());
    VFS_LOG_DEBUG_CTX(log_category::transfer, "stream upload started", ctx);

    std::optional<progress_indicator> indicator;
    std::unique_ptr<progress_callback> owned_callback;
    progress_callback* callback = options.callback;
    if (callback == nullptr) {
        indicator.emplace(progress_indicator_options{
            *descriptor.label,
            options.total,
            progress_unit::bytes,
            options.no_progress_bar,
        });
        owned_callback = indicator->as_callback();
        callback = owned_callback.get();
    }

    callback_istream wrapped(source, *callback);
    auto uploaded = backend_.upload_stream(wrapped, destination, options.total, *callback);

    VFS_LOG_TRACE(log_category::progress,
                  "stream upload read " + std::to_string(wrapped.bytes_read()) + " bytes");
    return finish(descriptor, start, std::move(uploaded));
}

auto transfer_orchestrator::download(const path_info& source,
                                     const path_info& destination,
                                     const download_options& options) -> result<void> {
    auto start = std::chrono::steady_clock::now();

    if (source.scheme() != backend_.scheme()) {
        return unsupported_transfer("cannot download '" + source.url() + "' through the " +
                                    backend_.scheme() + " backend");
    }

    transfer_descriptor descriptor;
    descriptor.direction = transfer_direction::download;
    descriptor.source = source.url();
    descriptor.destination = destination;
    descriptor.has_callback = options.callback != nullptr;
    descriptor.label = options.label.value_or(source.name());

    if (destination.scheme() == backend_.scheme() && !destination.is_local()) {
        VFS_LOG_DEBUG(log_category::transfer,
                      "Server-side copy '" + source.url() + "' -> '" + destination.url() + "'");
        return finish(descriptor, start, backend_.copy(source, destination));
    }

    if (!destination.is_local()) {
        return unsupported_transfer("cannot download '" + source.url() + "' to '" +
                                    destination.url() + "': destination must be local");
    }

    if (auto supported = check_capability(capability::get_file); !supported) {
        return supported;
    }

    if (!options.file_only && backend_.isdir(source)) {
        descriptor.is_directory = true;
        auto ctx = descriptor.to_log_context(backend_.scheme());
        VFS_LOG_DEBUG_CTX(log_category::transfer, "directory download started", ctx);

        directory_scheduler scheduler(backend_, local_, pool_);
        directory_transfer_options dir_options;
        dir_options.jobs = options.jobs;
        dir_options.callback = options.callback;
        dir_options.no_progress_bar = options.no_progress_bar;

        auto summary = scheduler.download(source, destination, dir_options);
        if (!summary) {
            return finish(descriptor, start, unexpected(summary.error()));
        }
        return finish(descriptor, start, {});
    }

    auto ctx = descriptor.to_log_context(backend_.scheme());
    VFS_LOG_DEBUG_CTX(log_category::transfer, "download started", ctx);

    file_materializer materializer(backend_, local_);
    materialize_options file_options;
    file_options.label = descriptor.label;
    file_options.callback = options.callback;
    file_options.no_progress_bar = options.no_progress_bar;
    return finish(descriptor, start, materializer.materialize(source, destination, file_options));
}

auto transfer_orchestrator::download_file(const path_info& source,
                                          const path_info& destination,
                                          const download_options& options) -> result<void> {
    auto file_options = options;
    file_options.file_only = true;
    return download(source, destination, file_options);
}

}  // namespace kcenon::vfs_transfer
