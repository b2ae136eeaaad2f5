/**
 * @file file_materializer.cpp
 * @brief Implementation of file_materializer
 */

#include "kcenon/vfs_transfer/transfer/file_materializer.h"

#include "kcenon/vfs_transfer/core/logging.h"
#include "kcenon/vfs_transfer/progress/progress_indicator.h"

namespace kcenon::vfs_transfer {

file_materializer::file_materializer(filesystem& backend, std::shared_ptr<local_filesystem> local)
    : backend_(backend), local_(std::move(local)) {}

void file_materializer::discard_temporary(const path_info& tmp) {
    auto present = local_->exists(tmp);
    if (present && !present.value()) {
        return;
    }

    auto removed = local_->remove(tmp);
    if (!removed) {
        VFS_LOG_WARN(log_category::materializer,
                     "Failed to remove temporary file '" + tmp.url() +
                         "': " + removed.error().message);
    }
}

auto file_materializer::materialize(const path_info& from,
                                    const path_info& to,
                                    const materialize_options& options) -> result<void> {
    auto parent = to.parent();
    if (!parent.path().empty()) {
        auto created = local_->makedirs(parent);
        if (!created) {
            return created;
        }
    }

    auto tmp = temporary_sibling(to);

    std::optional<progress_indicator> indicator;
    std::unique_ptr<progress_callback> owned_callback;
    progress_callback* callback = options.callback;
    if (callback == nullptr) {
        indicator.emplace(progress_indicator_options{
            options.label.value_or(from.name()),
            std::nullopt,
            progress_unit::bytes,
            options.no_progress_bar,
        });
        owned_callback = indicator->as_callback(backend_, from);
        callback = owned_callback.get();
    }

    VFS_LOG_DEBUG(log_category::materializer,
                  "Downloading '" + from.url() + "' via '" + tmp.url() + "'");

    result<void> fetched;
    try {
        fetched = backend_.get_file(from, tmp, *callback);
    } catch (...) {
        discard_temporary(tmp);
        throw;
    }
    if (!fetched) {
        discard_temporary(tmp);
        return fetched;
    }

    auto moved = local_->move(tmp, to);
    if (!moved) {
        discard_temporary(tmp);
        return moved;
    }
    return {};
}

}  // namespace kcenon::vfs_transfer
