/**
 * @file filesystem.cpp
 * @brief Default behaviour of the capability contract
 */

#include "kcenon/vfs_transfer/fs/filesystem.h"

#include "kcenon/vfs_transfer/core/logging.h"

namespace kcenon::vfs_transfer {

filesystem::filesystem(filesystem_config config, const backend_traits& traits)
    : config_(std::move(config)),
      traits_(traits),
      jobs_(config_.jobs.value_or(traits.default_jobs)),
      checksum_jobs_(config_.checksum_jobs.value_or(traits.default_checksum_jobs)) {}

filesystem::~filesystem() = default;

auto filesystem::unsupported(capability action) const -> unexpected {
    return unsupported(std::string_view(to_string(action)));
}

auto filesystem::unsupported(std::string_view action) const -> unexpected {
    return unexpected(make_action_not_supported(std::string(action), scheme()));
}

auto filesystem::checksum(const path_info&) const -> result<std::string> {
    return unexpected(make_not_implemented("checksum", scheme()));
}

auto filesystem::info(const path_info&) const -> result<resource_info> {
    return unexpected(make_not_implemented("info", scheme()));
}

auto filesystem::exists(const path_info&) const -> result<bool> {
    return unexpected(make_not_implemented("exists", scheme()));
}

auto filesystem::isdir(const path_info&) const -> bool {
    return false;
}

auto filesystem::isfile(const path_info&) const -> bool {
    return true;
}

auto filesystem::isexec(const path_info&) const -> bool {
    return false;
}

auto filesystem::iscopy(const path_info&) const -> bool {
    return false;
}

auto filesystem::is_empty(const path_info&) const -> bool {
    return false;
}

auto filesystem::getsize(const path_info& path) const -> result<uint64_t> {
    auto details = info(path);
    if (!details) {
        return unexpected(details.error());
    }
    return details.value().size;
}

auto filesystem::is_dir_hash(std::string_view hash) noexcept -> bool {
    return hash.size() >= checksum_dir_suffix.size() &&
           hash.substr(hash.size() - checksum_dir_suffix.size()) == checksum_dir_suffix;
}

auto filesystem::walk(const path_info&) const -> result<lazy_sequence<walk_entry>> {
    return unsupported(capability::walk);
}

auto filesystem::walk_files(const path_info&) const -> result<lazy_sequence<path_info>> {
    return unsupported(capability::walk_files);
}

auto filesystem::ls(const path_info&, bool) const -> result<std::vector<resource_info>> {
    return unsupported(capability::ls);
}

auto filesystem::find(const path_info&, bool, std::optional<std::string>) const
    -> result<std::vector<resource_info>> {
    return unsupported(capability::find);
}

auto filesystem::open(const path_info&, open_mode) const
    -> result<std::unique_ptr<std::iostream>> {
    return unsupported(capability::open);
}

auto filesystem::remove(const path_info&) -> result<void> {
    return unsupported(capability::remove);
}

auto filesystem::makedirs(const path_info&) -> result<void> {
    return unsupported(capability::makedirs);
}

auto filesystem::copy(const path_info&, const path_info&) -> result<void> {
    return unsupported(capability::copy);
}

auto filesystem::move(const path_info& from, const path_info& to) -> result<void> {
    auto copied = copy(from, to);
    if (!copied) {
        return copied;
    }

    VFS_LOG_DEBUG(log_category::filesystem,
                  "Moved '" + from.url() + "' by copy, removing source");
    return remove(from);
}

auto filesystem::symlink(const path_info&, const path_info&) -> result<void> {
    return unsupported(capability::symlink);
}

auto filesystem::hardlink(const path_info&, const path_info&) -> result<void> {
    return unsupported(capability::hardlink);
}

auto filesystem::reflink(const path_info&, const path_info&) -> result<void> {
    return unsupported(capability::reflink);
}

auto filesystem::get_file(const path_info&, const path_info&, progress_callback&)
    -> result<void> {
    return unsupported(capability::get_file);
}

auto filesystem::put_file(const path_info&, const path_info&, progress_callback&)
    -> result<void> {
    return unsupported(capability::put_file);
}

auto filesystem::upload_stream(std::istream&, const path_info&, std::optional<uint64_t>,
                               progress_callback&) -> result<void> {
    return unsupported(capability::upload_stream);
}

}  // namespace kcenon::vfs_transfer
