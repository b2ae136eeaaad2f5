/**
 * @file local_filesystem.cpp
 * @brief Implementation of the local disk backend
 */

#include "kcenon/vfs_transfer/fs/local_filesystem.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <openssl/err.h>
#include <openssl/evp.h>

#if defined(__linux__)
#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <unistd.h>
#endif

#include "kcenon/vfs_transfer/core/logging.h"

namespace kcenon::vfs_transfer {

namespace stdfs = std::filesystem;

namespace {

constexpr std::size_t copy_buffer_size = 1024 * 1024;

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
class evp_md_ctx_wrapper {
public:
    evp_md_ctx_wrapper() : ctx_(EVP_MD_CTX_new()) {}

    ~evp_md_ctx_wrapper() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    evp_md_ctx_wrapper(const evp_md_ctx_wrapper&) = delete;
    auto operator=(const evp_md_ctx_wrapper&) -> evp_md_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

auto to_hex(const unsigned char* data, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

/**
 * @brief Incremental MD5 over data fed in pieces
 */
class md5_digest {
public:
    auto init() -> result<void> {
        if (!ctx_) {
            return unexpected(error{error_code::checksum_failed, get_openssl_error()});
        }
        if (EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
            return unexpected(error{error_code::checksum_failed, get_openssl_error()});
        }
        return {};
    }

    auto update(const void* data, std::size_t length) -> result<void> {
        if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
            return unexpected(error{error_code::checksum_failed, get_openssl_error()});
        }
        return {};
    }

    auto finish() -> result<std::string> {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1) {
            return unexpected(error{error_code::checksum_failed, get_openssl_error()});
        }
        return to_hex(digest.data(), length);
    }

private:
    evp_md_ctx_wrapper ctx_;
};

auto md5_of_file(const stdfs::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::file_read_error,
                                "Failed to open file: " + path.string()});
    }

    md5_digest digest;
    if (auto started = digest.init(); !started) {
        return unexpected(started.error());
    }

    std::vector<char> buffer(copy_buffer_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = file.gcount();
        if (count > 0) {
            if (auto fed = digest.update(buffer.data(), static_cast<std::size_t>(count)); !fed) {
                return unexpected(fed.error());
            }
        }
    }
    if (file.bad()) {
        return unexpected(error{error_code::file_read_error,
                                "Failed to read file: " + path.string()});
    }
    return digest.finish();
}

auto io_error(error_code code, std::string_view action, const path_info& path,
              const std::error_code& ec) -> unexpected {
    return unexpected(error{code, std::string(action) + " '" + path.url() + "': " + ec.message()});
}

auto not_found(const path_info& path) -> unexpected {
    return unexpected(error{error_code::file_not_found, "No such file or directory: '" +
                                                            path.url() + "'"});
}

/**
 * @brief Top-down walk: one entry per directory, subdirectories after their parent
 */
class local_walk_cursor final : public sequence_cursor<walk_entry> {
public:
    explicit local_walk_cursor(path_info root) {
        std::error_code ec;
        if (stdfs::is_directory(root.native(), ec)) {
            pending_.push_back(std::move(root));
        }
    }

    [[nodiscard]] auto next() -> result<std::optional<walk_entry>> override {
        if (pending_.empty()) {
            return std::optional<walk_entry>{};
        }

        auto dir = std::move(pending_.back());
        pending_.pop_back();

        walk_entry entry{dir, {}, {}};
        std::vector<std::string> descend;

        std::error_code ec;
        stdfs::directory_iterator it(dir.native(), ec);
        if (ec) {
            return io_error(error_code::file_read_error, "Failed to list", dir, ec);
        }
        for (; it != stdfs::directory_iterator(); it.increment(ec)) {
            const auto& item = *it;
            auto name = item.path().filename().string();
            std::error_code type_ec;
            if (item.is_directory(type_ec)) {
                entry.dirs.push_back(name);
                if (!item.is_symlink(type_ec)) {
                    descend.push_back(name);
                }
            } else {
                entry.files.push_back(name);
            }
        }
        if (ec) {
            return io_error(error_code::file_read_error, "Failed to list", dir, ec);
        }

        std::sort(entry.dirs.begin(), entry.dirs.end());
        std::sort(entry.files.begin(), entry.files.end());
        std::sort(descend.begin(), descend.end());

        // Stack order: first subdirectory is visited next.
        for (auto name = descend.rbegin(); name != descend.rend(); ++name) {
            pending_.push_back(dir / *name);
        }

        return std::optional<walk_entry>(std::move(entry));
    }

private:
    std::vector<path_info> pending_;
};

}  // namespace

local_filesystem::local_filesystem(filesystem_config config)
    : filesystem(std::move(config), traits()) {}

local_filesystem::~local_filesystem() = default;

auto local_filesystem::traits() -> const backend_traits& {
    static const backend_traits instance{
        std::string(path_info::local_scheme),
        {},
        all_capabilities,
    };
    return instance;
}

auto local_filesystem::checksum(const path_info& path) const -> result<std::string> {
    std::error_code ec;
    auto status = stdfs::status(path.native(), ec);
    if (ec || !stdfs::exists(status)) {
        return not_found(path);
    }

    if (!stdfs::is_directory(status)) {
        return md5_of_file(path.native());
    }

    // Directory: digest of "<relative path> <md5>" lines in sorted order.
    auto listing = walk_files(path);
    if (!listing) {
        return unexpected(listing.error());
    }
    auto files = listing.value().collect();
    if (!files) {
        return unexpected(files.error());
    }

    std::vector<std::pair<std::string, std::string>> lines;
    for (const auto& file : files.value()) {
        auto relative = file.relative_to(path);
        if (!relative) {
            return unexpected(relative.error());
        }
        auto md5 = md5_of_file(file.native());
        if (!md5) {
            return unexpected(md5.error());
        }
        lines.emplace_back(relative.value(), md5.value());
    }
    std::sort(lines.begin(), lines.end());

    md5_digest digest;
    if (auto started = digest.init(); !started) {
        return unexpected(started.error());
    }
    for (const auto& [relative, md5] : lines) {
        std::string line = relative + " " + md5 + "\n";
        if (auto fed = digest.update(line.data(), line.size()); !fed) {
            return unexpected(fed.error());
        }
    }
    auto hash = digest.finish();
    if (!hash) {
        return hash;
    }
    return hash.value() + std::string(checksum_dir_suffix);
}

auto local_filesystem::info(const path_info& path) const -> result<resource_info> {
    std::error_code ec;
    auto status = stdfs::status(path.native(), ec);
    if (ec || !stdfs::exists(status)) {
        return not_found(path);
    }

    resource_info details;
    details.path = path;
    if (stdfs::is_directory(status)) {
        details.type = entry_type::directory;
    } else if (stdfs::is_regular_file(status)) {
        details.type = entry_type::file;
        details.size = stdfs::file_size(path.native(), ec);
        if (ec) {
            return io_error(error_code::file_read_error, "Failed to stat", path, ec);
        }
    } else {
        details.type = entry_type::other;
    }
    details.is_exec = (status.permissions() & stdfs::perms::owner_exec) != stdfs::perms::none;
    return details;
}

auto local_filesystem::exists(const path_info& path) const -> result<bool> {
    std::error_code ec;
    bool found = stdfs::exists(path.native(), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return io_error(error_code::file_access_denied, "Failed to check", path, ec);
    }
    return found;
}

auto local_filesystem::isdir(const path_info& path) const -> bool {
    std::error_code ec;
    return stdfs::is_directory(path.native(), ec);
}

auto local_filesystem::isfile(const path_info& path) const -> bool {
    std::error_code ec;
    return stdfs::is_regular_file(path.native(), ec);
}

auto local_filesystem::isexec(const path_info& path) const -> bool {
    std::error_code ec;
    auto status = stdfs::status(path.native(), ec);
    if (ec) {
        return false;
    }
    return (status.permissions() & stdfs::perms::owner_exec) != stdfs::perms::none;
}

auto local_filesystem::iscopy(const path_info& path) const -> bool {
    std::error_code ec;
    if (stdfs::is_symlink(path.native(), ec)) {
        return true;
    }
    if (!stdfs::is_regular_file(path.native(), ec)) {
        return false;
    }
    auto links = stdfs::hard_link_count(path.native(), ec);
    return !ec && links > 1;
}

auto local_filesystem::is_empty(const path_info& path) const -> bool {
    std::error_code ec;
    if (isfile(path)) {
        auto size = stdfs::file_size(path.native(), ec);
        return !ec && size == 0;
    }
    if (isdir(path)) {
        return stdfs::is_empty(path.native(), ec) && !ec;
    }
    return false;
}

auto local_filesystem::walk(const path_info& root) const -> result<lazy_sequence<walk_entry>> {
    return lazy_sequence<walk_entry>([root]() -> std::unique_ptr<sequence_cursor<walk_entry>> {
        return std::make_unique<local_walk_cursor>(root);
    });
}

auto local_filesystem::walk_files(const path_info& root) const
    -> result<lazy_sequence<path_info>> {
    auto tree = walk(root);
    if (!tree) {
        return unexpected(tree.error());
    }
    return files_of(std::move(tree).value());
}

auto local_filesystem::ls(const path_info& path, bool detail) const
    -> result<std::vector<resource_info>> {
    std::error_code ec;
    auto status = stdfs::status(path.native(), ec);
    if (ec || !stdfs::exists(status)) {
        return not_found(path);
    }

    if (!stdfs::is_directory(status)) {
        if (detail) {
            auto details = info(path);
            if (!details) {
                return unexpected(details.error());
            }
            return std::vector<resource_info>{details.value()};
        }
        return std::vector<resource_info>{resource_info{path, entry_type::file, 0, false}};
    }

    std::vector<resource_info> entries;
    stdfs::directory_iterator it(path.native(), ec);
    if (ec) {
        return io_error(error_code::file_read_error, "Failed to list", path, ec);
    }
    for (; it != stdfs::directory_iterator(); it.increment(ec)) {
        const auto& item = *it;
        auto child = path / item.path().filename().string();
        if (detail) {
            auto details = info(child);
            if (!details) {
                return unexpected(details.error());
            }
            entries.push_back(details.value());
        } else {
            std::error_code type_ec;
            auto type = item.is_directory(type_ec) ? entry_type::directory : entry_type::file;
            entries.push_back(resource_info{child, type, 0, false});
        }
    }
    if (ec) {
        return io_error(error_code::file_read_error, "Failed to list", path, ec);
    }

    std::sort(entries.begin(), entries.end(),
              [](const resource_info& a, const resource_info& b) { return a.path < b.path; });
    return entries;
}

auto local_filesystem::find(const path_info& path, bool detail,
                            std::optional<std::string> prefix) const
    -> result<std::vector<resource_info>> {
    auto listing = walk_files(path);
    if (!listing) {
        return unexpected(listing.error());
    }

    auto cursor = listing.value().open();
    std::vector<resource_info> found;
    for (;;) {
        auto item = cursor->next();
        if (!item) {
            return unexpected(item.error());
        }
        if (!item.value()) {
            break;
        }
        const auto& file = *item.value();

        if (prefix) {
            auto relative = file.relative_to(path);
            if (!relative || relative.value().rfind(*prefix, 0) != 0) {
                continue;
            }
        }

        if (detail) {
            auto details = info(file);
            if (!details) {
                return unexpected(details.error());
            }
            found.push_back(details.value());
        } else {
            found.push_back(resource_info{file, entry_type::file, 0, false});
        }
    }
    return found;
}

auto local_filesystem::open(const path_info& path, open_mode mode) const
    -> result<std::unique_ptr<std::iostream>> {
    if (mode == open_mode::read) {
        auto stream = std::make_unique<std::fstream>(path.native(),
                                                     std::ios::in | std::ios::binary);
        if (!stream->is_open()) {
            return not_found(path);
        }
        return std::unique_ptr<std::iostream>(std::move(stream));
    }

    auto stream = std::make_unique<std::fstream>(
        path.native(), std::ios::out | std::ios::trunc | std::ios::binary);
    if (!stream->is_open()) {
        return unexpected(error{error_code::file_write_error,
                                "Failed to open for writing: '" + path.url() + "'"});
    }
    return std::unique_ptr<std::iostream>(std::move(stream));
}

auto local_filesystem::remove(const path_info& path) -> result<void> {
    std::error_code ec;
    if (!stdfs::exists(stdfs::symlink_status(path.native(), ec))) {
        return {};
    }
    stdfs::remove_all(path.native(), ec);
    if (ec) {
        return io_error(error_code::remove_failed, "Failed to remove", path, ec);
    }
    return {};
}

auto local_filesystem::makedirs(const path_info& path) -> result<void> {
    std::error_code ec;
    stdfs::create_directories(path.native(), ec);
    if (ec) {
        return io_error(error_code::directory_create_failed, "Failed to create directory",
                        path, ec);
    }
    return {};
}

auto local_filesystem::copy(const path_info& from, const path_info& to) -> result<void> {
    std::error_code ec;
    if (stdfs::is_directory(from.native(), ec)) {
        stdfs::copy(from.native(), to.native(),
                    stdfs::copy_options::recursive | stdfs::copy_options::overwrite_existing,
                    ec);
        if (ec) {
            return io_error(error_code::file_write_error, "Failed to copy to", to, ec);
        }
        return {};
    }

    auto tmp = temporary_sibling(to);
    stdfs::copy_file(from.native(), tmp.native(), stdfs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code cleanup_ec;
        stdfs::remove(tmp.native(), cleanup_ec);
        if (!stdfs::exists(from.native(), cleanup_ec)) {
            return not_found(from);
        }
        return io_error(error_code::file_write_error, "Failed to copy to", to, ec);
    }

    stdfs::rename(tmp.native(), to.native(), ec);
    if (ec) {
        std::error_code cleanup_ec;
        stdfs::remove(tmp.native(), cleanup_ec);
        return io_error(error_code::rename_failed, "Failed to replace", to, ec);
    }
    return {};
}

auto local_filesystem::move(const path_info& from, const path_info& to) -> result<void> {
    std::error_code ec;
    stdfs::rename(from.native(), to.native(), ec);
    if (!ec) {
        return {};
    }
    if (ec == std::errc::cross_device_link) {
        VFS_LOG_DEBUG(log_category::filesystem,
                      "Cross-device move of '" + from.url() + "', copying instead");
        return filesystem::move(from, to);
    }
    std::error_code exists_ec;
    if (ec == std::errc::no_such_file_or_directory &&
        !stdfs::exists(from.native(), exists_ec)) {
        return not_found(from);
    }
    return io_error(error_code::rename_failed, "Failed to move to", to, ec);
}

auto local_filesystem::symlink(const path_info& from, const path_info& to) -> result<void> {
    std::error_code ec;
    stdfs::create_symlink(from.native(), to.native(), ec);
    if (ec) {
        return io_error(error_code::file_write_error, "Failed to symlink", to, ec);
    }
    return {};
}

auto local_filesystem::hardlink(const path_info& from, const path_info& to) -> result<void> {
    std::error_code ec;
    stdfs::create_hard_link(from.native(), to.native(), ec);
    if (ec) {
        return io_error(error_code::file_write_error, "Failed to hardlink", to, ec);
    }
    return {};
}

auto local_filesystem::reflink(const path_info& from, const path_info& to) -> result<void> {
#if defined(__linux__) && defined(FICLONE)
    int src = ::open(from.native().c_str(), O_RDONLY | O_CLOEXEC);
    if (src < 0) {
        return not_found(from);
    }
    int dst = ::open(to.native().c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (dst < 0) {
        auto ec = std::error_code(errno, std::generic_category());
        ::close(src);
        return io_error(error_code::file_write_error, "Failed to reflink", to, ec);
    }

    int rc = ::ioctl(dst, FICLONE, src);
    auto saved_errno = errno;
    ::close(src);
    ::close(dst);
    if (rc == 0) {
        return {};
    }

    ::unlink(to.native().c_str());
    if (saved_errno == EOPNOTSUPP || saved_errno == EXDEV || saved_errno == EINVAL ||
        saved_errno == ENOTTY) {
        return unsupported(capability::reflink);
    }
    return io_error(error_code::file_write_error, "Failed to reflink", to,
                    std::error_code(saved_errno, std::generic_category()));
#else
    (void)from;
    (void)to;
    return unsupported(capability::reflink);
#endif
}

auto local_filesystem::copy_file_with_progress(const path_info& from,
                                               const path_info& to,
                                               progress_callback& callback) -> result<void> {
    std::error_code ec;
    auto size = stdfs::file_size(from.native(), ec);
    if (ec) {
        return not_found(from);
    }
    callback.set_size(size);

    std::ifstream input(from.native(), std::ios::binary);
    if (!input) {
        return unexpected(error{error_code::file_read_error,
                                "Failed to open file: '" + from.url() + "'"});
    }
    std::ofstream output(to.native(), std::ios::binary | std::ios::trunc);
    if (!output) {
        return unexpected(error{error_code::file_write_error,
                                "Failed to open for writing: '" + to.url() + "'"});
    }

    std::vector<char> buffer(copy_buffer_size);
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = input.gcount();
        if (count <= 0) {
            break;
        }
        if (!output.write(buffer.data(), count)) {
            return unexpected(error{error_code::file_write_error,
                                    "Failed to write: '" + to.url() + "'"});
        }
        callback.relative_update(static_cast<uint64_t>(count));
    }
    if (input.bad()) {
        return unexpected(error{error_code::file_read_error,
                                "Failed to read: '" + from.url() + "'"});
    }

    output.flush();
    if (!output) {
        return unexpected(error{error_code::file_write_error,
                                "Failed to flush: '" + to.url() + "'"});
    }
    return {};
}

auto local_filesystem::get_file(const path_info& from, const path_info& to_local,
                                progress_callback& callback) -> result<void> {
    return copy_file_with_progress(from, to_local, callback);
}

auto local_filesystem::put_file(const path_info& from_local, const path_info& to,
                                progress_callback& callback) -> result<void> {
    auto tmp = temporary_sibling(to);
    auto copied = copy_file_with_progress(from_local, tmp, callback);
    if (!copied) {
        std::error_code cleanup_ec;
        stdfs::remove(tmp.native(), cleanup_ec);
        return copied;
    }

    std::error_code ec;
    stdfs::rename(tmp.native(), to.native(), ec);
    if (ec) {
        std::error_code cleanup_ec;
        stdfs::remove(tmp.native(), cleanup_ec);
        return io_error(error_code::rename_failed, "Failed to replace", to, ec);
    }
    return {};
}

auto local_filesystem::upload_stream(std::istream& stream, const path_info& to,
                                     std::optional<uint64_t> size_hint,
                                     progress_callback& callback) -> result<void> {
    if (size_hint) {
        callback.set_size(size_hint);
    }

    auto tmp = temporary_sibling(to);
    auto fail = [&tmp](error err) -> result<void> {
        std::error_code cleanup_ec;
        stdfs::remove(tmp.native(), cleanup_ec);
        return unexpected(std::move(err));
    };

    {
        std::ofstream output(tmp.native(), std::ios::binary | std::ios::trunc);
        if (!output) {
            return fail(error{error_code::file_write_error,
                              "Failed to open for writing: '" + tmp.url() + "'"});
        }

        std::vector<char> buffer(copy_buffer_size);
        while (stream) {
            stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto count = stream.gcount();
            if (count <= 0) {
                break;
            }
            if (!output.write(buffer.data(), count)) {
                return fail(error{error_code::file_write_error,
                                  "Failed to write: '" + tmp.url() + "'"});
            }
        }
        if (stream.bad()) {
            return fail(error{error_code::file_read_error, "Failed to read upload stream"});
        }
        output.flush();
        if (!output) {
            return fail(error{error_code::file_write_error,
                              "Failed to flush: '" + tmp.url() + "'"});
        }
    }

    std::error_code ec;
    stdfs::rename(tmp.native(), to.native(), ec);
    if (ec) {
        return fail(error{error_code::rename_failed,
                          "Failed to replace '" + to.url() + "': " + ec.message()});
    }
    return {};
}

}  // namespace kcenon::vfs_transfer
