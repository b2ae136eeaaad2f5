/**
 * @file path_info.cpp
 * @brief Implementation of path_info
 */

#include "kcenon/vfs_transfer/fs/path_info.h"

#include <cstdint>
#include <cstdio>
#include <random>

namespace kcenon::vfs_transfer {

namespace {

auto normalize(std::string_view raw) -> std::string {
    std::string out;
    out.reserve(raw.size());

    bool previous_sep = false;
    for (char c : raw) {
        if (c == '\\') {
            c = '/';
        }
        if (c == '/') {
            if (previous_sep) {
                continue;
            }
            previous_sep = true;
        } else {
            previous_sep = false;
        }
        out.push_back(c);
    }

    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

}  // namespace

path_info::path_info(std::string scheme, std::string path)
    : scheme_(std::move(scheme)), path_(normalize(path)) {}

auto path_info::local(const std::filesystem::path& path) -> path_info {
    return path_info(std::string(local_scheme), path.generic_string());
}

auto path_info::from_url(std::string_view url) -> path_info {
    auto pos = url.find("://");
    if (pos == std::string_view::npos || pos == 0) {
        return path_info(std::string(local_scheme), std::string(url));
    }
    return path_info(std::string(url.substr(0, pos)), std::string(url.substr(pos + 3)));
}

auto path_info::name() const -> std::string {
    if (path_ == "/") {
        return {};
    }
    auto pos = path_.find_last_of('/');
    if (pos == std::string::npos) {
        return path_;
    }
    return path_.substr(pos + 1);
}

auto path_info::parent() const -> path_info {
    auto pos = path_.find_last_of('/');
    if (pos == std::string::npos) {
        return path_info(scheme_, "");
    }
    if (pos == 0) {
        return path_info(scheme_, "/");
    }
    return path_info(scheme_, path_.substr(0, pos));
}

auto path_info::is_under(const path_info& ancestor) const -> bool {
    if (scheme_ != ancestor.scheme_ || path_.size() <= ancestor.path_.size()) {
        return false;
    }
    if (ancestor.path_.empty()) {
        return path_.front() != '/';
    }
    if (path_.compare(0, ancestor.path_.size(), ancestor.path_) != 0) {
        return false;
    }
    return ancestor.path_.back() == '/' || path_[ancestor.path_.size()] == '/';
}

auto path_info::relative_to(const path_info& ancestor) const -> result<std::string> {
    if (!is_under(ancestor)) {
        return unexpected(error{error_code::invalid_file_path,
                                "'" + url() + "' is not under '" + ancestor.url() + "'"});
    }
    if (ancestor.path_.empty()) {
        return path_;
    }
    auto offset = ancestor.path_.size();
    if (ancestor.path_.back() != '/') {
        ++offset;
    }
    return path_.substr(offset);
}

auto path_info::url() const -> std::string {
    if (is_local()) {
        return path_;
    }
    return scheme_ + "://" + path_;
}

auto path_info::operator/(std::string_view relative) const -> path_info {
    while (!relative.empty() && (relative.front() == '/' || relative.front() == '\\')) {
        relative.remove_prefix(1);
    }
    if (relative.empty()) {
        return *this;
    }
    if (path_.empty()) {
        return path_info(scheme_, std::string(relative));
    }
    return path_info(scheme_, path_ + "/" + std::string(relative));
}

auto temporary_sibling(const path_info& target) -> path_info {
    thread_local std::mt19937_64 engine{std::random_device{}()};

    char suffix[17];
    std::snprintf(suffix, sizeof(suffix), "%016llx",
                  static_cast<unsigned long long>(engine()));

    return target.parent() / (target.name() + "." + suffix + ".tmp");
}

}  // namespace kcenon::vfs_transfer
