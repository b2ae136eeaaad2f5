/**
 * @file capability_gate.cpp
 * @brief Implementation of capability_gate
 */

#include "kcenon/vfs_transfer/fs/capability_gate.h"

#include <dlfcn.h>

#include "kcenon/vfs_transfer/core/logging.h"

namespace kcenon::vfs_transfer {

auto shared_library_resolver::is_available(const backend_dependency& dependency) const
    -> bool {
    if (dependency.library.empty()) {
        return false;
    }
    void* handle = ::dlopen(dependency.library.c_str(), RTLD_LAZY | RTLD_LOCAL);
    if (handle == nullptr) {
        return false;
    }
    ::dlclose(handle);
    return true;
}

capability_gate::capability_gate(std::shared_ptr<const dependency_resolver> resolver,
                                 std::string channel)
    : resolver_(resolver ? std::move(resolver)
                         : std::make_shared<const shared_library_resolver>()),
      channel_(std::move(channel)) {}

auto capability_gate::missing_dependencies(const backend_traits& traits) const
    -> std::vector<std::string> {
    std::vector<std::string> missing;
    for (const auto& dependency : traits.dependencies) {
        if (!resolver_->is_available(dependency)) {
            missing.push_back(dependency.package);
        }
    }
    return missing;
}

auto capability_gate::check(const backend_traits& traits, std::string_view url) const
    -> result<void> {
    auto missing = missing_dependencies(traits);
    if (missing.empty()) {
        return {};
    }

    std::string names;
    for (std::size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) {
            names += ", ";
        }
        names += "'" + missing[i] + "'";
    }

    auto hint = install_hint(traits.scheme, channel_);
    std::string message = "URL '" + std::string(url) +
                          "' is supported but requires these missing dependencies: [" +
                          names + "]. " + hint;

    VFS_LOG_ERROR(log_category::gate,
                  "Backend '" + traits.scheme + "' unavailable, missing: [" + names + "]");

    return unexpected(error{error_code::missing_dependencies, std::move(message),
                            missing_dependencies_details{std::string(url), traits.scheme,
                                                         std::move(missing), hint}});
}

auto capability_gate::normalize_scheme(std::string_view scheme) -> std::string {
    if (scheme == "webdavs") {
        return "webdav";
    }
    return std::string(scheme);
}

auto capability_gate::install_hint(std::string_view scheme, std::string_view channel)
    -> std::string {
    auto normalized = normalize_scheme(scheme);

    std::string command;
    if (channel == "apt") {
        command = "apt install libvfs-transfer-" + normalized;
    } else if (channel == "conda") {
        command = "conda install -c conda-forge vfs-transfer-" + normalized;
    } else if (channel == "vcpkg") {
        command = "vcpkg install vfs-transfer[" + normalized + "]";
    } else {
        return "Please report this bug. Thank you!";
    }

    return "To install vfs_transfer with those dependencies, run:\n\n\t" + command +
           "\n\nSee the installation guide for more info.";
}

}  // namespace kcenon::vfs_transfer
