/**
 * @file capability_gate.h
 * @brief Dependency check run before a backend instance is constructed
 */

#ifndef KCENON_VFS_TRANSFER_FS_CAPABILITY_GATE_H
#define KCENON_VFS_TRANSFER_FS_CAPABILITY_GATE_H

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "kcenon/vfs_transfer/config/feature_flags.h"
#include "kcenon/vfs_transfer/core/types.h"
#include "kcenon/vfs_transfer/fs/capability.h"
#include "kcenon/vfs_transfer/fs/filesystem_config.h"

namespace kcenon::vfs_transfer {

/**
 * @brief Decides whether a backend dependency is present
 */
class dependency_resolver {
public:
    virtual ~dependency_resolver() = default;

    [[nodiscard]] virtual auto is_available(const backend_dependency& dependency) const
        -> bool = 0;
};

/**
 * @brief Resolver that tries to load the dependency's shared library
 */
class shared_library_resolver final : public dependency_resolver {
public:
    [[nodiscard]] auto is_available(const backend_dependency& dependency) const
        -> bool override;
};

/**
 * @brief Fails backend construction early when dependencies are missing
 *
 * The installation hint depends on the packaging channel the library was
 * shipped through (VFS_TRANS_PACKAGE_CHANNEL unless overridden).
 */
class capability_gate {
public:
    explicit capability_gate(std::shared_ptr<const dependency_resolver> resolver = nullptr,
                             std::string channel = VFS_TRANS_PACKAGE_CHANNEL);

    /**
     * @brief Verify every dependency declared by @p traits
     * @param url Resource URL the caller attempted, echoed in the error
     * @return missing_dependencies with missing_dependencies_details on failure
     */
    [[nodiscard]] auto check(const backend_traits& traits, std::string_view url) const
        -> result<void>;

    /**
     * @brief Package names of unresolved dependencies, in declaration order
     */
    [[nodiscard]] auto missing_dependencies(const backend_traits& traits) const
        -> std::vector<std::string>;

    [[nodiscard]] auto channel() const noexcept -> const std::string& { return channel_; }

    [[nodiscard]] static auto install_hint(std::string_view scheme, std::string_view channel)
        -> std::string;

    /**
     * @brief Map scheme aliases onto the scheme packages are named after
     */
    [[nodiscard]] static auto normalize_scheme(std::string_view scheme) -> std::string;

private:
    std::shared_ptr<const dependency_resolver> resolver_;
    std::string channel_;
};

/**
 * @brief Construct a backend after checking its dependencies
 *
 * The check runs once here, never per call on the returned instance.
 *
 * @code
 * auto fs = make_filesystem<local_filesystem>(filesystem_config{});
 * if (!fs) {
 *     std::cerr << fs.error().message << "\n";
 * }
 * @endcode
 */
template <typename Backend>
[[nodiscard]] auto make_filesystem(filesystem_config config,
                                   const capability_gate& gate = capability_gate{})
    -> result<std::shared_ptr<Backend>> {
    const backend_traits& traits = Backend::traits();
    std::string url = config.url.empty() ? traits.scheme + "://" : config.url;

    auto checked = gate.check(traits, url);
    if (!checked) {
        return unexpected(checked.error());
    }
    return std::make_shared<Backend>(std::move(config));
}

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_FS_CAPABILITY_GATE_H
