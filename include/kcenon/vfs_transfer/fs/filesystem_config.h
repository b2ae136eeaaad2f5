/**
 * @file filesystem_config.h
 * @brief Per-instance backend configuration
 */

#ifndef KCENON_VFS_TRANSFER_FS_FILESYSTEM_CONFIG_H
#define KCENON_VFS_TRANSFER_FS_FILESYSTEM_CONFIG_H

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "kcenon/vfs_transfer/core/types.h"

namespace kcenon::vfs_transfer {

/**
 * @brief Configuration of one backend instance
 *
 * Unset job counts fall back to the backend type's defaults. Backend-specific
 * settings (credentials, endpoints, ...) go in the free-form options map.
 */
struct filesystem_config {
    std::string url;
    std::optional<std::size_t> jobs;
    std::optional<std::size_t> checksum_jobs;
    std::map<std::string, std::string> options;

    [[nodiscard]] auto option(const std::string& key) const -> std::optional<std::string> {
        auto it = options.find(key);
        if (it == options.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    class builder;
};

/**
 * @brief Fluent builder for filesystem_config
 *
 * @code
 * auto config = filesystem_config::builder()
 *     .with_url("ssh://user@host/srv/data")
 *     .with_jobs(8)
 *     .with_option("port", "2222")
 *     .build();
 * @endcode
 */
class filesystem_config::builder {
public:
    builder() = default;

    auto with_url(std::string url) -> builder& {
        config_.url = std::move(url);
        return *this;
    }

    auto with_jobs(std::size_t jobs) -> builder& {
        config_.jobs = jobs;
        return *this;
    }

    auto with_checksum_jobs(std::size_t jobs) -> builder& {
        config_.checksum_jobs = jobs;
        return *this;
    }

    auto with_option(std::string key, std::string value) -> builder& {
        config_.options[std::move(key)] = std::move(value);
        return *this;
    }

    [[nodiscard]] auto build() const -> result<filesystem_config> {
        if (config_.jobs && *config_.jobs == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "jobs must be greater than zero"});
        }
        if (config_.checksum_jobs && *config_.checksum_jobs == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "checksum_jobs must be greater than zero"});
        }
        return config_;
    }

private:
    filesystem_config config_;
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_FS_FILESYSTEM_CONFIG_H
