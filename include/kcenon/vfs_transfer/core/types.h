/**
 * @file types.h
 * @brief Core type definitions for vfs_transfer_system
 */

#ifndef KCENON_VFS_TRANSFER_CORE_TYPES_H
#define KCENON_VFS_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace kcenon::vfs_transfer {

/**
 * @brief Error codes for virtual filesystem transfer operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_already_exists = -102,
    invalid_file_path = -103,
    file_read_error = -104,
    file_write_error = -105,
    directory_create_failed = -106,
    rename_failed = -107,
    remove_failed = -108,

    // Contract errors (-120 to -139)
    not_implemented = -120,
    action_not_supported = -121,
    unsupported_transfer = -122,

    // Backend construction errors (-140 to -159)
    missing_dependencies = -140,
    invalid_configuration = -141,

    // Transfer errors (-160 to -179)
    transfer_failed = -160,
    remote_command_failed = -162,
    checksum_failed = -163,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_already_exists:
            return "file already exists";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::directory_create_failed:
            return "directory create failed";
        case error_code::rename_failed:
            return "rename failed";
        case error_code::remove_failed:
            return "remove failed";
        case error_code::not_implemented:
            return "not implemented";
        case error_code::action_not_supported:
            return "action not supported";
        case error_code::unsupported_transfer:
            return "unsupported transfer";
        case error_code::missing_dependencies:
            return "missing dependencies";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::transfer_failed:
            return "transfer failed";
        case error_code::remote_command_failed:
            return "remote command failed";
        case error_code::checksum_failed:
            return "checksum failed";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

[[nodiscard]] constexpr auto is_file_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -100 && v >= -119;
}

[[nodiscard]] constexpr auto is_contract_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -120 && v >= -139;
}

[[nodiscard]] constexpr auto is_construction_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -140 && v >= -159;
}

[[nodiscard]] constexpr auto is_transfer_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -160 && v >= -179;
}

/**
 * @brief Details of an optional primitive a backend does not provide
 */
struct unsupported_action_details {
    std::string action;
    std::string scheme;
};

/**
 * @brief Details of a backend that cannot be constructed
 */
struct missing_dependencies_details {
    std::string url;
    std::string scheme;
    std::vector<std::string> missing;
    std::string hint;
};

/**
 * @brief Details of an external command that exited non-zero
 */
struct command_failure_details {
    std::string remote;
    std::string command;
    int exit_code = 0;
    std::string error_output;
};

using error_details = std::variant<std::monostate,
                                   unsupported_action_details,
                                   missing_dependencies_details,
                                   command_failure_details>;

/**
 * @brief Error type with code, message and optional structured details
 */
struct error {
    error_code code;
    std::string message;
    error_details details;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, error_details d)
        : code(c), message(std::move(msg)), details(std::move(d)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    /**
     * @brief Access typed details, or nullptr when the error carries none of that type
     */
    template <typename T>
    [[nodiscard]] auto details_as() const noexcept -> const T* {
        return std::get_if<T>(&details);
    }
};

/**
 * @brief Build the error a backend returns for an omitted optional operation
 */
[[nodiscard]] inline auto make_action_not_supported(std::string action, std::string scheme)
    -> error {
    std::string message = action + " is not supported for " + scheme + " remotes";
    return error{error_code::action_not_supported, std::move(message),
                 unsupported_action_details{std::move(action), std::move(scheme)}};
}

/**
 * @brief Build the error for an operation every backend must override
 */
[[nodiscard]] inline auto make_not_implemented(std::string_view action, std::string_view scheme)
    -> error {
    return error{error_code::not_implemented,
                 std::string(action) + " is not implemented by the " +
                     std::string(scheme) + " backend"};
}

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_CORE_TYPES_H
