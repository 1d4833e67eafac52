/**
 * @file types.h
 * @brief Core type definitions for tree_transfer
 */

#ifndef KCENON_TREE_TRANSFER_CORE_TYPES_H
#define KCENON_TREE_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::tree_transfer {

/**
 * @brief Error codes reported by providers, streams and the engine
 *
 * Codes are grouped by range so callers can tell a filesystem condition
 * from a connection or configuration problem without parsing messages.
 */
enum class error_code {
    success = 0,

    // Filesystem errors (-100 to -119)
    no_such_file_or_directory = -100,
    permission_denied = -101,
    directory_already_exists = -102,
    file_already_exists = -103,
    not_a_directory = -104,
    is_a_directory = -105,
    directory_not_empty = -106,
    invalid_path = -107,

    // Stream I/O errors (-120 to -139)
    io_error = -120,
    file_read_error = -121,
    file_write_error = -122,
    seek_error = -123,
    stream_closed = -124,

    // Connection errors (-140 to -159)
    not_connected = -140,
    already_connected = -141,
    connection_failed = -142,
    authentication_failed = -143,
    bad_address = -144,
    protocol_error = -145,

    // Configuration errors (-160 to -179)
    invalid_configuration = -160,
    unsupported_feature = -161,

    // Transfer errors (-180 to -199)
    transfer_aborted = -180,
    transfer_failed = -181,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::no_such_file_or_directory:
            return "no such file or directory";
        case error_code::permission_denied:
            return "permission denied";
        case error_code::directory_already_exists:
            return "directory already exists";
        case error_code::file_already_exists:
            return "file already exists";
        case error_code::not_a_directory:
            return "not a directory";
        case error_code::is_a_directory:
            return "is a directory";
        case error_code::directory_not_empty:
            return "directory not empty";
        case error_code::invalid_path:
            return "invalid path";
        case error_code::io_error:
            return "I/O error";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::seek_error:
            return "seek error";
        case error_code::stream_closed:
            return "stream closed";
        case error_code::not_connected:
            return "not connected";
        case error_code::already_connected:
            return "already connected";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::bad_address:
            return "bad address";
        case error_code::protocol_error:
            return "protocol error";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::unsupported_feature:
            return "unsupported feature";
        case error_code::transfer_aborted:
            return "transfer aborted";
        case error_code::transfer_failed:
            return "transfer failed";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

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
 * A simple Result type similar to std::expected (C++23).
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

/**
 * @brief Direction of a transfer relative to the local host
 */
enum class transfer_direction {
    send,    ///< local -> remote
    receive  ///< remote -> local
};

/**
 * @brief Convert transfer_direction to string
 */
[[nodiscard]] constexpr auto to_string(transfer_direction direction) -> const char* {
    switch (direction) {
        case transfer_direction::send: return "send";
        case transfer_direction::receive: return "receive";
        default: return "unknown";
    }
}

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_CORE_TYPES_H
