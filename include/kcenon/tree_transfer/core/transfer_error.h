/**
 * @file transfer_error.h
 * @brief Classification of per-file transfer failures
 */

#ifndef KCENON_TREE_TRANSFER_CORE_TRANSFER_ERROR_H
#define KCENON_TREE_TRANSFER_CORE_TRANSFER_ERROR_H

#include <string>

#include "kcenon/tree_transfer/core/types.h"

namespace kcenon::tree_transfer {

/**
 * @brief Where a file transfer failed
 */
enum class transfer_error_kind {
    abrupted,           ///< aborted by the user
    could_not_rewind,   ///< source could not be seeked back to the start
    local_io_error,     ///< read or write failure on the local side
    host_error,         ///< local provider refused an operation
    remote_io_error,    ///< read or write failure on the remote stream
    protocol_error      ///< remote provider refused an operation
};

[[nodiscard]] constexpr auto to_string(transfer_error_kind kind) -> const char* {
    switch (kind) {
        case transfer_error_kind::abrupted: return "abrupted";
        case transfer_error_kind::could_not_rewind: return "could_not_rewind";
        case transfer_error_kind::local_io_error: return "local_io_error";
        case transfer_error_kind::host_error: return "host_error";
        case transfer_error_kind::remote_io_error: return "remote_io_error";
        case transfer_error_kind::protocol_error: return "protocol_error";
        default: return "unknown";
    }
}

/**
 * @brief Failure kind plus the underlying error
 */
struct transfer_error_reason {
    transfer_error_kind kind;
    error cause;

    [[nodiscard]] static auto abrupted() -> transfer_error_reason {
        return {transfer_error_kind::abrupted, error{}};
    }

    /**
     * @brief Human readable description, e.g. "I/O error on remote: ..."
     */
    [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief Whether a partially written destination must be removed
 *
 * On send the destination is remote; it is removed after an abort or a
 * remote I/O failure. On receive the destination is local; it is removed
 * after an abort or a local I/O failure.
 */
[[nodiscard]] constexpr auto should_cleanup_destination(transfer_error_kind kind,
                                                        transfer_direction direction) -> bool {
    switch (kind) {
        case transfer_error_kind::abrupted:
            return true;
        case transfer_error_kind::remote_io_error:
            return direction == transfer_direction::send;
        case transfer_error_kind::local_io_error:
            return direction == transfer_direction::receive;
        default:
            return false;
    }
}

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_CORE_TRANSFER_ERROR_H
