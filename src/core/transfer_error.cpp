/**
 * @file transfer_error.cpp
 */

#include "kcenon/tree_transfer/core/transfer_error.h"

namespace kcenon::tree_transfer {

auto transfer_error_reason::to_string() const -> std::string {
    switch (kind) {
        case transfer_error_kind::abrupted:
            return "File transfer aborted";
        case transfer_error_kind::could_not_rewind:
            return "Failed to seek file: " + cause.message;
        case transfer_error_kind::local_io_error:
            return "I/O error on localhost: " + cause.message;
        case transfer_error_kind::host_error:
            return "Host error: " + cause.message;
        case transfer_error_kind::remote_io_error:
            return "I/O error on remote: " + cause.message;
        case transfer_error_kind::protocol_error:
            return "File transfer error: " + cause.message;
        default:
            return cause.message;
    }
}

}  // namespace kcenon::tree_transfer
