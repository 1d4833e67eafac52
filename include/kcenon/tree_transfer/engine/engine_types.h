/**
 * @file engine_types.h
 * @brief Transfer engine configuration and event types
 */

#ifndef KCENON_TREE_TRANSFER_ENGINE_ENGINE_TYPES_H
#define KCENON_TREE_TRANSFER_ENGINE_ENGINE_TYPES_H

#include <chrono>
#include <cstddef>
#include <string>

#include "kcenon/tree_transfer/core/logging.h"

namespace kcenon::tree_transfer {

/**
 * @brief Transfer engine configuration
 */
struct engine_config {
    std::size_t buffer_size = 64 * 1024;                    // 64KB per read
    std::chrono::milliseconds input_poll_interval{500};     // input re-poll cadence
    bool preserve_permissions = true;                       // chmod received entries

    static constexpr std::size_t min_buffer_size = 1;
    static constexpr std::size_t max_buffer_size = 64 * 1024 * 1024;
    static constexpr std::chrono::milliseconds max_input_poll_interval{500};
};

/**
 * @brief Human readable record emitted while walking a payload
 *
 * Events flagged as alerts are meant to be surfaced to the user in
 * addition to the log.
 */
struct transfer_event {
    log_level level = log_level::info;
    std::string message;
    bool alert = false;
};

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_ENGINE_ENGINE_TYPES_H
