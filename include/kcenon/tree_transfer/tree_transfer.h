/**
 * @file tree_transfer.h
 * @brief Main header for the tree_transfer library
 * @version 0.1.0
 *
 * Include this header to access the transfer engine, the session controller
 * and the bundled providers.
 *
 * @code
 * #include <kcenon/tree_transfer/tree_transfer.h>
 *
 * using namespace kcenon::tree_transfer;
 *
 * auto session = session_controller::builder()
 *     .with_local_provider(std::make_unique<filesystem_local_provider>())
 *     .with_remote_provider(std::make_unique<directory_remote_provider>("/mnt/backup"))
 *     .build();
 * @endcode
 */

#ifndef KCENON_TREE_TRANSFER_TREE_TRANSFER_H
#define KCENON_TREE_TRANSFER_TREE_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/tree_transfer/core/types.h"
#include "kcenon/tree_transfer/core/fs_entry.h"
#include "kcenon/tree_transfer/core/transfer_progress.h"
#include "kcenon/tree_transfer/core/transfer_error.h"

// Providers
#include "kcenon/tree_transfer/provider/local_provider.h"
#include "kcenon/tree_transfer/provider/remote_provider.h"
#include "kcenon/tree_transfer/provider/filesystem_local_provider.h"
#include "kcenon/tree_transfer/provider/directory_remote_provider.h"

// Engine
#include "kcenon/tree_transfer/engine/transfer_engine.h"

// Session
#include "kcenon/tree_transfer/session/session_types.h"
#include "kcenon/tree_transfer/session/session_controller.h"

namespace kcenon::tree_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_TREE_TRANSFER_H
