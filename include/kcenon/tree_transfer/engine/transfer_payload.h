/**
 * @file transfer_payload.h
 * @brief Unit of a transfer request
 */

#ifndef KCENON_TREE_TRANSFER_ENGINE_TRANSFER_PAYLOAD_H
#define KCENON_TREE_TRANSFER_ENGINE_TRANSFER_PAYLOAD_H

#include <variant>
#include <vector>

#include "kcenon/tree_transfer/core/fs_entry.h"

namespace kcenon::tree_transfer {

/**
 * @brief One file whose size is already known
 *
 * The aggregate size is taken from the entry without querying a provider,
 * and the per-file failure is returned to the caller.
 */
struct single_file {
    fs_file file;
};

/**
 * @brief One file or directory expanded during the walk
 */
struct single_entry {
    fs_entry entry;
};

/**
 * @brief Ordered list of entries; never renamed
 */
struct batch {
    std::vector<fs_entry> entries;
};

using transfer_payload = std::variant<single_file, single_entry, batch>;

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_ENGINE_TRANSFER_PAYLOAD_H
