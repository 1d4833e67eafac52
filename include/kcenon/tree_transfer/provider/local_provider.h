/**
 * @file local_provider.h
 * @brief Capability contract for the local filesystem
 */

#ifndef KCENON_TREE_TRANSFER_PROVIDER_LOCAL_PROVIDER_H
#define KCENON_TREE_TRANSFER_PROVIDER_LOCAL_PROVIDER_H

#include <filesystem>
#include <memory>
#include <vector>

#include "kcenon/tree_transfer/core/fs_entry.h"
#include "kcenon/tree_transfer/core/io_stream.h"
#include "kcenon/tree_transfer/core/types.h"

namespace kcenon::tree_transfer {

/**
 * @brief Local filesystem operations needed by the engine and the session
 *
 * Relative paths are resolved against the working directory.
 */
class local_provider {
public:
    virtual ~local_provider() = default;

    [[nodiscard]] virtual auto pwd() const -> std::filesystem::path = 0;

    /**
     * @brief Change the working directory
     * @return The new working directory
     */
    [[nodiscard]] virtual auto change_wrkdir(const std::filesystem::path& dir)
        -> result<std::filesystem::path> = 0;

    [[nodiscard]] virtual auto scan_dir(const std::filesystem::path& dir)
        -> result<std::vector<fs_entry>> = 0;

    [[nodiscard]] virtual auto stat(const std::filesystem::path& path) -> result<fs_entry> = 0;

    [[nodiscard]] virtual auto open_file_read(const std::filesystem::path& path)
        -> result<std::unique_ptr<readable_stream>> = 0;

    /**
     * @brief Create or truncate a file for writing
     */
    [[nodiscard]] virtual auto open_file_write(const std::filesystem::path& path)
        -> result<std::unique_ptr<writable_stream>> = 0;

    /**
     * @brief Create a directory
     *
     * With @p recursive, missing parents are created and an existing
     * directory is success. Without it, an existing directory fails with
     * error_code::directory_already_exists.
     */
    [[nodiscard]] virtual auto mkdir(const std::filesystem::path& dir, bool recursive)
        -> result<void> = 0;

    /**
     * @brief Remove a file or a directory with its content
     */
    [[nodiscard]] virtual auto remove(const fs_entry& entry) -> result<void> = 0;

    [[nodiscard]] virtual auto chmod(const std::filesystem::path& path, unix_pex mode)
        -> result<void> = 0;
};

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_PROVIDER_LOCAL_PROVIDER_H
