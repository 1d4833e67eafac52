/**
 * @file filesystem_local_provider.h
 * @brief local_provider backed by std::filesystem
 */

#ifndef KCENON_TREE_TRANSFER_PROVIDER_FILESYSTEM_LOCAL_PROVIDER_H
#define KCENON_TREE_TRANSFER_PROVIDER_FILESYSTEM_LOCAL_PROVIDER_H

#include "kcenon/tree_transfer/provider/local_provider.h"

namespace kcenon::tree_transfer {

/**
 * @brief Local provider operating on the host filesystem
 *
 * Keeps its own working directory instead of changing the process one.
 *
 * @code
 * filesystem_local_provider local("/home/user");
 * auto entries = local.scan_dir(local.pwd());
 * @endcode
 */
class filesystem_local_provider : public local_provider {
public:
    /**
     * @param working_dir Initial working directory (defaults to the process one)
     */
    explicit filesystem_local_provider(std::filesystem::path working_dir = {});

    [[nodiscard]] auto pwd() const -> std::filesystem::path override;
    [[nodiscard]] auto change_wrkdir(const std::filesystem::path& dir)
        -> result<std::filesystem::path> override;
    [[nodiscard]] auto scan_dir(const std::filesystem::path& dir)
        -> result<std::vector<fs_entry>> override;
    [[nodiscard]] auto stat(const std::filesystem::path& path) -> result<fs_entry> override;
    [[nodiscard]] auto open_file_read(const std::filesystem::path& path)
        -> result<std::unique_ptr<readable_stream>> override;
    [[nodiscard]] auto open_file_write(const std::filesystem::path& path)
        -> result<std::unique_ptr<writable_stream>> override;
    [[nodiscard]] auto mkdir(const std::filesystem::path& dir, bool recursive)
        -> result<void> override;
    [[nodiscard]] auto remove(const fs_entry& entry) -> result<void> override;
    [[nodiscard]] auto chmod(const std::filesystem::path& path, unix_pex mode)
        -> result<void> override;

private:
    [[nodiscard]] auto resolve(const std::filesystem::path& path) const -> std::filesystem::path;

    std::filesystem::path working_dir_;
};

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_PROVIDER_FILESYSTEM_LOCAL_PROVIDER_H
