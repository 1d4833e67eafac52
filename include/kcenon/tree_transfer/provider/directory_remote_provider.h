/**
 * @file directory_remote_provider.h
 * @brief remote_provider exposing a local directory as a remote host
 */

#ifndef KCENON_TREE_TRANSFER_PROVIDER_DIRECTORY_REMOTE_PROVIDER_H
#define KCENON_TREE_TRANSFER_PROVIDER_DIRECTORY_REMOTE_PROVIDER_H

#include "kcenon/tree_transfer/provider/remote_provider.h"

namespace kcenon::tree_transfer {

/**
 * @brief Remote provider rooted at a directory of the local disk
 *
 * The root is seen as "/" by the engine; paths climbing above the root are
 * refused with error_code::invalid_path. Serves the "file" protocol and is
 * used for mirroring to mounted volumes as well as in tests and examples.
 *
 * @code
 * directory_remote_provider remote("/mnt/backup");
 * auto banner = remote.connect(connection_params{.address = "localhost"});
 * @endcode
 */
class directory_remote_provider : public remote_provider {
public:
    explicit directory_remote_provider(std::filesystem::path root);

    [[nodiscard]] auto connect(const connection_params& params)
        -> result<std::optional<std::string>> override;
    [[nodiscard]] auto disconnect() -> result<void> override;
    [[nodiscard]] auto is_connected() const -> bool override;
    [[nodiscard]] auto pwd() -> result<std::filesystem::path> override;
    [[nodiscard]] auto change_dir(const std::filesystem::path& dir)
        -> result<std::filesystem::path> override;
    [[nodiscard]] auto list_dir(const std::filesystem::path& dir)
        -> result<std::vector<fs_entry>> override;
    [[nodiscard]] auto stat(const std::filesystem::path& path) -> result<fs_entry> override;
    [[nodiscard]] auto mkdir(const std::filesystem::path& dir,
                             std::optional<unix_pex> mode) -> result<void> override;
    [[nodiscard]] auto remove(const fs_entry& entry) -> result<void> override;
    [[nodiscard]] auto send_file(const fs_file& local_file,
                                 const std::filesystem::path& remote_path)
        -> result<std::unique_ptr<writable_stream>> override;
    [[nodiscard]] auto recv_file(const fs_file& remote_file)
        -> result<std::unique_ptr<readable_stream>> override;
    [[nodiscard]] auto on_sent(std::unique_ptr<writable_stream> stream) -> result<void> override;
    [[nodiscard]] auto on_recv(std::unique_ptr<readable_stream> stream) -> result<void> override;
    [[nodiscard]] auto protocol_name() const -> std::string_view override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    /**
     * @brief Normalize a remote path to an absolute remote path
     */
    [[nodiscard]] auto normalize(const std::filesystem::path& path) const
        -> result<std::filesystem::path>;

    /**
     * @brief Map an absolute remote path onto the disk
     */
    [[nodiscard]] auto to_local(const std::filesystem::path& remote_abs) const
        -> std::filesystem::path;

    [[nodiscard]] auto ensure_connected() const -> result<void>;

    std::filesystem::path root_;
    std::filesystem::path working_dir_{"/"};
    bool connected_ = false;
};

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_PROVIDER_DIRECTORY_REMOTE_PROVIDER_H
