/**
 * @file remote_provider.h
 * @brief Capability contract for a remote filesystem reached through a protocol
 *
 * Concrete providers wrap a protocol client (SFTP, SCP, FTP, ...). The engine
 * and the session only depend on this interface.
 */

#ifndef KCENON_TREE_TRANSFER_PROVIDER_REMOTE_PROVIDER_H
#define KCENON_TREE_TRANSFER_PROVIDER_REMOTE_PROVIDER_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/tree_transfer/core/fs_entry.h"
#include "kcenon/tree_transfer/core/io_stream.h"
#include "kcenon/tree_transfer/core/types.h"

namespace kcenon::tree_transfer {

/**
 * @brief Parameters for connecting to a remote host
 */
struct connection_params {
    std::string address;
    uint16_t port = 0;
    std::string username;
    std::optional<std::string> password;
    std::optional<std::filesystem::path> entry_directory;

    /**
     * @brief "user@address:port" (user and port omitted when unset)
     */
    [[nodiscard]] auto display_address() const -> std::string {
        std::string out;
        if (!username.empty()) {
            out = username + "@";
        }
        out += address;
        if (port != 0) {
            out += ":" + std::to_string(port);
        }
        return out;
    }
};

/**
 * @brief Remote filesystem operations
 *
 * Paths are remote paths; relative paths are resolved against the remote
 * working directory. mkdir on an existing directory must fail with
 * error_code::directory_already_exists.
 */
class remote_provider {
public:
    virtual ~remote_provider() = default;

    /**
     * @brief Connect to the host
     * @return Optional welcome banner
     */
    [[nodiscard]] virtual auto connect(const connection_params& params)
        -> result<std::optional<std::string>> = 0;

    [[nodiscard]] virtual auto disconnect() -> result<void> = 0;

    [[nodiscard]] virtual auto is_connected() const -> bool = 0;

    [[nodiscard]] virtual auto pwd() -> result<std::filesystem::path> = 0;

    /**
     * @brief Change the remote working directory
     * @return The new working directory
     */
    [[nodiscard]] virtual auto change_dir(const std::filesystem::path& dir)
        -> result<std::filesystem::path> = 0;

    [[nodiscard]] virtual auto list_dir(const std::filesystem::path& dir)
        -> result<std::vector<fs_entry>> = 0;

    [[nodiscard]] virtual auto stat(const std::filesystem::path& path) -> result<fs_entry> = 0;

    [[nodiscard]] virtual auto mkdir(const std::filesystem::path& dir,
                                     std::optional<unix_pex> mode) -> result<void> = 0;

    [[nodiscard]] virtual auto remove(const fs_entry& entry) -> result<void> = 0;

    /**
     * @brief Open a remote file for writing
     * @param local_file Source metadata (size, permissions)
     * @param remote_path Destination path
     */
    [[nodiscard]] virtual auto send_file(const fs_file& local_file,
                                         const std::filesystem::path& remote_path)
        -> result<std::unique_ptr<writable_stream>> = 0;

    [[nodiscard]] virtual auto recv_file(const fs_file& remote_file)
        -> result<std::unique_ptr<readable_stream>> = 0;

    /**
     * @brief Finalize a stream returned by send_file
     */
    [[nodiscard]] virtual auto on_sent(std::unique_ptr<writable_stream> stream)
        -> result<void> = 0;

    /**
     * @brief Finalize a stream returned by recv_file
     */
    [[nodiscard]] virtual auto on_recv(std::unique_ptr<readable_stream> stream)
        -> result<void> = 0;

    [[nodiscard]] virtual auto protocol_name() const -> std::string_view = 0;
};

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_PROVIDER_REMOTE_PROVIDER_H
