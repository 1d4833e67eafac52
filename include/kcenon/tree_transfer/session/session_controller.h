/**
 * @file session_controller.h
 * @brief Orchestrates providers and the transfer engine for one connection
 */

#ifndef KCENON_TREE_TRANSFER_SESSION_SESSION_CONTROLLER_H
#define KCENON_TREE_TRANSFER_SESSION_SESSION_CONTROLLER_H

#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/tree_transfer/core/types.h"
#include "kcenon/tree_transfer/engine/transfer_engine.h"
#include "kcenon/tree_transfer/provider/local_provider.h"
#include "kcenon/tree_transfer/provider/remote_provider.h"
#include "kcenon/tree_transfer/session/session_types.h"

namespace kcenon::tree_transfer {

/**
 * @brief Session controller
 *
 * Owns the local and remote providers and the transfer engine, turns user
 * intents into engine calls and keeps the explorer listings current. Every
 * message is recorded in a bounded log and forwarded to listeners.
 *
 * @code
 * auto session_result = session_controller::builder()
 *     .with_local_provider(std::make_unique<filesystem_local_provider>())
 *     .with_remote_provider(std::make_unique<directory_remote_provider>("/srv/export"))
 *     .with_connection_params({.address = "localhost"})
 *     .build();
 *
 * if (session_result.has_value()) {
 *     auto& session = session_result.value();
 *     if (session.connect()) {
 *         session.send_selection(session.local_explorer().files());
 *     }
 * }
 * @endcode
 */
class session_controller {
public:
    using log_listener = std::function<void(const log_record&)>;
    using alert_listener = std::function<void(log_level, const std::string&)>;
    using fatal_listener = std::function<void(const std::string&)>;

    /**
     * @brief Builder for session_controller
     */
    class builder {
    public:
        builder();

        auto with_local_provider(std::unique_ptr<local_provider> provider) -> builder&;
        auto with_remote_provider(std::unique_ptr<remote_provider> provider) -> builder&;
        auto with_connection_params(connection_params params) -> builder&;

        /**
         * @brief Set the engine configuration (validated on build)
         */
        auto with_engine_config(const engine_config& config) -> builder&;

        /**
         * @brief Directory used by download_file_as_temp
         */
        auto with_cache_dir(std::filesystem::path dir) -> builder&;

        /**
         * @brief Number of log records kept (default: 256)
         */
        auto with_log_capacity(std::size_t capacity) -> builder&;

        /**
         * @brief Depth of the directory history (default: 16)
         */
        auto with_dir_stack_capacity(std::size_t capacity) -> builder&;

        /**
         * @brief Build the session
         * @return Result containing the session or an error
         */
        [[nodiscard]] auto build() -> result<session_controller>;

    private:
        session_config config_;
        std::unique_ptr<local_provider> local_;
        std::unique_ptr<remote_provider> remote_;
    };

    // Non-copyable, movable
    session_controller(const session_controller&) = delete;
    auto operator=(const session_controller&) -> session_controller& = delete;
    session_controller(session_controller&&) noexcept;
    auto operator=(session_controller&&) noexcept -> session_controller&;
    ~session_controller();

    // Connection
    /**
     * @brief Connect to the remote host
     *
     * On failure the fatal listener is notified and the session stays
     * disconnected.
     */
    [[nodiscard]] auto connect() -> result<void>;

    /**
     * @brief Disconnect and request exit with exit_reason::disconnect
     */
    void disconnect();

    /**
     * @brief Disconnect and request exit with exit_reason::quit
     */
    void disconnect_and_quit();

    [[nodiscard]] auto is_connected() const -> bool;

    [[nodiscard]] auto get_exit_reason() const -> std::optional<exit_reason>;

    // Explorers
    void reload_local_dir();
    void reload_remote_dir();

    /**
     * @brief Change the local working directory
     * @param push Remember the previous directory for go_to_previous_local_dir
     */
    auto local_changedir(const std::filesystem::path& dir, bool push) -> result<void>;
    auto remote_changedir(const std::filesystem::path& dir, bool push) -> result<void>;

    /**
     * @brief Return to the last remembered local directory
     * @return no_such_file_or_directory when the history is empty
     */
    auto go_to_previous_local_dir() -> result<void>;
    auto go_to_previous_remote_dir() -> result<void>;

    [[nodiscard]] auto local_explorer() const -> const explorer_state&;
    [[nodiscard]] auto remote_explorer() const -> const explorer_state&;

    // Transfers
    /**
     * @brief Send a payload into the remote working directory
     */
    [[nodiscard]] auto send(const transfer_payload& payload,
                            std::optional<std::string> rename = std::nullopt) -> result<void>;

    /**
     * @brief Receive a payload into the local working directory
     */
    [[nodiscard]] auto recv(const transfer_payload& payload,
                            std::optional<std::string> rename = std::nullopt) -> result<void>;

    [[nodiscard]] auto send_selection(std::vector<fs_entry> entries) -> result<void>;
    [[nodiscard]] auto recv_selection(std::vector<fs_entry> entries) -> result<void>;

    /**
     * @brief Download a remote file into the cache directory
     * @return Path of the downloaded copy
     */
    [[nodiscard]] auto download_file_as_temp(const fs_file& file)
        -> result<std::filesystem::path>;

    /**
     * @brief Request cancellation of the running transfer
     */
    void abort_transfer();

    [[nodiscard]] auto engine() -> transfer_engine&;
    [[nodiscard]] auto engine() const -> const transfer_engine&;
    [[nodiscard]] auto local() -> local_provider&;
    [[nodiscard]] auto remote() -> remote_provider&;

    // Log
    /**
     * @brief Session log, newest record first
     */
    [[nodiscard]] auto logs() const -> const std::deque<log_record>&;

    void on_log(log_listener listener);
    void on_alert(alert_listener listener);
    void on_fatal(fatal_listener listener);

private:
    session_controller(session_config config,
                       std::unique_ptr<local_provider> local,
                       std::unique_ptr<remote_provider> remote,
                       transfer_engine engine);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_SESSION_SESSION_CONTROLLER_H
