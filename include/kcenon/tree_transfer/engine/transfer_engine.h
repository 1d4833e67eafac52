/**
 * @file transfer_engine.h
 * @brief Recursive tree transfer between a local and a remote provider
 */

#ifndef KCENON_TREE_TRANSFER_ENGINE_TRANSFER_ENGINE_H
#define KCENON_TREE_TRANSFER_ENGINE_TRANSFER_ENGINE_H

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/tree_transfer/core/transfer_progress.h"
#include "kcenon/tree_transfer/core/types.h"
#include "kcenon/tree_transfer/engine/engine_types.h"
#include "kcenon/tree_transfer/engine/transfer_payload.h"
#include "kcenon/tree_transfer/provider/local_provider.h"
#include "kcenon/tree_transfer/provider/remote_provider.h"

namespace kcenon::tree_transfer {

/**
 * @brief Transfer engine
 *
 * Walks a payload depth-first and streams every file through the provider
 * streams, keeping full and partial progress. Runs on the caller's thread;
 * the input poll handler is the cooperative yield point where the caller
 * may request abort().
 *
 * @code
 * auto engine_result = transfer_engine::builder()
 *     .with_buffer_size(128 * 1024)
 *     .build();
 *
 * if (engine_result.has_value()) {
 *     auto& engine = engine_result.value();
 *     engine.set_input_poll_handler([&] { if (cancel_requested()) engine.abort(); });
 *     auto r = engine.send(local, remote, single_entry{entry}, "/upload");
 * }
 * @endcode
 */
class transfer_engine {
public:
    using input_poll_handler = std::function<void()>;
    using progress_handler =
        std::function<void(const transfer_progress& full, const transfer_progress& partial)>;
    using event_handler = std::function<void(const transfer_event&)>;
    using reload_handler = std::function<void()>;

    /**
     * @brief Builder for transfer_engine
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the copy buffer size
         * @param size Bytes per read (default: 64KB, range 1 byte to 64MB)
         * @return Reference to builder for chaining
         */
        auto with_buffer_size(std::size_t size) -> builder&;

        /**
         * @brief Set the input poll cadence
         * @param interval Poll interval (default: 500ms, at most 1s)
         * @return Reference to builder for chaining
         */
        auto with_input_poll_interval(std::chrono::milliseconds interval) -> builder&;

        /**
         * @brief Re-apply source permissions to received entries
         * @return Reference to builder for chaining
         */
        auto with_preserve_permissions(bool enable) -> builder&;

        auto with_config(const engine_config& config) -> builder&;

        /**
         * @brief Build the engine instance
         * @return Result containing the engine or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<transfer_engine>;

    private:
        engine_config config_;
    };

    // Non-copyable, movable
    transfer_engine(const transfer_engine&) = delete;
    auto operator=(const transfer_engine&) -> transfer_engine& = delete;
    transfer_engine(transfer_engine&&) noexcept;
    auto operator=(transfer_engine&&) noexcept -> transfer_engine&;
    ~transfer_engine();

    /**
     * @brief Upload a payload into a remote directory
     * @param local Local provider (source)
     * @param remote Remote provider (destination)
     * @param payload Entries to send
     * @param remote_dir Destination directory on the remote
     * @param rename Name for the top-level entry (ignored for a batch)
     * @return For single_file, the file outcome; otherwise success once the
     *         walk ran (per-entry failures are reported as events)
     */
    [[nodiscard]] auto send(local_provider& local,
                            remote_provider& remote,
                            const transfer_payload& payload,
                            const std::filesystem::path& remote_dir,
                            std::optional<std::string> rename = std::nullopt) -> result<void>;

    /**
     * @brief Download a payload into a local directory
     * @param local Local provider (destination)
     * @param remote Remote provider (source)
     * @param payload Remote entries to receive
     * @param local_dir Destination directory on the local host
     * @param rename Name for the top-level entry (ignored for a batch)
     */
    [[nodiscard]] auto recv(local_provider& local,
                            remote_provider& remote,
                            const transfer_payload& payload,
                            const std::filesystem::path& local_dir,
                            std::optional<std::string> rename = std::nullopt) -> result<void>;

    /**
     * @brief Request cancellation; observed before the next chunk
     *
     * Safe to call from any thread.
     */
    void abort();

    [[nodiscard]] auto aborted() const -> bool;

    [[nodiscard]] auto state() const -> const transfer_state&;

    /**
     * @brief Ratio of the whole payload transferred, in [0, 1]
     */
    [[nodiscard]] auto full_progress() const -> double;

    /**
     * @brief Ratio of the current file transferred, in [0, 1]
     */
    [[nodiscard]] auto partial_progress() const -> double;

    /**
     * @brief Throughput of the current file
     */
    [[nodiscard]] auto bytes_per_second() const -> uint64_t;

    [[nodiscard]] auto config() const -> const engine_config&;

    void set_input_poll_handler(input_poll_handler handler);

    /**
     * @brief Called whenever the rounded partial percentage changes
     */
    void set_progress_handler(progress_handler handler);

    void set_event_handler(event_handler handler);

    /**
     * @brief Called after each received entry so the local listing can be refreshed
     */
    void set_local_reload_handler(reload_handler handler);

    /**
     * @brief Called after each sent entry so the remote listing can be refreshed
     */
    void set_remote_reload_handler(reload_handler handler);

private:
    explicit transfer_engine(engine_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_ENGINE_TRANSFER_ENGINE_H
