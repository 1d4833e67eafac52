/**
 * @file transfer_engine.cpp
 * @brief Transfer engine implementation
 */

#include "kcenon/tree_transfer/engine/transfer_engine.h"

#include "kcenon/tree_transfer/config/feature_flags.h"
#include "kcenon/tree_transfer/core/format_utils.h"
#include "kcenon/tree_transfer/core/logging.h"
#include "kcenon/tree_transfer/core/transfer_error.h"

#include <span>
#include <vector>

namespace kcenon::tree_transfer {

namespace {

/// Outcome of a single file copy; empty on success
using transfer_failure = std::optional<transfer_error_reason>;

auto quoted(const std::filesystem::path& path) -> std::string {
    return "\"" + path.string() + "\"";
}

[[maybe_unused]] auto mode_string(unix_pex mode) -> std::string {
    return std::to_string(mode.user) + std::to_string(mode.group) + std::to_string(mode.others);
}

/**
 * @brief Error returned to the caller of a single_file transfer
 */
auto to_error(const transfer_error_reason& reason) -> error {
    if (reason.kind == transfer_error_kind::abrupted) {
        return error{error_code::transfer_aborted, reason.to_string()};
    }
    auto code = reason.cause.code == error_code::success ? error_code::transfer_failed
                                                         : reason.cause.code;
    return error{code, reason.to_string()};
}

}  // namespace

struct transfer_engine::impl {
    engine_config config;
    transfer_state state;

    input_poll_handler on_input;
    progress_handler on_progress;
    event_handler on_event;
    reload_handler on_local_reload;
    reload_handler on_remote_reload;

    explicit impl(engine_config cfg) : config(std::move(cfg)) {}

    void emit(log_level level, const std::string& message, bool alert,
              const transfer_log_context* ctx = nullptr) {
        if (ctx) {
            TT_LOG_CTX(level, log_category::engine, message, *ctx);
        } else {
            TT_LOG(level, log_category::engine, message);
        }
        if (on_event) {
            on_event(transfer_event{level, message, alert});
        }
    }

    [[nodiscard]] auto failure_context(const std::filesystem::path& source,
                                       const std::filesystem::path& destination,
                                       const transfer_error_reason& reason) const
        -> transfer_log_context {
        transfer_log_context ctx;
        ctx.source = source.string();
        ctx.destination = destination.string();
        ctx.file_size = state.partial.total();
        ctx.bytes_transferred = state.partial.transferred();
        ctx.error_message = reason.to_string();
        return ctx;
    }

    // ========================================================================
    // Size aggregation
    // ========================================================================

    auto local_size(local_provider& local, const fs_entry& entry) -> uint64_t {
        if (const auto* file = std::get_if<fs_file>(&entry)) {
            return file->size;
        }
        auto children = local.scan_dir(get_abs_path(entry));
        if (!children) {
            emit(log_level::error,
                 "Could not list directory " + quoted(get_abs_path(entry)) + ": " +
                     children.error().message,
                 false);
            return 0;
        }
        uint64_t total = 0;
        for (const auto& child : children.value()) {
            total += local_size(local, child);
        }
        return total;
    }

    auto remote_size(remote_provider& remote, const fs_entry& entry) -> uint64_t {
        if (const auto* file = std::get_if<fs_file>(&entry)) {
            return file->size;
        }
        auto children = remote.list_dir(get_abs_path(entry));
        if (!children) {
            emit(log_level::error,
                 "Could not list directory " + quoted(get_abs_path(entry)) + ": " +
                     children.error().message,
                 false);
            return 0;
        }
        uint64_t total = 0;
        for (const auto& child : children.value()) {
            total += remote_size(remote, child);
        }
        return total;
    }

    // ========================================================================
    // Copy loop
    // ========================================================================

    auto copy_stream(readable_stream& source, writable_stream& destination,
                     transfer_direction direction) -> transfer_failure {
        const auto read_failure = direction == transfer_direction::send
                                      ? transfer_error_kind::local_io_error
                                      : transfer_error_kind::remote_io_error;
        const auto write_failure = direction == transfer_direction::send
                                       ? transfer_error_kind::remote_io_error
                                       : transfer_error_kind::local_io_error;

        std::vector<std::byte> buffer(config.buffer_size);
        std::optional<time_point> last_poll;
        std::optional<unsigned> last_percentage;

        while (!state.aborted()) {
            auto now = std::chrono::steady_clock::now();
            if (!last_poll || now - *last_poll >= config.input_poll_interval) {
                if (on_input) {
                    on_input();
                }
                last_poll = std::chrono::steady_clock::now();
                if (state.aborted()) {
                    break;
                }
            }

            auto read = source.read(std::span<std::byte>(buffer));
            if (!read) {
                return transfer_error_reason{read_failure, read.error()};
            }
            const auto count = read.value();
            if (count == 0) {
                break;
            }

            std::size_t written = 0;
            while (written < count) {
                auto chunk = std::span<const std::byte>(buffer.data() + written, count - written);
                auto result = destination.write(chunk);
                if (!result) {
                    return transfer_error_reason{write_failure, result.error()};
                }
                if (result.value() == 0) {
                    return transfer_error_reason{
                        write_failure, error{error_code::file_write_error, "Stream accepted no bytes"}};
                }
                written += result.value();
            }

            state.partial.update_progress(count);
            state.full.update_progress(count);

            auto percentage = state.partial.calc_percentage();
            if (!last_percentage || *last_percentage != percentage) {
                last_percentage = percentage;
                if (on_progress) {
                    on_progress(state.full, state.partial);
                }
            }
        }
        return std::nullopt;
    }

    void log_saved(const std::filesystem::path& source, const std::filesystem::path& destination,
                   std::string_view protocol) {
        const auto elapsed = state.partial.elapsed();
        const auto rate = state.partial.calc_bytes_per_second();

        transfer_log_context ctx;
        ctx.source = source.string();
        ctx.destination = destination.string();
        ctx.file_size = state.partial.total();
        ctx.bytes_transferred = state.partial.transferred();
        ctx.duration_ms = static_cast<uint64_t>(elapsed.count());
        ctx.rate_bps = rate;
        ctx.protocol = std::string(protocol);

        emit(log_level::info,
             "Saved file " + quoted(source) + " to " + quoted(destination) + " (took " +
                 format_seconds(elapsed) + " seconds; at " +
                 format_throughput(static_cast<double>(rate)) + ")",
             false, &ctx);
    }

    void apply_mode([[maybe_unused]] local_provider& local,
                    [[maybe_unused]] const std::filesystem::path& path,
                    [[maybe_unused]] const std::optional<unix_pex>& mode) {
#if TREE_TRANS_HAS_UNIX_PERMISSIONS
        if (!config.preserve_permissions || !mode) {
            return;
        }
        if (auto r = local.chmod(path, *mode); !r) {
            emit(log_level::error,
                 "Could not apply file mode " + mode_string(*mode) + " to " + quoted(path) + ": " +
                     r.error().message,
                 false);
        }
#endif
    }

    // ========================================================================
    // Send path
    // ========================================================================

    auto send_one(local_provider& local, remote_provider& remote, const fs_file& file,
                  const std::filesystem::path& remote_path) -> transfer_failure {
        auto reader = local.open_file_read(file.abs_path);
        if (!reader) {
            return transfer_error_reason{transfer_error_kind::host_error, reader.error()};
        }
        auto writer = remote.send_file(file, remote_path);
        if (!writer) {
            return transfer_error_reason{transfer_error_kind::protocol_error, writer.error()};
        }

        auto& source = *reader.value();
        auto size = source.seek(0, seek_origin::end);
        state.partial.init(size ? size.value() : file.size);

        transfer_failure failure;
        if (auto rewind = source.seek(0, seek_origin::begin); !rewind) {
            failure = transfer_error_reason{transfer_error_kind::could_not_rewind, rewind.error()};
        } else {
            failure = copy_stream(source, *writer.value(), transfer_direction::send);
        }
        if (!failure && !state.aborted()) {
            if (auto flushed = writer.value()->flush(); !flushed) {
                failure = transfer_error_reason{transfer_error_kind::remote_io_error, flushed.error()};
            }
        }

        if (auto finalized = remote.on_sent(std::move(writer.value())); !finalized) {
            emit(log_level::warn,
                 "Could not finalize remote stream: \"" + finalized.error().message + "\"", false);
        }

        if (failure) {
            return failure;
        }
        if (state.aborted()) {
            return transfer_error_reason::abrupted();
        }
        log_saved(file.abs_path, remote_path, remote.protocol_name());
        return std::nullopt;
    }

    void cleanup_remote(remote_provider& remote, const std::filesystem::path& remote_path) {
        auto entry = remote.stat(remote_path);
        if (!entry) {
            emit(log_level::error,
                 "Could not remove created file " + remote_path.string() + ": " +
                     entry.error().message,
                 false);
            return;
        }
        if (auto removed = remote.remove(entry.value()); !removed) {
            emit(log_level::error,
                 "Could not remove created file " + remote_path.string() + ": " +
                     removed.error().message,
                 false);
            return;
        }
        TT_LOG_DEBUG(log_category::engine, "Removed partial file " + remote_path.string());
    }

    /**
     * @brief Send one file and handle its failure
     * @return The failure, already reported and cleaned up
     */
    auto send_and_report(local_provider& local, remote_provider& remote, const fs_file& file,
                         const std::filesystem::path& remote_path) -> transfer_failure {
        auto failure = send_one(local, remote, file, remote_path);
        if (!failure) {
            return std::nullopt;
        }
        auto ctx = failure_context(file.abs_path, remote_path, *failure);
        emit(log_level::error, "Failed to upload file " + file.name + ": " + failure->to_string(),
             true, &ctx);
        if (should_cleanup_destination(failure->kind, transfer_direction::send)) {
            cleanup_remote(remote, remote_path);
        }
        return failure;
    }

    void send_recurse(local_provider& local, remote_provider& remote, const fs_entry& entry,
                      const std::filesystem::path& remote_dir,
                      const std::optional<std::string>& rename) {
        const auto remote_path = remote_dir / (rename ? *rename : get_name(entry));

        if (const auto* file = std::get_if<fs_file>(&entry)) {
            (void)send_and_report(local, remote, *file, remote_path);
        } else {
            const auto& dir = std::get<fs_directory>(entry);
            auto created = remote.mkdir(remote_path, dir.mode);
            if (created) {
                emit(log_level::info, "Created directory " + quoted(remote_path), false);
            } else if (created.error().code == error_code::directory_already_exists) {
                emit(log_level::info,
                     "Directory " + quoted(remote_path) + " already exists on remote", false);
            } else {
                emit(log_level::error,
                     "Failed to create directory " + quoted(remote_path) + ": " +
                         created.error().message,
                     true);
                return;
            }

            auto children = local.scan_dir(dir.abs_path);
            if (!children) {
                emit(log_level::error,
                     "Could not scan directory " + quoted(dir.abs_path) + ": " +
                         children.error().message,
                     true);
            } else {
                for (const auto& child : children.value()) {
                    if (state.aborted()) {
                        break;
                    }
                    send_recurse(local, remote, child, remote_path, std::nullopt);
                }
            }
        }

        if (on_remote_reload) {
            on_remote_reload();
        }
        if (state.aborted()) {
            emit(log_level::warn, "Upload aborted for " + quoted(get_abs_path(entry)) + "!", true);
        }
    }

    // ========================================================================
    // Receive path
    // ========================================================================

    auto recv_one(local_provider& local, remote_provider& remote,
                  const std::filesystem::path& local_path, const fs_file& file)
        -> transfer_failure {
        auto writer = local.open_file_write(local_path);
        if (!writer) {
            return transfer_error_reason{transfer_error_kind::host_error, writer.error()};
        }
        auto reader = remote.recv_file(file);
        if (!reader) {
            return transfer_error_reason{transfer_error_kind::protocol_error, reader.error()};
        }

        state.partial.init(file.size);
        auto failure = copy_stream(*reader.value(), *writer.value(), transfer_direction::receive);
        if (!failure && !state.aborted()) {
            if (auto flushed = writer.value()->flush(); !flushed) {
                failure = transfer_error_reason{transfer_error_kind::local_io_error, flushed.error()};
            }
        }
        // Close the local file before any cleanup touches it
        writer.value().reset();

        if (auto finalized = remote.on_recv(std::move(reader.value())); !finalized) {
            emit(log_level::warn,
                 "Could not finalize remote stream: \"" + finalized.error().message + "\"", false);
        }

        if (failure) {
            return failure;
        }
        if (state.aborted()) {
            return transfer_error_reason::abrupted();
        }
        apply_mode(local, local_path, file.mode);
        log_saved(file.abs_path, local_path, remote.protocol_name());
        return std::nullopt;
    }

    void cleanup_local(local_provider& local, const std::filesystem::path& local_path) {
        auto entry = local.stat(local_path);
        if (!entry) {
            emit(log_level::error,
                 "Could not remove created file " + local_path.string() + ": " +
                     entry.error().message,
                 false);
            return;
        }
        if (auto removed = local.remove(entry.value()); !removed) {
            emit(log_level::error,
                 "Could not remove created file " + local_path.string() + ": " +
                     removed.error().message,
                 false);
            return;
        }
        TT_LOG_DEBUG(log_category::engine, "Removed partial file " + local_path.string());
    }

    auto recv_and_report(local_provider& local, remote_provider& remote, const fs_file& file,
                         const std::filesystem::path& local_path) -> transfer_failure {
        auto failure = recv_one(local, remote, local_path, file);
        if (!failure) {
            return std::nullopt;
        }
        auto ctx = failure_context(file.abs_path, local_path, *failure);
        emit(log_level::error,
             "Could not download file " + file.name + ": " + failure->to_string(), true, &ctx);
        if (should_cleanup_destination(failure->kind, transfer_direction::receive)) {
            cleanup_local(local, local_path);
        }
        return failure;
    }

    void recv_recurse(local_provider& local, remote_provider& remote, const fs_entry& entry,
                      const std::filesystem::path& local_dir,
                      const std::optional<std::string>& rename) {
        const auto local_path = local_dir / (rename ? *rename : get_name(entry));

        if (const auto* file = std::get_if<fs_file>(&entry)) {
            (void)recv_and_report(local, remote, *file, local_path);
        } else {
            const auto& dir = std::get<fs_directory>(entry);
            if (auto created = local.mkdir(local_path, true); created) {
                apply_mode(local, local_path, dir.mode);
                emit(log_level::info, "Created directory " + quoted(local_path), false);

                auto children = remote.list_dir(dir.abs_path);
                if (!children) {
                    emit(log_level::error,
                         "Could not scan directory " + quoted(dir.abs_path) + ": " +
                             children.error().message,
                         true);
                } else {
                    for (const auto& child : children.value()) {
                        if (state.aborted()) {
                            break;
                        }
                        recv_recurse(local, remote, child, local_path, std::nullopt);
                    }
                }
            } else {
                emit(log_level::error,
                     "Failed to create directory " + quoted(local_path) + ": " +
                         created.error().message,
                     false);
            }
        }

        if (on_local_reload) {
            on_local_reload();
        }
        if (state.aborted()) {
            emit(log_level::warn, "Download aborted for " + quoted(get_abs_path(entry)) + "!",
                 true);
        }
    }
};

// ============================================================================
// Builder implementation
// ============================================================================

transfer_engine::builder::builder() = default;

auto transfer_engine::builder::with_buffer_size(std::size_t size) -> builder& {
    config_.buffer_size = size;
    return *this;
}

auto transfer_engine::builder::with_input_poll_interval(std::chrono::milliseconds interval)
    -> builder& {
    config_.input_poll_interval = interval;
    return *this;
}

auto transfer_engine::builder::with_preserve_permissions(bool enable) -> builder& {
    config_.preserve_permissions = enable;
    return *this;
}

auto transfer_engine::builder::with_config(const engine_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto transfer_engine::builder::build() -> result<transfer_engine> {
    if (config_.buffer_size < engine_config::min_buffer_size ||
        config_.buffer_size > engine_config::max_buffer_size) {
        return unexpected{error{error_code::invalid_configuration,
                               "Buffer size must be between 1 byte and 64MB"}};
    }
    if (config_.input_poll_interval.count() <= 0 ||
        config_.input_poll_interval > engine_config::max_input_poll_interval) {
        return unexpected{error{error_code::invalid_configuration,
                               "Input poll interval must be greater than 0 and at most 500ms"}};
    }
    return transfer_engine{config_};
}

// ============================================================================
// transfer_engine implementation
// ============================================================================

transfer_engine::transfer_engine(engine_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

transfer_engine::transfer_engine(transfer_engine&&) noexcept = default;
auto transfer_engine::operator=(transfer_engine&&) noexcept -> transfer_engine& = default;
transfer_engine::~transfer_engine() = default;

auto transfer_engine::send(local_provider& local,
                           remote_provider& remote,
                           const transfer_payload& payload,
                           const std::filesystem::path& remote_dir,
                           std::optional<std::string> rename) -> result<void> {
    if (!remote.is_connected()) {
        return unexpected{error{error_code::not_connected, "Not connected to remote host"}};
    }

    auto& state = impl_->state;
    state.reset();

    if (const auto* request = std::get_if<single_file>(&payload)) {
        const auto& file = request->file;
        state.full.init(file.size);
        TT_LOG_INFO(log_category::engine, "Uploading " + file.abs_path.string() + "...");

        auto remote_path = remote_dir / rename.value_or(file.name);
        auto failure = impl_->send_and_report(local, remote, file, remote_path);
        if (impl_->on_remote_reload) {
            impl_->on_remote_reload();
        }
        if (failure) {
            return unexpected{to_error(*failure)};
        }
        return {};
    }

    if (const auto* request = std::get_if<single_entry>(&payload)) {
        state.full.init(impl_->local_size(local, request->entry));
        TT_LOG_INFO(log_category::engine,
                    "Uploading " + get_abs_path(request->entry).string() + "...");
        impl_->send_recurse(local, remote, request->entry, remote_dir, rename);
        return {};
    }

    const auto& entries = std::get<batch>(payload).entries;
    uint64_t total = 0;
    for (const auto& entry : entries) {
        total += impl_->local_size(local, entry);
    }
    state.full.init(total);
    TT_LOG_INFO(log_category::engine,
                "Uploading " + std::to_string(entries.size()) + " entries...");
    for (const auto& entry : entries) {
        if (state.aborted()) {
            break;
        }
        impl_->send_recurse(local, remote, entry, remote_dir, std::nullopt);
    }
    return {};
}

auto transfer_engine::recv(local_provider& local,
                           remote_provider& remote,
                           const transfer_payload& payload,
                           const std::filesystem::path& local_dir,
                           std::optional<std::string> rename) -> result<void> {
    if (!remote.is_connected()) {
        return unexpected{error{error_code::not_connected, "Not connected to remote host"}};
    }

    auto& state = impl_->state;
    state.reset();

    if (const auto* request = std::get_if<single_file>(&payload)) {
        const auto& file = request->file;
        state.full.init(file.size);
        TT_LOG_INFO(log_category::engine, "Downloading " + file.abs_path.string() + "...");

        auto local_path = local_dir / rename.value_or(file.name);
        auto failure = impl_->recv_and_report(local, remote, file, local_path);
        if (impl_->on_local_reload) {
            impl_->on_local_reload();
        }
        if (failure) {
            return unexpected{to_error(*failure)};
        }
        return {};
    }

    if (const auto* request = std::get_if<single_entry>(&payload)) {
        state.full.init(impl_->remote_size(remote, request->entry));
        TT_LOG_INFO(log_category::engine,
                    "Downloading " + get_abs_path(request->entry).string() + "...");
        impl_->recv_recurse(local, remote, request->entry, local_dir, rename);
        return {};
    }

    const auto& entries = std::get<batch>(payload).entries;
    uint64_t total = 0;
    for (const auto& entry : entries) {
        total += impl_->remote_size(remote, entry);
    }
    state.full.init(total);
    TT_LOG_INFO(log_category::engine,
                "Downloading " + std::to_string(entries.size()) + " entries...");
    for (const auto& entry : entries) {
        if (state.aborted()) {
            break;
        }
        impl_->recv_recurse(local, remote, entry, local_dir, std::nullopt);
    }
    return {};
}

void transfer_engine::abort() {
    impl_->state.abort();
}

auto transfer_engine::aborted() const -> bool {
    return impl_->state.aborted();
}

auto transfer_engine::state() const -> const transfer_state& {
    return impl_->state;
}

auto transfer_engine::full_progress() const -> double {
    return impl_->state.full.calc_progress();
}

auto transfer_engine::partial_progress() const -> double {
    return impl_->state.partial.calc_progress();
}

auto transfer_engine::bytes_per_second() const -> uint64_t {
    return impl_->state.partial.calc_bytes_per_second();
}

auto transfer_engine::config() const -> const engine_config& {
    return impl_->config;
}

void transfer_engine::set_input_poll_handler(input_poll_handler handler) {
    impl_->on_input = std::move(handler);
}

void transfer_engine::set_progress_handler(progress_handler handler) {
    impl_->on_progress = std::move(handler);
}

void transfer_engine::set_event_handler(event_handler handler) {
    impl_->on_event = std::move(handler);
}

void transfer_engine::set_local_reload_handler(reload_handler handler) {
    impl_->on_local_reload = std::move(handler);
}

void transfer_engine::set_remote_reload_handler(reload_handler handler) {
    impl_->on_remote_reload = std::move(handler);
}

}  // namespace kcenon::tree_transfer
