/**
 * @file session_controller.cpp
 * @brief Session controller implementation
 */

#include "kcenon/tree_transfer/session/session_controller.h"

#include "kcenon/tree_transfer/core/logging.h"

namespace kcenon::tree_transfer {

struct session_controller::impl {
    session_config config;
    std::unique_ptr<local_provider> local;
    std::unique_ptr<remote_provider> remote;
    transfer_engine engine;

    explorer_state local_explorer;
    explorer_state remote_explorer;

    std::deque<log_record> records;
    std::optional<exit_reason> exit;

    log_listener on_log;
    alert_listener on_alert;
    fatal_listener on_fatal;

    impl(session_config cfg,
         std::unique_ptr<local_provider> local_provider_ptr,
         std::unique_ptr<remote_provider> remote_provider_ptr,
         transfer_engine transfer)
        : config(std::move(cfg))
        , local(std::move(local_provider_ptr))
        , remote(std::move(remote_provider_ptr))
        , engine(std::move(transfer))
        , local_explorer(config.dir_stack_capacity)
        , remote_explorer(config.dir_stack_capacity) {
        local_explorer.set_wrkdir(local->pwd());
        wire_engine();
    }

    void wire_engine() {
        // The engine already wrote these to the logger
        engine.set_event_handler([this](const transfer_event& event) {
            record(event.level, event.message);
            if (event.alert) {
                alert(event.level, event.message);
            }
        });
        engine.set_local_reload_handler([this] { reload_local(); });
        engine.set_remote_reload_handler([this] { reload_remote(); });
    }

    void record(log_level level, const std::string& message) {
        log_record entry{std::chrono::system_clock::now(), level, message};
        records.push_front(entry);
        while (records.size() > config.log_capacity) {
            records.pop_back();
        }
        if (on_log) {
            on_log(entry);
        }
    }

    void log(log_level level, const std::string& message) {
        TT_LOG(level, log_category::session, message);
        record(level, message);
    }

    void alert(log_level level, const std::string& message) {
        if (on_alert) {
            on_alert(level, message);
        }
    }

    void log_and_alert(log_level level, const std::string& message) {
        log(level, message);
        alert(level, message);
    }

    void reload_local() {
        auto wrkdir = local->pwd();
        auto files = local->scan_dir(wrkdir);
        if (!files) {
            log_and_alert(log_level::error,
                          "Could not scan current directory: " + files.error().message);
        } else {
            local_explorer.set_files(std::move(files.value()));
        }
        local_explorer.set_wrkdir(std::move(wrkdir));
    }

    void reload_remote() {
        auto wrkdir = remote->pwd();
        if (!wrkdir) {
            TT_LOG_DEBUG(log_category::session,
                         "Remote working directory unavailable: " + wrkdir.error().message);
            return;
        }
        auto files = remote->list_dir(wrkdir.value());
        if (!files) {
            log_and_alert(log_level::error,
                          "Could not scan current directory: " + files.error().message);
        } else {
            remote_explorer.set_files(std::move(files.value()));
        }
        remote_explorer.set_wrkdir(std::move(wrkdir.value()));
    }

    auto local_changedir(const std::filesystem::path& dir, bool push) -> result<void> {
        auto previous = local_explorer.wrkdir();
        auto changed = local->change_wrkdir(dir);
        if (!changed) {
            log_and_alert(log_level::error,
                          "Could not change working directory: " + changed.error().message);
            return unexpected{changed.error()};
        }
        log(log_level::info, "Changed directory on local: " + dir.string());
        reload_local();
        if (push) {
            local_explorer.pushd(previous);
        }
        return {};
    }

    auto remote_changedir(const std::filesystem::path& dir, bool push) -> result<void> {
        auto previous = remote_explorer.wrkdir();
        auto changed = remote->change_dir(dir);
        if (!changed) {
            log_and_alert(log_level::error,
                          "Could not change working directory: " + changed.error().message);
            return unexpected{changed.error()};
        }
        log(log_level::info, "Changed directory on remote: " + dir.string());
        reload_remote();
        if (push && !previous.empty()) {
            remote_explorer.pushd(previous);
        }
        return {};
    }
};

// ============================================================================
// Builder implementation
// ============================================================================

session_controller::builder::builder() = default;

auto session_controller::builder::with_local_provider(std::unique_ptr<local_provider> provider)
    -> builder& {
    local_ = std::move(provider);
    return *this;
}

auto session_controller::builder::with_remote_provider(std::unique_ptr<remote_provider> provider)
    -> builder& {
    remote_ = std::move(provider);
    return *this;
}

auto session_controller::builder::with_connection_params(connection_params params) -> builder& {
    config_.params = std::move(params);
    return *this;
}

auto session_controller::builder::with_engine_config(const engine_config& config) -> builder& {
    config_.engine = config;
    return *this;
}

auto session_controller::builder::with_cache_dir(std::filesystem::path dir) -> builder& {
    config_.cache_dir = std::move(dir);
    return *this;
}

auto session_controller::builder::with_log_capacity(std::size_t capacity) -> builder& {
    config_.log_capacity = capacity;
    return *this;
}

auto session_controller::builder::with_dir_stack_capacity(std::size_t capacity) -> builder& {
    config_.dir_stack_capacity = capacity;
    return *this;
}

auto session_controller::builder::build() -> result<session_controller> {
    if (!local_) {
        return unexpected{error{error_code::invalid_configuration, "Local provider is required"}};
    }
    if (!remote_) {
        return unexpected{error{error_code::invalid_configuration, "Remote provider is required"}};
    }
    if (config_.log_capacity == 0) {
        return unexpected{error{error_code::invalid_configuration,
                               "Log capacity must be greater than 0"}};
    }

    auto engine = transfer_engine::builder().with_config(config_.engine).build();
    if (!engine.has_value()) {
        return unexpected{engine.error()};
    }

    return session_controller{std::move(config_), std::move(local_), std::move(remote_),
                              std::move(engine.value())};
}

// ============================================================================
// session_controller implementation
// ============================================================================

session_controller::session_controller(session_config config,
                                       std::unique_ptr<local_provider> local,
                                       std::unique_ptr<remote_provider> remote,
                                       transfer_engine engine)
    : impl_(std::make_unique<impl>(std::move(config), std::move(local), std::move(remote),
                                   std::move(engine))) {
    get_logger().initialize();
}

session_controller::session_controller(session_controller&&) noexcept = default;
auto session_controller::operator=(session_controller&&) noexcept -> session_controller& = default;
session_controller::~session_controller() = default;

auto session_controller::connect() -> result<void> {
    const auto& params = impl_->config.params;
    auto welcome = impl_->remote->connect(params);
    if (!welcome) {
        impl_->log(log_level::error, "Could not connect to '" + params.address + "': " +
                                         welcome.error().message);
        if (impl_->on_fatal) {
            impl_->on_fatal(welcome.error().message);
        }
        return unexpected{welcome.error()};
    }

    if (welcome.value()) {
        impl_->log(log_level::info, "Established connection with '" + params.address + "': \"" +
                                        *welcome.value() + "\"");
    }
    if (params.entry_directory) {
        // Failure is reported through the log and alert listeners
        (void)impl_->remote_changedir(*params.entry_directory, false);
    }
    impl_->reload_remote();
    impl_->reload_local();
    return {};
}

void session_controller::disconnect() {
    impl_->log(log_level::info, "Disconnecting from " + impl_->config.params.address + "...");
    if (impl_->remote->is_connected()) {
        if (auto r = impl_->remote->disconnect(); !r) {
            impl_->log(log_level::warn, "Could not disconnect cleanly: " + r.error().message);
        }
    }
    impl_->exit = exit_reason::disconnect;
}

void session_controller::disconnect_and_quit() {
    disconnect();
    impl_->exit = exit_reason::quit;
}

auto session_controller::is_connected() const -> bool {
    return impl_->remote->is_connected();
}

auto session_controller::get_exit_reason() const -> std::optional<exit_reason> {
    return impl_->exit;
}

void session_controller::reload_local_dir() {
    impl_->reload_local();
}

void session_controller::reload_remote_dir() {
    impl_->reload_remote();
}

auto session_controller::local_changedir(const std::filesystem::path& dir, bool push)
    -> result<void> {
    return impl_->local_changedir(dir, push);
}

auto session_controller::remote_changedir(const std::filesystem::path& dir, bool push)
    -> result<void> {
    return impl_->remote_changedir(dir, push);
}

auto session_controller::go_to_previous_local_dir() -> result<void> {
    auto previous = impl_->local_explorer.popd();
    if (!previous) {
        return unexpected{error{error_code::no_such_file_or_directory,
                               "No previous local directory"}};
    }
    return impl_->local_changedir(*previous, false);
}

auto session_controller::go_to_previous_remote_dir() -> result<void> {
    auto previous = impl_->remote_explorer.popd();
    if (!previous) {
        return unexpected{error{error_code::no_such_file_or_directory,
                               "No previous remote directory"}};
    }
    return impl_->remote_changedir(*previous, false);
}

auto session_controller::local_explorer() const -> const explorer_state& {
    return impl_->local_explorer;
}

auto session_controller::remote_explorer() const -> const explorer_state& {
    return impl_->remote_explorer;
}

auto session_controller::send(const transfer_payload& payload,
                              std::optional<std::string> rename) -> result<void> {
    auto wrkdir = impl_->remote->pwd();
    if (!wrkdir) {
        return unexpected{wrkdir.error()};
    }
    return impl_->engine.send(*impl_->local, *impl_->remote, payload, wrkdir.value(),
                              std::move(rename));
}

auto session_controller::recv(const transfer_payload& payload,
                              std::optional<std::string> rename) -> result<void> {
    return impl_->engine.recv(*impl_->local, *impl_->remote, payload, impl_->local->pwd(),
                              std::move(rename));
}

auto session_controller::send_selection(std::vector<fs_entry> entries) -> result<void> {
    return send(batch{std::move(entries)});
}

auto session_controller::recv_selection(std::vector<fs_entry> entries) -> result<void> {
    return recv(batch{std::move(entries)});
}

auto session_controller::download_file_as_temp(const fs_file& file)
    -> result<std::filesystem::path> {
    if (!impl_->config.cache_dir) {
        return unexpected{error{error_code::not_initialized,
                               "Could not create tempfile: cache not available"}};
    }
    const auto& cache_dir = *impl_->config.cache_dir;

    auto received = impl_->engine.recv(*impl_->local, *impl_->remote, single_file{file},
                                       cache_dir, file.name);
    if (!received) {
        return unexpected{error{received.error().code,
                               "Could not download " + file.abs_path.string() +
                                   " to temporary file: " + received.error().message}};
    }
    return cache_dir / file.name;
}

void session_controller::abort_transfer() {
    impl_->engine.abort();
}

auto session_controller::engine() -> transfer_engine& {
    return impl_->engine;
}

auto session_controller::engine() const -> const transfer_engine& {
    return impl_->engine;
}

auto session_controller::local() -> local_provider& {
    return *impl_->local;
}

auto session_controller::remote() -> remote_provider& {
    return *impl_->remote;
}

auto session_controller::logs() const -> const std::deque<log_record>& {
    return impl_->records;
}

void session_controller::on_log(log_listener listener) {
    impl_->on_log = std::move(listener);
}

void session_controller::on_alert(alert_listener listener) {
    impl_->on_alert = std::move(listener);
}

void session_controller::on_fatal(fatal_listener listener) {
    impl_->on_fatal = std::move(listener);
}

}  // namespace kcenon::tree_transfer
