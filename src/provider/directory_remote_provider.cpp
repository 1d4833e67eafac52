/**
 * @file directory_remote_provider.cpp
 * @brief Directory-backed remote provider
 */

#include "kcenon/tree_transfer/provider/directory_remote_provider.h"

#include "kcenon/tree_transfer/config/feature_flags.h"
#include "kcenon/tree_transfer/core/logging.h"

#include <algorithm>
#include <system_error>

namespace kcenon::tree_transfer {

directory_remote_provider::directory_remote_provider(std::filesystem::path root)
    : root_(std::filesystem::absolute(root).lexically_normal()) {}

auto directory_remote_provider::ensure_connected() const -> result<void> {
    if (!connected_) {
        return unexpected{error{error_code::not_connected, "Not connected to remote host"}};
    }
    return {};
}

auto directory_remote_provider::normalize(const std::filesystem::path& path) const
    -> result<std::filesystem::path> {
    auto joined = path.is_absolute() ? path : working_dir_ / path;

    std::vector<std::filesystem::path> parts;
    for (const auto& part : joined.relative_path()) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (parts.empty()) {
                return unexpected{error{error_code::invalid_path,
                                       "Path escapes remote root: " + path.string()}};
            }
            parts.pop_back();
            continue;
        }
        parts.push_back(part);
    }

    std::filesystem::path normalized("/");
    for (const auto& part : parts) {
        normalized /= part;
    }
    return normalized;
}

auto directory_remote_provider::to_local(const std::filesystem::path& remote_abs) const
    -> std::filesystem::path {
    return (root_ / remote_abs.relative_path()).lexically_normal();
}

auto directory_remote_provider::connect(const connection_params& params)
    -> result<std::optional<std::string>> {
    if (connected_) {
        return unexpected{error{error_code::already_connected, "Already connected"}};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return unexpected{error{error_code::connection_failed,
                               "Remote root is not a directory: " + root_.string()}};
    }

    connected_ = true;
    working_dir_ = "/";
    TT_LOG_DEBUG(log_category::provider,
                 "Opened directory endpoint " + root_.string() + " for " +
                     params.display_address());
    return std::optional<std::string>("tree_transfer file endpoint at " + root_.string());
}

auto directory_remote_provider::disconnect() -> result<void> {
    if (auto r = ensure_connected(); !r) {
        return r;
    }
    connected_ = false;
    return {};
}

auto directory_remote_provider::is_connected() const -> bool {
    return connected_;
}

auto directory_remote_provider::pwd() -> result<std::filesystem::path> {
    if (auto r = ensure_connected(); !r) {
        return unexpected{r.error()};
    }
    return working_dir_;
}

auto directory_remote_provider::change_dir(const std::filesystem::path& dir)
    -> result<std::filesystem::path> {
    if (auto r = ensure_connected(); !r) {
        return unexpected{r.error()};
    }
    auto target = normalize(dir);
    if (!target) {
        return target;
    }

    std::error_code ec;
    auto local = to_local(target.value());
    if (!std::filesystem::exists(local, ec)) {
        return unexpected{error{error_code::no_such_file_or_directory,
                               "No such file or directory: " + target.value().string()}};
    }
    if (!std::filesystem::is_directory(local, ec)) {
        return unexpected{error{error_code::not_a_directory,
                               "Not a directory: " + target.value().string()}};
    }
    working_dir_ = target.value();
    return working_dir_;
}

auto directory_remote_provider::list_dir(const std::filesystem::path& dir)
    -> result<std::vector<fs_entry>> {
    if (auto r = ensure_connected(); !r) {
        return unexpected{r.error()};
    }
    auto target = normalize(dir);
    if (!target) {
        return unexpected{target.error()};
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(to_local(target.value()), ec);
    if (ec) {
        auto code = ec == std::errc::no_such_file_or_directory
                        ? error_code::no_such_file_or_directory
                        : error_code::io_error;
        return unexpected{error{code, "Could not list " + target.value().string() + ": " +
                                          ec.message()}};
    }

    std::vector<fs_entry> entries;
    for (const auto& child : it) {
        auto remote_path = target.value() / child.path().filename();
        auto entry = make_fs_entry(child.path(), remote_path);
        if (!entry) {
            continue;
        }
        entries.push_back(std::move(entry.value()));
    }
    std::sort(entries.begin(), entries.end(), [](const fs_entry& a, const fs_entry& b) {
        return get_name(a) < get_name(b);
    });
    return entries;
}

auto directory_remote_provider::stat(const std::filesystem::path& path) -> result<fs_entry> {
    if (auto r = ensure_connected(); !r) {
        return unexpected{r.error()};
    }
    auto target = normalize(path);
    if (!target) {
        return unexpected{target.error()};
    }
    return make_fs_entry(to_local(target.value()), target.value());
}

auto directory_remote_provider::mkdir(const std::filesystem::path& dir,
                                      [[maybe_unused]] std::optional<unix_pex> mode)
    -> result<void> {
    if (auto r = ensure_connected(); !r) {
        return r;
    }
    auto target = normalize(dir);
    if (!target) {
        return unexpected{target.error()};
    }

    auto local = to_local(target.value());
    std::error_code ec;
    if (std::filesystem::exists(local, ec)) {
        if (std::filesystem::is_directory(local, ec)) {
            return unexpected{error{error_code::directory_already_exists,
                                   "Directory already exists: " + target.value().string()}};
        }
        return unexpected{error{error_code::file_already_exists,
                               "File exists: " + target.value().string()}};
    }

    if (!std::filesystem::create_directory(local, ec) || ec) {
        auto code = ec == std::errc::no_such_file_or_directory
                        ? error_code::no_such_file_or_directory
                        : error_code::permission_denied;
        return unexpected{error{code, "Could not create " + target.value().string() + ": " +
                                          ec.message()}};
    }

#if TREE_TRANS_HAS_UNIX_PERMISSIONS
    if (mode) {
        std::filesystem::permissions(local, static_cast<std::filesystem::perms>(mode->to_mode()),
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            TT_LOG_WARN(log_category::provider,
                        "Could not apply mode to " + target.value().string() + ": " +
                            ec.message());
        }
    }
#endif
    return {};
}

auto directory_remote_provider::remove(const fs_entry& entry) -> result<void> {
    if (auto r = ensure_connected(); !r) {
        return r;
    }
    auto target = normalize(get_abs_path(entry));
    if (!target) {
        return unexpected{target.error()};
    }
    if (target.value() == "/") {
        return unexpected{error{error_code::permission_denied, "Refusing to remove remote root"}};
    }

    auto local = to_local(target.value());
    std::error_code ec;
    if (!std::filesystem::exists(local, ec)) {
        return unexpected{error{error_code::no_such_file_or_directory,
                               "No such file or directory: " + target.value().string()}};
    }
    std::filesystem::remove_all(local, ec);
    if (ec) {
        return unexpected{error{error_code::io_error,
                               "Could not remove " + target.value().string() + ": " +
                                   ec.message()}};
    }
    return {};
}

auto directory_remote_provider::send_file([[maybe_unused]] const fs_file& local_file,
                                          const std::filesystem::path& remote_path)
    -> result<std::unique_ptr<writable_stream>> {
    if (auto r = ensure_connected(); !r) {
        return unexpected{r.error()};
    }
    auto target = normalize(remote_path);
    if (!target) {
        return unexpected{target.error()};
    }
    auto stream = file_write_stream::create(to_local(target.value()));
    if (!stream) {
        return unexpected{stream.error()};
    }
    return std::unique_ptr<writable_stream>(std::move(stream.value()));
}

auto directory_remote_provider::recv_file(const fs_file& remote_file)
    -> result<std::unique_ptr<readable_stream>> {
    if (auto r = ensure_connected(); !r) {
        return unexpected{r.error()};
    }
    auto target = normalize(remote_file.abs_path);
    if (!target) {
        return unexpected{target.error()};
    }
    auto stream = file_read_stream::open(to_local(target.value()));
    if (!stream) {
        return unexpected{stream.error()};
    }
    return std::unique_ptr<readable_stream>(std::move(stream.value()));
}

auto directory_remote_provider::on_sent(std::unique_ptr<writable_stream> stream)
    -> result<void> {
    if (!stream) {
        return unexpected{error{error_code::stream_closed, "No stream to finalize"}};
    }
    return stream->flush();
}

auto directory_remote_provider::on_recv(std::unique_ptr<readable_stream> stream)
    -> result<void> {
    if (!stream) {
        return unexpected{error{error_code::stream_closed, "No stream to finalize"}};
    }
    return {};
}

auto directory_remote_provider::protocol_name() const -> std::string_view {
    return "file";
}

}  // namespace kcenon::tree_transfer
