/**
 * @file filesystem_local_provider.cpp
 * @brief Host filesystem provider
 */

#include "kcenon/tree_transfer/provider/filesystem_local_provider.h"

#include "kcenon/tree_transfer/config/feature_flags.h"
#include "kcenon/tree_transfer/core/logging.h"

#include <algorithm>
#include <system_error>

namespace kcenon::tree_transfer {

namespace {

auto from_error_code(const std::error_code& ec, const std::filesystem::path& path,
                     error_code fallback) -> error {
    if (ec == std::errc::no_such_file_or_directory) {
        return error{error_code::no_such_file_or_directory,
                     "No such file or directory: " + path.string()};
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return error{error_code::permission_denied, "Permission denied: " + path.string()};
    }
    if (ec == std::errc::not_a_directory) {
        return error{error_code::not_a_directory, "Not a directory: " + path.string()};
    }
    return error{fallback, path.string() + ": " + ec.message()};
}

}  // namespace

filesystem_local_provider::filesystem_local_provider(std::filesystem::path working_dir) {
    if (working_dir.empty()) {
        std::error_code ec;
        working_dir = std::filesystem::current_path(ec);
        if (ec) {
            working_dir = "/";
        }
    }
    working_dir_ = std::filesystem::absolute(working_dir).lexically_normal();
}

auto filesystem_local_provider::resolve(const std::filesystem::path& path) const
    -> std::filesystem::path {
    if (path.is_absolute()) {
        return path.lexically_normal();
    }
    return (working_dir_ / path).lexically_normal();
}

auto filesystem_local_provider::pwd() const -> std::filesystem::path {
    return working_dir_;
}

auto filesystem_local_provider::change_wrkdir(const std::filesystem::path& dir)
    -> result<std::filesystem::path> {
    auto target = resolve(dir);
    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        return unexpected{error{error_code::no_such_file_or_directory,
                               "No such file or directory: " + target.string()}};
    }
    if (!std::filesystem::is_directory(target, ec)) {
        return unexpected{error{error_code::not_a_directory,
                               "Not a directory: " + target.string()}};
    }
    working_dir_ = target;
    return working_dir_;
}

auto filesystem_local_provider::scan_dir(const std::filesystem::path& dir)
    -> result<std::vector<fs_entry>> {
    auto target = resolve(dir);
    std::error_code ec;
    std::filesystem::directory_iterator it(target, ec);
    if (ec) {
        return unexpected{from_error_code(ec, target, error_code::io_error)};
    }

    std::vector<fs_entry> entries;
    for (const auto& child : it) {
        auto entry = make_fs_entry(child.path(), child.path());
        if (!entry.has_value()) {
            // Dangling symlinks and entries removed during the scan
            TT_LOG_DEBUG(log_category::provider,
                         "Skipping unreadable entry: " + entry.error().message);
            continue;
        }
        entries.push_back(std::move(entry.value()));
    }

    std::sort(entries.begin(), entries.end(), [](const fs_entry& a, const fs_entry& b) {
        return get_name(a) < get_name(b);
    });
    return entries;
}

auto filesystem_local_provider::stat(const std::filesystem::path& path) -> result<fs_entry> {
    auto target = resolve(path);
    return make_fs_entry(target, target);
}

auto filesystem_local_provider::open_file_read(const std::filesystem::path& path)
    -> result<std::unique_ptr<readable_stream>> {
    auto stream = file_read_stream::open(resolve(path));
    if (!stream.has_value()) {
        return unexpected{stream.error()};
    }
    return std::unique_ptr<readable_stream>(std::move(stream.value()));
}

auto filesystem_local_provider::open_file_write(const std::filesystem::path& path)
    -> result<std::unique_ptr<writable_stream>> {
    auto stream = file_write_stream::create(resolve(path));
    if (!stream.has_value()) {
        return unexpected{stream.error()};
    }
    return std::unique_ptr<writable_stream>(std::move(stream.value()));
}

auto filesystem_local_provider::mkdir(const std::filesystem::path& dir, bool recursive)
    -> result<void> {
    auto target = resolve(dir);
    std::error_code ec;

    if (std::filesystem::is_directory(target, ec)) {
        if (recursive) {
            return {};
        }
        return unexpected{error{error_code::directory_already_exists,
                               "Directory already exists: " + target.string()}};
    }
    if (std::filesystem::exists(target, ec)) {
        return unexpected{error{error_code::file_already_exists,
                               "File exists: " + target.string()}};
    }

    if (recursive) {
        std::filesystem::create_directories(target, ec);
    } else {
        std::filesystem::create_directory(target, ec);
    }
    if (ec) {
        return unexpected{from_error_code(ec, target, error_code::io_error)};
    }
    return {};
}

auto filesystem_local_provider::remove(const fs_entry& entry) -> result<void> {
    auto target = resolve(get_abs_path(entry));
    std::error_code ec;
    if (is_dir(entry)) {
        std::filesystem::remove_all(target, ec);
    } else if (!std::filesystem::remove(target, ec) && !ec) {
        return unexpected{error{error_code::no_such_file_or_directory,
                               "No such file or directory: " + target.string()}};
    }
    if (ec) {
        return unexpected{from_error_code(ec, target, error_code::io_error)};
    }
    return {};
}

auto filesystem_local_provider::chmod([[maybe_unused]] const std::filesystem::path& path,
                                      [[maybe_unused]] unix_pex mode) -> result<void> {
#if TREE_TRANS_HAS_UNIX_PERMISSIONS
    auto target = resolve(path);
    std::error_code ec;
    std::filesystem::permissions(target, static_cast<std::filesystem::perms>(mode.to_mode()),
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        return unexpected{from_error_code(ec, target, error_code::io_error)};
    }
    return {};
#else
    return unexpected{error{error_code::unsupported_feature,
                           "Unix permissions are not supported on this platform"}};
#endif
}

}  // namespace kcenon::tree_transfer
