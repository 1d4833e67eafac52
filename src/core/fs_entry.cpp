/**
 * @file fs_entry.cpp
 * @brief Entry snapshots from the local disk
 */

#include "kcenon/tree_transfer/core/fs_entry.h"

#include "kcenon/tree_transfer/config/feature_flags.h"

#include <system_error>

namespace kcenon::tree_transfer {

namespace {

auto entry_name(const std::filesystem::path& abs_path) -> std::string {
    auto name = abs_path.filename().string();
    if (name.empty()) {
        // "/" or a path with a trailing separator
        name = abs_path.parent_path().filename().string();
    }
    return name.empty() ? std::string("/") : name;
}

auto to_unix_pex([[maybe_unused]] std::filesystem::perms perms) -> std::optional<unix_pex> {
#if TREE_TRANS_HAS_UNIX_PERMISSIONS
    return unix_pex::from_mode(static_cast<uint32_t>(perms & std::filesystem::perms::mask));
#else
    return std::nullopt;
#endif
}

}  // namespace

auto make_fs_entry(const std::filesystem::path& real_path,
                   std::filesystem::path abs_path) -> result<fs_entry> {
    std::error_code ec;
    auto status = std::filesystem::status(real_path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return unexpected{error{error_code::no_such_file_or_directory,
                               "No such file or directory: " + abs_path.string()}};
    }

    auto last_write = std::filesystem::last_write_time(real_path, ec);
    if (ec) {
        last_write = std::filesystem::file_time_type{};
    }

    auto name = entry_name(abs_path);
    auto mode = to_unix_pex(status.permissions());

    if (std::filesystem::is_directory(status)) {
        return fs_entry{fs_directory{std::move(abs_path), std::move(name), mode, last_write}};
    }

    auto size = std::filesystem::file_size(real_path, ec);
    if (ec) {
        return unexpected{error{error_code::io_error,
                               "Could not read size of " + abs_path.string() + ": " +
                                   ec.message()}};
    }
    return fs_entry{fs_file{std::move(abs_path), std::move(name), size, mode, last_write}};
}

}  // namespace kcenon::tree_transfer
