/**
 * @file fs_entry.h
 * @brief Filesystem entry snapshots shared by local and remote providers
 */

#ifndef KCENON_TREE_TRANSFER_CORE_FS_ENTRY_H
#define KCENON_TREE_TRANSFER_CORE_FS_ENTRY_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

#include "kcenon/tree_transfer/core/types.h"

namespace kcenon::tree_transfer {

/**
 * @brief POSIX permission triple (owner, group, others), each 3 bits
 */
struct unix_pex {
    uint8_t user = 0;
    uint8_t group = 0;
    uint8_t others = 0;

    /**
     * @brief Build from a mode value (only the lower 9 bits are used)
     */
    [[nodiscard]] static constexpr auto from_mode(uint32_t mode) -> unix_pex {
        return unix_pex{static_cast<uint8_t>((mode >> 6) & 0x7),
                        static_cast<uint8_t>((mode >> 3) & 0x7),
                        static_cast<uint8_t>(mode & 0x7)};
    }

    [[nodiscard]] constexpr auto to_mode() const -> uint32_t {
        return (static_cast<uint32_t>(user & 0x7) << 6) |
               (static_cast<uint32_t>(group & 0x7) << 3) |
               static_cast<uint32_t>(others & 0x7);
    }

    constexpr auto operator==(const unix_pex&) const -> bool = default;
};

/**
 * @brief Regular file snapshot
 */
struct fs_file {
    std::filesystem::path abs_path;
    std::string name;
    uint64_t size = 0;
    std::optional<unix_pex> mode;
    std::filesystem::file_time_type last_change_time{};
};

/**
 * @brief Directory snapshot
 */
struct fs_directory {
    std::filesystem::path abs_path;
    std::string name;
    std::optional<unix_pex> mode;
    std::filesystem::file_time_type last_change_time{};
};

/**
 * @brief A file or a directory as returned by a provider listing
 */
using fs_entry = std::variant<fs_file, fs_directory>;

[[nodiscard]] inline auto is_dir(const fs_entry& entry) -> bool {
    return std::holds_alternative<fs_directory>(entry);
}

[[nodiscard]] inline auto is_file(const fs_entry& entry) -> bool {
    return std::holds_alternative<fs_file>(entry);
}

[[nodiscard]] inline auto get_abs_path(const fs_entry& entry) -> const std::filesystem::path& {
    return std::visit([](const auto& e) -> const std::filesystem::path& { return e.abs_path; },
                      entry);
}

[[nodiscard]] inline auto get_name(const fs_entry& entry) -> const std::string& {
    return std::visit([](const auto& e) -> const std::string& { return e.name; }, entry);
}

[[nodiscard]] inline auto get_unix_pex(const fs_entry& entry) -> std::optional<unix_pex> {
    return std::visit([](const auto& e) { return e.mode; }, entry);
}

/**
 * @brief Snapshot an on-disk path as an entry
 *
 * @param real_path Path on the local disk to stat
 * @param abs_path Path stored in the entry (differs from real_path when a
 *        provider exposes the disk under its own namespace)
 * @return The entry, or no_such_file_or_directory / io_error
 */
[[nodiscard]] auto make_fs_entry(const std::filesystem::path& real_path,
                                 std::filesystem::path abs_path) -> result<fs_entry>;

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_CORE_FS_ENTRY_H
