/**
 * @file session_types.h
 * @brief Session-related type definitions for tree_transfer
 */

#ifndef KCENON_TREE_TRANSFER_SESSION_SESSION_TYPES_H
#define KCENON_TREE_TRANSFER_SESSION_SESSION_TYPES_H

#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/tree_transfer/core/fs_entry.h"
#include "kcenon/tree_transfer/core/logging.h"
#include "kcenon/tree_transfer/engine/engine_types.h"
#include "kcenon/tree_transfer/provider/remote_provider.h"

namespace kcenon::tree_transfer {

/**
 * @brief Why the session asked to be closed
 */
enum class exit_reason {
    disconnect,
    quit
};

[[nodiscard]] constexpr auto to_string(exit_reason reason) -> const char* {
    switch (reason) {
        case exit_reason::disconnect: return "disconnect";
        case exit_reason::quit: return "quit";
        default: return "unknown";
    }
}

/**
 * @brief One entry of the session log
 */
struct log_record {
    std::chrono::system_clock::time_point time;
    log_level level = log_level::info;
    std::string message;
};

/**
 * @brief Working directory, listing and navigation history of one side
 */
class explorer_state {
public:
    explicit explorer_state(std::size_t stack_capacity = 16) : stack_capacity_(stack_capacity) {}

    [[nodiscard]] auto wrkdir() const -> const std::filesystem::path& { return wrkdir_; }
    void set_wrkdir(std::filesystem::path dir) { wrkdir_ = std::move(dir); }

    [[nodiscard]] auto files() const -> const std::vector<fs_entry>& { return files_; }
    void set_files(std::vector<fs_entry> files) { files_ = std::move(files); }

    /**
     * @brief Remember a directory; the oldest one is dropped at capacity
     */
    void pushd(const std::filesystem::path& dir) {
        if (stack_capacity_ == 0) {
            return;
        }
        if (dir_stack_.size() >= stack_capacity_) {
            dir_stack_.pop_front();
        }
        dir_stack_.push_back(dir);
    }

    /**
     * @brief Take the most recently remembered directory
     */
    [[nodiscard]] auto popd() -> std::optional<std::filesystem::path> {
        if (dir_stack_.empty()) {
            return std::nullopt;
        }
        auto dir = std::move(dir_stack_.back());
        dir_stack_.pop_back();
        return dir;
    }

    [[nodiscard]] auto stack_size() const -> std::size_t { return dir_stack_.size(); }

private:
    std::filesystem::path wrkdir_;
    std::vector<fs_entry> files_;
    std::deque<std::filesystem::path> dir_stack_;
    std::size_t stack_capacity_;
};

/**
 * @brief Session configuration
 */
struct session_config {
    connection_params params;
    engine_config engine;
    std::optional<std::filesystem::path> cache_dir;
    std::size_t log_capacity = 256;
    std::size_t dir_stack_capacity = 16;
};

}  // namespace kcenon::tree_transfer

#endif  // KCENON_TREE_TRANSFER_SESSION_SESSION_TYPES_H
