/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_TREE_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_TREE_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::tree_transfer::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Scratch area holding a local source tree and a remote root
 *
 * Everything below the base directory is removed on destruction.
 */
class temp_tree_manager {
public:
    temp_tree_manager();
    ~temp_tree_manager();

    temp_tree_manager(const temp_tree_manager&) = delete;
    auto operator=(const temp_tree_manager&) -> temp_tree_manager& = delete;

    /**
     * @brief Create a file below the local source directory
     */
    auto create_file(const std::filesystem::path& relative, std::size_t size, uint32_t seed = 42)
        -> std::filesystem::path;

    /**
     * @brief Create @p dirs directories holding @p files_per_dir files each
     * @return Path of the tree root
     */
    auto create_tree(const std::string& name, std::size_t dirs, std::size_t files_per_dir,
                     std::size_t file_size) -> std::filesystem::path;

    /**
     * @brief Empty the remote root between iterations
     */
    void clear_remote();

    [[nodiscard]] auto local_dir() const -> const std::filesystem::path& { return local_dir_; }
    [[nodiscard]] auto remote_root() const -> const std::filesystem::path& { return remote_root_; }

private:
    std::filesystem::path base_dir_;
    std::filesystem::path local_dir_;
    std::filesystem::path remote_root_;
};

}  // namespace kcenon::tree_transfer::benchmark

#endif  // KCENON_TREE_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
