/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <random>

namespace kcenon::tree_transfer::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }
    return data;
}

temp_tree_manager::temp_tree_manager() {
    base_dir_ = std::filesystem::temp_directory_path() /
                ("tree_trans_bench_" + std::to_string(std::random_device{}()));
    local_dir_ = base_dir_ / "local";
    remote_root_ = base_dir_ / "remote";

    std::error_code ec;
    std::filesystem::create_directories(local_dir_, ec);
    std::filesystem::create_directories(remote_root_, ec);
}

temp_tree_manager::~temp_tree_manager() {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
}

auto temp_tree_manager::create_file(const std::filesystem::path& relative, std::size_t size,
                                    uint32_t seed) -> std::filesystem::path {
    auto path = local_dir_ / relative;
    std::filesystem::create_directories(path.parent_path());

    auto data = generate_random_data(size, seed);
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    return path;
}

auto temp_tree_manager::create_tree(const std::string& name, std::size_t dirs,
                                    std::size_t files_per_dir, std::size_t file_size)
    -> std::filesystem::path {
    auto root = local_dir_ / name;
    for (std::size_t d = 0; d < dirs; ++d) {
        for (std::size_t f = 0; f < files_per_dir; ++f) {
            create_file(std::filesystem::path(name) / ("dir_" + std::to_string(d)) /
                            ("file_" + std::to_string(f) + ".bin"),
                        file_size, static_cast<uint32_t>(d * files_per_dir + f + 1));
        }
    }
    return root;
}

void temp_tree_manager::clear_remote() {
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(remote_root_, ec)) {
        std::filesystem::remove_all(entry.path(), ec);
    }
}

}  // namespace kcenon::tree_transfer::benchmark
