/**
 * @file bench_tree_walk.cpp
 * @brief Benchmarks for recursive uploads of many small files
 *
 * Per-entry costs dominate here: directory creation, listing and the
 * open/finalize round trip of each file.
 */

#include <benchmark/benchmark.h>

#include <kcenon/tree_transfer/tree_transfer.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::tree_transfer::benchmark {

/**
 * @brief Upload a tree of N directories holding 10 files of 4 KB each
 */
static void BM_TreeWalk_Send(::benchmark::State& state) {
    const auto dirs = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t files_per_dir = 10;
    constexpr std::size_t file_size = 4 * sizes::KB;

    get_logger().set_console_output(false);
    temp_tree_manager tree;
    auto root = tree.create_tree("project", dirs, files_per_dir, file_size);

    filesystem_local_provider local(tree.local_dir());
    directory_remote_provider remote(tree.remote_root());
    if (!remote.connect(connection_params{})) {
        state.SkipWithError("Failed to connect");
        return;
    }
    auto entry = make_fs_entry(root, root);
    if (!entry) {
        state.SkipWithError("Failed to stat tree");
        return;
    }

    auto engine = transfer_engine::builder().build();
    if (!engine) {
        state.SkipWithError("Failed to create engine");
        return;
    }

    for (auto _ : state) {
        auto result = engine.value().send(local, remote, single_entry{entry.value()}, "/");
        if (!result) {
            state.SkipWithError(result.error().message.c_str());
            return;
        }
        state.PauseTiming();
        tree.clear_remote();
        state.ResumeTiming();
    }

    state.SetItemsProcessed(static_cast<int64_t>(dirs * files_per_dir) *
                            static_cast<int64_t>(state.iterations()));
    state.SetBytesProcessed(static_cast<int64_t>(dirs * files_per_dir * file_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_TreeWalk_Send)
    ->Arg(1)
    ->Arg(10)
    ->Arg(50)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::tree_transfer::benchmark
