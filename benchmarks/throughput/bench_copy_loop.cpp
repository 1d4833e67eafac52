/**
 * @file bench_copy_loop.cpp
 * @brief Benchmarks for single file transfer throughput through the engine
 *
 * Both endpoints live on the host filesystem, so the figures measure the
 * copy loop and the provider streams rather than a network.
 */

#include <benchmark/benchmark.h>

#include <kcenon/tree_transfer/tree_transfer.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::tree_transfer::benchmark {

namespace {

struct bench_endpoints {
    explicit bench_endpoints(const temp_tree_manager& tree)
        : local(tree.local_dir()), remote(tree.remote_root()) {
        get_logger().set_console_output(false);
        (void)remote.connect(connection_params{});
    }

    filesystem_local_provider local;
    directory_remote_provider remote;
};

}  // namespace

/**
 * @brief Upload throughput by file size (buffer fixed at the default)
 */
static void BM_Send_SingleFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_tree_manager tree;
    auto path = tree.create_file("upload.bin", file_size);
    bench_endpoints endpoints(tree);
    auto file = std::get<fs_file>(make_fs_entry(path, path).value());

    auto engine = transfer_engine::builder().build();
    if (!engine) {
        state.SkipWithError("Failed to create engine");
        return;
    }

    for (auto _ : state) {
        auto result = engine.value().send(endpoints.local, endpoints.remote, single_file{file}, "/");
        if (!result) {
            state.SkipWithError(result.error().message.c_str());
            return;
        }
        state.PauseTiming();
        tree.clear_remote();
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Download throughput by file size
 */
static void BM_Recv_SingleFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_tree_manager tree;
    auto path = tree.create_file("seed.bin", file_size);
    bench_endpoints endpoints(tree);

    auto engine = transfer_engine::builder().build();
    if (!engine) {
        state.SkipWithError("Failed to create engine");
        return;
    }
    auto file = std::get<fs_file>(make_fs_entry(path, path).value());
    if (!engine.value().send(endpoints.local, endpoints.remote, single_file{file}, "/")) {
        state.SkipWithError("Failed to seed remote");
        return;
    }
    auto remote_entry = endpoints.remote.stat("/seed.bin");
    if (!remote_entry || !is_file(remote_entry.value())) {
        state.SkipWithError("Remote seed missing");
        return;
    }
    auto remote_file = std::get<fs_file>(remote_entry.value());

    for (auto _ : state) {
        auto result = engine.value().recv(endpoints.local, endpoints.remote,
                                          single_file{remote_file}, tree.local_dir(),
                                          std::string("download.bin"));
        if (!result) {
            state.SkipWithError(result.error().message.c_str());
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Effect of the copy buffer size on a 16 MB upload
 */
static void BM_Send_BufferSizeImpact(::benchmark::State& state) {
    const auto buffer_size = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t file_size = 16 * sizes::MB;

    temp_tree_manager tree;
    auto path = tree.create_file("buffered.bin", file_size);
    bench_endpoints endpoints(tree);
    auto file = std::get<fs_file>(make_fs_entry(path, path).value());

    auto engine = transfer_engine::builder().with_buffer_size(buffer_size).build();
    if (!engine) {
        state.SkipWithError("Failed to create engine");
        return;
    }

    for (auto _ : state) {
        auto result = engine.value().send(endpoints.local, endpoints.remote, single_file{file}, "/");
        if (!result) {
            state.SkipWithError(result.error().message.c_str());
            return;
        }
        state.PauseTiming();
        tree.clear_remote();
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["buffer_KB"] = static_cast<double>(buffer_size) / sizes::KB;
}

BENCHMARK(BM_Send_SingleFile)
    ->Arg(static_cast<int64_t>(100 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Arg(static_cast<int64_t>(10 * sizes::MB))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Recv_SingleFile)
    ->Arg(static_cast<int64_t>(100 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Arg(static_cast<int64_t>(10 * sizes::MB))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Send_BufferSizeImpact)
    ->Arg(static_cast<int64_t>(4 * sizes::KB))
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::tree_transfer::benchmark
