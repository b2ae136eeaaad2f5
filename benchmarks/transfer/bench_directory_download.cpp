/**
 * @file bench_directory_download.cpp
 * @brief Benchmarks for single-file and directory downloads on the local backend
 */

#include <benchmark/benchmark.h>

#include <kcenon/vfs_transfer/vfs_transfer.h>

#include "utils/benchmark_helpers.h"

#include <memory>
#include <sstream>

namespace kcenon::vfs_transfer::benchmark {

namespace {

auto quiet_download(std::size_t jobs) -> download_options {
    download_options options;
    options.no_progress_bar = true;
    options.jobs = jobs;
    return options;
}

}  // namespace

/**
 * @brief Materialize one file of range(0) bytes
 */
static void BM_FileMaterialize(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    get_logger().set_quiet(true);
    temp_tree_manager tree;
    auto source = tree.create_random_file("source.bin", file_size, 42);
    auto local = std::make_shared<local_filesystem>();
    file_materializer materializer(*local, local);

    materialize_options options;
    options.no_progress_bar = true;
    auto destination = path_info::local(tree.base_dir() / "out/destination.bin");

    for (auto _ : state) {
        auto done = materializer.materialize(path_info::local(source), destination, options);
        if (!done) {
            state.SkipWithError(done.error().message.c_str());
            break;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    get_logger().set_quiet(false);
}

/**
 * @brief Directory download of range(0) files with range(1) workers
 */
static void BM_DirectoryDownload(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));
    const auto jobs = static_cast<std::size_t>(state.range(1));

    get_logger().set_quiet(true);
    temp_tree_manager tree;
    auto source = tree.create_tree("tree", file_count, sizes::small_file);
    auto local = std::make_shared<local_filesystem>();
    transfer_orchestrator orchestrator(*local, local);

    for (auto _ : state) {
        state.PauseTiming();
        tree.remove("copy");
        state.ResumeTiming();

        auto done = orchestrator.download(path_info::local(source),
                                          path_info::local(tree.base_dir() / "copy"),
                                          quiet_download(jobs));
        if (!done) {
            state.SkipWithError(done.error().message.c_str());
            break;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(file_count) *
                            static_cast<int64_t>(state.iterations()));
    state.SetBytesProcessed(static_cast<int64_t>(file_count * sizes::small_file) *
                            static_cast<int64_t>(state.iterations()));
    get_logger().set_quiet(false);
}

/**
 * @brief Overhead of byte accounting on a stream of range(0) bytes
 */
static void BM_CallbackIstream(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto payload = generate_random_data(size, 7);
    std::vector<char> buffer(64 * sizes::KB);

    for (auto _ : state) {
        std::istringstream source(payload);
        no_op_callback callback;
        callback_istream wrapped(source, callback);
        while (wrapped.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) ||
               wrapped.gcount() > 0) {
            ::benchmark::DoNotOptimize(buffer.data());
        }
        ::benchmark::DoNotOptimize(wrapped.bytes_read());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief MD5 checksum of a file of range(0) bytes
 */
static void BM_LocalChecksum(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_tree_manager tree;
    auto source = tree.create_random_file("checksum.bin", file_size, 42);
    local_filesystem local;

    for (auto _ : state) {
        auto sum = local.checksum(path_info::local(source));
        if (!sum) {
            state.SkipWithError(sum.error().message.c_str());
            break;
        }
        ::benchmark::DoNotOptimize(sum.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_FileMaterialize)
    ->Arg(static_cast<int64_t>(sizes::small_file))
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Arg(static_cast<int64_t>(sizes::large_file))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_DirectoryDownload)
    ->Args({64, 1})
    ->Args({64, 4})
    ->Args({64, 16})
    ->Args({512, 16})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_CallbackIstream)
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Arg(static_cast<int64_t>(sizes::large_file))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_LocalChecksum)
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Arg(static_cast<int64_t>(sizes::large_file))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::vfs_transfer::benchmark
