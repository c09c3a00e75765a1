/**
 * @file bench_chunk_operations.cpp
 * @brief Benchmarks for chunk splitting, writing and hashing
 */

#include <benchmark/benchmark.h>

#include <kcenon/fastdrop/core/checksum.h>
#include <kcenon/fastdrop/core/chunk_splitter.h>
#include <kcenon/fastdrop/core/transfer_receiver.h>

#include "utils/benchmark_helpers.h"

#include <filesystem>
#include <vector>

namespace kcenon::fastdrop::benchmark {

/**
 * @brief Read a file into chunks of the given size
 */
static void BM_ChunkSplitter_SendFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files("fastdrop_bench_split");
    auto test_file = temp_files.create_random_file("split_test.bin", file_size, 42);

    chunk_splitter splitter{chunk_config(chunk_size)};

    for (auto _ : state) {
        auto chunks = splitter.send_file(test_file, 0);
        if (!chunks) {
            state.SkipWithError("Failed to open file");
            return;
        }

        auto& iter = chunks.value();
        while (iter.has_next()) {
            auto chunk = iter.next();
            if (!chunk) {
                state.SkipWithError("Failed to read chunk");
                return;
            }
            ::benchmark::DoNotOptimize(chunk.value());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    const auto chunk_count = splitter.config().calculate_chunk_count(file_size);
    state.SetItemsProcessed(static_cast<int64_t>(chunk_count) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Write pre-split chunks to disk and verify the file hash
 */
static void BM_TransferReceiver_Process(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files("fastdrop_bench_receive");
    auto source = temp_files.create_random_file("source.bin", file_size, 7);

    chunk_config config(chunk_size);
    chunk_splitter splitter(config);
    std::vector<file_chunk> chunks;

    auto split = splitter.send_file(source, 0);
    if (!split) {
        state.SkipWithError("Failed to open source");
        return;
    }
    while (split.value().has_next()) {
        auto chunk = split.value().next();
        if (!chunk) {
            state.SkipWithError("Failed to read chunk");
            return;
        }
        chunks.push_back(std::move(chunk.value()));
    }

    auto digest = checksum::sha256_file(source);
    if (!digest) {
        state.SkipWithError("Failed to hash source");
        return;
    }

    file_manifest manifest;
    manifest.files.push_back(file_descriptor{"received.bin", file_size, digest.value()});
    manifest.total_size = file_size;

    for (auto _ : state) {
        state.PauseTiming();
        transfer_receiver receiver(temp_files.fresh_dir("out"), config);
        if (!receiver.begin(manifest)) {
            state.SkipWithError("Failed to begin");
            return;
        }
        state.ResumeTiming();

        for (const auto& chunk : chunks) {
            if (!receiver.process_chunk(chunk)) {
                state.SkipWithError("Failed to write chunk");
                return;
            }
        }

        auto report = receiver.finish();
        if (report.count(file_outcome::verified) != 1) {
            state.SkipWithError("File did not verify");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(chunks.size()) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Checksum_SHA256(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(data_size, 42);

    for (auto _ : state) {
        auto hash = checksum::sha256(data);
        ::benchmark::DoNotOptimize(hash);
    }

    state.SetBytesProcessed(static_cast<int64_t>(data_size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Checksum_SHA256_File(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files("fastdrop_bench_sha");
    auto test_file = temp_files.create_random_file("sha256_test.bin", file_size, 42);

    for (auto _ : state) {
        auto result = checksum::sha256_file(test_file);
        if (!result) {
            state.SkipWithError("Failed to calculate file hash");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkSplitter_SendFile)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::protocol_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::protocol_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::protocol_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::max_chunk)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_TransferReceiver_Process)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::protocol_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::protocol_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::protocol_chunk)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Checksum_SHA256)
    ->Arg(static_cast<int64_t>(1 * sizes::KB))
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Checksum_SHA256_File)
    ->Arg(static_cast<int64_t>(sizes::small_file))
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Arg(static_cast<int64_t>(sizes::large_file))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::fastdrop::benchmark
