/**
 * @file bench_wire_codec.cpp
 * @brief Benchmarks for message encoding and framed stream I/O
 */

#include <benchmark/benchmark.h>

#include <kcenon/fastdrop/core/checksum.h>
#include <kcenon/fastdrop/protocol/frame_io.h>
#include <kcenon/fastdrop/protocol/wire_codec.h>
#include <kcenon/fastdrop/transport/memory_stream.h>

#include "utils/benchmark_helpers.h"

#include <thread>

namespace kcenon::fastdrop::benchmark {

namespace {

auto make_chunk(std::size_t payload_size) -> file_chunk {
    file_chunk chunk;
    chunk.file_index = 2;
    chunk.chunk_number = 17;
    chunk.total_chunks = 100;
    chunk.payload = generate_random_data(payload_size, 42);
    return chunk;
}

auto make_manifest(std::size_t file_count) -> file_manifest {
    file_manifest manifest;
    for (std::size_t i = 0; i < file_count; ++i) {
        auto name = "file_" + std::to_string(i) + ".bin";
        auto digest = checksum::sha256(generate_random_data(64, static_cast<uint32_t>(i + 1)));
        manifest.files.push_back(file_descriptor{name, 1024 * (i + 1), digest});
        manifest.total_size += 1024 * (i + 1);
    }
    return manifest;
}

}  // namespace

static void BM_Codec_EncodeChunk(::benchmark::State& state) {
    const auto payload_size = static_cast<std::size_t>(state.range(0));
    auto chunk = make_chunk(payload_size);

    for (auto _ : state) {
        auto encoded = encode_message(chunk);
        if (!encoded) {
            state.SkipWithError("Failed to encode chunk");
            return;
        }
        ::benchmark::DoNotOptimize(encoded.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(payload_size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Codec_DecodeChunk(::benchmark::State& state) {
    const auto payload_size = static_cast<std::size_t>(state.range(0));
    auto encoded = encode_message(make_chunk(payload_size));
    if (!encoded) {
        state.SkipWithError("Failed to encode chunk");
        return;
    }

    for (auto _ : state) {
        auto decoded = decode_chunk(encoded.value());
        if (!decoded) {
            state.SkipWithError("Failed to decode chunk");
            return;
        }
        ::benchmark::DoNotOptimize(decoded.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(payload_size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Codec_ResponseRoundTrip(::benchmark::State& state) {
    transfer_response response;
    response.request_id = 0x1122334455667788ULL;
    response.accepted = true;
    response.manifest = make_manifest(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        auto encoded = encode_message(response);
        if (!encoded) {
            state.SkipWithError("Failed to encode response");
            return;
        }
        auto decoded = decode_response(encoded.value());
        if (!decoded) {
            state.SkipWithError("Failed to decode response");
            return;
        }
        ::benchmark::DoNotOptimize(decoded.value());
    }

    state.SetItemsProcessed(state.range(0) * static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Chunks written by one thread and read back by another over a stream pair
 */
static void BM_FrameIo_ChunkStream(::benchmark::State& state) {
    const auto payload_size = static_cast<std::size_t>(state.range(0));
    constexpr int chunks_per_iteration = 16;
    auto chunk = make_chunk(payload_size);

    for (auto _ : state) {
        auto [writer, reader] = make_stream_pair();

        std::thread producer([&chunk, w = writer.get()] {
            for (int i = 0; i < chunks_per_iteration; ++i) {
                if (!send_chunk(*w, chunk)) {
                    break;
                }
            }
            w->close();
        });

        int received = 0;
        while (true) {
            auto next = receive_chunk(*reader);
            if (!next || !next.value()) {
                break;
            }
            ++received;
        }
        producer.join();

        if (received != chunks_per_iteration) {
            state.SkipWithError("Stream ended early");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(payload_size) * chunks_per_iteration *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Codec_EncodeChunk)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(sizes::protocol_chunk))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Codec_DecodeChunk)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(sizes::protocol_chunk))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Codec_ResponseRoundTrip)
    ->Arg(1)
    ->Arg(10)
    ->Arg(100)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_FrameIo_ChunkStream)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(sizes::protocol_chunk))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::fastdrop::benchmark
