/**
 * @file bench_checksum_throughput.cpp
 * @brief Benchmarks for chunk digests and the combined object checksum
 */

#include <benchmark/benchmark.h>

#include <dx/transfer/core/checksum.h>
#include <dx/transfer/core/integrity_verifier.h>

#include "utils/benchmark_helpers.h"

namespace dx::transfer::benchmark {

static void BM_ChunkDigest(::benchmark::State& state, checksum_algorithm alg) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = random_bytes(size, 42);
    integrity_verifier verifier(alg);

    for (auto _ : state) {
        auto digest = verifier.compute(data);
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_Crc32(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = random_bytes(size, 42);

    for (auto _ : state) {
        auto crc = checksum::crc32(data);
        ::benchmark::DoNotOptimize(crc);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Combining per-chunk digests at object finalization
 */
static void BM_CombineDigests(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    integrity_verifier verifier(checksum_algorithm::md5);

    std::vector<std::string> digests;
    digests.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto block = random_bytes(64, static_cast<uint32_t>(i + 1));
        digests.push_back(verifier.compute(block));
    }

    for (auto _ : state) {
        auto combined = verifier.combine(digests);
        if (!combined) {
            state.SkipWithError("Failed to combine");
            return;
        }
        ::benchmark::DoNotOptimize(combined.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

static void BM_FileDigest(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    scratch_space scratch;
    auto path = scratch.random_file("digest.bin", size, 42);

    for (auto _ : state) {
        auto digest = checksum::file_digest(checksum_algorithm::md5, path);
        if (!digest) {
            state.SkipWithError("Failed to digest file");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK_CAPTURE(BM_ChunkDigest, md5, checksum_algorithm::md5)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(sizes::default_chunk))
    ->Arg(static_cast<int64_t>(sizes::large_chunk))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK_CAPTURE(BM_ChunkDigest, sha256, checksum_algorithm::sha256)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(sizes::default_chunk))
    ->Arg(static_cast<int64_t>(sizes::large_chunk))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Crc32)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(sizes::default_chunk))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_CombineDigests)
    ->Arg(10)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_FileDigest)
    ->Arg(static_cast<int64_t>(sizes::medium_object))
    ->Arg(static_cast<int64_t>(sizes::large_object))
    ->Unit(::benchmark::kMillisecond);

}  // namespace dx::transfer::benchmark
