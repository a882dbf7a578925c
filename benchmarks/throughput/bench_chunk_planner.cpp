/**
 * @file bench_chunk_planner.cpp
 * @brief Benchmarks for chunk planning and chunk reads
 */

#include <benchmark/benchmark.h>

#include <dx/transfer/core/chunk_planner.h>

#include "utils/benchmark_helpers.h"

namespace dx::transfer::benchmark {

/**
 * @brief Planning with the default platform policy (scales for huge objects)
 */
static void BM_ChunkPlanner_Plan(::benchmark::State& state) {
    const auto total_size = static_cast<uint64_t>(state.range(0));
    chunk_planner planner;

    for (auto _ : state) {
        auto plan = planner.plan(total_size);
        if (!plan) {
            state.SkipWithError(plan.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(plan.value().chunks.data());
    }

    auto plan = planner.plan(total_size);
    if (plan) {
        state.counters["chunks"] = static_cast<double>(plan.value().chunk_count());
        state.SetLabel(format_bytes(plan.value().chunk_size) + " chunks");
    }
}

static void BM_ChunkPlanner_PlanFixed(::benchmark::State& state) {
    const auto total_size = static_cast<uint64_t>(state.range(0));
    const auto chunk_size = static_cast<uint64_t>(state.range(1));

    for (auto _ : state) {
        auto plan = chunk_planner::plan_fixed(total_size, chunk_size);
        ::benchmark::DoNotOptimize(plan);
    }

    state.SetItemsProcessed(static_cast<int64_t>((total_size + chunk_size - 1) / chunk_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Sequential reads of every planned chunk of a local file
 */
static void BM_ChunkReader_ReadAll(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<uint64_t>(state.range(1));

    scratch_space scratch;
    auto source = scratch.random_file("read_test.bin", file_size, 42);

    auto plan = chunk_planner::plan_fixed(file_size, chunk_size);
    if (!plan) {
        state.SkipWithError("Failed to plan");
        return;
    }

    chunk_reader reader(source);
    std::vector<std::byte> buffer;
    for (auto _ : state) {
        for (const auto& chunk : plan.value().chunks) {
            auto read = reader.read(chunk, buffer);
            if (!read) {
                state.SkipWithError("Failed to read chunk");
                return;
            }
            ::benchmark::DoNotOptimize(buffer.data());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkPlanner_Plan)
    ->Arg(static_cast<int64_t>(sizes::medium_object))
    ->Arg(static_cast<int64_t>(10 * sizes::GB))
    ->Arg(static_cast<int64_t>(1024 * sizes::GB))
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ChunkPlanner_PlanFixed)
    ->Args({static_cast<int64_t>(sizes::large_object), static_cast<int64_t>(sizes::small_chunk)})
    ->Args({static_cast<int64_t>(10 * sizes::GB), static_cast<int64_t>(sizes::large_chunk)})
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ChunkReader_ReadAll)
    ->Args({static_cast<int64_t>(sizes::medium_object), static_cast<int64_t>(sizes::small_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_object), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_object), static_cast<int64_t>(sizes::large_chunk)})
    ->Unit(::benchmark::kMillisecond);

}  // namespace dx::transfer::benchmark
