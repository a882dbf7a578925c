/**
 * @file bench_transfer_throughput.cpp
 * @brief End-to-end upload and download throughput against a local object store
 */

#include <benchmark/benchmark.h>

#include <dx/transfer/transfer.h>
#include <dx/transfer/engine/transfer_orchestrator.h>
#include <dx/transfer/transport/local_object_store.h>

#include "utils/benchmark_helpers.h"

namespace dx::transfer::benchmark {

namespace {

auto bench_config(const std::filesystem::path& state_dir, uint64_t chunk_size,
                  std::size_t parallelism) -> transfer_config {
    transfer_config config;
    config.policy = chunk_policy::unbounded();
    config.chunk_size = chunk_size;
    config.parallelism = parallelism;
    config.state_directory = state_dir;
    return config;
}

auto run_job(const transfer_context& ctx, const transfer_endpoint& src,
             const transfer_endpoint& dst, const transfer_config& config) -> transfer_outcome {
    transfer_orchestrator job(ctx, job_id::generate(), src, dst, config);
    cancellation_token token;
    return job.run(token);
}

}  // namespace

/**
 * @brief Upload throughput by object size, chunk size and parallelism
 */
static void BM_Upload(::benchmark::State& state) {
    const auto object_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<uint64_t>(state.range(1));
    const auto parallelism = static_cast<std::size_t>(state.range(2));

    get_logger().set_console_output(false);
    scratch_space scratch;
    auto source = scratch.random_file("upload.bin", object_size, 42);
    auto state_dir = scratch.fresh_dir("state");

    transfer_context ctx;
    auto config = bench_config(state_dir, chunk_size, parallelism);
    int run = 0;

    for (auto _ : state) {
        state.PauseTiming();
        auto store_dir = scratch.fresh_dir("store");
        ctx.service = local_object_store::create(store_dir);
        ctx.transport.reset();
        if (!ctx.service) {
            state.SkipWithError("Failed to create object store");
            return;
        }
        state.ResumeTiming();

        auto outcome = run_job(ctx, transfer_endpoint::local(source),
                               transfer_endpoint::remote("bench/upload_" + std::to_string(run++)),
                               config);
        if (!outcome.succeeded()) {
            state.SkipWithError(outcome.message.c_str());
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(object_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(chunk_size) + " x" + std::to_string(parallelism));
}

static void BM_Download(::benchmark::State& state) {
    const auto object_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<uint64_t>(state.range(1));
    const auto parallelism = static_cast<std::size_t>(state.range(2));

    get_logger().set_console_output(false);
    scratch_space scratch;
    auto source = scratch.random_file("seed.bin", object_size, 42);
    auto state_dir = scratch.fresh_dir("state");
    auto out_dir = scratch.fresh_dir("out");

    auto store = local_object_store::create(scratch.fresh_dir("store"));
    if (!store || !store->import_object("bench/seed.bin", source, chunk_size)) {
        state.SkipWithError("Failed to seed object store");
        return;
    }

    transfer_context ctx;
    ctx.service = store;
    auto config = bench_config(state_dir, chunk_size, parallelism);
    auto target = out_dir / "seed.bin";

    for (auto _ : state) {
        auto outcome = run_job(ctx, transfer_endpoint::remote("bench/seed.bin"),
                               transfer_endpoint::local(target), config);
        if (!outcome.succeeded()) {
            state.SkipWithError(outcome.message.c_str());
            return;
        }

        state.PauseTiming();
        std::error_code ec;
        std::filesystem::remove(target, ec);
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(object_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(chunk_size) + " x" + std::to_string(parallelism));
}

BENCHMARK(BM_Upload)
    ->Args({static_cast<int64_t>(sizes::medium_object), static_cast<int64_t>(sizes::default_chunk), 1})
    ->Args({static_cast<int64_t>(sizes::medium_object), static_cast<int64_t>(sizes::default_chunk), 4})
    ->Args({static_cast<int64_t>(sizes::large_object), static_cast<int64_t>(sizes::large_chunk), 4})
    ->Args({static_cast<int64_t>(sizes::large_object), static_cast<int64_t>(sizes::small_chunk), 8})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Download)
    ->Args({static_cast<int64_t>(sizes::medium_object), static_cast<int64_t>(sizes::default_chunk), 1})
    ->Args({static_cast<int64_t>(sizes::medium_object), static_cast<int64_t>(sizes::default_chunk), 4})
    ->Args({static_cast<int64_t>(sizes::large_object), static_cast<int64_t>(sizes::large_chunk), 4})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace dx::transfer::benchmark
