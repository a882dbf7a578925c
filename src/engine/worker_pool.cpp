/**
 * @file worker_pool.cpp
 * @brief Implementation of the chunk worker pool
 */

#include "dx/transfer/engine/worker_pool.h"

#include "dx/transfer/core/logging.h"

#include <algorithm>
#include <deque>
#include <exception>
#include <future>
#include <mutex>

namespace dx::transfer {

namespace {

struct dispatch_state {
    std::mutex mutex;
    std::deque<uint64_t> queue;
    bool stopped = false;
    std::size_t active = 0;
    pool_report report;
};

/// Next index to run, or nullopt when dispatch is over.
auto acquire(dispatch_state& state, cancellation_token& token) -> std::optional<uint64_t> {
    std::lock_guard<std::mutex> lock(state.mutex);
    if (token.is_cancelled() && !state.stopped) {
        state.stopped = true;
        state.report.cancelled = true;
    }
    if (state.stopped || state.queue.empty()) {
        return std::nullopt;
    }
    auto index = state.queue.front();
    state.queue.pop_front();
    ++state.active;
    state.report.peak_concurrency = std::max(state.report.peak_concurrency, state.active);
    return index;
}

void release(dispatch_state& state, std::optional<chunk_failure> failure) {
    std::lock_guard<std::mutex> lock(state.mutex);
    --state.active;
    if (!failure) {
        ++state.report.completed;
        return;
    }
    state.stopped = true;
    if (failure->is_cancellation()) {
        state.report.cancelled = true;
        return;
    }
    if (!state.report.failure) {
        state.report.failure = std::move(failure);
    }
}

void worker_loop(dispatch_state& state, const worker_pool::chunk_task& task,
                 cancellation_token& token) {
    while (auto index = acquire(state, token)) {
        std::optional<chunk_failure> failure;
        try {
            failure = task(*index);
        } catch (const std::exception& e) {
            DXT_LOG_ERROR(log_category::pool,
                          "chunk " + std::to_string(*index) + " task threw: " + e.what());
            failure = chunk_failure{*index, error_kind::io_error, error_code::internal_error, 0,
                                    e.what()};
        }
        release(state, std::move(failure));
    }
}

}  // namespace

worker_pool::worker_pool(std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
                         transfer_direction direction)
    : pool_(std::move(pool)), direction_(direction) {}

auto worker_pool::run(const std::vector<uint64_t>& pending,
                      std::size_t parallelism,
                      const chunk_task& task,
                      cancellation_token& token) -> pool_report {
    dispatch_state state;
    state.queue.assign(pending.begin(), pending.end());

    auto workers = std::min(std::max<std::size_t>(parallelism, 1), pending.size());
    DXT_LOG_DEBUG(log_category::pool,
                  "dispatching " + std::to_string(pending.size()) + " chunks on " +
                      std::to_string(workers) + " workers");

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        futures.push_back(pool_->submit(
            [&state, &task, &token] { worker_loop(state, task, token); }, direction_));
    }

    for (auto& f : futures) {
        try {
            f.get();
        } catch (const std::exception& e) {
            // worker_loop converts task exceptions; this is the pool itself failing
            DXT_LOG_ERROR(log_category::pool, std::string("worker failed: ") + e.what());
            std::lock_guard<std::mutex> lock(state.mutex);
            state.stopped = true;
            if (!state.report.failure) {
                state.report.failure =
                    chunk_failure{0, error_kind::io_error, error_code::internal_error, 0, e.what()};
            }
        }
    }

    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.report.failure && !state.report.cancelled && token.is_cancelled() &&
        !state.queue.empty()) {
        state.report.cancelled = true;
    }

    DXT_LOG_DEBUG(log_category::pool,
                  "pool drained: " + std::to_string(state.report.completed) + " completed, peak " +
                      std::to_string(state.report.peak_concurrency) + " concurrent" +
                      (state.report.cancelled ? ", cancelled" : "") +
                      (state.report.failure ? ", failed" : ""));
    return state.report;
}

}  // namespace dx::transfer
