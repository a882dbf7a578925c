// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker loop executors
 */

#include "dx/transfer/adapters/thread_pool_adapter.h"

#include "dx/transfer/core/logging.h"

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#if DX_TRANSFER_USE_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace dx::transfer::adapters {

namespace {

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

auto slot(transfer_direction direction) noexcept -> size_t {
    return direction == transfer_direction::download ? 1 : 0;
}

/**
 * @brief Wrap a loop so its counter slot is released before the waiter wakes
 */
auto make_tracked(std::function<void()> task,
                  transfer_direction direction,
                  std::shared_ptr<std::promise<void>> promise,
                  in_flight_counter* counter) -> std::function<void()> {
    return [task = std::move(task), direction, promise = std::move(promise), counter]() {
        std::exception_ptr failure;
        try {
            task();
        } catch (...) {
            failure = std::current_exception();
        }
        counter->end(direction);
        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value();
        }
    };
}

auto rejected(const std::string& pool_name) -> std::future<void> {
    std::promise<void> promise;
    promise.set_exception(
        std::make_exception_ptr(std::runtime_error(pool_name + " is shut down")));
    return promise.get_future();
}

}  // namespace

// ============================================================================
// in_flight_counter
// ============================================================================

void in_flight_counter::begin(transfer_direction direction) noexcept {
    counts_[slot(direction)].fetch_add(1, std::memory_order_relaxed);
    auto now = total_.fetch_add(1, std::memory_order_acq_rel) + 1;
    auto seen = peak_.load(std::memory_order_relaxed);
    while (now > seen && !peak_.compare_exchange_weak(seen, now, std::memory_order_relaxed)) {
    }
}

void in_flight_counter::end(transfer_direction direction) noexcept {
    auto& c = counts_[slot(direction)];
    auto current = c.load(std::memory_order_relaxed);
    while (current > 0 &&
           !c.compare_exchange_weak(current, current - 1, std::memory_order_relaxed)) {
    }
    if (current == 0) {
        return;
    }
    total_.fetch_sub(1, std::memory_order_acq_rel);
}

size_t in_flight_counter::count() const noexcept {
    return total_.load(std::memory_order_acquire);
}

size_t in_flight_counter::count(transfer_direction direction) const noexcept {
    return counts_[slot(direction)].load(std::memory_order_relaxed);
}

size_t in_flight_counter::peak() const noexcept {
    return peak_.load(std::memory_order_relaxed);
}

// ============================================================================
// thread_system_transfer_adapter
// ============================================================================

#if DX_TRANSFER_USE_THREAD_SYSTEM

/**
 * @brief thread_system job running one worker loop
 */
class worker_loop_job : public kcenon::thread::job {
public:
    worker_loop_job(std::function<void()> loop, transfer_direction direction)
        : job(std::string("dx_") + to_string(direction) + "_loop"), loop_(std::move(loop)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (loop_) {
            loop_();
        }
        return common::ok();
    }

private:
    std::function<void()> loop_;
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<bool> running{true};
    in_flight_counter counter;
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = resolve_worker_count(worker_count);
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() {
    shutdown();
}

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create_default(size_t worker_count,
                                               const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    DXT_LOG_DEBUG(log_category::pool, pool_name + ": thread_system pool with " +
                                          std::to_string(worker_count) + " workers");
    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), pool_name,
                                                            worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task,
                                                         transfer_direction direction) {
    if (!pimpl_->running.load()) {
        return rejected(pimpl_->pool_name);
    }

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->counter.begin(direction);
    // The loop keeps impl alive, so counters survive an adapter destroyed mid-run
    auto keep = pimpl_;
    auto tracked = make_tracked(std::move(task), direction, promise, &keep->counter);
    auto job = std::make_unique<worker_loop_job>(
        [tracked = std::move(tracked), keep]() { tracked(); }, direction);

    auto queued = pimpl_->pool->enqueue(std::move(job));
    if (!queued.is_ok()) {
        pimpl_->counter.end(direction);
        DXT_LOG_ERROR(log_category::pool, pimpl_->pool_name + ": enqueue rejected");
        return rejected(pimpl_->pool_name);
    }
    return future;
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_transfer_adapter::is_running() const {
    return pimpl_->running.load() && pimpl_->pool != nullptr;
}

size_t thread_system_transfer_adapter::in_flight() const {
    return pimpl_->counter.count();
}

size_t thread_system_transfer_adapter::in_flight(transfer_direction direction) const {
    return pimpl_->counter.count(direction);
}

size_t thread_system_transfer_adapter::peak_in_flight() const {
    return pimpl_->counter.peak();
}

void thread_system_transfer_adapter::shutdown() {
    if (pimpl_ && pimpl_->running.exchange(false) && pimpl_->pool) {
        pimpl_->pool->stop();
    }
}

std::string thread_system_transfer_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // DX_TRANSFER_USE_THREAD_SYSTEM

// ============================================================================
// std_thread_transfer_pool
// ============================================================================

struct std_thread_transfer_pool::impl {
    std::string pool_name;
    size_t worker_count{0};

    std::mutex mutex;
    std::condition_variable wake;
    std::deque<std::function<void()>> queue;
    bool stopping = false;
    std::vector<std::thread> threads;

    in_flight_counter counter;

    void worker() {
        for (;;) {
            std::function<void()> loop;
            {
                std::unique_lock<std::mutex> lock(mutex);
                wake.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                loop = std::move(queue.front());
                queue.pop_front();
            }
            loop();
        }
    }
};

std_thread_transfer_pool::std_thread_transfer_pool(size_t worker_count,
                                                   const std::string& pool_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = resolve_worker_count(worker_count);
    pimpl_->threads.reserve(pimpl_->worker_count);
    for (size_t i = 0; i < pimpl_->worker_count; ++i) {
        pimpl_->threads.emplace_back([p = pimpl_.get()] { p->worker(); });
    }
}

std_thread_transfer_pool::~std_thread_transfer_pool() {
    shutdown();
}

std::future<void> std_thread_transfer_pool::submit(std::function<void()> task,
                                                   transfer_direction direction) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return rejected(pimpl_->pool_name);
        }
        pimpl_->counter.begin(direction);
        pimpl_->queue.push_back(
            make_tracked(std::move(task), direction, promise, &pimpl_->counter));
    }
    pimpl_->wake.notify_one();
    return future;
}

size_t std_thread_transfer_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool std_thread_transfer_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t std_thread_transfer_pool::in_flight() const {
    return pimpl_->counter.count();
}

size_t std_thread_transfer_pool::in_flight(transfer_direction direction) const {
    return pimpl_->counter.count(direction);
}

size_t std_thread_transfer_pool::peak_in_flight() const {
    return pimpl_->counter.peak();
}

void std_thread_transfer_pool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            return;
        }
        pimpl_->stopping = true;
    }
    pimpl_->wake.notify_all();

    const auto self = std::this_thread::get_id();
    for (auto& t : pimpl_->threads) {
        if (!t.joinable()) {
            continue;
        }
        if (t.get_id() == self) {
            // Shut down from one of our own loops; that thread exits after the loop returns
            t.detach();
        } else {
            t.join();
        }
    }
}

// ============================================================================
// transfer_pool_factory
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if DX_TRANSFER_USE_THREAD_SYSTEM
    return thread_system_transfer_adapter::create_default(worker_count, pool_name);
#else
    return std::make_shared<std_thread_transfer_pool>(worker_count, pool_name);
#endif
}

}  // namespace dx::transfer::adapters
