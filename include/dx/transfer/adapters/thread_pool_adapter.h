// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Executors for chunk worker loops
 *
 * The worker pool hands each of its P worker loops to one of these
 * executors. Outstanding loops are counted per transfer direction so a
 * pool shared between jobs can report how much upload and download work
 * it is carrying.
 *
 * Backends:
 * - thread_system_transfer_adapter: kcenon thread_system pool
 * - std_thread_transfer_pool: fixed set of std::thread workers
 */

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"
#include "../core/types.h"

#if DX_TRANSFER_USE_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace dx::transfer::adapters {

/**
 * @brief Executor interface used by the worker pool
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Queue a worker loop for a job moving data in the given direction
     * @return Future that completes when the loop returns; a loop that
     *         throws, or a pool that has shut down, surfaces as an exception
     */
    virtual std::future<void> submit(std::function<void()> task,
                                     transfer_direction direction) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Loops submitted but not yet finished, queued ones included
     */
    [[nodiscard]] virtual size_t in_flight() const = 0;

    [[nodiscard]] virtual size_t in_flight(transfer_direction direction) const = 0;

    /**
     * @brief Highest in_flight() seen since the pool was created
     */
    [[nodiscard]] virtual size_t peak_in_flight() const = 0;

    /**
     * @brief Stop accepting work, finish queued loops and release threads
     */
    virtual void shutdown() = 0;
};

/**
 * @brief Lock-free outstanding-loop counters, one per direction
 */
class in_flight_counter {
public:
    void begin(transfer_direction direction) noexcept;
    void end(transfer_direction direction) noexcept;

    [[nodiscard]] size_t count() const noexcept;
    [[nodiscard]] size_t count(transfer_direction direction) const noexcept;
    [[nodiscard]] size_t peak() const noexcept;

private:
    std::array<std::atomic<size_t>, 2> counts_{};
    std::atomic<size_t> total_{0};
    std::atomic<size_t> peak_{0};
};

#if DX_TRANSFER_USE_THREAD_SYSTEM

/**
 * @brief Runs worker loops as jobs on a thread_system thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    explicit thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "dx_transfer_pool",
        size_t worker_count = 0);

    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Create a started pool with worker_count workers
     * @param worker_count 0 = hardware concurrency
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "dx_transfer_pool");

    std::future<void> submit(std::function<void()> task,
                             transfer_direction direction) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t in_flight() const override;
    [[nodiscard]] size_t in_flight(transfer_direction direction) const override;
    [[nodiscard]] size_t peak_in_flight() const override;
    void shutdown() override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

#endif  // DX_TRANSFER_USE_THREAD_SYSTEM

/**
 * @brief Fixed-size pool of std::thread workers over a FIFO of loops
 *
 * Used when thread_system is not available. Loops beyond worker_count()
 * wait in the queue; shutdown() and the destructor drain the queue and
 * join every worker.
 */
class std_thread_transfer_pool : public transfer_thread_pool_interface {
public:
    explicit std_thread_transfer_pool(size_t worker_count = 0,
                                      const std::string& pool_name = "dx_transfer_pool");
    ~std_thread_transfer_pool() override;

    std_thread_transfer_pool(const std_thread_transfer_pool&) = delete;
    std_thread_transfer_pool& operator=(const std_thread_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task,
                             transfer_direction direction) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t in_flight() const override;
    [[nodiscard]] size_t in_flight(transfer_direction direction) const override;
    [[nodiscard]] size_t peak_in_flight() const override;
    void shutdown() override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Creates the best available pool
 *
 * 1. thread_system_transfer_adapter (when DX_TRANSFER_USE_THREAD_SYSTEM)
 * 2. std_thread_transfer_pool (fallback)
 */
class transfer_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "dx_transfer_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if DX_TRANSFER_USE_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace dx::transfer::adapters
