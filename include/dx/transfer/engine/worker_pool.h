/**
 * @file worker_pool.h
 * @brief Bounded-parallelism dispatch of chunk tasks
 */

#ifndef DX_TRANSFER_ENGINE_WORKER_POOL_H
#define DX_TRANSFER_ENGINE_WORKER_POOL_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dx/transfer/adapters/thread_pool_adapter.h"
#include "dx/transfer/core/cancellation.h"
#include "dx/transfer/core/error_codes.h"

namespace dx::transfer {

/**
 * @brief Terminal failure of one chunk
 */
struct chunk_failure {
    uint64_t index = 0;
    error_kind kind = error_kind::none;
    error_code code = error_code::internal_error;
    uint32_t attempts = 0;
    std::string message;

    [[nodiscard]] auto is_cancellation() const noexcept -> bool {
        return kind == error_kind::cancelled;
    }
};

/**
 * @brief Summary of one pool run
 */
struct pool_report {
    std::size_t completed = 0;         ///< Chunks whose task succeeded
    std::size_t peak_concurrency = 0;  ///< Most tasks observed running at once
    std::optional<chunk_failure> failure;  ///< First fatal failure, if any
    bool cancelled = false;

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return !failure && !cancelled;
    }
};

/**
 * @brief Runs chunk tasks with at most P in flight
 *
 * P long-lived worker loops are submitted to the thread pool. Each pulls
 * the next index from a shared FIFO, runs the task and pulls again until
 * the queue is empty. A fatal failure or a cancelled token stops further
 * dispatch; tasks already running finish their current chunk before
 * run() returns.
 */
class worker_pool {
public:
    /// Transfers, verifies and records one chunk; nullopt on success.
    using chunk_task = std::function<std::optional<chunk_failure>(uint64_t index)>;

    /**
     * @param pool Executor for the worker loops; may be shared between jobs
     * @param direction Direction of the job, used for the pool's in-flight accounting
     */
    explicit worker_pool(std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
                         transfer_direction direction = transfer_direction::upload);

    /**
     * @brief Dispatch pending chunks and wait for the pool to drain
     */
    [[nodiscard]] auto run(const std::vector<uint64_t>& pending,
                           std::size_t parallelism,
                           const chunk_task& task,
                           cancellation_token& token) -> pool_report;

    [[nodiscard]] auto thread_pool() const
        -> const std::shared_ptr<adapters::transfer_thread_pool_interface>& {
        return pool_;
    }

private:
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
    transfer_direction direction_;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_ENGINE_WORKER_POOL_H
