/**
 * @file transfer_engine.h
 * @brief Caller-facing entry point: start, observe and cancel transfer jobs
 */

#ifndef DX_TRANSFER_ENGINE_TRANSFER_ENGINE_H
#define DX_TRANSFER_ENGINE_TRANSFER_ENGINE_H

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "dx/transfer/core/types.h"
#include "dx/transfer/engine/transfer_config.h"
#include "dx/transfer/engine/transfer_orchestrator.h"
#include "dx/transfer/engine/transfer_types.h"

namespace dx::transfer {

namespace detail {
struct job_record;
}  // namespace detail

/**
 * @brief Handle to a running or finished transfer job
 *
 * Handles are cheap to copy; all copies refer to the same job.
 *
 * @code
 * auto handle = engine.start_transfer(transfer_endpoint::local("reads.bam"),
 *                                     transfer_endpoint::remote("project/reads.bam"),
 *                                     config);
 * if (handle.has_value()) {
 *     auto outcome = handle.value().await_completion();
 * }
 * @endcode
 */
class transfer_handle {
public:
    /**
     * @brief Default constructor (invalid handle)
     */
    transfer_handle() = default;

    explicit transfer_handle(std::shared_ptr<detail::job_record> record);

    [[nodiscard]] auto is_valid() const noexcept -> bool { return record_ != nullptr; }

    [[nodiscard]] auto id() const -> job_id;

    [[nodiscard]] auto state() const -> job_state;

    [[nodiscard]] auto progress() const -> transfer_progress;

    /**
     * @brief Request cancellation
     *
     * Chunks already in flight finish their current attempt; the job then
     * persists its state and ends as cancelled.
     */
    void cancel();

    /**
     * @brief Block until the job reaches a terminal state
     */
    [[nodiscard]] auto await_completion() const -> transfer_outcome;

    /**
     * @brief Wait up to timeout for the job to finish
     * @return Outcome, or nullopt if still running
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) const
        -> std::optional<transfer_outcome>;

private:
    std::shared_ptr<detail::job_record> record_;
};

/**
 * @brief Runs transfer jobs against one remote object service
 *
 * Each job runs its orchestrator on a dedicated thread; chunk work goes
 * to the context's thread pool. Destroying the engine cancels and joins
 * every job still running.
 */
class transfer_engine {
public:
    explicit transfer_engine(transfer_context context);
    ~transfer_engine();

    transfer_engine(const transfer_engine&) = delete;
    auto operator=(const transfer_engine&) -> transfer_engine& = delete;

    /**
     * @brief Validate and start a job
     *
     * The job id is config.id when set, otherwise derived from the
     * endpoints so the same source and destination resume the same job.
     *
     * @return invalid_configuration for a bad config or endpoint pairing,
     *         already_running if a job with that id is still running
     */
    [[nodiscard]] auto start_transfer(const transfer_endpoint& source,
                                      const transfer_endpoint& destination,
                                      const transfer_config& config = {})
        -> result<transfer_handle>;

    /**
     * @brief Ids of jobs that have not reached a terminal state
     */
    [[nodiscard]] auto active_jobs() const -> std::vector<job_id>;

    /**
     * @brief Cancel every running job without waiting
     */
    void cancel_all();

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_ENGINE_TRANSFER_ENGINE_H
