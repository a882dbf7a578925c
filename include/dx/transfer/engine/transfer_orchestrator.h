/**
 * @file transfer_orchestrator.h
 * @brief State machine driving one upload or download job
 */

#ifndef DX_TRANSFER_ENGINE_TRANSFER_ORCHESTRATOR_H
#define DX_TRANSFER_ENGINE_TRANSFER_ORCHESTRATOR_H

#include <memory>
#include <optional>

#include "dx/transfer/adapters/thread_pool_adapter.h"
#include "dx/transfer/core/cancellation.h"
#include "dx/transfer/core/chunk_types.h"
#include "dx/transfer/engine/transfer_config.h"
#include "dx/transfer/engine/transfer_types.h"
#include "dx/transfer/engine/worker_pool.h"
#include "dx/transfer/transport/chunk_transport.h"
#include "dx/transfer/transport/remote_object_service.h"

namespace dx::transfer {

/**
 * @brief Collaborators a job runs against
 *
 * Passed explicitly at job start; nothing here is ambient global state.
 */
struct transfer_context {
    std::shared_ptr<remote_object_service> service;

    /// Chunk transport; a service_transport over service when unset
    std::shared_ptr<chunk_transport> transport;

    /// Consulted once per chunk when the remote reports auth_expired
    std::shared_ptr<credential_provider> credentials;

    /// Worker threads; a pool sized to the job's parallelism when unset
    std::shared_ptr<adapters::transfer_thread_pool_interface> thread_pool;
};

/**
 * @brief Runs one transfer job through its states
 *
 * Upload: planned (stat, plan, restore, open session) -> in_progress
 * (send chunks) -> finalizing (whole-object check, close_object once)
 * -> complete.
 *
 * Download: planned (metadata, plan, restore, open part file) ->
 * in_progress (receive and pwrite chunks) -> finalizing (whole-object
 * check, fsync, rename) -> complete.
 *
 * failed and cancelled keep the persisted state, the upload session and
 * the part file for a later resume, unless cleanup_on_abort is set.
 *
 * run() is called once, typically on a background thread; state() and
 * progress() may be called concurrently from any thread.
 */
class transfer_orchestrator {
public:
    /**
     * @param id Job identity keying the persisted state
     * @param source Local file (upload) or remote object (download)
     * @param destination Remote object (upload) or local path (download)
     */
    transfer_orchestrator(transfer_context context,
                          job_id id,
                          transfer_endpoint source,
                          transfer_endpoint destination,
                          transfer_config config);

    ~transfer_orchestrator();

    transfer_orchestrator(const transfer_orchestrator&) = delete;
    auto operator=(const transfer_orchestrator&) -> transfer_orchestrator& = delete;

    /**
     * @brief Run the job to a terminal state
     *
     * The token is observed between chunk attempts and between states.
     */
    [[nodiscard]] auto run(cancellation_token& token) -> transfer_outcome;

    [[nodiscard]] auto state() const -> job_state;

    [[nodiscard]] auto id() const -> const job_id&;

    [[nodiscard]] auto direction() const -> transfer_direction;

    [[nodiscard]] auto progress() const -> transfer_progress;

    /**
     * @brief Report of the most recent worker pool run, if any
     */
    [[nodiscard]] auto last_pool_report() const -> std::optional<pool_report>;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Direction implied by an endpoint pair
 * @return invalid_configuration unless local->remote or remote->local
 */
[[nodiscard]] auto direction_of(const transfer_endpoint& source,
                                const transfer_endpoint& destination)
    -> result<transfer_direction>;

}  // namespace dx::transfer

#endif  // DX_TRANSFER_ENGINE_TRANSFER_ORCHESTRATOR_H
