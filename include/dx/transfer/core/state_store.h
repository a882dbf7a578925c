/**
 * @file state_store.h
 * @brief Durable storage of resumable transfer state
 *
 * Each job is stored as one JSON record, `<job-id>.json`, in the state
 * directory. Records are written to a temporary file and renamed into
 * place so a crash never leaves a half-written record behind. Each record
 * carries a CRC-32 of its body; a record that fails the check or cannot be
 * parsed is reported as state_corruption.
 */

#ifndef DX_TRANSFER_CORE_STATE_STORE_H
#define DX_TRANSFER_CORE_STATE_STORE_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "dx/transfer/core/progress_tracker.h"
#include "dx/transfer/core/types.h"

namespace dx::transfer {

/**
 * @brief Configuration for state_store
 */
struct state_store_config {
    /// Directory holding one record per job
    std::filesystem::path directory;

    /// Age after which cleanup_expired() removes a record
    std::chrono::seconds state_ttl{std::chrono::hours(24 * 7)};

    state_store_config();
    explicit state_store_config(std::filesystem::path dir);
};

/**
 * @brief Saves, loads and expires transfer_state records
 *
 * Thread-safe. The store itself never decides whether a state still
 * matches a job; the orchestrator validates it against the current plan.
 */
class state_store {
public:
    explicit state_store(const state_store_config& config = state_store_config{});
    ~state_store();

    state_store(const state_store&) = delete;
    auto operator=(const state_store&) -> state_store& = delete;
    state_store(state_store&&) noexcept;
    auto operator=(state_store&&) noexcept -> state_store&;

    /**
     * @brief Persist a state, replacing any previous record for its job
     */
    [[nodiscard]] auto save(const transfer_state& state) -> result<void>;

    /**
     * @brief Load the record of a job
     * @return state_not_found if there is none, state_corruption if it is damaged
     */
    [[nodiscard]] auto load(const job_id& id) const -> result<transfer_state>;

    [[nodiscard]] auto exists(const job_id& id) const -> bool;

    /**
     * @brief Delete the record of a job; removing a missing record succeeds
     */
    [[nodiscard]] auto remove(const job_id& id) -> result<void>;

    /**
     * @brief All loadable records; damaged ones are skipped and logged
     */
    [[nodiscard]] auto list() const -> std::vector<transfer_state>;

    /**
     * @brief Remove records whose last update is older than ttl
     * @return Number of records removed
     */
    auto cleanup_expired(std::chrono::seconds ttl) -> std::size_t;

    /**
     * @brief cleanup_expired() with the configured state_ttl
     */
    auto cleanup_expired() -> std::size_t;

    [[nodiscard]] auto record_path(const job_id& id) const -> std::filesystem::path;

    [[nodiscard]] auto config() const -> const state_store_config&;

    /**
     * @brief Encode a state as its on-disk record
     */
    [[nodiscard]] static auto encode(const transfer_state& state) -> std::string;

    /**
     * @brief Decode an on-disk record
     */
    [[nodiscard]] static auto decode(const std::string& record) -> result<transfer_state>;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_CORE_STATE_STORE_H
