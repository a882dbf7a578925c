/**
 * @file progress_tracker.h
 * @brief Completed-chunk bookkeeping and the resumable transfer state
 *
 * The progress tracker is the single source of truth for which chunks of
 * a job are done. Its snapshot is the record persisted by state_store.
 */

#ifndef DX_TRANSFER_CORE_PROGRESS_TRACKER_H
#define DX_TRANSFER_CORE_PROGRESS_TRACKER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "dx/transfer/core/chunk_types.h"
#include "dx/transfer/core/types.h"

namespace dx::transfer {

/**
 * @brief Persistable record of a partially completed job
 *
 * Every index in completed carries the verified checksum of that chunk.
 */
struct transfer_state {
    job_id id;
    transfer_direction direction = transfer_direction::upload;
    std::string object_id;   ///< Remote object locator
    std::string local_path;  ///< Local file (source or final destination)
    uint64_t total_size = 0;
    uint64_t chunk_size = 0;
    std::string session_token;  ///< Upload session; empty for downloads
    std::map<uint64_t, std::string> completed;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;

    [[nodiscard]] auto completed_count() const noexcept -> std::size_t {
        return completed.size();
    }

    [[nodiscard]] auto operator==(const transfer_state& other) const -> bool = default;
};

/**
 * @brief Thread-safe tracker of completed chunks for one chunk plan
 *
 * Completion records are append-only; the only removal is invalidate(),
 * used when the whole-object check fails and chunks are re-verified.
 */
class progress_tracker {
public:
    /**
     * @param plan Plan the job runs against
     * @param identity Job identity fields copied into every snapshot
     */
    progress_tracker(chunk_plan plan, transfer_state identity);

    progress_tracker(const progress_tracker&) = delete;
    auto operator=(const progress_tracker&) -> progress_tracker& = delete;

    /**
     * @brief Record a verified chunk
     *
     * A repeat with the same checksum is a no-op. A repeat with a
     * different checksum fails with state_inconsistency.
     */
    [[nodiscard]] auto mark_complete(uint64_t index, const std::string& checksum)
        -> result<void>;

    [[nodiscard]] auto is_complete(uint64_t index) const -> bool;

    /**
     * @brief Indices not yet complete, ascending
     */
    [[nodiscard]] auto pending_chunks() const -> std::vector<uint64_t>;

    [[nodiscard]] auto snapshot() const -> transfer_state;

    /**
     * @brief Replace the completed set with a persisted one
     *
     * Fails with state_inconsistency if the state was taken against a
     * different plan, and with state_corruption if it names an index
     * outside the plan or a completed chunk without a checksum.
     */
    [[nodiscard]] auto restore(const transfer_state& state) -> result<void>;

    /**
     * @brief Drop a completion so the chunk is transferred again
     */
    void invalidate(uint64_t index);

    void record_attempt(uint64_t index, error_kind kind);

    [[nodiscard]] auto chunk_status(uint64_t index) const -> chunk_result;

    void set_session_token(std::string token);

    [[nodiscard]] auto bytes_done() const noexcept -> uint64_t {
        return bytes_done_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto completed_count() const -> std::size_t;

    [[nodiscard]] auto all_complete() const -> bool;

    /**
     * @brief Checksums in index order; fails unless every chunk is complete
     */
    [[nodiscard]] auto ordered_checksums() const -> result<std::vector<std::string>>;

    [[nodiscard]] auto plan() const -> const chunk_plan& { return plan_; }

private:
    const chunk_plan plan_;
    mutable std::mutex mutex_;
    transfer_state state_;
    std::vector<chunk_result> results_;
    std::atomic<uint64_t> bytes_done_{0};
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_CORE_PROGRESS_TRACKER_H
