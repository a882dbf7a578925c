/**
 * @file statistics_collector.h
 * @brief Chunk-level rate, ETA and failure statistics for one job
 *
 * Bytes restored from persisted state count toward completion but not
 * toward the rate, so a resumed job does not report an inflated speed.
 */

#ifndef DX_TRANSFER_CORE_STATISTICS_COLLECTOR_H
#define DX_TRANSFER_CORE_STATISTICS_COLLECTOR_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "dx/transfer/core/error_codes.h"

namespace dx::transfer {

using duration = std::chrono::milliseconds;
using time_point = std::chrono::steady_clock::time_point;

/**
 * @brief Thread-safe statistics for a running transfer
 *
 * Workers report whole chunks: one call per verified chunk and one per
 * failed attempt. The current rate is measured over the last
 * rate_window chunk completions; the ETA divides the remaining bytes by
 * that rate (the average rate until the window fills) and is refreshed at
 * most every eta_refresh.
 */
class statistics_collector {
public:
    struct config {
        std::size_t rate_window = 16;  ///< Chunk completions in the rate window
        duration eta_refresh{500};
    };

    static constexpr std::size_t error_kind_count =
        static_cast<std::size_t>(error_kind::io_error) + 1;

    struct snapshot {
        uint64_t bytes_done = 0;      ///< Verified bytes, resumed bytes included
        uint64_t bytes_resumed = 0;   ///< Verified bytes restored at start
        uint64_t bytes_this_run = 0;  ///< Bytes moved since start()
        uint64_t total_bytes = 0;
        uint64_t chunks_completed = 0;
        uint64_t chunks_invalidated = 0;  ///< Chunks sent again after a failed whole-object check
        uint64_t failed_attempts = 0;
        uint64_t retries = 0;  ///< Sum of (attempts - 1) over completed chunks
        std::array<uint64_t, error_kind_count> failures_by_kind{};
        double current_rate = 0.0;  ///< bytes/sec over the rate window
        double average_rate = 0.0;  ///< bytes/sec since start()
        duration elapsed{0};
        duration estimated_remaining{0};

        [[nodiscard]] auto failures(error_kind kind) const -> uint64_t {
            return failures_by_kind[static_cast<std::size_t>(kind)];
        }
    };

    statistics_collector();
    explicit statistics_collector(config cfg);

    statistics_collector(const statistics_collector&) = delete;
    auto operator=(const statistics_collector&) -> statistics_collector& = delete;
    statistics_collector(statistics_collector&&) noexcept;
    auto operator=(statistics_collector&&) noexcept -> statistics_collector&;

    ~statistics_collector();

    /**
     * @brief Start timing
     * @param total_bytes Object size
     * @param already_done Bytes restored from persisted state
     */
    void start(uint64_t total_bytes, uint64_t already_done = 0);

    /**
     * @brief Stop timing; elapsed is frozen at this point
     */
    void stop();

    void reset();

    [[nodiscard]] auto is_active() const noexcept -> bool;

    /**
     * @brief A chunk was verified and recorded
     * @param bytes Chunk length
     * @param attempts Attempts the chunk took, the successful one included
     */
    void record_chunk_completed(uint64_t bytes, uint32_t attempts);

    /**
     * @brief A completed chunk failed re-verification and is pending again
     */
    void record_chunk_invalidated(uint64_t bytes);

    /**
     * @brief One chunk attempt failed with kind
     */
    void record_failure(error_kind kind);

    [[nodiscard]] auto bytes_done() const -> uint64_t;

    [[nodiscard]] auto bytes_this_run() const -> uint64_t;

    [[nodiscard]] auto elapsed() const -> duration;

    [[nodiscard]] auto get_snapshot() const -> snapshot;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_CORE_STATISTICS_COLLECTOR_H
