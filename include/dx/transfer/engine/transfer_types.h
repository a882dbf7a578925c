/**
 * @file transfer_types.h
 * @brief Job states, endpoints, progress and outcome types of the caller API
 */

#ifndef DX_TRANSFER_ENGINE_TRANSFER_TYPES_H
#define DX_TRANSFER_ENGINE_TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "dx/transfer/core/error_codes.h"
#include "dx/transfer/core/types.h"

namespace dx::transfer {

/**
 * @brief Lifecycle state of a transfer job
 */
enum class job_state : uint8_t {
    planned,      ///< Planned; session or destination being prepared
    in_progress,  ///< Chunks being transferred
    finalizing,   ///< All chunks done; verifying and committing
    complete,     ///< Committed and verified
    failed,       ///< Stopped by a fatal error; state kept for resume
    cancelled,    ///< Stopped by the caller; state kept for resume
};

[[nodiscard]] constexpr auto to_string(job_state state) noexcept -> const char* {
    switch (state) {
        case job_state::planned: return "planned";
        case job_state::in_progress: return "in_progress";
        case job_state::finalizing: return "finalizing";
        case job_state::complete: return "complete";
        case job_state::failed: return "failed";
        case job_state::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_state(job_state state) noexcept -> bool {
    return state == job_state::complete || state == job_state::failed ||
           state == job_state::cancelled;
}

/**
 * @brief Whether the job may move from one state to another
 *
 * planned -> in_progress -> finalizing -> complete, failure from
 * planned, in_progress or finalizing, and cancellation from any
 * non-terminal state. finalizing may go back to in_progress for a
 * single repair round after a whole-object mismatch.
 */
[[nodiscard]] constexpr auto is_valid_transition(job_state from, job_state to) noexcept -> bool {
    if (is_terminal_state(from)) {
        return false;
    }
    switch (to) {
        case job_state::in_progress:
            return from == job_state::planned || from == job_state::finalizing;
        case job_state::finalizing:
            return from == job_state::in_progress;
        case job_state::complete:
            return from == job_state::finalizing;
        case job_state::failed:
        case job_state::cancelled:
            return true;
        default:
            return false;
    }
}

/**
 * @brief One side of a transfer
 */
struct transfer_endpoint {
    enum class kind : uint8_t { local, remote };

    kind type = kind::local;
    std::filesystem::path path;  ///< Local file or directory
    std::string object_id;       ///< Remote object locator

    [[nodiscard]] static auto local(std::filesystem::path p) -> transfer_endpoint {
        transfer_endpoint ep;
        ep.type = kind::local;
        ep.path = std::move(p);
        return ep;
    }

    [[nodiscard]] static auto remote(std::string id) -> transfer_endpoint {
        transfer_endpoint ep;
        ep.type = kind::remote;
        ep.object_id = std::move(id);
        return ep;
    }

    [[nodiscard]] auto is_local() const noexcept -> bool { return type == kind::local; }
    [[nodiscard]] auto is_remote() const noexcept -> bool { return type == kind::remote; }

    [[nodiscard]] auto describe() const -> std::string {
        return is_local() ? "file:" + path.string() : "object:" + object_id;
    }
};

/**
 * @brief Progress of a running transfer
 */
struct transfer_progress {
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;
    uint64_t chunks_done = 0;
    uint64_t total_chunks = 0;
    double rate = 0.0;          ///< Current bytes per second
    double average_rate = 0.0;  ///< Average bytes per second
    std::chrono::milliseconds elapsed{0};
    std::chrono::milliseconds eta{0};
    uint64_t retries = 0;
    job_state state = job_state::planned;

    [[nodiscard]] auto completion_percentage() const noexcept -> double {
        if (bytes_total == 0) {
            return state == job_state::complete ? 100.0 : 0.0;
        }
        return static_cast<double>(bytes_done) / static_cast<double>(bytes_total) * 100.0;
    }
};

/**
 * @brief Final result of a transfer
 */
struct transfer_outcome {
    job_state status = job_state::failed;  ///< complete, failed or cancelled
    std::optional<uint64_t> failing_chunk;
    error_kind last_error = error_kind::none;
    error_code code = error_code::success;
    uint32_t attempts = 0;  ///< Attempts spent on the failing chunk
    uint64_t bytes_transferred = 0;
    std::chrono::milliseconds elapsed{0};
    std::string message;

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return status == job_state::complete;
    }
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_ENGINE_TRANSFER_TYPES_H
