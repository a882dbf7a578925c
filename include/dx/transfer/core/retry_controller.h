/**
 * @file retry_controller.h
 * @brief Bounded retry with exponential backoff for chunk operations
 */

#ifndef DX_TRANSFER_CORE_RETRY_CONTROLLER_H
#define DX_TRANSFER_CORE_RETRY_CONTROLLER_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "dx/transfer/core/cancellation.h"
#include "dx/transfer/core/error_codes.h"
#include "dx/transfer/transport/remote_object_service.h"

namespace dx::transfer {

/**
 * @brief Retry policy for chunk operations
 */
struct retry_policy {
    /// Total attempts per chunk, first try included
    uint32_t max_attempts = 5;

    /// Delay before the second attempt
    std::chrono::milliseconds initial_delay{1000};

    /// Upper bound for the exponential part of the delay
    std::chrono::milliseconds max_delay{30000};

    double backoff_multiplier = 2.0;

    /// Add a random extra in [0, delay]
    bool use_jitter = true;

    bool retry_on_rate_limit = true;
    bool retry_on_connection_error = true;
    bool retry_on_server_error = true;
};

/**
 * @brief Backoff before attempt + 1, jitter taken from jitter_fraction in [0, 1]
 */
[[nodiscard]] auto backoff_delay(const retry_policy& policy,
                                 uint32_t attempt,
                                 double jitter_fraction) -> std::chrono::milliseconds;

/**
 * @brief Backoff before attempt + 1 with random jitter
 */
[[nodiscard]] auto calculate_retry_delay(const retry_policy& policy, uint32_t attempt)
    -> std::chrono::milliseconds;

/**
 * @brief How a retried operation ended
 */
enum class retry_status : uint8_t {
    success,
    already_exists,  ///< Remote reported 409; the chunk is already there
    fatal,
    cancelled,
};

[[nodiscard]] constexpr auto to_string(retry_status status) -> const char* {
    switch (status) {
        case retry_status::success: return "success";
        case retry_status::already_exists: return "already_exists";
        case retry_status::fatal: return "fatal";
        case retry_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @brief Typed outcome of a retried operation
 */
template <typename T>
struct retry_outcome {
    retry_status status = retry_status::fatal;
    std::optional<T> value;
    uint32_t attempts = 0;                   ///< Operation calls made
    error_kind kind = error_kind::none;      ///< Reported kind (retries_exhausted on exhaustion)
    error_kind last_error = error_kind::none;
    int status_code = 0;
    std::string message;

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return status == retry_status::success || status == retry_status::already_exists;
    }
};

/**
 * @brief Wraps one chunk operation in an explicit bounded retry loop
 *
 * - timeout, connection_error, 429, 5xx and checksum_mismatch are retried
 * - other server rejections are fatal; 409 ends as already_exists
 * - auth_expired triggers one credential refresh that costs no attempt;
 *   a failed refresh or a second expiry is fatal
 * - a cancelled token ends the loop before the next attempt or during backoff
 *
 * Thread-safe: workers share one controller.
 */
class retry_controller {
public:
    using failure_observer =
        std::function<void(uint64_t chunk_index, uint32_t attempt, const transport_error&)>;

    explicit retry_controller(retry_policy policy = {},
                              std::shared_ptr<credential_provider> credentials = nullptr);

    [[nodiscard]] auto policy() const -> const retry_policy& { return policy_; }

    /**
     * @brief Called after every failed attempt (logging, bookkeeping)
     */
    void set_failure_observer(failure_observer observer) { observer_ = std::move(observer); }

    /**
     * @brief Whether a failure should be retried under this policy
     */
    [[nodiscard]] auto is_retryable(const transport_error& err) const -> bool;

    /**
     * @brief Run operation until it succeeds, fails fatally, or is cancelled
     * @param operation Receives the 1-based attempt number
     */
    template <typename T>
    auto execute(const std::function<transport_result<T>(uint32_t)>& operation,
                 uint64_t chunk_index,
                 cancellation_token& token) const -> retry_outcome<T>;

private:
    enum class step : uint8_t { retry, refreshed, stop };

    /// Classify a failure; fills outcome fields when the loop must stop.
    auto on_failure(const transport_error& err, uint64_t chunk_index, uint32_t attempt,
                    bool& refreshed, retry_status& status, error_kind& kind) const -> step;

    /// Sleep before the next attempt; false if cancelled meanwhile.
    auto backoff(uint32_t attempt, uint64_t chunk_index, cancellation_token& token) const
        -> bool;

    retry_policy policy_;
    std::shared_ptr<credential_provider> credentials_;
    failure_observer observer_;
};

template <typename T>
auto retry_controller::execute(const std::function<transport_result<T>(uint32_t)>& operation,
                               uint64_t chunk_index,
                               cancellation_token& token) const -> retry_outcome<T> {
    retry_outcome<T> out;
    uint32_t budget_used = 0;
    bool refreshed = false;

    while (true) {
        if (token.is_cancelled()) {
            out.status = retry_status::cancelled;
            out.kind = error_kind::cancelled;
            return out;
        }

        ++out.attempts;
        ++budget_used;
        auto res = operation(out.attempts);
        if (res) {
            out.status = retry_status::success;
            out.kind = error_kind::none;
            out.value = std::move(res).value();
            return out;
        }

        const auto& err = res.error();
        out.last_error = err.kind;
        out.status_code = err.status_code;
        out.message = err.message;
        if (observer_) {
            observer_(chunk_index, out.attempts, err);
        }

        retry_status status = retry_status::fatal;
        error_kind kind = err.kind;
        auto next = on_failure(err, chunk_index, out.attempts, refreshed, status, kind);

        if (next == step::stop) {
            out.status = status;
            out.kind = kind;
            return out;
        }
        if (next == step::refreshed) {
            --budget_used;
            continue;
        }

        if (budget_used >= policy_.max_attempts) {
            out.status = retry_status::fatal;
            out.kind = error_kind::retries_exhausted;
            return out;
        }

        if (!backoff(budget_used, chunk_index, token)) {
            out.status = retry_status::cancelled;
            out.kind = error_kind::cancelled;
            return out;
        }
    }
}

}  // namespace dx::transfer

#endif  // DX_TRANSFER_CORE_RETRY_CONTROLLER_H
