/**
 * @file retry_controller.cpp
 * @brief Retry classification and backoff
 */

#include "dx/transfer/core/retry_controller.h"

#include "dx/transfer/core/logging.h"

#include <algorithm>
#include <random>

namespace dx::transfer {

auto backoff_delay(const retry_policy& policy, uint32_t attempt, double jitter_fraction)
    -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy.initial_delay.count());

    for (uint32_t i = 1; i < attempt; ++i) {
        delay *= policy.backoff_multiplier;
        if (delay >= static_cast<double>(policy.max_delay.count())) {
            break;
        }
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        delay += delay * std::clamp(jitter_fraction, 0.0, 1.0);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto calculate_retry_delay(const retry_policy& policy, uint32_t attempt)
    -> std::chrono::milliseconds {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dis(0.0, 1.0);
    return backoff_delay(policy, attempt, dis(gen));
}

retry_controller::retry_controller(retry_policy policy,
                                   std::shared_ptr<credential_provider> credentials)
    : policy_(policy), credentials_(std::move(credentials)) {}

auto retry_controller::is_retryable(const transport_error& err) const -> bool {
    switch (err.kind) {
        case error_kind::timeout:
        case error_kind::connection_error:
            return policy_.retry_on_connection_error;
        case error_kind::checksum_mismatch:
            return true;
        case error_kind::server_rejected:
            if (err.status_code == 429) {
                return policy_.retry_on_rate_limit;
            }
            return policy_.retry_on_server_error && is_retryable_status(err.status_code);
        default:
            return false;
    }
}

auto retry_controller::on_failure(const transport_error& err, uint64_t chunk_index,
                                  uint32_t attempt, bool& refreshed, retry_status& status,
                                  error_kind& kind) const -> step {
    transfer_log_context ctx;
    ctx.chunk_index = chunk_index;
    ctx.attempt = attempt;
    ctx.error_kind = to_string(err.kind);
    ctx.error_message = err.message;

    if (err.is_already_exists()) {
        DXT_LOG_DEBUG_CTX(log_category::retry, "chunk already committed remotely", ctx);
        status = retry_status::already_exists;
        kind = error_kind::none;
        return step::stop;
    }

    if (err.kind == error_kind::auth_expired) {
        if (refreshed) {
            DXT_LOG_ERROR_CTX(log_category::retry, "credentials expired again after refresh",
                              ctx);
            return step::stop;
        }
        refreshed = true;
        if (credentials_ && credentials_->refresh_credentials()) {
            DXT_LOG_INFO_CTX(log_category::retry, "credentials refreshed", ctx);
            return step::refreshed;
        }
        DXT_LOG_ERROR_CTX(log_category::retry, "credential refresh failed", ctx);
        return step::stop;
    }

    if (err.kind == error_kind::cancelled) {
        status = retry_status::cancelled;
        return step::stop;
    }

    if (!is_retryable(err)) {
        DXT_LOG_ERROR_CTX(log_category::retry, "fatal chunk error", ctx);
        return step::stop;
    }

    DXT_LOG_WARN_CTX(log_category::retry, "chunk attempt failed", ctx);
    return step::retry;
}

auto retry_controller::backoff(uint32_t attempt, uint64_t chunk_index,
                               cancellation_token& token) const -> bool {
    auto delay = calculate_retry_delay(policy_, attempt);
    DXT_LOG_DEBUG(log_category::retry,
                  "chunk " + std::to_string(chunk_index) + " retrying in " +
                      std::to_string(delay.count()) + "ms");
    return !token.wait_for_cancel(delay);
}

}  // namespace dx::transfer
