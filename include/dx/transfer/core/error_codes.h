/**
 * @file error_codes.h
 * @brief Failure kinds and their retry classification
 *
 * Chunk-level failures are described by an error_kind. Every kind belongs
 * to one failure_class:
 * - transient: recovered locally by the retry controller
 * - fatal: surfaced to the caller as a failed job
 * - cancelled: surfaced distinctly from genuine failure
 */

#ifndef DX_TRANSFER_CORE_ERROR_CODES_H
#define DX_TRANSFER_CORE_ERROR_CODES_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "dx/transfer/core/types.h"

namespace dx::transfer {

/**
 * @brief Kind of a chunk-level failure
 */
enum class error_kind : uint8_t {
    none = 0,
    timeout,
    connection_error,
    auth_expired,
    server_rejected,
    cancelled,
    checksum_mismatch,
    retries_exhausted,
    state_corruption,
    state_inconsistency,
    io_error,
};

[[nodiscard]] constexpr auto to_string(error_kind kind) -> const char* {
    switch (kind) {
        case error_kind::none: return "none";
        case error_kind::timeout: return "timeout";
        case error_kind::connection_error: return "connection_error";
        case error_kind::auth_expired: return "auth_expired";
        case error_kind::server_rejected: return "server_rejected";
        case error_kind::cancelled: return "cancelled";
        case error_kind::checksum_mismatch: return "checksum_mismatch";
        case error_kind::retries_exhausted: return "retries_exhausted";
        case error_kind::state_corruption: return "state_corruption";
        case error_kind::state_inconsistency: return "state_inconsistency";
        case error_kind::io_error: return "io_error";
        default: return "unknown";
    }
}

/**
 * @brief Retry classification of a failure
 */
enum class failure_class : uint8_t {
    transient,
    fatal,
    cancelled,
};

[[nodiscard]] constexpr auto to_string(failure_class cls) -> const char* {
    switch (cls) {
        case failure_class::transient: return "transient";
        case failure_class::fatal: return "fatal";
        case failure_class::cancelled: return "cancelled";
        default: return "unknown";
    }
}

/// HTTP-style status reported by the remote side when a chunk already exists.
inline constexpr int status_already_exists = 409;

/**
 * @brief Check if a server status code is worth retrying
 *
 * 429 (rate limited) and all 5xx codes are retryable.
 */
[[nodiscard]] constexpr auto is_retryable_status(int status_code) noexcept -> bool {
    return status_code == 429 || (status_code >= 500 && status_code < 600);
}

/**
 * @brief Classify a failure kind
 *
 * auth_expired is reported as fatal here; the retry controller performs
 * the single credential refresh before consulting this.
 */
[[nodiscard]] constexpr auto classify(error_kind kind, int status_code = 0) noexcept
    -> failure_class {
    switch (kind) {
        case error_kind::timeout:
        case error_kind::connection_error:
        case error_kind::checksum_mismatch:
            return failure_class::transient;
        case error_kind::server_rejected:
            return is_retryable_status(status_code) ? failure_class::transient
                                                    : failure_class::fatal;
        case error_kind::cancelled:
            return failure_class::cancelled;
        default:
            return failure_class::fatal;
    }
}

/**
 * @brief Map a failure kind to the library error code
 */
[[nodiscard]] constexpr auto to_error_code(error_kind kind) noexcept -> error_code {
    switch (kind) {
        case error_kind::none: return error_code::success;
        case error_kind::timeout: return error_code::transport_timeout;
        case error_kind::connection_error: return error_code::connection_error;
        case error_kind::auth_expired: return error_code::auth_expired;
        case error_kind::server_rejected: return error_code::server_rejected;
        case error_kind::cancelled: return error_code::cancelled;
        case error_kind::checksum_mismatch: return error_code::checksum_mismatch;
        case error_kind::retries_exhausted: return error_code::retries_exhausted;
        case error_kind::state_corruption: return error_code::state_corruption;
        case error_kind::state_inconsistency: return error_code::state_inconsistency;
        case error_kind::io_error: return error_code::file_read_error;
        default: return error_code::internal_error;
    }
}

/**
 * @brief Failure reported by a transport or remote service call
 */
struct transport_error {
    error_kind kind = error_kind::none;
    int status_code = 0;  ///< Remote status, meaningful for server_rejected
    std::string message;

    transport_error() = default;
    transport_error(error_kind k, std::string msg)
        : kind(k), message(std::move(msg)) {}
    transport_error(error_kind k, int status, std::string msg)
        : kind(k), status_code(status), message(std::move(msg)) {}

    [[nodiscard]] auto classification() const noexcept -> failure_class {
        return classify(kind, status_code);
    }

    [[nodiscard]] auto is_already_exists() const noexcept -> bool {
        return kind == error_kind::server_rejected && status_code == status_already_exists;
    }

    [[nodiscard]] auto describe() const -> std::string {
        std::string out = to_string(kind);
        if (kind == error_kind::server_rejected) {
            out += "(" + std::to_string(status_code) + ")";
        }
        if (!message.empty()) {
            out += ": " + message;
        }
        return out;
    }
};

/**
 * @brief Result of a single transport operation
 *
 * Like result<T>, but carries a transport_error so the retry controller
 * can classify the failure by kind and status.
 */
template <typename T>
class transport_result {
public:
    transport_result(T value) : value_(std::move(value)) {}
    transport_result(transport_error err) : error_(std::move(err)) {}

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const transport_error& { return error_; }

private:
    std::optional<T> value_;
    transport_error error_;
};

template <>
class transport_result<void> {
public:
    transport_result() : ok_(true) {}
    transport_result(transport_error err) : ok_(false), error_(std::move(err)) {}

    [[nodiscard]] auto has_value() const noexcept -> bool { return ok_; }
    [[nodiscard]] explicit operator bool() const noexcept { return ok_; }

    [[nodiscard]] auto error() const -> const transport_error& { return error_; }

private:
    bool ok_;
    transport_error error_;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_CORE_ERROR_CODES_H
