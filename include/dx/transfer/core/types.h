/**
 * @file types.h
 * @brief Core type definitions for dx_transfer
 */

#ifndef DX_TRANSFER_CORE_TYPES_H
#define DX_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace dx::transfer {

/**
 * @brief Error codes for transfer operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_already_exists = -102,
    file_too_large = -103,
    invalid_file_path = -104,
    file_read_error = -105,
    file_write_error = -106,

    // Chunk errors (-120 to -139)
    checksum_mismatch = -120,
    whole_checksum_mismatch = -121,
    invalid_chunk_index = -124,
    state_inconsistency = -125,

    // Configuration errors (-140 to -159)
    invalid_chunk_size = -140,
    invalid_configuration = -141,

    // Transport errors (-160 to -179)
    transport_timeout = -160,
    connection_error = -161,
    auth_expired = -162,
    server_rejected = -163,
    retries_exhausted = -164,

    // State errors (-180 to -199)
    state_corruption = -180,
    state_not_found = -181,
    state_io_error = -182,

    // Job errors (-200 to -219)
    cancelled = -200,
    invalid_state_transition = -201,
    already_running = -202,

    // Internal errors (-220 to -239)
    internal_error = -220,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success: return "success";
        case error_code::file_not_found: return "file not found";
        case error_code::file_access_denied: return "file access denied";
        case error_code::file_already_exists: return "file already exists";
        case error_code::file_too_large: return "file too large";
        case error_code::invalid_file_path: return "invalid file path";
        case error_code::file_read_error: return "file read error";
        case error_code::file_write_error: return "file write error";
        case error_code::checksum_mismatch: return "checksum mismatch";
        case error_code::whole_checksum_mismatch: return "whole-object checksum mismatch";
        case error_code::invalid_chunk_index: return "invalid chunk index";
        case error_code::state_inconsistency: return "state inconsistency";
        case error_code::invalid_chunk_size: return "invalid chunk size";
        case error_code::invalid_configuration: return "invalid configuration";
        case error_code::transport_timeout: return "transport timeout";
        case error_code::connection_error: return "connection error";
        case error_code::auth_expired: return "authentication expired";
        case error_code::server_rejected: return "server rejected request";
        case error_code::retries_exhausted: return "retries exhausted";
        case error_code::state_corruption: return "persisted state corrupted";
        case error_code::state_not_found: return "persisted state not found";
        case error_code::state_io_error: return "persisted state I/O error";
        case error_code::cancelled: return "cancelled";
        case error_code::invalid_state_transition: return "invalid state transition";
        case error_code::already_running: return "already running";
        case error_code::internal_error: return "internal error";
        default: return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Either a value of T or an error
 *
 * Modeled on std::expected; value() on an error result is undefined.
 */
template <typename T>
class result {
public:
    result() : state_(std::in_place_index<1>) {}
    result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    result(unexpected u) : state_(std::in_place_index<1>, std::move(u.err)) {}

    [[nodiscard]] auto has_value() const noexcept -> bool { return state_.index() == 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] auto value() & -> T& { return *std::get_if<0>(&state_); }
    [[nodiscard]] auto value() const& -> const T& { return *std::get_if<0>(&state_); }
    [[nodiscard]] auto value() && -> T&& { return std::move(*std::get_if<0>(&state_)); }

    [[nodiscard]] auto error() const -> const struct error& {
        static const struct error none{};
        auto* e = std::get_if<1>(&state_);
        return e ? *e : none;
    }

private:
    std::variant<T, struct error> state_;
};

template <>
class result<void> {
public:
    result() = default;
    result(unexpected u) : failed_(true), error_(std::move(u.err)) {}

    [[nodiscard]] auto has_value() const noexcept -> bool { return !failed_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool failed_ = false;
    struct error error_;
};

/**
 * @brief Transfer direction
 */
enum class transfer_direction : uint8_t {
    upload,    ///< Local file to remote object
    download,  ///< Remote object to local file
};

[[nodiscard]] constexpr auto to_string(transfer_direction dir) -> const char* {
    switch (dir) {
        case transfer_direction::upload: return "upload";
        case transfer_direction::download: return "download";
        default: return "unknown";
    }
}

}  // namespace dx::transfer

#endif  // DX_TRANSFER_CORE_TYPES_H
