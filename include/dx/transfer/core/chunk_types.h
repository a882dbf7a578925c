/**
 * @file chunk_types.h
 * @brief Chunk plan and per-chunk result records
 *
 * A transfer is planned once into an ordered list of chunk_descriptor
 * entries. Descriptors are immutable; mutable per-chunk bookkeeping lives
 * in chunk_result, owned by the progress tracker.
 */

#ifndef DX_TRANSFER_CORE_CHUNK_TYPES_H
#define DX_TRANSFER_CORE_CHUNK_TYPES_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dx/transfer/core/error_codes.h"

namespace dx::transfer {

/**
 * @brief Identity of a transfer job (16-byte UUID)
 *
 * The job id keys persisted resumable state, so callers that want to
 * resume pass the same id on restart.
 */
struct job_id {
    std::array<uint8_t, 16> bytes{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

    constexpr job_id() noexcept = default;

    explicit constexpr job_id(const std::array<uint8_t, 16>& b) noexcept
        : bytes(b) {}

    /**
     * @brief Generate a new random (version 4) job id
     */
    [[nodiscard]] static auto generate() -> job_id;

    /**
     * @brief Derive a stable job id from a source and destination pair
     *
     * Re-running the same transfer yields the same id, which lets a
     * restarted process find its persisted state without being told.
     */
    [[nodiscard]] static auto derive(std::string_view source, std::string_view destination)
        -> job_id;

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] static auto from_string(std::string_view str) -> std::optional<job_id>;

    [[nodiscard]] constexpr auto is_null() const noexcept -> bool {
        for (const auto& b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr auto operator==(const job_id& other) const noexcept
        -> bool = default;

    [[nodiscard]] constexpr auto operator<(const job_id& other) const noexcept -> bool {
        return bytes < other.bytes;
    }
};

/**
 * @brief Immutable plan entry for one chunk
 *
 * Covers the half-open byte range [offset, offset + length).
 */
struct chunk_descriptor {
    uint64_t index = 0;
    uint64_t offset = 0;
    uint64_t length = 0;
    std::optional<std::string> expected_checksum;  ///< Remote-declared digest (downloads)

    [[nodiscard]] constexpr auto end() const noexcept -> uint64_t { return offset + length; }

    [[nodiscard]] auto operator==(const chunk_descriptor& other) const -> bool = default;
};

/**
 * @brief Ordered chunk plan for one object
 */
struct chunk_plan {
    uint64_t total_size = 0;
    uint64_t chunk_size = 0;
    std::vector<chunk_descriptor> chunks;

    [[nodiscard]] auto chunk_count() const noexcept -> std::size_t { return chunks.size(); }

    [[nodiscard]] auto operator==(const chunk_plan& other) const -> bool = default;
};

/**
 * @brief Mutable bookkeeping for one chunk
 */
struct chunk_result {
    uint32_t attempts = 0;
    error_kind last_error = error_kind::none;
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::string checksum;

    [[nodiscard]] auto is_complete() const noexcept -> bool { return completed_at.has_value(); }
};

}  // namespace dx::transfer

template <>
struct std::hash<dx::transfer::job_id> {
    auto operator()(const dx::transfer::job_id& id) const noexcept -> std::size_t {
        std::size_t h = 0;
        for (auto b : id.bytes) {
            h = h * 131 + b;
        }
        return h;
    }
};

#endif  // DX_TRANSFER_CORE_CHUNK_TYPES_H
