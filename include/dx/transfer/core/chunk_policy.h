/**
 * @file chunk_policy.h
 * @brief Chunk size policy and platform limits
 */

#ifndef DX_TRANSFER_CORE_CHUNK_POLICY_H
#define DX_TRANSFER_CORE_CHUNK_POLICY_H

#include <dx/transfer/core/types.h>

#include <cstdint>
#include <optional>
#include <string>

namespace dx::transfer {

/**
 * @brief Chunk size policy
 *
 * Defaults follow common object-store multipart limits: parts between
 * 5 MiB and 5 GiB, at most 10000 parts per object.
 */
struct chunk_policy {
    static constexpr uint64_t mib = 1024ULL * 1024ULL;

    /// Caller override; when unset default_chunk_size is used
    std::optional<uint64_t> chunk_size;

    uint64_t default_chunk_size = 64 * mib;
    uint64_t min_chunk_size = 5 * mib;
    uint64_t max_chunk_size = 5 * 1024 * mib;
    uint64_t max_chunk_count = 10000;

    /// Scaled chunk sizes are rounded up to a multiple of this
    uint64_t size_alignment = mib;

    chunk_policy() = default;

    explicit chunk_policy(uint64_t size) : chunk_size(size) {}

    /**
     * @brief Policy without platform lower bounds
     *
     * For local stores and tests that need small chunks.
     */
    [[nodiscard]] static auto unbounded(std::optional<uint64_t> size = std::nullopt)
        -> chunk_policy {
        chunk_policy p;
        p.chunk_size = size;
        p.min_chunk_size = 1;
        p.default_chunk_size = size.value_or(8 * mib);
        p.size_alignment = 1;
        return p;
    }

    /**
     * @brief Validate the limits and the override
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (min_chunk_size == 0 || min_chunk_size > max_chunk_size) {
            return unexpected(error{error_code::invalid_configuration,
                                    "chunk size limits are inconsistent"});
        }
        if (max_chunk_count == 0 || size_alignment == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "chunk count limit and alignment must be positive"});
        }
        if (default_chunk_size < min_chunk_size || default_chunk_size > max_chunk_size) {
            return unexpected(error{error_code::invalid_configuration,
                                    "default chunk size outside limits"});
        }
        if (chunk_size) {
            if (*chunk_size < min_chunk_size) {
                return unexpected(error{
                    error_code::invalid_chunk_size,
                    "chunk size too small (minimum: " + std::to_string(min_chunk_size) + ")"});
            }
            if (*chunk_size > max_chunk_size) {
                return unexpected(error{
                    error_code::invalid_chunk_size,
                    "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
            }
        }
        return {};
    }

    /**
     * @brief Largest object this policy can plan
     */
    [[nodiscard]] auto max_object_size() const -> uint64_t {
        return max_chunk_size * max_chunk_count;
    }
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_CORE_CHUNK_POLICY_H
