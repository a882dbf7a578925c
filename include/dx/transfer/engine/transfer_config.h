/**
 * @file transfer_config.h
 * @brief Per-transfer configuration and its builder
 */

#ifndef DX_TRANSFER_ENGINE_TRANSFER_CONFIG_H
#define DX_TRANSFER_ENGINE_TRANSFER_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include "dx/transfer/core/checksum.h"
#include "dx/transfer/core/chunk_policy.h"
#include "dx/transfer/core/chunk_types.h"
#include "dx/transfer/core/retry_controller.h"
#include "dx/transfer/core/types.h"

namespace dx::transfer {

/**
 * @brief Configuration of one transfer
 *
 * chunk_size, parallelism, max_retries and timeout are the caller-facing
 * knobs; the remaining fields tune retry backoff, verification and
 * resumable state.
 */
struct transfer_config {
    /// Override of the planned chunk size; unset lets the policy choose
    std::optional<uint64_t> chunk_size;

    /// Concurrent chunk operations; 0 = hardware concurrency
    std::size_t parallelism = 0;

    /// Total attempts per chunk, first try included
    uint32_t max_retries = 5;

    /// Deadline of a single chunk operation
    std::chrono::milliseconds timeout{30000};

    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_cap{30000};
    bool backoff_jitter = true;

    checksum_algorithm checksum = checksum_algorithm::md5;

    /// Compare the combined digest with the remote whole-object checksum
    bool verify_whole_object = true;

    /// On failure or cancel, abort the upload session and delete state and part files
    bool cleanup_on_abort = false;

    std::filesystem::path state_directory;

    /// Persist state after this many chunk completions
    uint32_t checkpoint_interval = 1;

    /// Job identity; unset derives a stable id from source and destination
    std::optional<job_id> id;

    /// Platform chunk limits
    chunk_policy policy;

    transfer_config();

    [[nodiscard]] auto validate() const -> result<void>;

    [[nodiscard]] auto effective_parallelism() const -> std::size_t;

    [[nodiscard]] auto make_retry_policy() const -> retry_policy;

    /**
     * @brief policy with the chunk_size override applied
     */
    [[nodiscard]] auto make_chunk_policy() const -> chunk_policy;

    /**
     * @brief Overlay DX_TRANSFER_* environment variables onto base
     *
     * Recognised: DX_TRANSFER_CHUNK_SIZE (bytes, optional K/M/G suffix),
     * DX_TRANSFER_PARALLELISM, DX_TRANSFER_MAX_RETRIES,
     * DX_TRANSFER_TIMEOUT_MS, DX_TRANSFER_STATE_DIR, DX_TRANSFER_CHECKSUM
     * (md5 or sha256). An unparsable value fails with invalid_configuration.
     */
    [[nodiscard]] static auto from_environment(transfer_config base = transfer_config{})
        -> result<transfer_config>;

    class builder;
};

/**
 * @brief Fluent builder for transfer_config
 */
class transfer_config::builder {
public:
    builder() = default;

    /**
     * @brief Start from an existing configuration, e.g. from_environment()
     */
    explicit builder(transfer_config base) : config_(std::move(base)) {}

    auto with_chunk_size(uint64_t size) -> builder&;
    auto with_parallelism(std::size_t workers) -> builder&;
    auto with_max_retries(uint32_t attempts) -> builder&;
    auto with_timeout(std::chrono::milliseconds timeout) -> builder&;

    /**
     * @brief Set retry backoff base delay and cap
     */
    auto with_backoff(std::chrono::milliseconds base, std::chrono::milliseconds cap,
                      bool jitter = true) -> builder&;

    auto with_checksum(checksum_algorithm alg) -> builder&;
    auto with_whole_object_verification(bool enable) -> builder&;
    auto with_cleanup_on_abort(bool enable) -> builder&;
    auto with_state_directory(std::filesystem::path dir) -> builder&;
    auto with_checkpoint_interval(uint32_t completions) -> builder&;
    auto with_job_id(const job_id& id) -> builder&;
    auto with_policy(chunk_policy policy) -> builder&;

    /**
     * @brief Validate and return the configuration
     */
    [[nodiscard]] auto build() const -> result<transfer_config>;

private:
    transfer_config config_;
};

/**
 * @brief Parse a byte count with an optional binary K, M or G suffix ("8M")
 * @return nullopt for malformed text or overflow
 */
[[nodiscard]] auto parse_byte_size(std::string_view text) -> std::optional<uint64_t>;

}  // namespace dx::transfer

#endif  // DX_TRANSFER_ENGINE_TRANSFER_CONFIG_H
