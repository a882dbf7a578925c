/**
 * @file remote_object_service.h
 * @brief Interfaces to the remote object service and credential refresh
 *
 * Both are external collaborators: the engine only orchestrates calls
 * through them and never implements the remote protocol itself.
 */

#ifndef DX_TRANSFER_TRANSPORT_REMOTE_OBJECT_SERVICE_H
#define DX_TRANSFER_TRANSPORT_REMOTE_OBJECT_SERVICE_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "dx/transfer/core/error_codes.h"

namespace dx::transfer {

/**
 * @brief Options for a single remote call
 */
struct call_options {
    std::chrono::milliseconds timeout{30000};  ///< Per-call deadline
};

/**
 * @brief Acknowledgement of a committed chunk
 */
struct chunk_ack {
    std::string checksum;  ///< Digest computed by the remote side
};

/**
 * @brief Remote description of a stored object
 */
struct object_metadata {
    uint64_t size = 0;
    uint64_t chunk_size = 0;
    std::vector<std::string> chunk_checksums;    ///< Index order
    std::optional<std::string> whole_checksum;
};

/**
 * @brief Remote object service
 *
 * @code
 * auto token = service.open_upload_session("project/reads.bam", size);
 * for (...) service.put_chunk(token.value(), index, bytes);
 * service.close_object(token.value(), combined);
 * @endcode
 */
class remote_object_service {
public:
    virtual ~remote_object_service() = default;

    /**
     * @brief Open an upload session for an object
     * @return Session token
     */
    [[nodiscard]] virtual auto open_upload_session(const std::string& object_id,
                                                   uint64_t total_size,
                                                   const call_options& options = {})
        -> transport_result<std::string> = 0;

    /**
     * @brief Commit one chunk by index
     *
     * Reassembly is by index, so commits may arrive in any order.
     * A service may replace a chunk committed before, or refuse it with
     * server_rejected(409).
     */
    [[nodiscard]] virtual auto put_chunk(const std::string& session_token,
                                         uint64_t index,
                                         std::span<const std::byte> data,
                                         const call_options& options = {})
        -> transport_result<chunk_ack> = 0;

    /**
     * @brief Fetch the bytes of one chunk of a closed object
     */
    [[nodiscard]] virtual auto get_chunk(const std::string& object_id,
                                         uint64_t index,
                                         uint64_t offset,
                                         uint64_t length,
                                         const call_options& options = {})
        -> transport_result<std::vector<std::byte>> = 0;

    /**
     * @brief Close the session and make the object visible
     */
    [[nodiscard]] virtual auto close_object(const std::string& session_token,
                                            const std::string& whole_checksum,
                                            const call_options& options = {})
        -> transport_result<void> = 0;

    [[nodiscard]] virtual auto get_object_metadata(const std::string& object_id,
                                                   const call_options& options = {})
        -> transport_result<object_metadata> = 0;

    /**
     * @brief Discard an open session and its committed chunks
     */
    [[nodiscard]] virtual auto abort_upload_session(const std::string& session_token,
                                                    const call_options& options = {})
        -> transport_result<void> = 0;

    /**
     * @brief Whole-object checksum of the chunks committed so far
     *
     * Services that cannot report it return nullopt and the upload
     * finalizes on the local checksum alone.
     */
    [[nodiscard]] virtual auto query_session_checksum(const std::string& session_token,
                                                      const call_options& options = {})
        -> transport_result<std::optional<std::string>> {
        (void)session_token;
        (void)options;
        return std::optional<std::string>{};
    }
};

/**
 * @brief Refreshes credentials after the remote reports auth_expired
 */
class credential_provider {
public:
    virtual ~credential_provider() = default;

    /**
     * @brief Obtain fresh credentials
     * @return true on success, false if refresh is impossible
     */
    [[nodiscard]] virtual auto refresh_credentials() -> bool = 0;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_TRANSPORT_REMOTE_OBJECT_SERVICE_H
