/**
 * @file chunk_transport.h
 * @brief Single-chunk transport abstraction
 */

#ifndef DX_TRANSFER_TRANSPORT_CHUNK_TRANSPORT_H
#define DX_TRANSFER_TRANSPORT_CHUNK_TRANSPORT_H

#include <chrono>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "dx/transfer/core/chunk_types.h"
#include "dx/transfer/core/error_codes.h"
#include "dx/transfer/transport/remote_object_service.h"

namespace dx::transfer {

/**
 * @brief Remote handles a transfer needs for its chunk calls
 */
struct transfer_session {
    std::string object_id;
    std::string session_token;  ///< Empty for downloads
};

/**
 * @brief Transport interface for one chunk operation
 *
 * Each call performs exactly one network operation and blocks until it
 * completes or the timeout passes. Implementations never retry; that is
 * the retry controller's job.
 */
class chunk_transport {
public:
    chunk_transport() = default;
    virtual ~chunk_transport() = default;

    chunk_transport(const chunk_transport&) = delete;
    auto operator=(const chunk_transport&) -> chunk_transport& = delete;

    /**
     * @brief Transport type identifier (e.g. "service")
     */
    [[nodiscard]] virtual auto type() const -> std::string_view = 0;

    /**
     * @brief Upload one chunk
     * @return Remote acknowledgement with its checksum
     */
    [[nodiscard]] virtual auto send(const transfer_session& session,
                                    const chunk_descriptor& chunk,
                                    std::span<const std::byte> data,
                                    std::chrono::milliseconds timeout)
        -> transport_result<chunk_ack> = 0;

    /**
     * @brief Download one chunk
     * @return The chunk's raw bytes
     */
    [[nodiscard]] virtual auto receive(const transfer_session& session,
                                       const chunk_descriptor& chunk,
                                       std::chrono::milliseconds timeout)
        -> transport_result<std::vector<std::byte>> = 0;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_TRANSPORT_CHUNK_TRANSPORT_H
