/**
 * @file service_transport.h
 * @brief chunk_transport backed by a remote_object_service
 */

#ifndef DX_TRANSFER_TRANSPORT_SERVICE_TRANSPORT_H
#define DX_TRANSFER_TRANSPORT_SERVICE_TRANSPORT_H

#include <atomic>
#include <cstdint>
#include <memory>

#include "dx/transfer/transport/chunk_transport.h"

namespace dx::transfer {

/**
 * @brief Transport statistics
 */
struct transport_statistics {
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t calls = 0;
    uint64_t errors = 0;
    uint64_t late_responses = 0;  ///< Answers that arrived after the deadline
};

/**
 * @brief Adapts remote_object_service to chunk_transport
 *
 * The deadline is handed to the service with every call. A response that
 * still arrives after the deadline is reported as a timeout, so callers
 * see one consistent failure kind for slow calls.
 */
class service_transport final : public chunk_transport {
public:
    explicit service_transport(std::shared_ptr<remote_object_service> service);

    [[nodiscard]] auto type() const -> std::string_view override { return "service"; }

    [[nodiscard]] auto send(const transfer_session& session,
                            const chunk_descriptor& chunk,
                            std::span<const std::byte> data,
                            std::chrono::milliseconds timeout)
        -> transport_result<chunk_ack> override;

    [[nodiscard]] auto receive(const transfer_session& session,
                               const chunk_descriptor& chunk,
                               std::chrono::milliseconds timeout)
        -> transport_result<std::vector<std::byte>> override;

    [[nodiscard]] auto get_statistics() const -> transport_statistics;

    [[nodiscard]] auto service() const -> const std::shared_ptr<remote_object_service>& {
        return service_;
    }

private:
    std::shared_ptr<remote_object_service> service_;

    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> calls_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<uint64_t> late_responses_{0};
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_TRANSPORT_SERVICE_TRANSPORT_H
