/**
 * @file service_transport.cpp
 * @brief Implementation of the service-backed chunk transport
 */

#include "dx/transfer/transport/service_transport.h"

#include "dx/transfer/core/logging.h"

namespace dx::transfer {

namespace {

using steady = std::chrono::steady_clock;

auto past_deadline(steady::time_point started, std::chrono::milliseconds timeout) -> bool {
    return timeout.count() > 0 && steady::now() - started > timeout;
}

}  // namespace

service_transport::service_transport(std::shared_ptr<remote_object_service> service)
    : service_(std::move(service)) {}

auto service_transport::send(const transfer_session& session,
                             const chunk_descriptor& chunk,
                             std::span<const std::byte> data,
                             std::chrono::milliseconds timeout)
    -> transport_result<chunk_ack> {
    ++calls_;
    auto started = steady::now();

    auto res = service_->put_chunk(session.session_token, chunk.index, data,
                                   call_options{timeout});
    if (!res) {
        ++errors_;
        return res;
    }

    if (past_deadline(started, timeout)) {
        ++late_responses_;
        ++errors_;
        DXT_LOG_DEBUG(log_category::transport,
                      "chunk " + std::to_string(chunk.index) + " ack arrived after deadline");
        return transport_error{error_kind::timeout, "put_chunk exceeded " +
                                                        std::to_string(timeout.count()) + "ms"};
    }

    bytes_sent_ += data.size();
    return res;
}

auto service_transport::receive(const transfer_session& session,
                                const chunk_descriptor& chunk,
                                std::chrono::milliseconds timeout)
    -> transport_result<std::vector<std::byte>> {
    ++calls_;
    auto started = steady::now();

    auto res = service_->get_chunk(session.object_id, chunk.index, chunk.offset, chunk.length,
                                   call_options{timeout});
    if (!res) {
        ++errors_;
        return res;
    }

    if (past_deadline(started, timeout)) {
        ++late_responses_;
        ++errors_;
        return transport_error{error_kind::timeout, "get_chunk exceeded " +
                                                        std::to_string(timeout.count()) + "ms"};
    }

    if (res.value().size() != chunk.length) {
        ++errors_;
        return transport_error{error_kind::connection_error,
                               "short response for chunk " + std::to_string(chunk.index) +
                                   ": " + std::to_string(res.value().size()) + " of " +
                                   std::to_string(chunk.length) + " bytes"};
    }

    bytes_received_ += res.value().size();
    return res;
}

auto service_transport::get_statistics() const -> transport_statistics {
    transport_statistics stats;
    stats.bytes_sent = bytes_sent_.load();
    stats.bytes_received = bytes_received_.load();
    stats.calls = calls_.load();
    stats.errors = errors_.load();
    stats.late_responses = late_responses_.load();
    return stats;
}

}  // namespace dx::transfer
