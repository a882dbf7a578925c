/**
 * @file integrity_verifier.cpp
 * @brief Implementation of checksum validation
 */

#include <dx/transfer/core/integrity_verifier.h>

#include <dx/transfer/core/logging.h>

#include <cctype>

namespace dx::transfer {

namespace {

auto strip_quotes(std::string_view s) -> std::string_view {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

}  // namespace

integrity_verifier::integrity_verifier(checksum_algorithm alg) : alg_(alg) {}

auto integrity_verifier::compute(std::span<const std::byte> data) const -> std::string {
    return checksum::hex_digest(alg_, data);
}

auto integrity_verifier::same_digest(std::string_view a, std::string_view b) -> bool {
    a = strip_quotes(a);
    b = strip_quotes(b);
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

auto integrity_verifier::verify_chunk(const chunk_descriptor& chunk,
                                      std::string_view actual,
                                      std::string_view expected) const -> result<void> {
    if (same_digest(actual, expected)) {
        return {};
    }

    DXT_LOG_WARN(log_category::verifier,
                 "chunk " + std::to_string(chunk.index) + " checksum mismatch: expected " +
                     std::string(expected) + ", got " + std::string(actual));
    return unexpected(error{error_code::checksum_mismatch,
                            "chunk " + std::to_string(chunk.index) + " checksum mismatch"});
}

auto integrity_verifier::combine(const std::vector<std::string>& chunk_digests) const
    -> result<std::string> {
    digest_builder builder(alg_);

    for (std::size_t i = 0; i < chunk_digests.size(); ++i) {
        auto raw = checksum::from_hex(strip_quotes(chunk_digests[i]));
        if (!raw) {
            return unexpected(error{error_code::checksum_mismatch,
                                    "chunk " + std::to_string(i) + " digest is not hex"});
        }
        builder.update(std::span<const uint8_t>(raw->data(), raw->size()));
    }

    auto combined = builder.finish();
    return checksum::to_hex(combined) + "-" + std::to_string(chunk_digests.size());
}

auto integrity_verifier::verify_whole_object(std::string_view local,
                                             std::string_view remote) const -> result<void> {
    if (same_digest(local, remote)) {
        DXT_LOG_DEBUG(log_category::verifier, "whole-object checksum verified");
        return {};
    }

    DXT_LOG_ERROR(log_category::verifier,
                  "whole-object checksum mismatch: local " + std::string(local) +
                      ", remote " + std::string(remote));
    return unexpected(error{error_code::whole_checksum_mismatch,
                            "whole-object checksum mismatch"});
}

}  // namespace dx::transfer
