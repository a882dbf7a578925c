/**
 * @file integrity_verifier.h
 * @brief Per-chunk and whole-object checksum validation
 */

#ifndef DX_TRANSFER_CORE_INTEGRITY_VERIFIER_H
#define DX_TRANSFER_CORE_INTEGRITY_VERIFIER_H

#include <dx/transfer/core/checksum.h>
#include <dx/transfer/core/chunk_types.h>
#include <dx/transfer/core/types.h>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dx::transfer {

/**
 * @brief Computes and validates content checksums
 *
 * The whole-object checksum combines chunk digests in index order:
 *
 *     hex(H(raw(d_0) || raw(d_1) || ... || raw(d_{n-1}))) + "-" + n
 *
 * which is the multipart ETag form most object stores report.
 */
class integrity_verifier {
public:
    explicit integrity_verifier(checksum_algorithm alg = checksum_algorithm::md5);

    [[nodiscard]] auto algorithm() const -> checksum_algorithm { return alg_; }

    /**
     * @brief Hex digest of one chunk's bytes
     */
    [[nodiscard]] auto compute(std::span<const std::byte> data) const -> std::string;

    /**
     * @brief Compare an actual digest with the expected one
     *
     * Comparison ignores hex case and surrounding quotes.
     * @return checksum_mismatch on difference
     */
    [[nodiscard]] auto verify_chunk(const chunk_descriptor& chunk,
                                    std::string_view actual,
                                    std::string_view expected) const -> result<void>;

    /**
     * @brief Combine per-chunk hex digests (index order) into the object checksum
     * @return Combined checksum, or checksum_mismatch if a digest is not valid hex
     */
    [[nodiscard]] auto combine(const std::vector<std::string>& chunk_digests) const
        -> result<std::string>;

    /**
     * @brief Validate a locally combined checksum against the remote's
     * @return whole_checksum_mismatch on difference
     */
    [[nodiscard]] auto verify_whole_object(std::string_view local,
                                           std::string_view remote) const -> result<void>;

    /**
     * @brief Case- and quote-insensitive digest equality
     */
    [[nodiscard]] static auto same_digest(std::string_view a, std::string_view b) -> bool;

private:
    checksum_algorithm alg_;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_CORE_INTEGRITY_VERIFIER_H
