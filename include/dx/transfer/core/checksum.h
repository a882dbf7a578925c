/**
 * @file checksum.h
 * @brief Digest utilities for chunk and record integrity
 */

#ifndef DX_TRANSFER_CORE_CHECKSUM_H
#define DX_TRANSFER_CORE_CHECKSUM_H

#include <dx/transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dx::transfer {

/**
 * @brief Content digest used for chunk checksums
 */
enum class checksum_algorithm : uint8_t {
    md5,     ///< Object-store ETag compatible
    sha256,
};

[[nodiscard]] constexpr auto to_string(checksum_algorithm alg) -> const char* {
    switch (alg) {
        case checksum_algorithm::md5: return "md5";
        case checksum_algorithm::sha256: return "sha256";
        default: return "unknown";
    }
}

[[nodiscard]] auto parse_checksum_algorithm(std::string_view name)
    -> std::optional<checksum_algorithm>;

/**
 * @brief Checksum utilities
 *
 * Provides static methods for:
 * - CRC32 for persisted record integrity
 * - MD5 / SHA-256 (OpenSSL EVP) for chunk content digests
 * - hex encoding of raw digests
 */
class checksum {
public:
    /**
     * @brief Calculate CRC32 checksum of data
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> uint32_t;

    [[nodiscard]] static auto crc32(std::string_view text) -> uint32_t;

    [[nodiscard]] static auto verify_crc32(
        std::span<const std::byte> data, uint32_t expected) -> bool;

    /**
     * @brief Raw digest of data
     */
    [[nodiscard]] static auto digest(checksum_algorithm alg, std::span<const std::byte> data)
        -> std::vector<uint8_t>;

    /**
     * @brief Lowercase hex digest of data
     */
    [[nodiscard]] static auto hex_digest(checksum_algorithm alg,
                                         std::span<const std::byte> data) -> std::string;

    /**
     * @brief Lowercase hex digest of a file, streamed
     */
    [[nodiscard]] static auto file_digest(checksum_algorithm alg,
                                          const std::filesystem::path& path)
        -> result<std::string>;

    [[nodiscard]] static auto digest_size(checksum_algorithm alg) -> std::size_t;

    [[nodiscard]] static auto to_hex(std::span<const uint8_t> bytes) -> std::string;

    /**
     * @brief Decode a hex string
     * @return Raw bytes, or nullopt on odd length or a non-hex character
     */
    [[nodiscard]] static auto from_hex(std::string_view hex)
        -> std::optional<std::vector<uint8_t>>;
};

/**
 * @brief Incremental digest over several buffers
 */
class digest_builder {
public:
    explicit digest_builder(checksum_algorithm alg);
    ~digest_builder();

    digest_builder(const digest_builder&) = delete;
    auto operator=(const digest_builder&) -> digest_builder& = delete;
    digest_builder(digest_builder&&) noexcept;
    auto operator=(digest_builder&&) noexcept -> digest_builder&;

    void update(std::span<const std::byte> data);
    void update(std::span<const uint8_t> data);

    /**
     * @brief Finish and return the raw digest; the builder is reset
     */
    [[nodiscard]] auto finish() -> std::vector<uint8_t>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_CORE_CHECKSUM_H
