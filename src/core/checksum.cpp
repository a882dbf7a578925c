/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <dx/transfer/core/checksum.h>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

namespace dx::transfer {

namespace {

// CRC32 polynomial (IEEE 802.3)
constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr auto generate_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1) {
                crc = (crc >> 1) ^ CRC32_POLYNOMIAL;
            } else {
                crc >>= 1;
            }
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto CRC32_TABLE = generate_crc32_table();

auto evp_for(checksum_algorithm alg) -> const EVP_MD* {
    switch (alg) {
        case checksum_algorithm::sha256:
            return EVP_sha256();
        case checksum_algorithm::md5:
        default:
            return EVP_md5();
    }
}

constexpr std::size_t FILE_READ_BUFFER = 1024 * 1024;

}  // namespace

auto parse_checksum_algorithm(std::string_view name) -> std::optional<checksum_algorithm> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "md5") {
        return checksum_algorithm::md5;
    }
    if (lower == "sha256" || lower == "sha-256") {
        return checksum_algorithm::sha256;
    }
    return std::nullopt;
}

// ============================================================================
// checksum
// ============================================================================

auto checksum::crc32(std::span<const std::byte> data) -> uint32_t {
    uint32_t crc = 0xFFFFFFFF;

    for (const auto& byte : data) {
        auto index = static_cast<uint8_t>((crc ^ static_cast<uint8_t>(byte)) & 0xFF);
        crc = (crc >> 8) ^ CRC32_TABLE[index];
    }

    return crc ^ 0xFFFFFFFF;
}

auto checksum::crc32(std::string_view text) -> uint32_t {
    return crc32(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

auto checksum::verify_crc32(std::span<const std::byte> data, uint32_t expected) -> bool {
    return crc32(data) == expected;
}

auto checksum::digest(checksum_algorithm alg, std::span<const std::byte> data)
    -> std::vector<uint8_t> {
    digest_builder builder(alg);
    builder.update(data);
    return builder.finish();
}

auto checksum::hex_digest(checksum_algorithm alg, std::span<const std::byte> data)
    -> std::string {
    auto raw = digest(alg, data);
    return to_hex(raw);
}

auto checksum::file_digest(checksum_algorithm alg, const std::filesystem::path& path)
    -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_access_denied, "cannot open file: " + path.string()});
    }

    digest_builder builder(alg);
    std::vector<std::byte> buffer(FILE_READ_BUFFER);

    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        auto n = static_cast<std::size_t>(file.gcount());
        if (n > 0) {
            builder.update(std::span<const std::byte>(buffer.data(), n));
        }
    }

    if (file.bad()) {
        return unexpected(error{error_code::file_read_error, "read failed: " + path.string()});
    }

    auto raw = builder.finish();
    return to_hex(raw);
}

auto checksum::digest_size(checksum_algorithm alg) -> std::size_t {
    return static_cast<std::size_t>(EVP_MD_size(evp_for(alg)));
}

auto checksum::to_hex(std::span<const uint8_t> bytes) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

auto checksum::from_hex(std::string_view hex) -> std::optional<std::vector<uint8_t>> {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

// ============================================================================
// digest_builder
// ============================================================================

struct digest_builder::impl {
    checksum_algorithm alg;
    EVP_MD_CTX* ctx = nullptr;

    explicit impl(checksum_algorithm a) : alg(a), ctx(EVP_MD_CTX_new()) {
        EVP_DigestInit_ex(ctx, evp_for(alg), nullptr);
    }

    ~impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

digest_builder::digest_builder(checksum_algorithm alg) : impl_(std::make_unique<impl>(alg)) {}

digest_builder::~digest_builder() = default;

digest_builder::digest_builder(digest_builder&&) noexcept = default;

auto digest_builder::operator=(digest_builder&&) noexcept -> digest_builder& = default;

void digest_builder::update(std::span<const std::byte> data) {
    if (!data.empty()) {
        EVP_DigestUpdate(impl_->ctx, data.data(), data.size());
    }
}

void digest_builder::update(std::span<const uint8_t> data) {
    if (!data.empty()) {
        EVP_DigestUpdate(impl_->ctx, data.data(), data.size());
    }
}

auto digest_builder::finish() -> std::vector<uint8_t> {
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    EVP_DigestFinal_ex(impl_->ctx, out.data(), &len);
    out.resize(len);

    EVP_DigestInit_ex(impl_->ctx, evp_for(impl_->alg), nullptr);
    return out;
}

}  // namespace dx::transfer
