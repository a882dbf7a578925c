/**
 * @file job_id.cpp
 * @brief job_id generation and UUID text form
 */

#include "dx/transfer/core/chunk_types.h"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>
#include <random>

namespace dx::transfer {

namespace {

constexpr char hex_digits[] = "0123456789abcdef";

void stamp_uuid_bits(job_id& id, uint8_t version) {
    id.bytes[6] = static_cast<uint8_t>((id.bytes[6] & 0x0F) | (version << 4));
    id.bytes[8] = static_cast<uint8_t>((id.bytes[8] & 0x3F) | 0x80);
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

auto dash_before(std::size_t byte) -> bool {
    return byte == 4 || byte == 6 || byte == 8 || byte == 10;
}

}  // namespace

auto job_id::generate() -> job_id {
    job_id id;
    if (RAND_bytes(id.bytes.data(), static_cast<int>(id.bytes.size())) != 1) {
        std::random_device rd;
        for (auto& b : id.bytes) {
            b = static_cast<uint8_t>(rd());
        }
    }
    stamp_uuid_bits(id, 4);
    return id;
}

auto job_id::derive(std::string_view source, std::string_view destination) -> job_id {
    // Name-based id: first 16 bytes of SHA-256(source '\0' destination)
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                 &EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE] = {};
    unsigned int digest_len = 0;
    const char separator = '\0';

    EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx.get(), source.data(), source.size());
    EVP_DigestUpdate(ctx.get(), &separator, 1);
    EVP_DigestUpdate(ctx.get(), destination.data(), destination.size());
    EVP_DigestFinal_ex(ctx.get(), digest, &digest_len);

    job_id id;
    std::copy(digest, digest + id.bytes.size(), id.bytes.begin());
    stamp_uuid_bits(id, 8);
    return id;
}

auto job_id::to_string() const -> std::string {
    std::string text;
    text.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (dash_before(i)) {
            text += '-';
        }
        text += hex_digits[bytes[i] >> 4];
        text += hex_digits[bytes[i] & 0x0F];
    }
    return text;
}

auto job_id::from_string(std::string_view str) -> std::optional<job_id> {
    // Canonical 8-4-4-4-12 form or 32 bare hex digits
    bool dashed = str.size() == 36;
    if (!dashed && str.size() != 32) {
        return std::nullopt;
    }

    job_id id;
    std::size_t pos = 0;
    for (std::size_t i = 0; i < id.bytes.size(); ++i) {
        if (dashed && dash_before(i)) {
            if (str[pos++] != '-') {
                return std::nullopt;
            }
        }
        int hi = hex_value(str[pos++]);
        int lo = hex_value(str[pos++]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        id.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return id;
}

}  // namespace dx::transfer
