/**
 * @file test_checksum.cpp
 * @brief Unit tests for checksum utilities
 */

#include <gtest/gtest.h>

#include <dx/transfer/core/checksum.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace dx::transfer::test {

namespace {

auto to_bytes(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return bytes;
}

}  // namespace

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("dx_transfer_test_checksum_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, const std::vector<std::byte>& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
        return path;
    }

    std::filesystem::path test_dir_;
};

// CRC32 Tests

TEST_F(ChecksumTest, CRC32_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::crc32(empty), 0x00000000u);
}

TEST_F(ChecksumTest, CRC32_KnownValues) {
    // "123456789" -> 0xCBF43926
    EXPECT_EQ(checksum::crc32(to_bytes("123456789")), 0xCBF43926u);
    EXPECT_EQ(checksum::crc32(std::string_view("123456789")), 0xCBF43926u);
}

TEST_F(ChecksumTest, CRC32_Verify) {
    auto data = to_bytes("persisted record");
    auto crc = checksum::crc32(data);
    EXPECT_TRUE(checksum::verify_crc32(data, crc));
    EXPECT_FALSE(checksum::verify_crc32(data, crc ^ 1u));
}

// Content digests

TEST_F(ChecksumTest, MD5_KnownValues) {
    EXPECT_EQ(checksum::hex_digest(checksum_algorithm::md5, to_bytes("")),
              "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(checksum::hex_digest(checksum_algorithm::md5, to_bytes("abc")),
              "900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(ChecksumTest, SHA256_KnownValues) {
    EXPECT_EQ(checksum::hex_digest(checksum_algorithm::sha256, to_bytes("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(checksum::hex_digest(checksum_algorithm::sha256, to_bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, DigestSize) {
    EXPECT_EQ(checksum::digest_size(checksum_algorithm::md5), 16u);
    EXPECT_EQ(checksum::digest_size(checksum_algorithm::sha256), 32u);
    EXPECT_EQ(checksum::digest(checksum_algorithm::md5, to_bytes("x")).size(), 16u);
}

TEST_F(ChecksumTest, DigestBuilderMatchesOneShot) {
    auto whole = to_bytes("The quick brown fox jumps over the lazy dog");
    digest_builder builder(checksum_algorithm::sha256);
    builder.update(std::span<const std::byte>(whole.data(), 10));
    builder.update(std::span<const std::byte>(whole.data() + 10, whole.size() - 10));

    EXPECT_EQ(builder.finish(), checksum::digest(checksum_algorithm::sha256, whole));
}

TEST_F(ChecksumTest, DigestBuilderResetsAfterFinish) {
    digest_builder builder(checksum_algorithm::md5);
    builder.update(to_bytes("first"));
    (void)builder.finish();
    builder.update(to_bytes("abc"));
    EXPECT_EQ(checksum::to_hex(builder.finish()), "900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(ChecksumTest, FileDigestMatchesBufferDigest) {
    std::vector<std::byte> content(300 * 1024);
    std::mt19937 gen(7);
    for (auto& b : content) {
        b = static_cast<std::byte>(gen() & 0xFF);
    }
    auto path = create_test_file("payload.bin", content);

    auto result = checksum::file_digest(checksum_algorithm::md5, path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), checksum::hex_digest(checksum_algorithm::md5, content));
}

TEST_F(ChecksumTest, FileDigestMissingFile) {
    auto result = checksum::file_digest(checksum_algorithm::md5, test_dir_ / "absent.bin");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::file_access_denied);
}

// Hex encoding

TEST_F(ChecksumTest, HexRoundTrip) {
    std::vector<uint8_t> raw = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(checksum::to_hex(raw), "000fa5ff");

    auto decoded = checksum::from_hex("000FA5ff");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, raw);
}

TEST_F(ChecksumTest, FromHexRejectsMalformed) {
    EXPECT_FALSE(checksum::from_hex("abc").has_value());
    EXPECT_FALSE(checksum::from_hex("zz").has_value());
}

TEST_F(ChecksumTest, ParseAlgorithmName) {
    EXPECT_EQ(parse_checksum_algorithm("md5"), checksum_algorithm::md5);
    EXPECT_EQ(parse_checksum_algorithm("SHA256"), checksum_algorithm::sha256);
    EXPECT_FALSE(parse_checksum_algorithm("crc64").has_value());
}

}  // namespace dx::transfer::test
