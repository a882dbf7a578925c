/**
 * @file test_integrity_verifier.cpp
 * @brief Unit tests for chunk and whole-object checksum validation
 */

#include <gtest/gtest.h>

#include <dx/transfer/core/integrity_verifier.h>

#include <cstring>
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

auto chunk_at(uint64_t index) -> chunk_descriptor {
    chunk_descriptor c;
    c.index = index;
    c.offset = index * 10;
    c.length = 10;
    return c;
}

}  // namespace

TEST(IntegrityVerifierTest, ComputeMatchesChecksumHexDigest) {
    integrity_verifier verifier;
    auto data = to_bytes("a");
    EXPECT_EQ(verifier.algorithm(), checksum_algorithm::md5);
    EXPECT_EQ(verifier.compute(data), "0cc175b9c0f1b6a831c399e269772661");
}

TEST(IntegrityVerifierTest, Sha256Compute) {
    integrity_verifier verifier(checksum_algorithm::sha256);
    auto data = to_bytes("abc");
    EXPECT_EQ(verifier.compute(data),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(IntegrityVerifierTest, VerifyChunkAcceptsEqualDigests) {
    integrity_verifier verifier;
    auto sum = verifier.compute(to_bytes("chunk"));
    EXPECT_TRUE(verifier.verify_chunk(chunk_at(0), sum, sum).has_value());
}

TEST(IntegrityVerifierTest, VerifyChunkIgnoresCaseAndQuotes) {
    integrity_verifier verifier;
    EXPECT_TRUE(verifier
                    .verify_chunk(chunk_at(1), "0cc175b9c0f1b6a831c399e269772661",
                                  "\"0CC175B9C0F1B6A831C399E269772661\"")
                    .has_value());
}

TEST(IntegrityVerifierTest, VerifyChunkReportsMismatch) {
    integrity_verifier verifier;
    auto result = verifier.verify_chunk(chunk_at(4), "aaaa", "bbbb");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::checksum_mismatch);
    EXPECT_NE(result.error().message.find("4"), std::string::npos);
}

TEST(IntegrityVerifierTest, SameDigestRequiresEqualLength) {
    EXPECT_FALSE(integrity_verifier::same_digest("abc", "abcd"));
    EXPECT_TRUE(integrity_verifier::same_digest("", ""));
    EXPECT_TRUE(integrity_verifier::same_digest("\"AbC\"", "abc"));
}

TEST(IntegrityVerifierTest, CombineIsDigestOfConcatenatedRawDigests) {
    integrity_verifier verifier;
    auto d0 = verifier.compute(to_bytes("first"));
    auto d1 = verifier.compute(to_bytes("second"));

    auto raw0 = checksum::digest(checksum_algorithm::md5, to_bytes("first"));
    auto raw1 = checksum::digest(checksum_algorithm::md5, to_bytes("second"));
    std::vector<std::byte> concat;
    for (auto b : raw0) {
        concat.push_back(static_cast<std::byte>(b));
    }
    for (auto b : raw1) {
        concat.push_back(static_cast<std::byte>(b));
    }
    auto expected =
        checksum::to_hex(checksum::digest(checksum_algorithm::md5, concat)) + "-2";

    auto combined = verifier.combine({d0, d1});
    ASSERT_TRUE(combined.has_value());
    EXPECT_EQ(combined.value(), expected);
}

TEST(IntegrityVerifierTest, CombineDependsOnOrder) {
    integrity_verifier verifier;
    auto d0 = verifier.compute(to_bytes("first"));
    auto d1 = verifier.compute(to_bytes("second"));

    auto forward = verifier.combine({d0, d1});
    auto backward = verifier.combine({d1, d0});
    ASSERT_TRUE(forward.has_value());
    ASSERT_TRUE(backward.has_value());
    EXPECT_NE(forward.value(), backward.value());
}

TEST(IntegrityVerifierTest, CombineSingleChunkHasCountSuffix) {
    integrity_verifier verifier;
    auto combined = verifier.combine({verifier.compute(to_bytes("only"))});
    ASSERT_TRUE(combined.has_value());
    EXPECT_EQ(combined.value().substr(combined.value().size() - 2), "-1");
    EXPECT_EQ(combined.value().size(), 32u + 2u);
}

TEST(IntegrityVerifierTest, CombineRejectsNonHexDigest) {
    integrity_verifier verifier;
    auto combined = verifier.combine({"0cc175b9c0f1b6a831c399e269772661", "not-hex!"});
    ASSERT_FALSE(combined.has_value());
    EXPECT_EQ(combined.error().code, error_code::checksum_mismatch);
}

TEST(IntegrityVerifierTest, WholeObjectMatch) {
    integrity_verifier verifier;
    EXPECT_TRUE(verifier.verify_whole_object("ABCDEF-3", "abcdef-3").has_value());
}

TEST(IntegrityVerifierTest, WholeObjectMismatch) {
    integrity_verifier verifier;
    auto result = verifier.verify_whole_object("abcdef-3", "abcdef-4");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::whole_checksum_mismatch);
}

}  // namespace dx::transfer::test
