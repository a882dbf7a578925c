/**
 * @file test_local_object_store.cpp
 * @brief Unit tests for the directory-backed object store
 */

#include <gtest/gtest.h>

#include <dx/transfer/core/integrity_verifier.h>
#include <dx/transfer/transport/local_object_store.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace dx::transfer::test {

namespace {

auto to_bytes(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return bytes;
}

auto as_text(const std::vector<std::byte>& bytes) -> std::string {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

}  // namespace

class LocalObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("dx_transfer_test_store_" + std::to_string(std::random_device{}()));
        store_ = local_object_store::create(test_dir_);
        ASSERT_NE(store_, nullptr);
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto open(const std::string& object_id, uint64_t size) -> std::string {
        auto token = store_->open_upload_session(object_id, size);
        EXPECT_TRUE(token.has_value());
        return token.has_value() ? token.value() : std::string{};
    }

    std::filesystem::path test_dir_;
    std::shared_ptr<local_object_store> store_;
    integrity_verifier verifier_;
};

TEST_F(LocalObjectStoreTest, CreateLaysOutDirectories) {
    EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "objects"));
    EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "sessions"));
    EXPECT_EQ(store_->base_path(), test_dir_);
}

TEST_F(LocalObjectStoreTest, UploadOutOfOrderAndClose) {
    auto token = open("project/hello.txt", 11);
    ASSERT_TRUE(store_->session_exists(token));

    auto second = to_bytes("world");
    auto first = to_bytes("hello ");

    auto ack1 = store_->put_chunk(token, 1, second);
    ASSERT_TRUE(ack1.has_value());
    EXPECT_EQ(ack1.value().checksum, verifier_.compute(second));

    auto ack0 = store_->put_chunk(token, 0, first);
    ASSERT_TRUE(ack0.has_value());

    auto combined = verifier_.combine({ack0.value().checksum, ack1.value().checksum});
    ASSERT_TRUE(combined.has_value());

    auto session_sum = store_->query_session_checksum(token);
    ASSERT_TRUE(session_sum.has_value());
    ASSERT_TRUE(session_sum.value().has_value());
    EXPECT_EQ(*session_sum.value(), combined.value());

    ASSERT_TRUE(store_->close_object(token, combined.value()).has_value());
    EXPECT_TRUE(store_->object_exists("project/hello.txt"));
    EXPECT_FALSE(store_->session_exists(token));

    auto meta = store_->get_object_metadata("project/hello.txt");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta.value().size, 11u);
    EXPECT_EQ(meta.value().chunk_size, 6u);
    ASSERT_EQ(meta.value().chunk_checksums.size(), 2u);
    ASSERT_TRUE(meta.value().whole_checksum.has_value());
    EXPECT_EQ(*meta.value().whole_checksum, combined.value());

    auto tail = store_->get_chunk("project/hello.txt", 1, 6, 5);
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(as_text(tail.value()), "world");
}

TEST_F(LocalObjectStoreTest, RepeatedChunkReplacesPart) {
    auto token = open("project/replace.bin", 4);
    ASSERT_TRUE(store_->put_chunk(token, 0, to_bytes("abXd")).has_value());

    auto replaced = store_->put_chunk(token, 0, to_bytes("abcd"));
    ASSERT_TRUE(replaced.has_value());
    EXPECT_EQ(replaced.value().checksum, verifier_.compute(to_bytes("abcd")));
    ASSERT_TRUE(store_->close_object(token, "").has_value());

    auto data = store_->get_chunk("project/replace.bin", 0, 0, 4);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(as_text(data.value()), "abcd");
}

TEST_F(LocalObjectStoreTest, UnknownSessionIsNotFound) {
    auto data = to_bytes("x");
    auto put = store_->put_chunk("nosuchsession", 0, data);
    ASSERT_FALSE(put.has_value());
    EXPECT_EQ(put.error().kind, error_kind::server_rejected);
    EXPECT_EQ(put.error().status_code, 404);

    EXPECT_FALSE(store_->close_object("nosuchsession", "").has_value());
    EXPECT_FALSE(store_->abort_upload_session("../escape").has_value());
}

TEST_F(LocalObjectStoreTest, CloseWithMissingChunkFails) {
    auto token = open("project/gap.bin", 8);
    ASSERT_TRUE(store_->put_chunk(token, 1, to_bytes("efgh")).has_value());

    auto closed = store_->close_object(token, "");
    ASSERT_FALSE(closed.has_value());
    EXPECT_EQ(closed.error().status_code, 400);
    EXPECT_FALSE(store_->object_exists("project/gap.bin"));
}

TEST_F(LocalObjectStoreTest, CloseWithWrongSizeFails) {
    auto token = open("project/size.bin", 100);
    ASSERT_TRUE(store_->put_chunk(token, 0, to_bytes("short")).has_value());

    auto closed = store_->close_object(token, "");
    ASSERT_FALSE(closed.has_value());
    EXPECT_EQ(closed.error().status_code, 400);
}

TEST_F(LocalObjectStoreTest, CloseWithWrongChecksumFails) {
    auto token = open("project/sum.bin", 4);
    ASSERT_TRUE(store_->put_chunk(token, 0, to_bytes("abcd")).has_value());

    auto closed = store_->close_object(token, "00000000000000000000000000000000-1");
    ASSERT_FALSE(closed.has_value());
    EXPECT_EQ(closed.error().status_code, 422);
    EXPECT_TRUE(store_->session_exists(token));
}

TEST_F(LocalObjectStoreTest, EmptyObject) {
    auto token = open("project/empty.bin", 0);
    ASSERT_TRUE(store_->put_chunk(token, 0, std::span<const std::byte>{}).has_value());
    ASSERT_TRUE(store_->close_object(token, "").has_value());

    auto meta = store_->get_object_metadata("project/empty.bin");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta.value().size, 0u);
    EXPECT_EQ(meta.value().chunk_checksums.size(), 1u);
}

TEST_F(LocalObjectStoreTest, AbortDiscardsSession) {
    auto token = open("project/abort.bin", 4);
    ASSERT_TRUE(store_->put_chunk(token, 0, to_bytes("abcd")).has_value());
    ASSERT_TRUE(store_->abort_upload_session(token).has_value());

    EXPECT_FALSE(store_->session_exists(token));
    EXPECT_FALSE(store_->object_exists("project/abort.bin"));
    EXPECT_EQ(store_->get_statistics().sessions_aborted, 1u);
}

TEST_F(LocalObjectStoreTest, ImportObjectPublishesMetadata) {
    auto src = test_dir_ / "seed.bin";
    {
        std::ofstream out(src, std::ios::binary);
        out << std::string(2500, 'z');
    }

    ASSERT_TRUE(store_->import_object("project/seed.bin", src, 1000).has_value());

    auto meta = store_->get_object_metadata("project/seed.bin");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta.value().size, 2500u);
    EXPECT_EQ(meta.value().chunk_size, 1000u);
    EXPECT_EQ(meta.value().chunk_checksums.size(), 3u);
    ASSERT_TRUE(meta.value().whole_checksum.has_value());
    EXPECT_EQ(*meta.value().whole_checksum,
              verifier_.combine(meta.value().chunk_checksums).value());
}

TEST_F(LocalObjectStoreTest, GetChunkOutOfRange) {
    auto src = test_dir_ / "small.bin";
    {
        std::ofstream out(src, std::ios::binary);
        out << "0123456789";
    }
    ASSERT_TRUE(store_->import_object("small", src, 4).has_value());

    auto bad = store_->get_chunk("small", 3, 8, 4);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().status_code, 416);

    auto missing = store_->get_object_metadata("absent");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().status_code, 404);
}

TEST_F(LocalObjectStoreTest, StatisticsCountOperations) {
    auto token = open("project/stats.bin", 4);
    ASSERT_TRUE(store_->put_chunk(token, 0, to_bytes("abcd")).has_value());
    ASSERT_TRUE(store_->close_object(token, "").has_value());
    ASSERT_TRUE(store_->get_chunk("project/stats.bin", 0, 0, 4).has_value());

    auto stats = store_->get_statistics();
    EXPECT_EQ(stats.sessions_opened, 1u);
    EXPECT_EQ(stats.chunks_put, 1u);
    EXPECT_EQ(stats.objects_closed, 1u);
    EXPECT_EQ(stats.chunks_get, 1u);
}

}  // namespace dx::transfer::test
