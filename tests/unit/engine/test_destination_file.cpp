/**
 * @file test_destination_file.cpp
 * @brief Unit tests for the download part file
 */

#include <gtest/gtest.h>

#include <dx/transfer/engine/destination_file.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <thread>
#include <vector>

namespace dx::transfer::test {

namespace {

auto filled(std::size_t size, char value) -> std::vector<std::byte> {
    return std::vector<std::byte>(size, static_cast<std::byte>(value));
}

}  // namespace

class DestinationFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("dx_transfer_test_dest_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        part_ = test_dir_ / "out.bin.part";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream file(path, std::ios::binary);
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }

    std::filesystem::path test_dir_;
    std::filesystem::path part_;
};

TEST_F(DestinationFileTest, OpenSizesFile) {
    auto file = destination_file::open(part_, 4096, true);
    ASSERT_TRUE(file.has_value()) << file.error().message;
    EXPECT_TRUE(file.value()->is_open());
    EXPECT_EQ(file.value()->path(), part_);
    EXPECT_EQ(std::filesystem::file_size(part_), 4096u);
}

TEST_F(DestinationFileTest, WritesLandAtTheirOffsets) {
    auto file = destination_file::open(part_, 9, true);
    ASSERT_TRUE(file.has_value());
    auto& f = *file.value();

    ASSERT_TRUE(f.write_at(6, filled(3, 'c')).has_value());
    ASSERT_TRUE(f.write_at(0, filled(3, 'a')).has_value());
    ASSERT_TRUE(f.write_at(3, filled(3, 'b')).has_value());

    auto back = f.read_at(3, 3);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back.value(), filled(3, 'b'));

    auto final_path = test_dir_ / "out.bin";
    ASSERT_TRUE(f.commit(final_path).has_value());
    EXPECT_FALSE(f.is_open());
    EXPECT_FALSE(std::filesystem::exists(part_));
    EXPECT_EQ(read_file(final_path), "aaabbbccc");
}

TEST_F(DestinationFileTest, ReopenWithoutTruncateKeepsContent) {
    {
        auto file = destination_file::open(part_, 4, true);
        ASSERT_TRUE(file.has_value());
        ASSERT_TRUE(file.value()->write_at(0, filled(2, 'x')).has_value());
    }

    auto file = destination_file::open(part_, 4, false);
    ASSERT_TRUE(file.has_value());
    auto back = file.value()->read_at(0, 2);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back.value(), filled(2, 'x'));
}

TEST_F(DestinationFileTest, ReopenWithTruncateDiscardsContent) {
    {
        auto file = destination_file::open(part_, 4, true);
        ASSERT_TRUE(file.has_value());
        ASSERT_TRUE(file.value()->write_at(0, filled(4, 'x')).has_value());
    }

    auto file = destination_file::open(part_, 4, true);
    ASSERT_TRUE(file.has_value());
    auto back = file.value()->read_at(0, 4);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back.value(), filled(4, '\0'));
}

TEST_F(DestinationFileTest, ReadPastEndFails) {
    auto file = destination_file::open(part_, 4, true);
    ASSERT_TRUE(file.has_value());
    auto back = file.value()->read_at(2, 10);
    ASSERT_FALSE(back.has_value());
    EXPECT_EQ(back.error().code, error_code::file_read_error);
}

TEST_F(DestinationFileTest, OpenInMissingDirectoryFails) {
    auto file = destination_file::open(test_dir_ / "absent" / "x.part", 4, true);
    ASSERT_FALSE(file.has_value());
    EXPECT_EQ(file.error().code, error_code::file_write_error);
}

TEST_F(DestinationFileTest, DiscardRemovesPartFile) {
    auto file = destination_file::open(part_, 4, true);
    ASSERT_TRUE(file.has_value());
    file.value()->discard();

    EXPECT_FALSE(file.value()->is_open());
    EXPECT_FALSE(std::filesystem::exists(part_));
    EXPECT_FALSE(file.value()->write_at(0, filled(1, 'x')).has_value());
}

TEST_F(DestinationFileTest, EmptyObject) {
    auto file = destination_file::open(part_, 0, true);
    ASSERT_TRUE(file.has_value());
    ASSERT_TRUE(file.value()->write_at(0, {}).has_value());

    auto final_path = test_dir_ / "empty.bin";
    ASSERT_TRUE(file.value()->commit(final_path).has_value());
    EXPECT_EQ(std::filesystem::file_size(final_path), 0u);
}

TEST_F(DestinationFileTest, ConcurrentDisjointWrites) {
    constexpr std::size_t chunk = 4096;
    constexpr int workers = 8;
    auto file = destination_file::open(part_, chunk * workers, true);
    ASSERT_TRUE(file.has_value());
    auto& f = *file.value();

    std::vector<std::thread> threads;
    for (int w = 0; w < workers; ++w) {
        threads.emplace_back([&f, w] {
            auto data = filled(chunk, static_cast<char>('A' + w));
            EXPECT_TRUE(f.write_at(static_cast<uint64_t>(w) * chunk, data).has_value());
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int w = 0; w < workers; ++w) {
        auto back = f.read_at(static_cast<uint64_t>(w) * chunk, chunk);
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(back.value(), filled(chunk, static_cast<char>('A' + w)));
    }
}

}  // namespace dx::transfer::test
