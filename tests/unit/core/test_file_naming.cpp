/**
 * @file test_file_naming.cpp
 * @brief Unit tests for local file naming helpers
 */

#include <gtest/gtest.h>

#include <dx/transfer/core/file_naming.h>

#include <filesystem>
#include <fstream>
#include <random>

namespace dx::transfer::test {

class FileNamingTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("dx_transfer_test_naming_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path test_dir_;
};

TEST_F(FileNamingTest, PlainNameIsUnchanged) {
    auto name = make_unix_filename("reads.bam");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name.value(), "reads.bam");
}

TEST_F(FileNamingTest, SlashesAreEscaped) {
    auto name = make_unix_filename("a/b");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(name.value(), "a%2Fb");
}

TEST_F(FileNamingTest, ReservedNamesAreRejected) {
    for (auto bad : {"", ".", ".."}) {
        auto name = make_unix_filename(bad);
        ASSERT_FALSE(name.has_value()) << bad;
        EXPECT_EQ(name.error().code, error_code::invalid_file_path);
    }
}

TEST_F(FileNamingTest, EnsureDirectoryCreatesNestedPath) {
    auto dir = test_dir_ / "a" / "b" / "c";
    ASSERT_TRUE(ensure_directory(dir).has_value());
    EXPECT_TRUE(std::filesystem::is_directory(dir));

    // Existing directory is fine
    EXPECT_TRUE(ensure_directory(dir).has_value());
}

TEST_F(FileNamingTest, EnsureDirectoryRejectsExistingFile) {
    auto file = test_dir_ / "plain";
    std::ofstream(file) << "x";

    auto made = ensure_directory(file);
    ASSERT_FALSE(made.has_value());
    EXPECT_EQ(made.error().code, error_code::invalid_file_path);
}

TEST_F(FileNamingTest, DownloadIntoDirectoryUsesObjectBaseName) {
    auto path = resolve_download_path(test_dir_, "project/run1/reads.bam");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path.value(), test_dir_ / "reads.bam");
}

TEST_F(FileNamingTest, DownloadIntoDirectoryWithFlatObjectId) {
    auto path = resolve_download_path(test_dir_, "file-abc123");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path.value(), test_dir_ / "file-abc123");
}

TEST_F(FileNamingTest, DownloadIntoDirectoryRejectsTrailingSlashObject) {
    auto path = resolve_download_path(test_dir_, "project/");
    ASSERT_FALSE(path.has_value());
    EXPECT_EQ(path.error().code, error_code::invalid_file_path);
}

TEST_F(FileNamingTest, DownloadToFilePathCreatesParent) {
    auto target = test_dir_ / "new" / "sub" / "out.bin";
    auto path = resolve_download_path(target, "project/reads.bam");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path.value(), target);
    EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "new" / "sub"));
}

TEST_F(FileNamingTest, DownloadParentThatIsAFileFails) {
    auto blocker = test_dir_ / "blocker";
    std::ofstream(blocker) << "x";

    auto path = resolve_download_path(blocker / "out.bin", "project/reads.bam");
    ASSERT_FALSE(path.has_value());
    EXPECT_EQ(path.error().code, error_code::invalid_file_path);
}

}  // namespace dx::transfer::test
