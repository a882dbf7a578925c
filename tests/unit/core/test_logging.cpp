/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and masking
 */

#include <gtest/gtest.h>

#include <dx/transfer/core/logging.h>

#include <string>
#include <vector>

namespace dx::transfer::test {

// masking_config

class MaskingConfigTest : public ::testing::Test {};

TEST_F(MaskingConfigTest, DefaultConfig) {
    masking_config config;
    EXPECT_TRUE(config.mask_tokens);
    EXPECT_FALSE(config.mask_paths);
    EXPECT_EQ(config.mask_char, '*');
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();
    EXPECT_TRUE(config.mask_tokens);
    EXPECT_TRUE(config.mask_paths);
}

TEST_F(MaskingConfigTest, NoneConfig) {
    auto config = masking_config::none();
    EXPECT_FALSE(config.mask_tokens);
    EXPECT_FALSE(config.mask_paths);
}

// sensitive_info_masker

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, MasksSessionToken) {
    sensitive_info_masker masker;
    EXPECT_EQ(masker.mask_token("abcdef123456"), "abcd********");
}

TEST_F(SensitiveInfoMaskerTest, ShortTokenKeepsAtMostHalf) {
    sensitive_info_masker masker;
    EXPECT_EQ(masker.mask_token("abcdef"), "abc***");
}

TEST_F(SensitiveInfoMaskerTest, MasksTokensInText) {
    sensitive_info_masker masker;
    auto masked = masker.mask("opened session token=abcdef123456 for upload");
    EXPECT_EQ(masked, "opened session token=abcd******** for upload");
}

TEST_F(SensitiveInfoMaskerTest, MasksQuotedTokenCaseInsensitive) {
    sensitive_info_masker masker;
    auto masked = masker.mask(R"({"Session_Token": "zyxw987654"})");
    EXPECT_EQ(masked.find("987654"), std::string::npos);
    EXPECT_NE(masked.find("zyxw"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, TokensLeftAloneWhenDisabled) {
    sensitive_info_masker masker(masking_config::none());
    EXPECT_EQ(masker.mask("token=abcdef123456"), "token=abcdef123456");
}

TEST_F(SensitiveInfoMaskerTest, PathsNotMaskedByDefault) {
    sensitive_info_masker masker;
    EXPECT_EQ(masker.mask_path("/home/user/data/reads.bam"), "/home/user/data/reads.bam");
}

TEST_F(SensitiveInfoMaskerTest, MaskFilePathKeepsFilename) {
    sensitive_info_masker masker(masking_config::all_masked());
    EXPECT_EQ(masker.mask_path("/home/user/data/reads.bam"), "***************/reads.bam");
}

TEST_F(SensitiveInfoMaskerTest, MaskPathsInText) {
    sensitive_info_masker masker(masking_config::all_masked());
    auto masked = masker.mask("cannot open /srv/incoming/sample.fastq for reading");
    EXPECT_EQ(masked.find("/srv/incoming"), std::string::npos);
    EXPECT_NE(masked.find("/sample.fastq"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, EmptyInput) {
    sensitive_info_masker masker(masking_config::all_masked());
    EXPECT_EQ(masker.mask(""), "");
    EXPECT_EQ(masker.mask_token(""), "");
}

TEST_F(SensitiveInfoMaskerTest, UpdateConfig) {
    sensitive_info_masker masker;
    masker.set_config(masking_config::none());
    EXPECT_FALSE(masker.get_config().mask_tokens);
}

// transfer_log_context

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContextToJson) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, BasicFieldsToJson) {
    transfer_log_context ctx;
    ctx.job_id = "0123abcd";
    ctx.direction = "upload";
    ctx.chunk_index = 7;

    auto json = ctx.to_json();
    EXPECT_EQ(json, R"({"job_id":"0123abcd","direction":"upload","chunk_index":7})");
}

TEST_F(TransferLogContextTest, AllFieldsToJson) {
    transfer_log_context ctx;
    ctx.job_id = "job";
    ctx.direction = "download";
    ctx.object_id = "project/reads.bam";
    ctx.local_path = "/data/reads.bam";
    ctx.session_token = "secret-token";
    ctx.total_size = 1000;
    ctx.bytes_done = 500;
    ctx.chunk_index = 3;
    ctx.total_chunks = 10;
    ctx.attempt = 2;
    ctx.error_kind = "timeout";
    ctx.rate_mbps = 12.5;
    ctx.duration_ms = 1500;
    ctx.error_message = "deadline exceeded";

    auto json = ctx.to_json();
    EXPECT_NE(json.find(R"("object_id":"project/reads.bam")"), std::string::npos);
    EXPECT_NE(json.find(R"("session_token":"secret-token")"), std::string::npos);
    EXPECT_NE(json.find(R"("bytes_done":500)"), std::string::npos);
    EXPECT_NE(json.find(R"("attempt":2)"), std::string::npos);
    EXPECT_NE(json.find(R"("error_kind":"timeout")"), std::string::npos);
    EXPECT_NE(json.find(R"("rate_mbps":12.50)"), std::string::npos);
    EXPECT_NE(json.find(R"("duration_ms":1500)"), std::string::npos);
}

TEST_F(TransferLogContextTest, JsonWithMaskingHidesSessionToken) {
    transfer_log_context ctx;
    ctx.session_token = "abcdef123456";

    sensitive_info_masker masker;
    auto json = ctx.to_json_with_masking(&masker);
    EXPECT_EQ(json, R"({"session_token":"abcd********"})");
}

TEST_F(TransferLogContextTest, JsonEscaping) {
    transfer_log_context ctx;
    ctx.error_message = "line1\nline2 \"quoted\"";

    auto json = ctx.to_json();
    EXPECT_NE(json.find(R"(line1\nline2 \"quoted\")"), std::string::npos);
}

// structured_log_entry

class StructuredLogEntryTest : public ::testing::Test {};

TEST_F(StructuredLogEntryTest, EntryWithContextIsFlattened) {
    structured_log_entry entry;
    entry.timestamp = "2026-01-01T00:00:00.000Z";
    entry.level = log_level::warn;
    entry.category = std::string(log_category::retry);
    entry.message = "chunk attempt failed";
    transfer_log_context ctx;
    ctx.chunk_index = 4;
    entry.context = ctx;

    EXPECT_EQ(entry.to_json(),
              R"({"timestamp":"2026-01-01T00:00:00.000Z","level":"WARN",)"
              R"("category":"dx_transfer.retry","message":"chunk attempt failed",)"
              R"("chunk_index":4})");
}

TEST_F(StructuredLogEntryTest, EntryWithSourceLocation) {
    structured_log_entry entry;
    entry.message = "m";
    entry.source_file = "worker_pool.cpp";
    entry.source_line = 42;
    entry.function_name = "run";

    auto json = entry.to_json();
    EXPECT_NE(json.find(R"("source":{"file":"worker_pool.cpp","line":42,"function":"run"})"),
              std::string::npos);
}

TEST_F(StructuredLogEntryTest, MessageIsMasked) {
    structured_log_entry entry;
    entry.message = "refresh failed for token=abcdef123456";

    sensitive_info_masker masker;
    auto json = entry.to_json_with_masking(&masker);
    EXPECT_EQ(json.find("123456"), std::string::npos);
}

TEST_F(StructuredLogEntryTest, StampedEntryCarriesUtcTimestamp) {
    auto entry = structured_log_entry::stamped(log_level::error, log_category::orchestrator,
                                               "chunk failed");
    EXPECT_EQ(entry.level, log_level::error);
    EXPECT_EQ(entry.category, "dx_transfer.orchestrator");
    EXPECT_EQ(entry.message, "chunk failed");
    EXPECT_FALSE(entry.context.has_value());

    // 2026-01-01T00:00:00.000Z
    ASSERT_EQ(entry.timestamp.size(), 24u);
    EXPECT_EQ(entry.timestamp[10], 'T');
    EXPECT_EQ(entry.timestamp[19], '.');
    EXPECT_EQ(entry.timestamp.back(), 'Z');
}

TEST_F(StructuredLogEntryTest, NestedSourceObjectIsEscaped) {
    structured_log_entry entry;
    entry.message = "m";
    entry.source_file = "C:\\src\\pool.cpp";

    auto json = entry.to_json();
    EXPECT_NE(json.find(R"("source":{"file":"C:\\src\\pool.cpp"})"), std::string::npos);
}

// log levels

TEST(LogLevelTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::debug), "DEBUG");
    EXPECT_EQ(log_level_to_string(log_level::info), "INFO");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::error), "ERROR");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

// transfer_logger

class TransferLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = get_logger();
        saved_level_ = logger.get_level();
        logger.set_console_output(false);
        logger.set_level(log_level::trace);
    }

    void TearDown() override {
        auto& logger = get_logger();
        logger.set_callback(nullptr);
        logger.set_json_callback(nullptr);
        logger.set_output_format(log_output_format::text);
        logger.set_masking_config(masking_config{});
        logger.set_level(saved_level_);
        logger.set_console_output(true);
    }

    log_level saved_level_ = log_level::info;
};

TEST_F(TransferLoggerTest, CallbackReceivesCategoryAndContext) {
    std::vector<std::string> categories;
    std::vector<uint64_t> chunks;
    get_logger().set_callback([&](log_level, std::string_view category, std::string_view,
                                  const transfer_log_context* ctx) {
        categories.emplace_back(category);
        if (ctx && ctx->chunk_index) {
            chunks.push_back(*ctx->chunk_index);
        }
    });

    transfer_log_context ctx;
    ctx.chunk_index = 9;
    DXT_LOG_WARN_CTX(log_category::retry, "attempt failed", ctx);
    DXT_LOG_INFO(log_category::engine, "started");

    ASSERT_EQ(categories.size(), 2u);
    EXPECT_EQ(categories[0], "dx_transfer.retry");
    EXPECT_EQ(categories[1], "dx_transfer.engine");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], 9u);
}

TEST_F(TransferLoggerTest, LogLevelFiltering) {
    int calls = 0;
    get_logger().set_callback(
        [&](log_level, std::string_view, std::string_view, const transfer_log_context*) {
            ++calls;
        });
    get_logger().set_level(log_level::warn);

    DXT_LOG_DEBUG(log_category::pool, "hidden");
    DXT_LOG_INFO(log_category::pool, "hidden");
    DXT_LOG_WARN(log_category::pool, "shown");
    DXT_LOG_ERROR(log_category::pool, "shown");

    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::fatal));
}

TEST_F(TransferLoggerTest, JsonCallbackSeesMaskedOutput) {
    std::string captured;
    get_logger().set_output_format(log_output_format::json);
    get_logger().set_json_callback(
        [&](const structured_log_entry&, const std::string& json) { captured = json; });

    transfer_log_context ctx;
    ctx.session_token = "abcdef123456";
    DXT_LOG_INFO_CTX(log_category::orchestrator, "session opened", ctx);

    EXPECT_NE(captured.find(R"("level":"INFO")"), std::string::npos);
    EXPECT_NE(captured.find(R"("session_token":"abcd********")"), std::string::npos);
    EXPECT_EQ(captured.find("123456"), std::string::npos);
}

TEST_F(TransferLoggerTest, OutputFormatRoundTrips) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);
    get_logger().set_output_format(log_output_format::text);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(TransferLoggerTest, InitializeIsIdempotent) {
    get_logger().initialize();
    get_logger().initialize();
    EXPECT_TRUE(get_logger().is_initialized());
}

}  // namespace dx::transfer::test
