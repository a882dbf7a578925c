/**
 * @file test_resume.cpp
 * @brief Interrupted transfers resuming from persisted state
 */

#include "test_fixtures.h"

namespace dx::transfer::test {

namespace {

auto reject_chunk(uint64_t failing) -> fault_injecting_service::fault_fn {
    return [failing](uint64_t index, uint32_t) -> std::optional<transport_error> {
        if (index == failing) {
            return transport_error{error_kind::server_rejected, 403, "forbidden"};
        }
        return std::nullopt;
    };
}

}  // namespace

class ResumeTest : public TransferFixture {};

TEST_F(ResumeTest, UploadResumesAfterFatalChunkFailure) {
    auto source = create_test_file("resume_up.bin", 6 * 4096);
    auto config = fast_config(4096, 1);

    service_->set_put_fault(reject_chunk(3));
    auto first = upload(source, "resume_up.bin", config);

    ASSERT_FALSE(first.succeeded());
    EXPECT_EQ(first.status, job_state::failed);
    ASSERT_TRUE(first.failing_chunk.has_value());
    EXPECT_EQ(*first.failing_chunk, 3u);
    EXPECT_EQ(first.code, error_code::server_rejected);
    EXPECT_EQ(first.last_error, error_kind::server_rejected);
    EXPECT_EQ(first.attempts, 1u);

    auto saved = saved_state(upload_id(source, "resume_up.bin"));
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->completed.size(), 3u);
    EXPECT_FALSE(saved->session_token.empty());
    EXPECT_TRUE(store_->session_exists(saved->session_token));

    service_->set_put_fault(nullptr);
    service_->reset_counters();

    auto second = upload(source, "resume_up.bin", config);
    ASSERT_TRUE(second.succeeded()) << second.message;

    // Same session, only the missing chunks sent
    EXPECT_EQ(service_->open_calls(), 0);
    for (uint64_t i = 0; i < 3; ++i) {
        EXPECT_EQ(service_->put_calls(i), 0u) << i;
    }
    for (uint64_t i = 3; i < 6; ++i) {
        EXPECT_EQ(service_->put_calls(i), 1u) << i;
    }
    EXPECT_EQ(second.bytes_transferred, 3u * 4096);
    EXPECT_EQ(object_data("resume_up.bin"), read_file(source));
    EXPECT_FALSE(saved_state(upload_id(source, "resume_up.bin")).has_value());
}

TEST_F(ResumeTest, CancelledUploadResumesRemainingChunks) {
    auto source = create_test_file("cancel_up.bin", 5 * 4096);
    auto config = fast_config(4096, 1);

    cancellation_token token;
    service_->set_on_put([&token](uint64_t index) {
        if (index == 1) {
            token.cancel();
        }
    });

    auto job = upload_job(source, "cancel_up.bin", config);
    auto first = job->run(token);

    EXPECT_EQ(first.status, job_state::cancelled);
    EXPECT_EQ(first.code, error_code::cancelled);
    EXPECT_EQ(first.last_error, error_kind::cancelled);
    EXPECT_FALSE(first.failing_chunk.has_value());
    EXPECT_EQ(job->state(), job_state::cancelled);

    auto saved = saved_state(upload_id(source, "cancel_up.bin"));
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->completed.size(), 2u);

    service_->set_on_put(nullptr);
    service_->reset_counters();

    auto second = upload(source, "cancel_up.bin", config);
    ASSERT_TRUE(second.succeeded()) << second.message;
    EXPECT_EQ(service_->total_put_calls(), 3u);
    EXPECT_EQ(object_data("cancel_up.bin"), read_file(source));
}

TEST_F(ResumeTest, DownloadResumesIntoPartFile) {
    auto source = create_test_file("resume_down.bin", 5 * 4096 + 100);
    seed_object("resume_down.bin", source, 4096);
    auto target = download_dir_ / "resume_down.bin";
    auto config = fast_config(4096, 1);

    service_->set_get_fault(reject_chunk(2));
    auto first = download("resume_down.bin", target, config);

    ASSERT_FALSE(first.succeeded());
    ASSERT_TRUE(first.failing_chunk.has_value());
    EXPECT_EQ(*first.failing_chunk, 2u);
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_TRUE(std::filesystem::exists(target.string() + ".part"));

    auto saved = saved_state(download_id("resume_down.bin", target));
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->completed.size(), 2u);
    EXPECT_TRUE(saved->session_token.empty());

    service_->set_get_fault(nullptr);
    service_->reset_counters();

    auto second = download("resume_down.bin", target, config);
    ASSERT_TRUE(second.succeeded()) << second.message;
    EXPECT_EQ(service_->get_calls(0), 0u);
    EXPECT_EQ(service_->get_calls(1), 0u);
    EXPECT_EQ(service_->total_get_calls(), 4u);
    EXPECT_TRUE(files_equal(source, target));
    EXPECT_FALSE(std::filesystem::exists(target.string() + ".part"));
}

TEST_F(ResumeTest, ChangedSourceStartsFresh) {
    auto source = create_test_file("drift.bin", 5 * 4096);
    auto config = fast_config(4096, 1);

    service_->set_put_fault(reject_chunk(2));
    ASSERT_FALSE(upload(source, "drift.bin", config).succeeded());
    auto stale = saved_state(upload_id(source, "drift.bin"));
    ASSERT_TRUE(stale.has_value());

    // Same path, different size
    create_test_file("drift.bin", 7 * 4096, 7);
    service_->set_put_fault(nullptr);
    service_->reset_counters();

    auto second = upload(source, "drift.bin", config);
    ASSERT_TRUE(second.succeeded()) << second.message;

    EXPECT_EQ(service_->abort_calls(), 1);
    EXPECT_FALSE(store_->session_exists(stale->session_token));
    EXPECT_EQ(service_->open_calls(), 1);
    EXPECT_EQ(service_->total_put_calls(), 7u);
    EXPECT_EQ(object_data("drift.bin"), read_file(source));
}

TEST_F(ResumeTest, ChangedChunkSizeStartsFresh) {
    auto source = create_test_file("rechunk.bin", 8 * 1024);

    service_->set_put_fault(reject_chunk(1));
    ASSERT_FALSE(upload(source, "rechunk.bin", fast_config(2048, 1)).succeeded());

    service_->set_put_fault(nullptr);
    service_->reset_counters();

    auto second = upload(source, "rechunk.bin", fast_config(4096, 1));
    ASSERT_TRUE(second.succeeded()) << second.message;
    EXPECT_EQ(service_->abort_calls(), 1);
    EXPECT_EQ(service_->total_put_calls(), 2u);
    EXPECT_EQ(object_data("rechunk.bin"), read_file(source));
}

TEST_F(ResumeTest, CorruptStateFileFailsJob) {
    auto source = create_test_file("corrupt_state.bin", 4096);
    auto id = upload_id(source, "corrupt_state.bin");

    state_store states{state_store_config(state_dir_)};
    auto path = states.record_path(id);
    std::filesystem::create_directories(path.parent_path());
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "not a transfer state record";
    }

    auto outcome = upload(source, "corrupt_state.bin", fast_config(4096));
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.code, error_code::state_corruption);
    EXPECT_EQ(outcome.last_error, error_kind::state_corruption);
    EXPECT_EQ(service_->open_calls(), 0);

    // The corrupt record is left for inspection
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(read_file(path), "not a transfer state record");
}

TEST_F(ResumeTest, MissingPartFileRestartsDownload) {
    auto source = create_test_file("lost_part.bin", 4 * 4096);
    seed_object("lost_part.bin", source, 4096);
    auto target = download_dir_ / "lost_part.bin";
    auto config = fast_config(4096, 1);

    service_->set_get_fault(reject_chunk(2));
    ASSERT_FALSE(download("lost_part.bin", target, config).succeeded());
    ASSERT_TRUE(std::filesystem::remove(target.string() + ".part"));

    service_->set_get_fault(nullptr);
    service_->reset_counters();

    auto second = download("lost_part.bin", target, config);
    ASSERT_TRUE(second.succeeded()) << second.message;
    EXPECT_EQ(service_->total_get_calls(), 4u);
    EXPECT_TRUE(files_equal(source, target));
}

TEST_F(ResumeTest, ExplicitJobIdSharesStateAcrossEndpoints) {
    auto source = create_test_file("explicit.bin", 4 * 4096);
    auto config = fast_config(4096, 1);
    config.id = job_id::generate();

    service_->set_put_fault(reject_chunk(2));
    cancellation_token token;
    auto first = std::make_unique<transfer_orchestrator>(
        context(), *config.id, transfer_endpoint::local(source),
        transfer_endpoint::remote("explicit.bin"), config)->run(token);
    ASSERT_FALSE(first.succeeded());

    auto saved = saved_state(*config.id);
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->id, *config.id);
    EXPECT_EQ(saved->object_id, "explicit.bin");
    EXPECT_EQ(saved->direction, transfer_direction::upload);
    EXPECT_EQ(saved->total_size, 4u * 4096);
    EXPECT_EQ(saved->chunk_size, 4096u);
}

TEST_F(ResumeTest, ResumeResendsChunksCorruptedInEarlierRun) {
    auto source = create_test_file("stale_good.bin", 3 * 4096);
    auto config = fast_config(4096, 1);

    // Every copy of chunk 1 is damaged behind a correct-looking ack
    service_->set_silent_corrupt_put([](uint64_t index, uint32_t) { return index == 1; });
    auto first = upload(source, "stale_good.bin", config);
    ASSERT_FALSE(first.succeeded());
    EXPECT_EQ(first.code, error_code::whole_checksum_mismatch);

    auto saved = saved_state(upload_id(source, "stale_good.bin"));
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->completed.size(), 3u);

    service_->set_silent_corrupt_put(nullptr);
    service_->reset_counters();

    auto second = upload(source, "stale_good.bin", config);
    ASSERT_TRUE(second.succeeded()) << second.message;
    EXPECT_EQ(service_->open_calls(), 0);
    for (uint64_t i = 0; i < 3; ++i) {
        EXPECT_EQ(service_->put_calls(i), 1u) << i;
    }
    EXPECT_EQ(service_->close_calls(), 1);
    EXPECT_EQ(object_data("stale_good.bin"), read_file(source));
    EXPECT_FALSE(saved_state(upload_id(source, "stale_good.bin")).has_value());
}

}  // namespace dx::transfer::test
