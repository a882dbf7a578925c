/**
 * @file test_progress_tracker.cpp
 * @brief Unit tests for the completed-chunk tracker
 */

#include <gtest/gtest.h>

#include <dx/transfer/core/chunk_planner.h>
#include <dx/transfer/core/progress_tracker.h>

#include <thread>
#include <vector>

namespace dx::transfer::test {

class ProgressTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto plan = chunk_planner::plan_fixed(2500, 1000);
        ASSERT_TRUE(plan.has_value());
        plan_ = plan.value();

        identity_.id = job_id::derive("local:/data/a.bin", "remote:project/a.bin");
        identity_.direction = transfer_direction::upload;
        identity_.object_id = "project/a.bin";
        identity_.local_path = "/data/a.bin";
    }

    auto make_tracker() -> std::unique_ptr<progress_tracker> {
        return std::make_unique<progress_tracker>(plan_, identity_);
    }

    chunk_plan plan_;
    transfer_state identity_;
};

TEST_F(ProgressTrackerTest, StartsWithEverythingPending) {
    auto tracker = make_tracker();
    EXPECT_EQ(tracker->pending_chunks(), (std::vector<uint64_t>{0, 1, 2}));
    EXPECT_EQ(tracker->completed_count(), 0u);
    EXPECT_EQ(tracker->bytes_done(), 0u);
    EXPECT_FALSE(tracker->all_complete());
}

TEST_F(ProgressTrackerTest, SnapshotCarriesIdentityAndPlan) {
    auto tracker = make_tracker();
    auto state = tracker->snapshot();
    EXPECT_EQ(state.id, identity_.id);
    EXPECT_EQ(state.object_id, "project/a.bin");
    EXPECT_EQ(state.total_size, 2500u);
    EXPECT_EQ(state.chunk_size, 1000u);
    EXPECT_TRUE(state.completed.empty());
    EXPECT_NE(state.created_at, std::chrono::system_clock::time_point{});
}

TEST_F(ProgressTrackerTest, MarkCompleteUpdatesBytesAndPending) {
    auto tracker = make_tracker();
    ASSERT_TRUE(tracker->mark_complete(2, "aa").has_value());
    ASSERT_TRUE(tracker->mark_complete(0, "bb").has_value());

    EXPECT_EQ(tracker->bytes_done(), 1500u);
    EXPECT_EQ(tracker->pending_chunks(), (std::vector<uint64_t>{1}));
    EXPECT_TRUE(tracker->is_complete(2));
    EXPECT_FALSE(tracker->is_complete(1));
    EXPECT_EQ(tracker->chunk_status(2).checksum, "aa");
    EXPECT_TRUE(tracker->chunk_status(2).is_complete());
}

TEST_F(ProgressTrackerTest, MarkCompleteIsIdempotent) {
    auto tracker = make_tracker();
    ASSERT_TRUE(tracker->mark_complete(1, "cafe").has_value());
    ASSERT_TRUE(tracker->mark_complete(1, "cafe").has_value());

    EXPECT_EQ(tracker->completed_count(), 1u);
    EXPECT_EQ(tracker->bytes_done(), 1000u);
}

TEST_F(ProgressTrackerTest, MarkCompleteWithDifferentChecksumIsInconsistent) {
    auto tracker = make_tracker();
    ASSERT_TRUE(tracker->mark_complete(1, "cafe").has_value());

    auto again = tracker->mark_complete(1, "beef");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::state_inconsistency);
    EXPECT_EQ(tracker->chunk_status(1).checksum, "cafe");
}

TEST_F(ProgressTrackerTest, MarkCompleteRejectsBadInput) {
    auto tracker = make_tracker();

    auto out_of_range = tracker->mark_complete(3, "aa");
    ASSERT_FALSE(out_of_range.has_value());
    EXPECT_EQ(out_of_range.error().code, error_code::invalid_chunk_index);

    auto no_sum = tracker->mark_complete(0, "");
    ASSERT_FALSE(no_sum.has_value());
    EXPECT_EQ(no_sum.error().code, error_code::state_inconsistency);
}

TEST_F(ProgressTrackerTest, OrderedChecksumsRequireCompletion) {
    auto tracker = make_tracker();
    ASSERT_TRUE(tracker->mark_complete(2, "c2").has_value());
    ASSERT_TRUE(tracker->mark_complete(0, "c0").has_value());
    EXPECT_FALSE(tracker->ordered_checksums().has_value());

    ASSERT_TRUE(tracker->mark_complete(1, "c1").has_value());
    auto sums = tracker->ordered_checksums();
    ASSERT_TRUE(sums.has_value());
    EXPECT_EQ(sums.value(), (std::vector<std::string>{"c0", "c1", "c2"}));
    EXPECT_TRUE(tracker->all_complete());
}

TEST_F(ProgressTrackerTest, RestoreReplacesCompletedSet) {
    auto tracker = make_tracker();
    auto saved = tracker->snapshot();
    saved.completed = {{0, "c0"}, {2, "c2"}};
    saved.session_token = "session-1";

    ASSERT_TRUE(tracker->restore(saved).has_value());
    EXPECT_EQ(tracker->pending_chunks(), (std::vector<uint64_t>{1}));
    EXPECT_EQ(tracker->bytes_done(), 1500u);
    EXPECT_EQ(tracker->snapshot().session_token, "session-1");
}

TEST_F(ProgressTrackerTest, RestoreRejectsDifferentPlan) {
    auto tracker = make_tracker();
    auto saved = tracker->snapshot();
    saved.chunk_size = 500;

    auto restored = tracker->restore(saved);
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, error_code::state_inconsistency);
}

TEST_F(ProgressTrackerTest, RestoreRejectsCorruptEntries) {
    auto tracker = make_tracker();

    auto outside = tracker->snapshot();
    outside.completed = {{7, "c7"}};
    auto r1 = tracker->restore(outside);
    ASSERT_FALSE(r1.has_value());
    EXPECT_EQ(r1.error().code, error_code::state_corruption);

    auto no_sum = tracker->snapshot();
    no_sum.completed = {{1, ""}};
    auto r2 = tracker->restore(no_sum);
    ASSERT_FALSE(r2.has_value());
    EXPECT_EQ(r2.error().code, error_code::state_corruption);

    EXPECT_EQ(tracker->completed_count(), 0u);
}

TEST_F(ProgressTrackerTest, InvalidateMakesChunkPendingAgain) {
    auto tracker = make_tracker();
    ASSERT_TRUE(tracker->mark_complete(1, "c1").has_value());
    tracker->invalidate(1);

    EXPECT_FALSE(tracker->is_complete(1));
    EXPECT_EQ(tracker->bytes_done(), 0u);
    ASSERT_TRUE(tracker->mark_complete(1, "other").has_value());

    // Invalidating something never completed is harmless
    tracker->invalidate(0);
    EXPECT_EQ(tracker->bytes_done(), 1000u);
}

TEST_F(ProgressTrackerTest, RecordAttemptCountsPerChunk) {
    auto tracker = make_tracker();
    tracker->record_attempt(0, error_kind::timeout);
    tracker->record_attempt(0, error_kind::none);
    tracker->record_attempt(99, error_kind::timeout);

    auto status = tracker->chunk_status(0);
    EXPECT_EQ(status.attempts, 2u);
    EXPECT_EQ(status.last_error, error_kind::none);
}

TEST_F(ProgressTrackerTest, ConcurrentCompletionsAreAllRecorded) {
    auto plan = chunk_planner::plan_fixed(1000 * 64, 64);
    ASSERT_TRUE(plan.has_value());
    progress_tracker tracker(plan.value(), identity_);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&tracker, t] {
            for (uint64_t i = static_cast<uint64_t>(t); i < 1000; i += 8) {
                EXPECT_TRUE(tracker.mark_complete(i, "sum" + std::to_string(i)).has_value());
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_TRUE(tracker.all_complete());
    EXPECT_EQ(tracker.bytes_done(), 64000u);
}

}  // namespace dx::transfer::test
