/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for bounded chunk dispatch
 */

#include <gtest/gtest.h>

#include <dx/transfer/engine/worker_pool.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <numeric>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace dx::transfer::test {

namespace {

auto indices(uint64_t n) -> std::vector<uint64_t> {
    std::vector<uint64_t> v(n);
    std::iota(v.begin(), v.end(), 0);
    return v;
}

}  // namespace

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_unique<worker_pool>(adapters::transfer_pool_factory::create(8));
    }

    std::unique_ptr<worker_pool> pool_;
    cancellation_token token_;
};

TEST_F(WorkerPoolTest, RunsEveryPendingChunkOnce) {
    std::mutex mutex;
    std::multiset<uint64_t> seen;

    auto report = pool_->run(indices(20), 4,
                             [&](uint64_t index) -> std::optional<chunk_failure> {
                                 std::lock_guard<std::mutex> lock(mutex);
                                 seen.insert(index);
                                 return std::nullopt;
                             },
                             token_);

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.completed, 20u);
    ASSERT_EQ(seen.size(), 20u);
    for (uint64_t i = 0; i < 20; ++i) {
        EXPECT_EQ(seen.count(i), 1u) << i;
    }
}

TEST_F(WorkerPoolTest, NeverExceedsParallelism) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    auto report = pool_->run(indices(24), 3,
                             [&](uint64_t) -> std::optional<chunk_failure> {
                                 auto now = ++running;
                                 int prev = peak.load();
                                 while (now > prev && !peak.compare_exchange_weak(prev, now)) {
                                 }
                                 std::this_thread::sleep_for(std::chrono::milliseconds(5));
                                 --running;
                                 return std::nullopt;
                             },
                             token_);

    EXPECT_TRUE(report.succeeded());
    EXPECT_LE(peak.load(), 3);
    EXPECT_LE(report.peak_concurrency, 3u);
    EXPECT_GE(report.peak_concurrency, 1u);
}

TEST_F(WorkerPoolTest, EmptyPendingListIsImmediateSuccess) {
    bool called = false;
    auto report = pool_->run({}, 4,
                             [&](uint64_t) -> std::optional<chunk_failure> {
                                 called = true;
                                 return std::nullopt;
                             },
                             token_);

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.completed, 0u);
    EXPECT_FALSE(called);
}

TEST_F(WorkerPoolTest, FatalFailureStopsDispatch) {
    std::atomic<int> calls{0};

    // One worker so dispatch order is the pending order
    auto report = pool_->run(indices(10), 1,
                             [&](uint64_t index) -> std::optional<chunk_failure> {
                                 ++calls;
                                 if (index == 3) {
                                     return chunk_failure{index, error_kind::retries_exhausted,
                                                          error_code::retries_exhausted, 5,
                                                          "gave up"};
                                 }
                                 return std::nullopt;
                             },
                             token_);

    EXPECT_FALSE(report.succeeded());
    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->index, 3u);
    EXPECT_EQ(report.failure->attempts, 5u);
    EXPECT_EQ(report.completed, 3u);
    EXPECT_EQ(calls.load(), 4);
}

TEST_F(WorkerPoolTest, CancelledTokenStopsBeforeDispatch) {
    token_.cancel();
    std::atomic<int> calls{0};

    auto report = pool_->run(indices(5), 2,
                             [&](uint64_t) -> std::optional<chunk_failure> {
                                 ++calls;
                                 return std::nullopt;
                             },
                             token_);

    EXPECT_TRUE(report.cancelled);
    EXPECT_FALSE(report.failure.has_value());
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(WorkerPoolTest, CancelMidRunLetsRunningChunkFinish) {
    std::atomic<int> calls{0};

    auto report = pool_->run(indices(5), 1,
                             [&](uint64_t index) -> std::optional<chunk_failure> {
                                 ++calls;
                                 if (index == 1) {
                                     token_.cancel();
                                 }
                                 return std::nullopt;
                             },
                             token_);

    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.completed, 2u);
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(WorkerPoolTest, CancellationFailureIsNotReportedAsFatal) {
    auto report = pool_->run(indices(3), 1,
                             [&](uint64_t index) -> std::optional<chunk_failure> {
                                 return chunk_failure{index, error_kind::cancelled,
                                                      error_code::cancelled, 1,
                                                      "cancelled"};
                             },
                             token_);

    EXPECT_TRUE(report.cancelled);
    EXPECT_FALSE(report.failure.has_value());
}

TEST_F(WorkerPoolTest, ThrowingTaskBecomesFailure) {
    auto report = pool_->run(indices(2), 1,
                             [&](uint64_t index) -> std::optional<chunk_failure> {
                                 if (index == 0) {
                                     throw std::runtime_error("boom");
                                 }
                                 return std::nullopt;
                             },
                             token_);

    ASSERT_TRUE(report.failure.has_value());
    EXPECT_EQ(report.failure->index, 0u);
    EXPECT_EQ(report.failure->code, error_code::internal_error);
    EXPECT_EQ(report.failure->message, "boom");
}

TEST_F(WorkerPoolTest, ExposesThreadPool) {
    EXPECT_NE(pool_->thread_pool(), nullptr);
}

}  // namespace dx::transfer::test
