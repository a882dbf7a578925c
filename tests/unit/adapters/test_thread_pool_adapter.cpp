/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the worker loop executors
 */

#include <gtest/gtest.h>

#include <dx/transfer/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

namespace dx::transfer::test {

using namespace dx::transfer::adapters;

TEST(InFlightCounterTest, CountsPerDirection) {
    in_flight_counter counter;
    counter.begin(transfer_direction::upload);
    counter.begin(transfer_direction::upload);
    counter.begin(transfer_direction::download);

    EXPECT_EQ(counter.count(transfer_direction::upload), 2u);
    EXPECT_EQ(counter.count(transfer_direction::download), 1u);
    EXPECT_EQ(counter.count(), 3u);

    counter.end(transfer_direction::upload);
    counter.end(transfer_direction::download);
    EXPECT_EQ(counter.count(transfer_direction::upload), 1u);
    EXPECT_EQ(counter.count(transfer_direction::download), 0u);
    EXPECT_EQ(counter.count(), 1u);
    EXPECT_EQ(counter.peak(), 3u);
}

TEST(InFlightCounterTest, EndNeverUnderflows) {
    in_flight_counter counter;
    counter.end(transfer_direction::download);
    EXPECT_EQ(counter.count(transfer_direction::download), 0u);
    EXPECT_EQ(counter.count(), 0u);

    counter.begin(transfer_direction::upload);
    counter.end(transfer_direction::download);
    EXPECT_EQ(counter.count(), 1u);
}

TEST(StdThreadTransferPoolTest, WorkerCountResolves) {
    std_thread_transfer_pool fixed(4);
    EXPECT_EQ(fixed.worker_count(), 4u);
    EXPECT_TRUE(fixed.is_running());

    std_thread_transfer_pool automatic;
    EXPECT_GE(automatic.worker_count(), 1u);
}

TEST(StdThreadTransferPoolTest, SubmitRunsLoop) {
    std_thread_transfer_pool pool(2);
    std::atomic<int> value{0};

    auto f = pool.submit([&] { value = 42; }, transfer_direction::upload);
    f.get();
    EXPECT_EQ(value.load(), 42);
    EXPECT_EQ(pool.in_flight(), 0u);
}

TEST(StdThreadTransferPoolTest, InFlightTracksRunningLoops) {
    std_thread_transfer_pool pool(2);
    std::promise<void> gate;
    auto opened = gate.get_future().share();

    auto f = pool.submit([opened] { opened.wait(); }, transfer_direction::download);
    EXPECT_EQ(pool.in_flight(transfer_direction::download), 1u);
    EXPECT_EQ(pool.in_flight(transfer_direction::upload), 0u);
    EXPECT_EQ(pool.in_flight(), 1u);

    gate.set_value();
    f.get();
    EXPECT_EQ(pool.in_flight(transfer_direction::download), 0u);
    EXPECT_EQ(pool.in_flight(), 0u);
    EXPECT_EQ(pool.peak_in_flight(), 1u);
}

TEST(StdThreadTransferPoolTest, LoopsBeyondWorkerCountQueue) {
    std_thread_transfer_pool pool(1);
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    std::atomic<bool> second_ran{false};

    auto first = pool.submit([opened] { opened.wait(); }, transfer_direction::upload);
    auto second = pool.submit([&] { second_ran = true; }, transfer_direction::upload);

    // One worker: the second loop waits behind the first
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(second_ran.load());
    EXPECT_EQ(pool.in_flight(transfer_direction::upload), 2u);

    gate.set_value();
    first.get();
    second.get();
    EXPECT_TRUE(second_ran.load());
    EXPECT_EQ(pool.peak_in_flight(), 2u);
}

TEST(StdThreadTransferPoolTest, ExceptionReachesFuture) {
    std_thread_transfer_pool pool(1);
    auto f = pool.submit([] { throw std::runtime_error("chunk failed"); },
                         transfer_direction::download);
    EXPECT_THROW(f.get(), std::runtime_error);
    EXPECT_EQ(pool.in_flight(transfer_direction::download), 0u);
}

TEST(StdThreadTransferPoolTest, ShutdownDrainsQueueAndRejectsNewWork) {
    std_thread_transfer_pool pool(1);
    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool.submit([&] { ++done; }, transfer_direction::upload));
    }

    pool.shutdown();
    EXPECT_FALSE(pool.is_running());
    EXPECT_EQ(done.load(), 8);
    for (auto& f : futures) {
        EXPECT_NO_THROW(f.get());
    }

    auto late = pool.submit([&] { ++done; }, transfer_direction::upload);
    EXPECT_THROW(late.get(), std::runtime_error);
    EXPECT_EQ(done.load(), 8);
    EXPECT_EQ(pool.in_flight(), 0u);
}

TEST(TransferPoolFactoryTest, CreatesWorkingPool) {
    auto pool = transfer_pool_factory::create(4, "factory_test");
    ASSERT_NE(pool, nullptr);
    EXPECT_TRUE(pool->is_running());
    EXPECT_GE(pool->worker_count(), 1u);

    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 16; ++i) {
        auto direction = i % 2 == 0 ? transfer_direction::upload : transfer_direction::download;
        futures.push_back(pool->submit([&] { ++done; }, direction));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(done.load(), 16);
    EXPECT_EQ(pool->in_flight(), 0u);
    EXPECT_GE(pool->peak_in_flight(), 1u);
}

TEST(TransferPoolFactoryTest, ReportsBackend) {
#if DX_TRANSFER_USE_THREAD_SYSTEM
    EXPECT_TRUE(transfer_pool_factory::has_thread_system());
#else
    EXPECT_FALSE(transfer_pool_factory::has_thread_system());
#endif
}

}  // namespace dx::transfer::test
