/**
 * @file worker_pool_test.cpp
 * @brief thread pool ordering + cooperative stop flag
 */
#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "tio/search/stop_signal.hpp"
#include "tio/search/worker_pool.hpp"

using testing::ElementsAre;

TEST(WorkerPool, MapIdsReturnsResultsInIdOrder)
{
    tio::search::WorkerPool pool{4U};
    EXPECT_EQ(pool.size(), 4U);

    // later ids finish first on purpose
    const auto results = pool.map_ids<std::size_t>(10U, 6U, [](std::size_t id) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2U * (16U - id)));
        return id * id;
    });
    EXPECT_THAT(results, ElementsAre(100U, 121U, 144U, 169U, 196U, 225U));
}

TEST(WorkerPool, ZeroWorkersStillRunsOneThread)
{
    tio::search::WorkerPool pool{0U};
    EXPECT_EQ(pool.size(), 1U);
    const auto results = pool.map_ids<int>(0U, 3U, [](std::size_t id) { return static_cast<int>(id) + 1; });
    EXPECT_THAT(results, ElementsAre(1, 2, 3));
}

TEST(WorkerPool, EveryTaskRunsExactlyOnce)
{
    tio::search::WorkerPool  pool{3U};
    std::atomic<std::size_t> calls{0U};
    const auto               results = pool.map_ids<bool>(0U, 500U, [&calls](std::size_t) {
        calls.fetch_add(1U);
        return true;
    });
    EXPECT_EQ(results.size(), 500U);
    EXPECT_EQ(calls.load(), 500U);
}

TEST(WorkerPool, ExceptionsSurfaceAfterTheBatchDrains)
{
    tio::search::WorkerPool  pool{2U};
    std::atomic<std::size_t> finished{0U};
    EXPECT_THROW(
        {
            (void)pool.map_ids<int>(0U, 8U, [&finished](std::size_t id) {
                if (id == 3U)
                {
                    throw std::runtime_error("boom");
                }
                finished.fetch_add(1U);
                return 0;
            });
        },
        std::runtime_error);
    EXPECT_EQ(finished.load(), 7U);
}

TEST(WorkerPool, SubmitDeliversThroughFuture)
{
    tio::search::WorkerPool pool{1U};
    auto                    future = pool.submit([]() { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(StopSignal, FlagCanBeSetAndReset)
{
    tio::search::reset_stop();
    EXPECT_FALSE(tio::search::stop_requested());
    tio::search::request_stop();
    EXPECT_TRUE(tio::search::stop_requested());
    tio::search::reset_stop();
    EXPECT_FALSE(tio::search::stop_requested());
}

TEST(StopSignal, ScopedHandlerTurnsSigtermIntoAStopRequest)
{
    tio::search::reset_stop();
    {
        const tio::search::ScopedStopSignal guard;
        ASSERT_EQ(std::raise(SIGTERM), 0);
        EXPECT_TRUE(tio::search::stop_requested());
    }
    tio::search::reset_stop();
}
