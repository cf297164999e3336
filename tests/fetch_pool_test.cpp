#include <gtest/gtest.h>

#include "fetch_pool.hpp"
#include "test_fakes.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>

using realtime::FetchPool;

namespace
{

    // Parks the task that calls wait() until open().
    class Gate
    {
      public:
        void wait()
        {
            std::unique_lock<std::mutex> lk(m_mtx);
            m_entered = true;
            m_cv.notify_all();
            m_cv.wait(lk, [this]() { return m_open; });
        }

        bool waitEntered()
        {
            std::unique_lock<std::mutex> lk(m_mtx);
            return m_cv.wait_for(lk, std::chrono::seconds(2), [this]() { return m_entered; });
        }

        void open()
        {
            {
                std::lock_guard<std::mutex> lk(m_mtx);
                m_open = true;
            }
            m_cv.notify_all();
        }

      private:
        std::mutex              m_mtx;
        std::condition_variable m_cv;
        bool                    m_entered{false};
        bool                    m_open{false};
    };

} // namespace

TEST(FetchPool, RunsSubmittedTasks)
{
    diag::DiagnosticManager diagMgr(testing_support::quietLogConfig());
    FetchPool               pool("test", 3, diagMgr);
    std::atomic<int>        ran{0};

    for (int i = 0; i < 10; ++i)
        ASSERT_EQ(pool.submit("k" + std::to_string(i), [&ran]() { ++ran; }), FetchPool::SubmitResult::Queued);
    ASSERT_TRUE(pool.waitIdle(std::chrono::milliseconds(2000)));
    EXPECT_EQ(ran.load(), 10);
    EXPECT_EQ(pool.workerCount(), 3u);
}

TEST(FetchPool, QueuedKeyIsCoalesced)
{
    diag::DiagnosticManager diagMgr(testing_support::quietLogConfig());
    FetchPool               pool("test", 1, diagMgr);
    Gate                    gate;
    std::atomic<int>        bRuns{0};

    ASSERT_EQ(pool.submit("a", [&gate]() { gate.wait(); }), FetchPool::SubmitResult::Queued);
    ASSERT_TRUE(gate.waitEntered());

    EXPECT_EQ(pool.submit("b", [&bRuns]() { ++bRuns; }), FetchPool::SubmitResult::Queued);
    EXPECT_EQ(pool.submit("b", [&bRuns]() { ++bRuns; }), FetchPool::SubmitResult::Coalesced);
    EXPECT_TRUE(pool.isQueued("b"));
    EXPECT_EQ(pool.pending(), 1u);

    // "a" is running, not queued, so a fresh fetch for it is accepted.
    EXPECT_FALSE(pool.isQueued("a"));
    EXPECT_EQ(pool.submit("a", []() {}), FetchPool::SubmitResult::Queued);
    EXPECT_EQ(pool.pending(), 2u);

    gate.open();
    ASSERT_TRUE(pool.waitIdle(std::chrono::milliseconds(2000)));
    EXPECT_EQ(bRuns.load(), 1);
    EXPECT_FALSE(pool.isQueued("b"));
}

TEST(FetchPool, QueueGrowsWithDistinctKeysWhileWorkersAreBusy)
{
    diag::DiagnosticManager diagMgr(testing_support::quietLogConfig());
    FetchPool               pool("test", 1, diagMgr);
    Gate                    gate;
    std::atomic<int>        ran{0};

    ASSERT_EQ(pool.submit("slow", [&gate]() { gate.wait(); }), FetchPool::SubmitResult::Queued);
    ASSERT_TRUE(gate.waitEntered());

    for (int i = 0; i < 500; ++i)
        ASSERT_EQ(pool.submit("t" + std::to_string(i), [&ran]() { ++ran; }), FetchPool::SubmitResult::Queued);
    EXPECT_EQ(pool.pending(), 500u);

    gate.open();
    ASSERT_TRUE(pool.waitIdle(std::chrono::milliseconds(5000)));
    EXPECT_EQ(ran.load(), 500);
}

TEST(FetchPool, ThrowingTaskDoesNotKillWorker)
{
    diag::DiagnosticManager diagMgr(testing_support::quietLogConfig());
    FetchPool               pool("test", 1, diagMgr);
    std::atomic<bool>       ran{false};

    pool.submit("bad", []() { throw std::runtime_error("boom"); });
    pool.submit("good", [&ran]() { ran = true; });
    ASSERT_TRUE(pool.waitIdle(std::chrono::milliseconds(2000)));
    EXPECT_TRUE(ran.load());
}

TEST(FetchPool, SubmitAfterStopIsRefused)
{
    diag::DiagnosticManager diagMgr(testing_support::quietLogConfig());
    FetchPool               pool("test", 2, diagMgr);
    pool.stop();
    EXPECT_EQ(pool.submit("k", []() {}), FetchPool::SubmitResult::Stopped);
    EXPECT_TRUE(pool.waitIdle(std::chrono::milliseconds(10)));
}
