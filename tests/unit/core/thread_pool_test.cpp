#include <gtest/gtest.h>
#include <opf/core/thread_pool.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace opf::test {

using namespace std::chrono_literals;

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override { pool_ = std::make_unique<ThreadPool>(2, "test-pool"); }
    void TearDown() override { pool_.reset(); }

    std::unique_ptr<ThreadPool> pool_;
};

TEST_F(ThreadPoolTest, RunsQueuedTask) {
    std::atomic<int> sum{0};
    ASSERT_TRUE(pool_->enqueue_detached([&] { sum.fetch_add(5); }));
    pool_->stop();
    EXPECT_EQ(sum.load(), 5);
    EXPECT_EQ(pool_->thread_count(), 2u);
}

TEST_F(ThreadPoolTest, ConcurrencyIsBoundedByWorkers) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    for (int i = 0; i < 8; ++i) {
        ASSERT_TRUE(pool_->enqueue_detached([&] {
            int now = running.fetch_add(1) + 1;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(10ms);
            running.fetch_sub(1);
        }));
    }
    pool_->stop();
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

TEST_F(ThreadPoolTest, StopDrainsQueuedTasks) {
    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(pool_->enqueue_detached([&] {
            std::this_thread::sleep_for(2ms);
            done.fetch_add(1);
        }));
    }
    pool_->stop();
    EXPECT_EQ(done.load(), 10);
}

TEST_F(ThreadPoolTest, RejectsWorkAfterStop) {
    pool_->stop();
    EXPECT_FALSE(pool_->enqueue_detached([] {}));
    pool_->stop();
}

TEST_F(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    std::atomic<int> ran{0};
    ASSERT_TRUE(pool_->enqueue_detached([] { throw std::runtime_error("boom"); }));
    ASSERT_TRUE(pool_->enqueue_detached([] { throw std::runtime_error("boom"); }));
    ASSERT_TRUE(pool_->enqueue_detached([&] { ran.fetch_add(1); }));
    pool_->stop();
    EXPECT_EQ(ran.load(), 1);
}

} // namespace opf::test
