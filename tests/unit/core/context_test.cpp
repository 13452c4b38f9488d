#include <gtest/gtest.h>
#include <opf/core/context.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace opf::test {

using namespace std::chrono_literals;

TEST(ContextTest, BackgroundIsNeverDone) {
    auto ctx = Context::background();
    EXPECT_FALSE(ctx.done());
    EXPECT_FALSE(ctx.deadline().has_value());
    EXPECT_EQ(ctx.err().code, ErrorCode::Success);
}

TEST(ContextTest, CancelPropagatesToChildrenOnly) {
    auto parent = Context::background().withCancel();
    auto child = parent.withCancel();
    auto sibling = parent.withCancel();

    child.cancel();
    EXPECT_TRUE(child.cancelled());
    EXPECT_FALSE(parent.cancelled());
    EXPECT_FALSE(sibling.cancelled());

    parent.cancel();
    EXPECT_TRUE(sibling.cancelled());
    EXPECT_EQ(sibling.err().code, ErrorCode::OperationCancelled);
}

TEST(ContextTest, CopiesShareCancellation) {
    auto ctx = Context::background().withCancel();
    Context copy = ctx;
    copy.cancel();
    EXPECT_TRUE(ctx.cancelled());
}

TEST(ContextTest, ChildKeepsEarlierParentDeadline) {
    auto parent = Context::background().withTimeout(50ms);
    auto child = parent.withTimeout(10s);
    ASSERT_TRUE(child.deadline().has_value());
    EXPECT_EQ(*child.deadline(), *parent.deadline());

    auto tighter = parent.withTimeout(1ms);
    EXPECT_LT(*tighter.deadline(), *parent.deadline());
}

TEST(ContextTest, WaitTimesOutAtDeadline) {
    auto ctx = Context::background().withTimeout(20ms);
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ctx.wait(cv, lock, [] { return false; }));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
    EXPECT_TRUE(ctx.expired());
    EXPECT_EQ(ctx.err().code, ErrorCode::Timeout);
}

TEST(ContextTest, WaitReturnsWhenPredicateHolds) {
    auto ctx = Context::background().withTimeout(5s);
    std::mutex m;
    std::condition_variable_any cv;
    bool ready = false;

    std::thread notifier([&] {
        std::this_thread::sleep_for(10ms);
        {
            std::lock_guard<std::mutex> g(m);
            ready = true;
        }
        cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(m);
    EXPECT_TRUE(ctx.wait(cv, lock, [&] { return ready; }));
    lock.unlock();
    notifier.join();
    EXPECT_FALSE(ctx.done());
}

TEST(ContextTest, CancelWakesWaiter) {
    auto parent = Context::background().withCancel();
    auto ctx = parent.withCancel();
    std::mutex m;
    std::condition_variable_any cv;

    std::thread canceller([&] {
        std::this_thread::sleep_for(10ms);
        parent.cancel();
    });

    std::unique_lock<std::mutex> lock(m);
    EXPECT_FALSE(ctx.wait(cv, lock, [] { return false; }));
    lock.unlock();
    canceller.join();
    EXPECT_EQ(ctx.err().code, ErrorCode::OperationCancelled);
}

TEST(ContextTest, DerivedFromCancelledParentStartsCancelled) {
    auto parent = Context::background().withCancel();
    parent.cancel();
    auto child = parent.withTimeout(1s);
    EXPECT_TRUE(child.cancelled());
}

} // namespace opf::test
