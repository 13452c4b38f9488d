#include <gtest/gtest.h>
#include <opf/protocol/envelope.h>
#include <opf/stream/in_process_stream.h>

#include <chrono>
#include <thread>

namespace opf::stream::test {

using namespace std::chrono_literals;
using protocol::Envelope;

class InProcessStreamTest : public ::testing::Test {
protected:
    void SetUp() override { std::tie(host_, plugin_) = makeInProcessPair<Envelope>(); }

    std::shared_ptr<InProcessStream<Envelope>> host_;
    std::shared_ptr<InProcessStream<Envelope>> plugin_;
};

TEST_F(InProcessStreamTest, DeliversInOrder) {
    ASSERT_TRUE(plugin_->send(protocol::makeRegister("echo", "v1")));
    ASSERT_TRUE(plugin_->send(protocol::makeResponse("1", Bytes{1})));

    auto ctx = Context::background();
    auto first = host_->recv(ctx);
    ASSERT_TRUE(first) << first.error().message;
    EXPECT_TRUE(first.value().isRegister());

    auto second = host_->recv(ctx);
    ASSERT_TRUE(second) << second.error().message;
    EXPECT_TRUE(second.value().isResponse());
}

TEST_F(InProcessStreamTest, CloseSendEndsPeerAfterDrain) {
    ASSERT_TRUE(plugin_->send(protocol::makeRegister("echo", "v1")));
    ASSERT_TRUE(plugin_->closeSend());

    auto send = plugin_->send(protocol::makeRegister("again", "v1"));
    ASSERT_FALSE(send);
    EXPECT_EQ(send.error().code, ErrorCode::StreamClosed);

    auto ctx = Context::background();
    ASSERT_TRUE(host_->recv(ctx));
    auto end = host_->recv(ctx);
    ASSERT_FALSE(end);
    EXPECT_EQ(end.error().code, ErrorCode::StreamClosed);

    // The other direction stays usable.
    ASSERT_TRUE(host_->send(protocol::makeResponse("1", {})));
    EXPECT_TRUE(plugin_->recv(ctx));
}

TEST_F(InProcessStreamTest, RecvHonoursDeadline) {
    auto ctx = Context::background().withTimeout(20ms);
    auto r = host_->recv(ctx);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
}

TEST_F(InProcessStreamTest, CloseUnblocksPendingRecv) {
    std::thread closer([this] {
        std::this_thread::sleep_for(10ms);
        host_->close();
    });
    auto r = host_->recv(Context::background());
    closer.join();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::StreamClosed);

    auto peer = plugin_->recv(Context::background().withTimeout(1s));
    ASSERT_FALSE(peer);
    EXPECT_EQ(peer.error().code, ErrorCode::StreamClosed);
}

TEST_F(InProcessStreamTest, CancelUnblocksPendingRecv) {
    auto ctx = Context::background().withCancel();
    std::thread canceller([ctx] {
        std::this_thread::sleep_for(10ms);
        ctx.cancel();
    });
    auto r = host_->recv(ctx);
    canceller.join();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
}

} // namespace opf::stream::test
