#include <gtest/gtest.h>
#include <opf/plugin/message_loop.h>
#include <opf/stream/in_process_stream.h>
#include <opf/test/v1/test_messages.pb.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace opf::plugin::test {

using namespace std::chrono_literals;
using opf::test::v1::DomainMessage;

namespace {

DomainMessage labelled(const std::string& label) {
    DomainMessage m;
    m.set_label(label);
    return m;
}

Result<DomainMessage> upperCase(const Context&, const DomainMessage& in) {
    auto out = in;
    std::string label = in.label();
    std::transform(label.begin(), label.end(), label.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    out.set_label(label);
    return out;
}

} // namespace

class MessageLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::tie(hostEnd_, pluginEnd_) = stream::makeInProcessPair<DomainMessage>();
    }

    void TearDown() override {
        hostEnd_->close();
        pluginEnd_->close();
    }

    std::shared_ptr<stream::InProcessStream<DomainMessage>> hostEnd_;
    std::shared_ptr<stream::InProcessStream<DomainMessage>> pluginEnd_;
};

TEST_F(MessageLoopTest, RepliesUntilPeerHalfCloses) {
    for (const char* label : {"a", "bc", "def"}) {
        ASSERT_TRUE(hostEnd_->send(labelled(label)));
    }
    ASSERT_TRUE(hostEnd_->closeSend());

    MessageLoop<DomainMessage> loop(pluginEnd_, upperCase);
    auto r = loop.run(Context::background().withTimeout(5s));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(loop.handled(), 3u);

    for (const char* expected : {"A", "BC", "DEF"}) {
        auto reply = hostEnd_->recv(Context::background().withTimeout(1s));
        ASSERT_TRUE(reply) << reply.error().message;
        EXPECT_EQ(reply.value().label(), expected);
    }
}

TEST_F(MessageLoopTest, HandlerErrorStopsLoop) {
    ASSERT_TRUE(hostEnd_->send(labelled("bad")));
    ASSERT_TRUE(hostEnd_->send(labelled("never handled")));

    MessageLoop<DomainMessage> loop(
        pluginEnd_, [](const Context&, const DomainMessage& in) -> Result<DomainMessage> {
            return Error{ErrorCode::InvalidArgument, "rejected " + in.label()};
        });
    auto r = loop.run(Context::background().withTimeout(5s));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(r.error().message, "handler error: rejected bad");
    EXPECT_EQ(loop.handled(), 0u);
}

TEST_F(MessageLoopTest, ThrowingHandlerIsInternalError) {
    ASSERT_TRUE(hostEnd_->send(labelled("x")));

    MessageLoop<DomainMessage> loop(
        pluginEnd_, [](const Context&, const DomainMessage&) -> Result<DomainMessage> {
            throw std::runtime_error("boom");
        });
    auto r = loop.run(Context::background().withTimeout(5s));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InternalError);
    EXPECT_EQ(r.error().message, "handler error: boom");
}

TEST_F(MessageLoopTest, SendFailureStopsLoop) {
    ASSERT_TRUE(hostEnd_->send(labelled("orphan")));
    hostEnd_->close();

    MessageLoop<DomainMessage> loop(pluginEnd_, upperCase);
    auto r = loop.run(Context::background().withTimeout(5s));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::StreamClosed);
    EXPECT_EQ(r.error().message.rfind("send error: ", 0), 0u);
}

TEST_F(MessageLoopTest, CancelStopsIdleLoop) {
    MessageLoop<DomainMessage> loop(pluginEnd_, upperCase);
    auto ctx = Context::background().withCancel();
    Result<void> result;
    std::thread runner([&] { result = loop.run(ctx); });

    std::this_thread::sleep_for(20ms);
    ctx.cancel();
    runner.join();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
}

TEST_F(MessageLoopTest, DeadlineStopsLoop) {
    MessageLoop<DomainMessage> loop(pluginEnd_, upperCase);
    auto r = loop.run(Context::background().withTimeout(30ms));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
}

} // namespace opf::plugin::test
