#include <gtest/gtest.h>
#include <opf/host/host_session.h>
#include <opf/plugin/dispatcher.h>
#include <opf/stream/in_process_stream.h>
#include <opf/test/v1/test_messages.pb.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace opf::plugin::test {

using namespace std::chrono_literals;
using opf::test::v1::DomainMessage;
using opf::test::v1::EchoRequest;
using opf::test::v1::EchoResponse;
using protocol::Envelope;

namespace {

Bytes toBytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

MethodTable echoMethods() {
    MethodTable methods;
    methods.addMessage<EchoRequest, EchoResponse>(
        "Echo", [](const Context&, const EchoRequest& req) -> Result<EchoResponse> {
            if (req.repeat() < 0) {
                return Error{ErrorCode::InvalidArgument, "repeat must not be negative"};
            }
            EchoResponse resp;
            for (int i = 0; i < std::max(1, req.repeat()); ++i) {
                resp.mutable_text()->append(req.text());
            }
            return resp;
        });
    methods.add("Throw", [](const Context&, const Bytes&) -> Result<Bytes> {
        throw std::runtime_error("handler exploded");
    });
    methods.add("Raw", [](const Context&, const Bytes& in) -> Result<Bytes> { return in; });
    return methods;
}

} // namespace

class PluginDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::tie(hostEnd_, pluginEnd_) = stream::makeInProcessPair<Envelope>();
    }

    void TearDown() override {
        serveCtx_.cancel();
        listenCtx_.cancel();
        if (server_.joinable()) {
            server_.join();
        }
        hostEnd_->close();
        pluginEnd_->close();
        if (listener_.joinable()) {
            listener_.join();
        }
    }

    // Create the dispatcher, serve it, and accept it on the host side.
    void start(MethodTable methods, DispatcherOptions options = {}) {
        auto created = PluginDispatcher::create(pluginEnd_, "echo", "v1", std::move(methods),
                                                options);
        ASSERT_TRUE(created) << created.error().message;
        dispatcher_ = std::move(created).value();
        server_ = std::thread([this] { serveResult_ = dispatcher_->serve(serveCtx_); });

        auto accepted = host::HostSession::accept(Context::background().withTimeout(5s), hostEnd_);
        ASSERT_TRUE(accepted) << accepted.error().message;
        session_ = accepted.value();
        listener_ = std::thread([this] { listenResult_ = session_->listen(listenCtx_); });
    }

    Context callCtx() const { return Context::background().withTimeout(5s); }

    std::shared_ptr<stream::InProcessStream<Envelope>> hostEnd_;
    std::shared_ptr<stream::InProcessStream<Envelope>> pluginEnd_;
    std::unique_ptr<PluginDispatcher> dispatcher_;
    std::shared_ptr<host::HostSession> session_;
    Context serveCtx_ = Context::background().withCancel();
    Context listenCtx_ = Context::background().withCancel();
    std::thread server_;
    std::thread listener_;
    Result<void> serveResult_;
    Result<void> listenResult_;
};

TEST_F(PluginDispatcherTest, CreateRequiresName) {
    auto r = PluginDispatcher::create(pluginEnd_, "", "v1", MethodTable{});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST_F(PluginDispatcherTest, CreateFailsWhenRegistrationCannotBeSent) {
    hostEnd_->close();
    auto r = PluginDispatcher::create(pluginEnd_, "echo", "v1", MethodTable{});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::StreamClosed);
    EXPECT_EQ(r.error().message.rfind("failed to send registration", 0), 0u);
}

TEST_F(PluginDispatcherTest, RegistersWithHost) {
    start(echoMethods());
    EXPECT_EQ(session_->pluginName(), "echo");
    EXPECT_EQ(session_->pluginVersion(), "v1");
    EXPECT_EQ(dispatcher_->name(), "echo");
}

TEST_F(PluginDispatcherTest, TypedCallRoundTrip) {
    start(echoMethods());
    EchoRequest req;
    req.set_text("ab");
    req.set_repeat(3);

    auto resp = session_->callMessage<EchoResponse>(callCtx(), "/echo.EchoService/Echo", req);
    ASSERT_TRUE(resp) << resp.error().message;
    EXPECT_EQ(resp.value().text(), "ababab");
    EXPECT_EQ(dispatcher_->callsHandled(), 1u);
}

TEST_F(PluginDispatcherTest, UnknownMethodIsUnimplemented) {
    start(echoMethods());
    auto r = session_->call(callCtx(), "Missing", {});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotImplemented);
    EXPECT_EQ(r.error().message, "unknown method Missing");
}

TEST_F(PluginDispatcherTest, UndecodableRequestIsMarshalError) {
    start(echoMethods());
    auto r = session_->call(callCtx(), "Echo", Bytes{0x0A, 0x05, 0x01});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::SerializationError);
}

TEST_F(PluginDispatcherTest, HandlerErrorIsRpcError) {
    start(echoMethods());
    EchoRequest req;
    req.set_repeat(-1);
    auto r = session_->callMessage<EchoResponse>(callCtx(), "Echo", req);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::RemoteError);
    EXPECT_EQ(r.error().message, "repeat must not be negative");
}

TEST_F(PluginDispatcherTest, ThrowingHandlerIsRpcError) {
    start(echoMethods());
    auto r = session_->call(callCtx(), "Throw", {});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::RemoteError);
    EXPECT_EQ(r.error().message, "handler exploded");

    // The dispatcher keeps serving.
    auto ok = session_->call(callCtx(), "Raw", toBytes("still here"));
    ASSERT_TRUE(ok) << ok.error().message;
}

TEST_F(PluginDispatcherTest, NonCallEnvelopesAreIgnored) {
    start(echoMethods());
    ASSERT_TRUE(hostEnd_->send(protocol::makeRegister("host", "v0")));
    ASSERT_TRUE(hostEnd_->send(protocol::makeResponse("nobody", {})));
    auto ok = session_->call(callCtx(), "Raw", toBytes("x"));
    ASSERT_TRUE(ok) << ok.error().message;
    EXPECT_EQ(ok.value(), toBytes("x"));
}

TEST_F(PluginDispatcherTest, ConcurrentCallsAreBounded) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    MethodTable methods;
    methods.add("Slow", [&](const Context&, const Bytes& in) -> Result<Bytes> {
        int now = running.fetch_add(1) + 1;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::sleep_for(20ms);
        running.fetch_sub(1);
        return in;
    });
    DispatcherOptions options;
    options.maxConcurrentCalls = 2;
    start(std::move(methods), options);

    std::vector<std::thread> callers;
    std::atomic<int> succeeded{0};
    for (int i = 0; i < 6; ++i) {
        callers.emplace_back([&, i] {
            auto r = session_->call(callCtx(), "Slow", Bytes{static_cast<uint8_t>(i)});
            if (r && r.value() == Bytes{static_cast<uint8_t>(i)}) {
                succeeded.fetch_add(1);
            }
        });
    }
    for (auto& t : callers) {
        t.join();
    }
    EXPECT_EQ(succeeded.load(), 6);
    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(dispatcher_->callsHandled(), 6u);
}

TEST_F(PluginDispatcherTest, CancelDrainsAndHalfCloses) {
    start(echoMethods());
    ASSERT_TRUE(session_->call(callCtx(), "Raw", toBytes("warm")));

    serveCtx_.cancel();
    server_.join();
    EXPECT_TRUE(serveResult_) << serveResult_.error().message;

    listener_.join();
    ASSERT_FALSE(listenResult_);
    EXPECT_EQ(listenResult_.error().code, ErrorCode::StreamClosed);
}

TEST_F(PluginDispatcherTest, CancelDoesNotWaitForBlockedHandler) {
    std::atomic<int> runs{0};
    MethodTable methods;
    methods.add("Hang", [&](const Context&, const Bytes&) -> Result<Bytes> {
        runs.fetch_add(1);
        std::this_thread::sleep_for(1s);
        return Bytes{};
    });
    DispatcherOptions options;
    options.maxConcurrentCalls = 1;
    options.drainTimeout = 100ms;
    start(std::move(methods), options);

    for (int i = 0; i < 4; ++i) {
        auto r = session_->call(Context::background().withTimeout(50ms), "Hang", {});
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    }
    EXPECT_EQ(session_->pendingCount(), 0u);

    const auto cancelledAt = std::chrono::steady_clock::now();
    serveCtx_.cancel();
    server_.join();
    const auto elapsed = std::chrono::steady_clock::now() - cancelledAt;
    EXPECT_LT(elapsed, 500ms);
    EXPECT_TRUE(serveResult_) << serveResult_.error().message;

    // Destruction waits for the running handler; the queued calls never start.
    dispatcher_.reset();
    EXPECT_EQ(runs.load(), 1);
}

TEST_F(PluginDispatcherTest, QueuedCallsAreCancelledWhenServeStops) {
    std::atomic<int> started{0};
    MethodTable methods;
    methods.add("Block", [&](const Context& ctx, const Bytes&) -> Result<Bytes> {
        started.fetch_add(1);
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(m);
        ctx.wait(cv, lock, [] { return false; });
        return ctx.err();
    });
    DispatcherOptions options;
    options.maxConcurrentCalls = 1;
    start(std::move(methods), options);

    std::vector<Result<Bytes>> results(3, Result<Bytes>(Bytes{}));
    std::vector<std::thread> callers;
    for (int i = 0; i < 3; ++i) {
        callers.emplace_back([&, i] { results[i] = session_->call(callCtx(), "Block", {}); });
    }
    for (int i = 0; i < 200 && (started.load() == 0 || session_->pendingCount() < 3); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_EQ(started.load(), 1);
    // Let the dispatcher pull the remaining calls off the stream.
    std::this_thread::sleep_for(100ms);

    serveCtx_.cancel();
    server_.join();
    for (auto& t : callers) {
        t.join();
    }
    EXPECT_TRUE(serveResult_) << serveResult_.error().message;

    int remote = 0;
    int cancelled = 0;
    for (const auto& r : results) {
        ASSERT_FALSE(r);
        remote += r.error().code == ErrorCode::RemoteError;
        cancelled += r.error().code == ErrorCode::OperationCancelled;
    }
    EXPECT_EQ(remote, 1);
    EXPECT_EQ(cancelled, 2);
    EXPECT_EQ(started.load(), 1);
    EXPECT_EQ(dispatcher_->callsHandled(), 1u);
}

TEST_F(PluginDispatcherTest, HostHangupFailsServe) {
    start(echoMethods());
    hostEnd_->close();
    server_.join();
    ASSERT_FALSE(serveResult_);
    EXPECT_EQ(serveResult_.error().code, ErrorCode::StreamClosed);
    EXPECT_NE(serveResult_.error().message.find("failed to receive message"), std::string::npos);
}

TEST(PluginDispatcherAdapterTest, ServesOverCarrierMessages) {
    auto [hostCarrier, pluginCarrier] = stream::makeInProcessPair<DomainMessage>();
    auto wrap = [](Bytes b) {
        DomainMessage m;
        m.set_label("opf");
        m.set_data(std::string(b.begin(), b.end()));
        return m;
    };
    auto unwrap = [](const DomainMessage& m) { return Bytes(m.data().begin(), m.data().end()); };

    auto dispatcher = makePluginDispatcherWithAdapter<DomainMessage>(
        pluginCarrier, wrap, unwrap, "carried", "v2", echoMethods());
    ASSERT_TRUE(dispatcher) << dispatcher.error().message;

    auto serveCtx = Context::background().withCancel();
    std::thread server([&] { (void)dispatcher.value()->serve(serveCtx); });

    auto hostStream =
        std::make_shared<stream::CarrierStreamAdapter<DomainMessage>>(hostCarrier, wrap, unwrap);
    auto accepted = host::HostSession::accept(Context::background().withTimeout(5s), hostStream);
    ASSERT_TRUE(accepted) << accepted.error().message;
    auto session = accepted.value();
    EXPECT_EQ(session->pluginName(), "carried");

    auto listenCtx = Context::background().withCancel();
    std::thread listener([&] { (void)session->listen(listenCtx); });

    auto r = session->call(Context::background().withTimeout(5s), "Raw", Bytes{1, 2, 3});
    EXPECT_TRUE(r && r.value() == (Bytes{1, 2, 3}));

    serveCtx.cancel();
    server.join();
    listener.join();
}

} // namespace opf::plugin::test
