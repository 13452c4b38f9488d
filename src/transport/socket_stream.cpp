#include <opf/transport/socket_stream.h>

#include <spdlog/spdlog.h>
#include <array>
#include <future>
#include <stop_token>
#include <string>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/write.hpp>

namespace opf::transport {

namespace asio = boost::asio;
using asio::awaitable;
using asio::use_awaitable;
using GenericEndpoint = asio::generic::stream_protocol::endpoint;

namespace {

bool isEndOfStream(const boost::system::error_code& ec) {
    return ec == asio::error::eof || ec == asio::error::connection_reset ||
           ec == asio::error::broken_pipe || ec == asio::error::bad_descriptor ||
           ec == asio::error::not_connected;
}

} // namespace

SocketStream::SocketStream(Socket socket, size_t maxMessageSize)
    : socket_(std::move(socket)), strand_(asio::make_strand(socket_.get_executor())),
      framer_(maxMessageSize) {}

std::shared_ptr<SocketStream> SocketStream::create(Socket socket, size_t maxMessageSize) {
    return std::shared_ptr<SocketStream>(new SocketStream(std::move(socket), maxMessageSize));
}

Result<std::shared_ptr<SocketStream>> SocketStream::connect(const Context& ctx,
                                                            asio::any_io_executor executor,
                                                            const Address& address,
                                                            size_t maxMessageSize) {
    std::vector<GenericEndpoint> endpoints;
    if (address.scheme == Address::Scheme::Unix) {
        endpoints.emplace_back(asio::local::stream_protocol::endpoint(address.host));
    } else {
        asio::ip::tcp::resolver resolver(executor);
        boost::system::error_code ec;
        auto results = resolver.resolve(address.host, std::to_string(address.port), ec);
        if (ec) {
            return Error{ErrorCode::NetworkError,
                         "resolve " + address.toString() + " failed: " + ec.message()};
        }
        for (const auto& entry : results) {
            endpoints.emplace_back(entry.endpoint());
        }
    }

    Error last{ErrorCode::NetworkError, "no endpoints for " + address.toString()};
    for (const auto& endpoint : endpoints) {
        auto stream = create(Socket(executor), maxMessageSize);
        auto r = stream->runCancellable(
            ctx,
            [raw = stream.get(), &endpoint](std::atomic<bool>& abort) {
                return raw->doConnect(endpoint, abort);
            },
            "connect");
        if (r) {
            spdlog::debug("SocketStream: connected to {}", address.toString());
            return stream;
        }
        last = r.error();
        if (ctx.done()) {
            break;
        }
    }
    return last;
}

Result<void> SocketStream::runCancellable(const Context& ctx, Operation op, const char* what) {
    if (ctx.done()) {
        return ctx.err();
    }

    auto self = shared_from_this();
    auto abort = std::make_shared<std::atomic<bool>>(false);
    auto requestCancel = [self, abort] {
        abort->store(true);
        asio::post(self->strand_, [self] {
            boost::system::error_code ignored;
            self->socket_.cancel(ignored);
        });
    };

    auto future = asio::co_spawn(
        strand_, [op = std::move(op), abort]() { return op(*abort); }, asio::use_future);

    bool timedOut = false;
    {
        std::stop_callback onStop(ctx.stopToken(), requestCancel);
        if (auto deadline = ctx.deadline()) {
            if (future.wait_until(*deadline) == std::future_status::timeout) {
                timedOut = true;
                requestCancel();
            }
        }
        future.wait();
    }

    boost::system::error_code ec;
    try {
        ec = future.get();
    } catch (const std::exception& e) {
        // io context stopped underneath us, or the coroutine threw
        broken_ = true;
        return Error{ErrorCode::NetworkError, std::string(what) + " failed: " + e.what()};
    }

    if (!ec) {
        return Result<void>();
    }
    if (ec == asio::error::operation_aborted) {
        if (closed_) {
            return Error{ErrorCode::StreamClosed, "stream closed"};
        }
        if (timedOut) {
            return Error{ErrorCode::Timeout, "context deadline exceeded"};
        }
        if (ctx.cancelled()) {
            return Error{ErrorCode::OperationCancelled, "context cancelled"};
        }
    }
    if (closed_ || isEndOfStream(ec)) {
        return Error{ErrorCode::StreamClosed, "end of stream"};
    }
    return Error{ErrorCode::NetworkError, std::string(what) + " failed: " + ec.message()};
}

awaitable<boost::system::error_code> SocketStream::doRead(Frame& out, std::atomic<bool>& abort) {
    boost::system::error_code ec;
    if (abort.load()) {
        co_return asio::error::operation_aborted;
    }

    std::array<uint8_t, MessageFramer::HEADER_SIZE> headerBytes{};
    co_await asio::async_read(socket_, asio::buffer(headerBytes),
                              asio::redirect_error(use_awaitable, ec));
    if (ec) {
        co_return ec;
    }

    auto header = framer_.parse_header(headerBytes);
    if (!header) {
        out.error = header.error();
        co_return ec;
    }
    out.header = header.value();
    out.payload.resize(out.header.payload_size);

    if (out.header.payload_size > 0) {
        if (abort.load()) {
            co_return asio::error::operation_aborted;
        }
        co_await asio::async_read(socket_, asio::buffer(out.payload),
                                  asio::redirect_error(use_awaitable, ec));
    }
    co_return ec;
}

awaitable<boost::system::error_code> SocketStream::doWrite(const std::vector<uint8_t>& frame,
                                                           std::atomic<bool>& abort) {
    boost::system::error_code ec;
    if (abort.load()) {
        co_return asio::error::operation_aborted;
    }
    auto written = co_await asio::async_write(socket_, asio::buffer(frame),
                                              asio::redirect_error(use_awaitable, ec));
    if (!ec && written != frame.size()) {
        co_return asio::error::broken_pipe;
    }
    co_return ec;
}

awaitable<boost::system::error_code> SocketStream::doConnect(const GenericEndpoint& endpoint,
                                                             std::atomic<bool>& abort) {
    boost::system::error_code ec;
    if (abort.load()) {
        co_return asio::error::operation_aborted;
    }
    socket_.open(endpoint.protocol(), ec);
    if (ec) {
        co_return ec;
    }
    co_await socket_.async_connect(endpoint, asio::redirect_error(use_awaitable, ec));
    co_return ec;
}

awaitable<boost::system::error_code> SocketStream::doShutdownSend(std::atomic<bool>&) {
    boost::system::error_code ec;
    socket_.shutdown(asio::socket_base::shutdown_send, ec);
    co_return ec;
}

Result<SocketStream::Frame> SocketStream::readFrame(const Context& ctx) {
    if (ctx.done()) {
        return ctx.err();
    }
    Frame frame;
    auto r = runCancellable(
        ctx, [this, &frame](std::atomic<bool>& abort) { return doRead(frame, abort); }, "read");
    if (!r) {
        if (r.error().code == ErrorCode::OperationCancelled ||
            r.error().code == ErrorCode::Timeout) {
            broken_ = true;
        }
        return r.error();
    }
    if (frame.error) {
        broken_ = true;
        return *frame.error;
    }
    return frame;
}

Result<void> SocketStream::writeFrame(const std::vector<uint8_t>& frame) {
    if (writeBroken_) {
        return Error{ErrorCode::NetworkError, "stream unusable after an interrupted write"};
    }
    auto r = runCancellable(
        Context::background().withTimeout(writeTimeout()),
        [this, &frame](std::atomic<bool>& abort) { return doWrite(frame, abort); }, "write");
    if (!r && r.error().code == ErrorCode::Timeout) {
        // Part of the frame may already be on the wire.
        writeBroken_ = true;
        spdlog::warn("SocketStream: write timed out after {} ms, peer is not reading",
                     writeTimeout().count());
    }
    return r;
}

Result<void> SocketStream::send(const protocol::Envelope& env) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    if (closed_) {
        return Error{ErrorCode::StreamClosed, "stream closed"};
    }
    auto frame = framer_.frame_envelope(env);
    if (!frame) {
        return frame.error();
    }
    return writeFrame(frame.value());
}

Result<protocol::Envelope> SocketStream::recv(const Context& ctx) {
    std::lock_guard<std::mutex> lock(recvMutex_);
    if (closed_) {
        return Error{ErrorCode::StreamClosed, "stream closed"};
    }
    if (broken_) {
        return Error{ErrorCode::NetworkError, "stream unusable after an interrupted read"};
    }
    auto frame = readFrame(ctx);
    if (!frame) {
        return frame.error();
    }
    return framer_.parse_envelope(frame.value().header, frame.value().payload);
}

Result<void> SocketStream::closeSend() {
    std::lock_guard<std::mutex> lock(sendMutex_);
    if (closed_) {
        return Error{ErrorCode::StreamClosed, "stream closed"};
    }
    return runCancellable(
        Context::background(),
        [this](std::atomic<bool>& abort) { return doShutdownSend(abort); }, "shutdown");
}

void SocketStream::close() {
    if (closed_.exchange(true)) {
        return;
    }
    auto self = shared_from_this();
    asio::post(strand_, [self] {
        boost::system::error_code ignored;
        self->socket_.shutdown(asio::socket_base::shutdown_both, ignored);
        self->socket_.close(ignored);
    });
}

Result<void> SocketStream::sendHandshake(const protocol::Metadata& metadata) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    auto frame = framer_.frame_handshake(metadata);
    if (!frame) {
        return frame.error();
    }
    return writeFrame(frame.value());
}

Result<protocol::Metadata> SocketStream::recvHandshake(const Context& ctx) {
    std::lock_guard<std::mutex> lock(recvMutex_);
    auto frame = readFrame(ctx);
    if (!frame) {
        return frame.error();
    }
    return framer_.parse_handshake(frame.value().header, frame.value().payload);
}

} // namespace opf::transport
