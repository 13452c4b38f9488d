#pragma once

#include <opf/core/context.h>
#include <opf/core/types.h>
#include <opf/protocol/envelope_codec.h>
#include <opf/stream/stream.h>
#include <opf/transport/address.h>
#include <opf/transport/message_framing.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/generic/stream_protocol.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

namespace opf::transport {

/**
 * IEnvelopeStream over a framed unix or tcp socket.
 *
 * Socket I/O runs as coroutines on a strand of the owning IoContextRunner;
 * the blocking API waits on their futures, so it must not be called from an
 * io thread. A recv() interrupted by its Context leaves the stream unusable
 * for further reads (the frame may be half consumed).
 *
 * send() takes no Context; each write is bounded by the stream's write
 * timeout instead, and close() aborts it at once. A write that times out
 * leaves the stream unusable for further writes.
 *
 * Always owned by a shared_ptr (see create/connect).
 */
class SocketStream final : public stream::IEnvelopeStream,
                           public std::enable_shared_from_this<SocketStream> {
public:
    using Socket = boost::asio::generic::stream_protocol::socket;

    static std::shared_ptr<SocketStream> create(Socket socket,
                                                size_t maxMessageSize = DEFAULT_MAX_MESSAGE_SIZE);

    // Dial address (resolving tcp host names synchronously).
    static Result<std::shared_ptr<SocketStream>>
    connect(const Context& ctx, boost::asio::any_io_executor executor, const Address& address,
            size_t maxMessageSize = DEFAULT_MAX_MESSAGE_SIZE);

    ~SocketStream() override = default;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    Result<void> send(const protocol::Envelope& env) override;
    Result<protocol::Envelope> recv(const Context& ctx) override;
    Result<void> closeSend() override;
    void close() override;

    // Connection preamble, exchanged once before any envelope.
    Result<void> sendHandshake(const protocol::Metadata& metadata);
    Result<protocol::Metadata> recvHandshake(const Context& ctx);

    bool isOpen() const noexcept { return !closed_.load(); }

    void setWriteTimeout(std::chrono::milliseconds timeout) noexcept {
        writeTimeoutMs_ = timeout.count();
    }
    std::chrono::milliseconds writeTimeout() const noexcept {
        return std::chrono::milliseconds(writeTimeoutMs_.load());
    }

private:
    using ErrorCodeT = boost::system::error_code;
    using Operation = std::function<boost::asio::awaitable<ErrorCodeT>(std::atomic<bool>&)>;

    struct Frame {
        MessageFramer::FrameHeader header;
        std::vector<uint8_t> payload;
        std::optional<Error> error;
    };

    SocketStream(Socket socket, size_t maxMessageSize);

    // Run op on the strand and block until it completes, cancelling it when ctx fires.
    Result<void> runCancellable(const Context& ctx, Operation op, const char* what);

    Result<Frame> readFrame(const Context& ctx);
    Result<void> writeFrame(const std::vector<uint8_t>& frame);

    boost::asio::awaitable<ErrorCodeT> doRead(Frame& out, std::atomic<bool>& abort);
    boost::asio::awaitable<ErrorCodeT> doWrite(const std::vector<uint8_t>& frame,
                                               std::atomic<bool>& abort);
    boost::asio::awaitable<ErrorCodeT>
    doConnect(const boost::asio::generic::stream_protocol::endpoint& endpoint,
              std::atomic<bool>& abort);
    boost::asio::awaitable<ErrorCodeT> doShutdownSend(std::atomic<bool>& abort);

    Socket socket_;
    boost::asio::strand<boost::asio::any_io_executor> strand_;
    MessageFramer framer_;
    std::mutex sendMutex_;
    std::mutex recvMutex_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> broken_{false};
    std::atomic<bool> writeBroken_{false};
    std::atomic<std::chrono::milliseconds::rep> writeTimeoutMs_{
        std::chrono::milliseconds(DEFAULT_WRITE_TIMEOUT).count()};
};

} // namespace opf::transport
