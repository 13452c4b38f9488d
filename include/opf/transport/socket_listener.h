#pragma once

#include <opf/core/types.h>
#include <opf/transport/address.h>
#include <opf/transport/socket_stream.h>

#include <atomic>
#include <functional>
#include <memory>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/basic_socket_acceptor.hpp>
#include <boost/asio/generic/stream_protocol.hpp>
#include <boost/asio/strand.hpp>

namespace opf::transport {

/**
 * Bound acceptor for a unix or tcp address. Each accepted connection is handed
 * to the AcceptHandler on an io thread; the handler must not block.
 */
class SocketListener : public std::enable_shared_from_this<SocketListener> {
public:
    using AcceptHandler = std::function<void(std::shared_ptr<SocketStream>)>;

    // Bind and listen. A stale unix socket file at the path is removed first.
    static Result<std::shared_ptr<SocketListener>> listen(boost::asio::any_io_executor executor,
                                                          const Address& address,
                                                          size_t maxMessageSize);

    ~SocketListener();

    void start(AcceptHandler onAccept);

    // Stop accepting and release the address. Idempotent.
    void close();

    const Address& address() const noexcept { return address_; }

private:
    using Acceptor = boost::asio::basic_socket_acceptor<boost::asio::generic::stream_protocol>;

    SocketListener(boost::asio::any_io_executor executor, Address address, size_t maxMessageSize);

    boost::asio::awaitable<void> acceptLoop(AcceptHandler onAccept);

    Acceptor acceptor_;
    boost::asio::strand<boost::asio::any_io_executor> strand_;
    Address address_;
    size_t maxMessageSize_;
    std::atomic<bool> closed_{false};
};

} // namespace opf::transport
