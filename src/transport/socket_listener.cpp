#include <opf/transport/socket_listener.h>

#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <sys/un.h>

namespace opf::transport {

namespace asio = boost::asio;
using asio::awaitable;
using asio::use_awaitable;
using GenericEndpoint = asio::generic::stream_protocol::endpoint;

namespace {

Result<GenericEndpoint> prepareUnixEndpoint(const std::string& path) {
    if (path.size() >= sizeof(sockaddr_un::sun_path)) {
        return Error{ErrorCode::InvalidAddress,
                     "Socket path too long for AF_UNIX (" + std::to_string(path.size()) + "/" +
                         std::to_string(sizeof(sockaddr_un::sun_path)) + ") : '" + path + "'"};
    }

    std::filesystem::path sockPath{path};
    std::error_code ec;
    std::filesystem::remove(sockPath, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        spdlog::warn("SocketListener: failed to remove existing socket {}: {}", path,
                     ec.message());
    }

    auto parent = sockPath.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Error{ErrorCode::NetworkError,
                         "cannot create socket directory " + parent.string() + ": " +
                             ec.message()};
        }
    }
    return GenericEndpoint(asio::local::stream_protocol::endpoint(path));
}

Result<GenericEndpoint> resolveTcpEndpoint(asio::any_io_executor executor,
                                           const Address& address) {
    asio::ip::tcp::resolver resolver(executor);
    boost::system::error_code ec;
    auto results = resolver.resolve(address.host, std::to_string(address.port),
                                    asio::ip::tcp::resolver::passive, ec);
    if (ec || results.empty()) {
        return Error{ErrorCode::InvalidAddress,
                     "cannot resolve " + address.toString() + ": " + ec.message()};
    }
    return GenericEndpoint(results.begin()->endpoint());
}

} // namespace

SocketListener::SocketListener(asio::any_io_executor executor, Address address,
                               size_t maxMessageSize)
    : acceptor_(executor), strand_(asio::make_strand(executor)), address_(std::move(address)),
      maxMessageSize_(maxMessageSize) {}

SocketListener::~SocketListener() {
    if (address_.scheme == Address::Scheme::Unix) {
        std::error_code ec;
        std::filesystem::remove(address_.host, ec);
    }
}

Result<std::shared_ptr<SocketListener>>
SocketListener::listen(asio::any_io_executor executor, const Address& address,
                       size_t maxMessageSize) {
    auto endpoint = address.scheme == Address::Scheme::Unix
                        ? prepareUnixEndpoint(address.host)
                        : resolveTcpEndpoint(executor, address);
    if (!endpoint) {
        return endpoint.error();
    }

    std::shared_ptr<SocketListener> listener(
        new SocketListener(executor, address, maxMessageSize));

    boost::system::error_code ec;
    auto& acceptor = listener->acceptor_;
    acceptor.open(endpoint.value().protocol(), ec);
    if (!ec && address.scheme == Address::Scheme::Tcp) {
        acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor.bind(endpoint.value(), ec);
    }
    if (!ec) {
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        return Error{ErrorCode::NetworkError,
                     "listen on " + address.toString() + " failed: " + ec.message()};
    }

    if (address.scheme == Address::Scheme::Unix) {
        std::error_code permEc;
        std::filesystem::permissions(address.host,
                                     std::filesystem::perms::owner_all |
                                         std::filesystem::perms::group_read |
                                         std::filesystem::perms::group_write,
                                     permEc);
    }

    spdlog::info("SocketListener: listening on {}", address.toString());
    return listener;
}

void SocketListener::start(AcceptHandler onAccept) {
    asio::co_spawn(strand_, acceptLoop(std::move(onAccept)), asio::detached);
}

void SocketListener::close() {
    if (closed_.exchange(true)) {
        return;
    }
    auto self = shared_from_this();
    asio::post(strand_, [self] {
        boost::system::error_code ignored;
        self->acceptor_.close(ignored);
    });
}

awaitable<void> SocketListener::acceptLoop(AcceptHandler onAccept) {
    auto self = shared_from_this();
    spdlog::debug("SocketListener: accept loop started on {}", address_.toString());

    while (!closed_) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(asio::redirect_error(use_awaitable, ec));

        if (ec) {
            if (closed_ || ec == asio::error::operation_aborted) {
                break;
            }
            spdlog::warn("SocketListener: accept error: {}", ec.message());
            asio::steady_timer timer(strand_, std::chrono::milliseconds(100));
            co_await timer.async_wait(asio::redirect_error(use_awaitable, ec));
            continue;
        }

        try {
            onAccept(SocketStream::create(std::move(socket), maxMessageSize_));
        } catch (const std::exception& e) {
            spdlog::error("SocketListener: accept handler threw: {}", e.what());
        }
    }

    spdlog::debug("SocketListener: accept loop exited on {}", address_.toString());
}

} // namespace opf::transport
