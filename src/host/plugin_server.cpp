#include <opf/auth/token_provider.h>
#include <opf/host/plugin_server.h>
#include <opf/transport/address.h>
#include <opf/transport/io_context_runner.h>
#include <opf/transport/socket_listener.h>
#include <opf/transport/socket_stream.h>

#include <spdlog/spdlog.h>
#include <condition_variable>

namespace opf::host {

using protocol::makeError;
namespace wire = protocol::wire;

namespace {

constexpr std::chrono::seconds kHandshakeTimeout{10};

std::string_view rejectionCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::ProtocolViolation:
        case ErrorCode::InvalidData:
            return wire::kInvalidArgument;
        case ErrorCode::ResourceExhausted:
            return wire::kResourceExhausted;
        case ErrorCode::Unauthenticated:
            return wire::kUnauthenticated;
        default:
            return wire::kRpcError;
    }
}

// Tell the peer why it is being dropped. The stream is closed right after,
// so a failed send only matters for the log.
void sendRejection(stream::IEnvelopeStream& stream, const Error& why) {
    auto sent = stream.send(makeError(std::string(rejectionCode(why.code)), why.message));
    if (!sent) {
        spdlog::debug("PluginServer: could not deliver rejection: {}", sent.error().message);
    }
}

} // namespace

PluginServer::PluginServer(ServerConfig config, std::shared_ptr<IConnectionHandler> handler)
    : config_(std::move(config)), connections_(config_.maxConnections, std::move(handler)) {}

PluginServer::~PluginServer() {
    stop();
}

Result<void> PluginServer::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (running_) {
        return Error{ErrorCode::InvalidState, "server already running"};
    }

    auto address = transport::parseAddress(config_.listenAddress);
    if (!address) {
        return Error{ErrorCode::InvalidAddress,
                     "invalid server address: " + address.error().message};
    }

    serverCtx_ = Context{};
    auto io = std::make_unique<transport::IoContextRunner>(config_.ioThreads, "opf-server");
    auto listener =
        transport::SocketListener::listen(io->executor(), address.value(), config_.maxMessageSize);
    if (!listener) {
        io->stop();
        return listener.error();
    }

    io_ = std::move(io);
    listener_ = std::move(listener).value();
    running_ = true;

    listener_->start(
        [this](std::shared_ptr<transport::SocketStream> stream) { onAccepted(std::move(stream)); });
    startReaper();

    spdlog::info("PluginServer: started on {} (max {} plugins)", address.value().toString(),
                 config_.maxConnections);
    return Result<void>();
}

void PluginServer::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    const bool wasRunning = running_.exchange(false);

    if (listener_) {
        listener_->close();
    }
    serverCtx_.cancel();

    {
        std::lock_guard<std::mutex> lock(liveMutex_);
        for (auto& [name, conn] : live_) {
            conn.lifetime.cancel();
        }
    }

    if (reaper_.joinable()) {
        reaper_.request_stop();
        reaper_.join();
    }

    std::vector<ConnectionThread> threads;
    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        threads.swap(connectionThreads_);
    }
    for (auto& t : threads) {
        if (t.thread.joinable()) {
            t.thread.join();
        }
    }

    listener_.reset();
    if (io_) {
        io_->stop();
        io_.reset();
    }

    if (wasRunning) {
        spdlog::info("PluginServer: stopped");
    }
}

void PluginServer::startReaper() {
    reaper_ = std::jthread([this](std::stop_token token) {
        std::mutex waitMutex;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(waitMutex);
        while (!token.stop_requested()) {
            cv.wait_for(lock, token, config_.idleCheckInterval, [] { return false; });
            if (token.stop_requested()) {
                break;
            }
            reapIdleConnections();
        }
    });
}

size_t PluginServer::reapIdleConnections() {
    size_t reaped = 0;
    for (const auto& name : connections_.idleConnections(config_.idleTimeout)) {
        std::lock_guard<std::mutex> lock(liveMutex_);
        auto it = live_.find(name);
        if (it == live_.end()) {
            continue;
        }
        spdlog::info("PluginServer: closing idle plugin '{}' (idle > {} ms)", name,
                     config_.idleTimeout.count());
        it->second.lifetime.cancel();
        ++reaped;
    }
    return reaped;
}

void PluginServer::onAccepted(std::shared_ptr<transport::SocketStream> stream) {
    std::lock_guard<std::mutex> lock(threadsMutex_);

    std::erase_if(connectionThreads_, [](ConnectionThread& t) {
        if (!t.finished->load()) {
            return false;
        }
        t.thread.join();
        return true;
    });

    if (!running_) {
        stream->close();
        return;
    }

    stream->setWriteTimeout(config_.writeTimeout);
    auto finished = std::make_shared<std::atomic<bool>>(false);
    connectionThreads_.push_back(ConnectionThread{
        std::jthread([this, stream = std::move(stream), finished]() mutable {
            serveSocket(std::move(stream));
            finished->store(true);
        }),
        finished});
}

void PluginServer::serveSocket(std::shared_ptr<transport::SocketStream> stream) {
    auto ctx = serverCtx_.withCancel();

    auto metadata = stream->recvHandshake(ctx.withTimeout(kHandshakeTimeout));
    if (!metadata) {
        spdlog::warn("PluginServer: dropping connection without handshake: {}",
                     metadata.error().message);
        stream->close();
        return;
    }

    if (config_.tokenValidator) {
        auto token = auth::bearerToken(metadata.value());
        Result<void> verdict = token ? config_.tokenValidator(token.value())
                                     : Result<void>(token.error());
        if (!verdict) {
            Error why{ErrorCode::Unauthenticated, "authentication failed"};
            spdlog::warn("PluginServer: rejecting connection: {}", verdict.error().message);
            sendRejection(*stream, why);
            stream->close();
            return;
        }
    }

    auto served = handleStream(ctx, stream);
    if (!served) {
        spdlog::debug("PluginServer: connection ended: {}", served.error().message);
    }
}

Result<void> PluginServer::handleStream(const Context& ctx,
                                        std::shared_ptr<stream::IEnvelopeStream> stream) {
    auto accepted = HostSession::accept(ctx, stream);
    if (!accepted) {
        const auto& err = accepted.error();
        if (err.code == ErrorCode::ProtocolViolation || err.code == ErrorCode::InvalidData) {
            spdlog::warn("PluginServer: protocol violation during registration: {}",
                         err.message);
            sendRejection(*stream, err);
        }
        stream->close();
        return err;
    }

    auto session = std::move(accepted).value();
    const std::string name = session->pluginName();
    auto lifetime = ctx.withCancel();

    std::jthread listener;
    Result<void> listenResult;
    auto attached = connections_.attach(lifetime, name, [&] {
        {
            std::lock_guard<std::mutex> lock(liveMutex_);
            live_.insert_or_assign(name, LiveConnection{session, lifetime});
        }
        listener = std::jthread([this, session, lifetime, name, &listenResult] {
            listenResult = session->listen(lifetime, [this, &name] { connections_.touch(name); });
            lifetime.cancel();
        });
    });

    if (!listener.joinable()) {
        if (!ctx.done()) {
            sendRejection(*stream, attached.error());
        }
        stream->close();
        return attached;
    }

    stream->close();
    listener.join();

    {
        std::lock_guard<std::mutex> lock(liveMutex_);
        auto it = live_.find(name);
        if (it != live_.end() && it->second.session == session) {
            live_.erase(it);
        }
    }

    if (ctx.done()) {
        return ctx.err();
    }
    // The plugin hanging up is a normal end; anything else (reaped, stopped,
    // transport failure) is reported.
    if (!listenResult && listenResult.error().code != ErrorCode::StreamClosed) {
        return listenResult;
    }
    return Result<void>();
}

std::shared_ptr<HostSession> PluginServer::session(const std::string& name) const {
    std::lock_guard<std::mutex> lock(liveMutex_);
    auto it = live_.find(name);
    return it != live_.end() ? it->second.session : nullptr;
}

Result<Bytes> PluginServer::call(const Context& ctx, const std::string& pluginName,
                                 const std::string& method, const Bytes& payload) {
    auto target = session(pluginName);
    if (!target) {
        return Error{ErrorCode::NotFound, "plugin not found: " + pluginName};
    }
    return target->call(ctx, method, payload);
}

} // namespace opf::host
