#pragma once

#include <opf/core/context.h>
#include <opf/core/types.h>
#include <opf/host/connection_registry.h>
#include <opf/host/host_session.h>
#include <opf/host/plugin_registry.h>
#include <opf/host/server_config.h>
#include <opf/stream/stream.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace opf::transport {
class IoContextRunner;
class SocketListener;
class SocketStream;
} // namespace opf::transport

namespace opf::host {

/**
 * Host endpoint plugins connect to.
 *
 * Each connection runs the same state machine, whatever carries it:
 * read Register, pass admission, run the receive loop until the connection's
 * lifetime ends, then detach. start() serves it on config.listenAddress;
 * handleStream() runs it over any IEnvelopeStream.
 *
 * @code
 * PluginServer server(ServerConfig::load());
 * if (auto r = server.start(); !r) { ... }
 * auto reply = server.call(ctx, "echo", "Echo", payload);
 * @endcode
 */
class PluginServer {
public:
    explicit PluginServer(ServerConfig config = {},
                          std::shared_ptr<IConnectionHandler> handler = nullptr);
    ~PluginServer();

    PluginServer(const PluginServer&) = delete;
    PluginServer& operator=(const PluginServer&) = delete;

    Result<void> start();
    void stop();
    bool isRunning() const noexcept { return running_.load(); }

    /**
     * Serve one plugin connection until it ends. Returns success when the
     * plugin closed the stream, the ctx error when ctx ended it, and the
     * rejection reason when registration or admission failed. The stream is
     * closed on return.
     */
    Result<void> handleStream(const Context& ctx, std::shared_ptr<stream::IEnvelopeStream> stream);

    size_t connectionCount() const { return connections_.count(); }
    std::vector<std::string> listPlugins() const { return connections_.list(); }
    bool isPluginConnected(const std::string& name) const {
        return connections_.isAttached(name);
    }

    // Null when no plugin with that name is attached.
    std::shared_ptr<HostSession> session(const std::string& name) const;

    Result<Bytes> call(const Context& ctx, const std::string& pluginName,
                       const std::string& method, const Bytes& payload);

    // Cancel connections idle for longer than config.idleTimeout. Returns how many.
    size_t reapIdleConnections();

    PluginRegistry& registry() noexcept { return registry_; }
    ConnectionRegistry& connections() noexcept { return connections_; }
    const ServerConfig& config() const noexcept { return config_; }

private:
    struct LiveConnection {
        std::shared_ptr<HostSession> session;
        Context lifetime;
    };

    struct ConnectionThread {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void onAccepted(std::shared_ptr<transport::SocketStream> stream);
    void serveSocket(std::shared_ptr<transport::SocketStream> stream);
    void startReaper();

    ServerConfig config_;
    ConnectionRegistry connections_;
    PluginRegistry registry_;

    mutable std::mutex liveMutex_;
    std::unordered_map<std::string, LiveConnection> live_;

    std::atomic<bool> running_{false};
    std::mutex lifecycleMutex_;
    Context serverCtx_;
    std::unique_ptr<transport::IoContextRunner> io_;
    std::shared_ptr<transport::SocketListener> listener_;

    std::mutex threadsMutex_;
    std::vector<ConnectionThread> connectionThreads_;
    std::jthread reaper_;
};

} // namespace opf::host
