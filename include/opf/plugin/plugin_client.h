#pragma once

#include <opf/auth/token_provider.h>
#include <opf/core/context.h>
#include <opf/core/types.h>
#include <opf/plugin/dispatcher.h>
#include <opf/plugin/method_table.h>

#include <chrono>
#include <memory>
#include <string>

namespace opf::transport {
class IoContextRunner;
class SocketStream;
} // namespace opf::transport

namespace opf::plugin {

struct ClientOptions {
    // unix:///path or tcp://host:port of the host's PluginServer
    std::string address;
    std::string pluginName;
    std::string pluginVersion;
    // Consulted once per connect; null sends no credentials.
    std::shared_ptr<auth::ITokenProvider> tokenProvider;
    size_t maxMessageSize = DEFAULT_MAX_MESSAGE_SIZE;
    size_t maxConcurrentCalls = 16;
    std::chrono::milliseconds connectTimeout = std::chrono::seconds(10);
    std::chrono::milliseconds writeTimeout = DEFAULT_WRITE_TIMEOUT;
};

/**
 * Plugin process side of a socket connection to a PluginServer.
 *
 * @code
 * MethodTable methods;
 * methods.add("Echo", [](const Context&, const Bytes& in) -> Result<Bytes> { return in; });
 * auto client = PluginClient::connect(ctx, options, std::move(methods));
 * if (client) client.value()->serve(ctx);
 * @endcode
 */
class PluginClient {
public:
    static Result<std::unique_ptr<PluginClient>> connect(const Context& ctx,
                                                         ClientOptions options,
                                                         MethodTable methods);

    ~PluginClient();

    PluginClient(const PluginClient&) = delete;
    PluginClient& operator=(const PluginClient&) = delete;

    // Serve calls until ctx ends or the connection fails.
    Result<void> serve(const Context& ctx);

    void close();

    const ClientOptions& options() const noexcept { return options_; }

private:
    explicit PluginClient(ClientOptions options);

    ClientOptions options_;
    std::unique_ptr<transport::IoContextRunner> io_;
    std::shared_ptr<transport::SocketStream> stream_;
    std::unique_ptr<PluginDispatcher> dispatcher_;
};

} // namespace opf::plugin
