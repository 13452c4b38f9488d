#include <opf/plugin/plugin_client.h>
#include <opf/transport/address.h>
#include <opf/transport/io_context_runner.h>
#include <opf/transport/socket_stream.h>

#include <spdlog/spdlog.h>

namespace opf::plugin {

PluginClient::PluginClient(ClientOptions options) : options_(std::move(options)) {}

PluginClient::~PluginClient() {
    close();
    dispatcher_.reset();
    stream_.reset();
    if (io_) {
        io_->stop();
    }
}

Result<std::unique_ptr<PluginClient>>
PluginClient::connect(const Context& ctx, ClientOptions options, MethodTable methods) {
    if (options.pluginName.empty()) {
        return Error{ErrorCode::InvalidArgument, "plugin name cannot be empty"};
    }

    auto address = transport::parseAddress(options.address);
    if (!address) {
        return address.error();
    }

    protocol::Metadata metadata;
    if (options.tokenProvider) {
        auto bearer = auth::bearerMetadata(*options.tokenProvider);
        if (!bearer) {
            return Error{bearer.error().code,
                         "failed to get authentication token: " + bearer.error().message};
        }
        metadata = std::move(bearer).value();
    }

    std::unique_ptr<PluginClient> client(new PluginClient(std::move(options)));
    client->io_ = std::make_unique<transport::IoContextRunner>(1, "opf-plugin");

    auto stream = transport::SocketStream::connect(ctx.withTimeout(client->options_.connectTimeout),
                                                   client->io_->executor(), address.value(),
                                                   client->options_.maxMessageSize);
    if (!stream) {
        spdlog::error("PluginClient: connect to {} failed: {}", address.value().toString(),
                      stream.error().message);
        return stream.error();
    }
    client->stream_ = std::move(stream).value();
    client->stream_->setWriteTimeout(client->options_.writeTimeout);

    auto hello = client->stream_->sendHandshake(metadata);
    if (!hello) {
        return hello.error();
    }

    DispatcherOptions dispatcherOptions;
    dispatcherOptions.maxConcurrentCalls = client->options_.maxConcurrentCalls;
    auto dispatcher =
        PluginDispatcher::create(client->stream_, client->options_.pluginName,
                                 client->options_.pluginVersion, std::move(methods),
                                 dispatcherOptions);
    if (!dispatcher) {
        return dispatcher.error();
    }
    client->dispatcher_ = std::move(dispatcher).value();

    spdlog::info("PluginClient: '{}' connected to {}", client->options_.pluginName,
                 address.value().toString());
    return client;
}

Result<void> PluginClient::serve(const Context& ctx) {
    if (!dispatcher_) {
        return Error{ErrorCode::InvalidState, "client is not connected"};
    }
    return dispatcher_->serve(ctx);
}

void PluginClient::close() {
    if (stream_) {
        stream_->close();
    }
}

} // namespace opf::plugin
