#pragma once

#include <opf/core/context.h>
#include <opf/core/types.h>
#include <opf/plugin/method_table.h>
#include <opf/protocol/envelope.h>
#include <opf/stream/carrier_adapter.h>
#include <opf/stream/stream.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace opf {
class ThreadPool;
}

namespace opf::plugin {

struct DispatcherOptions {
    // Handlers running at once; further calls queue.
    size_t maxConcurrentCalls = 16;
    // How long serve waits for running handlers once its context ends.
    std::chrono::milliseconds drainTimeout = std::chrono::seconds(2);
};

/**
 * Plugin side of a stream: registers with the host, then executes inbound
 * calls against a MethodTable and writes each outcome back on the stream.
 */
class PluginDispatcher {
public:
    // Sends Register{name, version}; a send failure fails creation.
    static Result<std::unique_ptr<PluginDispatcher>>
    create(std::shared_ptr<stream::IEnvelopeStream> stream, std::string name,
           std::string version, MethodTable methods, DispatcherOptions options = {});

    // Waits for any handler still running past a drain timeout.
    ~PluginDispatcher();

    PluginDispatcher(const PluginDispatcher&) = delete;
    PluginDispatcher& operator=(const PluginDispatcher&) = delete;

    /**
     * Receive loop. Calls run concurrently on a pool of
     * options.maxConcurrentCalls workers and may complete in any order.
     *
     * When the loop ends, calls still queued are answered with a CANCELLED
     * error without running and running handlers see their context cancelled
     * and get up to options.drainTimeout to finish. If ctx ended the loop, the
     * send side is then half-closed. The result of that half-close
     * is returned (NotSupported counts as success). A receive failure is
     * returned as is.
     */
    Result<void> serve(const Context& ctx);

    const std::string& name() const noexcept { return name_; }
    const std::string& version() const noexcept { return version_; }
    size_t callsHandled() const noexcept { return callsHandled_.load(); }

private:
    PluginDispatcher(std::shared_ptr<stream::IEnvelopeStream> stream, std::string name,
                     std::string version, MethodTable methods, DispatcherOptions options);

    void handleCall(const Context& ctx, const protocol::RpcCall& call);
    Result<void> sendEnvelope(const protocol::Envelope& env);
    // False if calls were still running when the timeout elapsed.
    bool drainCalls(std::chrono::milliseconds timeout);

    std::shared_ptr<stream::IEnvelopeStream> stream_;
    std::string name_;
    std::string version_;
    MethodTable methods_;
    DispatcherOptions options_;
    std::mutex sendMutex_;
    std::atomic<size_t> callsHandled_{0};

    std::mutex callsMutex_;
    std::condition_variable callsIdle_;
    size_t callsOutstanding_{0};
    // Outlives serve so a handler that ignores cancellation cannot hold it up.
    std::unique_ptr<ThreadPool> pool_;
};

/**
 * Dispatcher over a carrier stream: envelopes travel inside Carrier messages
 * through a CarrierStreamAdapter built from wrap/unwrap.
 */
template <typename Carrier>
Result<std::unique_ptr<PluginDispatcher>> makePluginDispatcherWithAdapter(
    std::shared_ptr<stream::ICarrierStream<Carrier>> carrier,
    typename stream::CarrierStreamAdapter<Carrier>::WrapFn wrap,
    typename stream::CarrierStreamAdapter<Carrier>::UnwrapFn unwrap, std::string name,
    std::string version, MethodTable methods, DispatcherOptions options = {}) {
    auto adapter = std::make_shared<stream::CarrierStreamAdapter<Carrier>>(
        std::move(carrier), std::move(wrap), std::move(unwrap));
    return PluginDispatcher::create(std::move(adapter), std::move(name), std::move(version),
                                    std::move(methods), options);
}

} // namespace opf::plugin
