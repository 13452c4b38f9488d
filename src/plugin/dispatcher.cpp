#include <opf/core/thread_pool.h>
#include <opf/plugin/dispatcher.h>

#include <spdlog/spdlog.h>

namespace opf::plugin {

using protocol::Envelope;
namespace wire = protocol::wire;

PluginDispatcher::PluginDispatcher(std::shared_ptr<stream::IEnvelopeStream> stream,
                                   std::string name, std::string version, MethodTable methods,
                                   DispatcherOptions options)
    : stream_(std::move(stream)), name_(std::move(name)), version_(std::move(version)),
      methods_(std::move(methods)), options_(options) {
    if (options_.maxConcurrentCalls == 0) {
        options_.maxConcurrentCalls = 1;
    }
}

PluginDispatcher::~PluginDispatcher() {
    // Joins the workers; handlers reference this dispatcher.
    pool_.reset();
}

Result<std::unique_ptr<PluginDispatcher>>
PluginDispatcher::create(std::shared_ptr<stream::IEnvelopeStream> stream, std::string name,
                         std::string version, MethodTable methods, DispatcherOptions options) {
    if (name.empty()) {
        return Error{ErrorCode::InvalidArgument, "plugin name cannot be empty"};
    }

    std::unique_ptr<PluginDispatcher> dispatcher(new PluginDispatcher(
        std::move(stream), std::move(name), std::move(version), std::move(methods), options));

    auto sent = dispatcher->sendEnvelope(
        protocol::makeRegister(dispatcher->name_, dispatcher->version_));
    if (!sent) {
        return Error{sent.error().code,
                     "failed to send registration: " + sent.error().message};
    }

    spdlog::info("PluginDispatcher: registered as '{}' version '{}' ({} methods)",
                 dispatcher->name_, dispatcher->version_, dispatcher->methods_.size());
    return dispatcher;
}

Result<void> PluginDispatcher::sendEnvelope(const Envelope& env) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    return stream_->send(env);
}

Result<void> PluginDispatcher::serve(const Context& ctx) {
    if (!pool_) {
        pool_ = std::make_unique<ThreadPool>(options_.maxConcurrentCalls, "opf-dispatch");
    }
    // Cancelled when the loop ends for any reason, so queued calls never start.
    auto callsCtx = ctx.withCancel();
    Result<void> outcome;

    while (true) {
        auto env = stream_->recv(ctx);
        if (!env) {
            if (ctx.done()) {
                break;
            }
            spdlog::warn("PluginDispatcher: receive failed: {}", env.error().message);
            outcome = Error{env.error().code, "failed to receive message: " + env.error().message};
            break;
        }

        const auto* call = env.value().asCall();
        if (!call) {
            spdlog::debug("PluginDispatcher: ignoring {} envelope",
                          protocol::envelopeKind(env.value()));
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(callsMutex_);
            ++callsOutstanding_;
        }
        auto callCtx = callsCtx.withCancel();
        bool queued = pool_->enqueue_detached([this, callCtx, call = *call]() {
            handleCall(callCtx, call);
            std::lock_guard<std::mutex> lock(callsMutex_);
            if (--callsOutstanding_ == 0) {
                callsIdle_.notify_all();
            }
        });
        if (!queued) {
            std::lock_guard<std::mutex> lock(callsMutex_);
            --callsOutstanding_;
            spdlog::error("PluginDispatcher: worker pool stopped, dropping call {}",
                          call->requestId);
        }
    }

    callsCtx.cancel();
    if (!drainCalls(options_.drainTimeout)) {
        spdlog::warn("PluginDispatcher: handlers still running after {} ms, returning anyway",
                     options_.drainTimeout.count());
    }

    if (!ctx.done()) {
        return outcome;
    }

    std::lock_guard<std::mutex> lock(sendMutex_);
    auto closed = stream_->closeSend();
    if (!closed && closed.error().code != ErrorCode::NotSupported) {
        return closed;
    }
    return Result<void>();
}

bool PluginDispatcher::drainCalls(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(callsMutex_);
    return callsIdle_.wait_for(lock, timeout, [this] { return callsOutstanding_ == 0; });
}

void PluginDispatcher::handleCall(const Context& ctx, const protocol::RpcCall& call) {
    if (ctx.done()) {
        spdlog::debug("PluginDispatcher: skipping {} ({}), serve is stopping", call.method,
                      call.requestId);
        auto sent = sendEnvelope(protocol::makeError(std::string(wire::kCancelled),
                                                     "plugin stopped before running " +
                                                         call.method,
                                                     call.requestId));
        if (!sent) {
            spdlog::debug("PluginDispatcher: failed to report skipped call: {}",
                          sent.error().message);
        }
        return;
    }

    callsHandled_.fetch_add(1);

    const auto* handler = methods_.resolve(call.method);
    if (!handler) {
        spdlog::warn("PluginDispatcher: unknown method {}", call.method);
        auto sent = sendEnvelope(protocol::makeError(
            std::string(wire::kUnimplemented), "unknown method " + call.method, call.requestId));
        if (!sent) {
            spdlog::warn("PluginDispatcher: failed to report unknown method: {}",
                         sent.error().message);
        }
        return;
    }

    Result<Bytes> result = Error{ErrorCode::InternalError, "handler produced no result"};
    try {
        result = (*handler)(ctx, call.payload);
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InternalError, e.what()};
    }

    Envelope reply = result ? protocol::makeResponse(call.requestId, std::move(result).value())
                            : protocol::makeError(std::string(protocol::wireCodeFor(
                                                      result.error().code)),
                                                  result.error().message, call.requestId);
    if (!result) {
        spdlog::debug("PluginDispatcher: {} ({}) failed: {}", call.method, call.requestId,
                      result.error().message);
    }

    auto sent = sendEnvelope(reply);
    if (!sent) {
        spdlog::warn("PluginDispatcher: failed to send reply for {}: {}", call.requestId,
                     sent.error().message);
    }
}

} // namespace opf::plugin
