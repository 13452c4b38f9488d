#pragma once

#include <opf/core/context.h>
#include <opf/core/types.h>
#include <opf/stream/stream.h>

#include <spdlog/spdlog.h>
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace opf::plugin {

/**
 * Request/reply loop over any message stream: each received message is passed
 * to the handler and its result sent back, one at a time.
 *
 * For plugins that speak their own message type directly instead of the
 * envelope protocol. Unlike PluginDispatcher there is no registration, no
 * request ids and no concurrency.
 */
template <typename Message> class MessageLoop {
public:
    using Handler = std::function<Result<Message>(const Context&, const Message&)>;

    MessageLoop(std::shared_ptr<stream::IMessageStream<Message>> stream, Handler handler)
        : stream_(std::move(stream)), handler_(std::move(handler)) {}

    /**
     * Runs until the peer half-closes (success) or ctx ends (its error).
     * A failed receive, handler or send stops the loop and is returned with
     * the failing step prefixed to the message.
     */
    Result<void> run(const Context& ctx) {
        while (!ctx.done()) {
            auto msg = stream_->recv(ctx);
            if (!msg) {
                if (msg.error().code == ErrorCode::StreamClosed) {
                    return Result<void>();
                }
                if (ctx.done()) {
                    break;
                }
                return Error{msg.error().code, "receive error: " + msg.error().message};
            }

            Result<Message> reply = Error{ErrorCode::InternalError, "handler produced no result"};
            try {
                reply = handler_(ctx, msg.value());
            } catch (const std::exception& e) {
                reply = Error{ErrorCode::InternalError, e.what()};
            }
            if (!reply) {
                spdlog::debug("MessageLoop: handler failed: {}", reply.error().message);
                return Error{reply.error().code, "handler error: " + reply.error().message};
            }

            auto sent = stream_->send(reply.value());
            if (!sent) {
                return Error{sent.error().code, "send error: " + sent.error().message};
            }
            handled_.fetch_add(1);
        }
        return ctx.err();
    }

    size_t handled() const noexcept { return handled_.load(); }

private:
    std::shared_ptr<stream::IMessageStream<Message>> stream_;
    Handler handler_;
    std::atomic<size_t> handled_{0};
};

} // namespace opf::plugin
