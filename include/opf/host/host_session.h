#pragma once

#include <opf/core/context.h>
#include <opf/core/types.h>
#include <opf/protocol/envelope.h>
#include <opf/stream/stream.h>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace opf::host {

/**
 * Host side of one registered plugin stream: turns the duplex envelope stream
 * into call/response RPC.
 *
 * call() may be used from any number of threads while a single thread runs
 * listen(). Responses are matched to callers by request id; when listen()
 * exits, every outstanding call fails with StreamClosed and later calls fail
 * immediately.
 */
class HostSession : public std::enable_shared_from_this<HostSession> {
public:
    using ActivityHook = std::function<void()>;

    /**
     * Read the plugin's first envelope. Anything but a Register with a
     * non-empty name is a ProtocolViolation; recv failures propagate.
     */
    static Result<std::shared_ptr<HostSession>>
    accept(const Context& ctx, std::shared_ptr<stream::IEnvelopeStream> stream);

    HostSession(const HostSession&) = delete;
    HostSession& operator=(const HostSession&) = delete;

    Result<Bytes> call(const Context& ctx, const std::string& method, const Bytes& payload);

    // Typed call for protobuf request/response messages.
    template <typename Resp, typename Req>
    Result<Resp> callMessage(const Context& ctx, const std::string& method, const Req& request);

    /**
     * Receive loop. Runs until recv fails or ctx is done and returns that
     * error. onActivity is invoked for every envelope received.
     */
    Result<void> listen(const Context& ctx, ActivityHook onActivity = {});

    // Connection scoped Error envelope (no request id).
    Result<void> sendError(std::string_view code, std::string message);

    const std::string& pluginName() const noexcept { return name_; }
    const std::string& pluginVersion() const noexcept { return version_; }
    size_t pendingCount() const;
    bool isClosed() const noexcept { return closed_.load(); }

    const std::shared_ptr<stream::IEnvelopeStream>& stream() const noexcept { return stream_; }

private:
    struct PendingCall {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::optional<Result<Bytes>> result;

        // First delivery wins; never blocks beyond the slot's own mutex.
        void deliver(Result<Bytes> value);
    };

    HostSession(std::shared_ptr<stream::IEnvelopeStream> stream, std::string name,
                std::string version);

    std::string nextRequestId();
    Result<void> sendEnvelope(const protocol::Envelope& env);

    // Hand result to the waiter for requestId. False when nobody is waiting.
    bool deliver(const std::string& requestId, Result<Bytes> result);
    void route(const protocol::Envelope& env);
    void sweep(const Error& error);

    std::shared_ptr<stream::IEnvelopeStream> stream_;
    std::string name_;
    std::string version_;

    std::mutex sendMutex_;

    mutable std::mutex pendingMutex_;
    std::unordered_map<std::string, std::shared_ptr<PendingCall>> pending_;
    std::atomic<bool> closed_{false};

    std::string nonce_;
    std::atomic<uint64_t> counter_{0};
};

template <typename Resp, typename Req>
Result<Resp> HostSession::callMessage(const Context& ctx, const std::string& method,
                                      const Req& request) {
    std::string serialized;
    if (!request.SerializeToString(&serialized)) {
        return Error{ErrorCode::SerializationError,
                     "failed to serialize request for " + method};
    }

    auto reply = call(ctx, method, Bytes(serialized.begin(), serialized.end()));
    if (!reply) {
        return reply.error();
    }

    Resp response;
    const auto& bytes = reply.value();
    if (!response.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Error{ErrorCode::SerializationError,
                     "failed to parse response for " + method};
    }
    return response;
}

} // namespace opf::host
