#include <opf/host/host_session.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <random>

namespace opf::host {

using protocol::Envelope;

namespace {

std::string makeNonce() {
    std::random_device rd;
    std::mt19937_64 gen(static_cast<uint64_t>(rd()) << 32 | rd());
    return fmt::format("{:016x}", gen());
}

} // namespace

void HostSession::PendingCall::deliver(Result<Bytes> value) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (result) {
            return;
        }
        result.emplace(std::move(value));
    }
    cv.notify_all();
}

HostSession::HostSession(std::shared_ptr<stream::IEnvelopeStream> stream, std::string name,
                         std::string version)
    : stream_(std::move(stream)), name_(std::move(name)), version_(std::move(version)),
      nonce_(makeNonce()) {}

Result<std::shared_ptr<HostSession>>
HostSession::accept(const Context& ctx, std::shared_ptr<stream::IEnvelopeStream> stream) {
    auto first = stream->recv(ctx);
    if (!first) {
        return first.error();
    }

    const auto* reg = first.value().asRegister();
    if (!reg) {
        return Error{ErrorCode::ProtocolViolation,
                     std::string("first message must be Register, got ") +
                         protocol::envelopeKind(first.value())};
    }
    if (reg->name.empty()) {
        return Error{ErrorCode::ProtocolViolation, "plugin name cannot be empty"};
    }

    spdlog::debug("HostSession: plugin '{}' version '{}' registered", reg->name, reg->version);
    return std::shared_ptr<HostSession>(new HostSession(std::move(stream), reg->name,
                                                        reg->version));
}

std::string HostSession::nextRequestId() {
    return nonce_ + "-" + std::to_string(counter_.fetch_add(1) + 1);
}

Result<void> HostSession::sendEnvelope(const Envelope& env) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    return stream_->send(env);
}

Result<void> HostSession::sendError(std::string_view code, std::string message) {
    return sendEnvelope(protocol::makeError(std::string(code), std::move(message)));
}

size_t HostSession::pendingCount() const {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    return pending_.size();
}

Result<Bytes> HostSession::call(const Context& ctx, const std::string& method,
                                const Bytes& payload) {
    if (ctx.done()) {
        return ctx.err();
    }

    const std::string requestId = nextRequestId();
    auto slot = std::make_shared<PendingCall>();

    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        if (closed_) {
            return Error{ErrorCode::StreamClosed, "stream closed"};
        }
        if (!pending_.emplace(requestId, slot).second) {
            return Error{ErrorCode::InternalError, "duplicate request id " + requestId};
        }
    }

    auto forget = [this, &requestId] {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pending_.erase(requestId);
    };

    auto sent = sendEnvelope(protocol::makeCall(requestId, method, payload));
    if (!sent) {
        forget();
        spdlog::warn("HostSession: failed to send {} to '{}': {}", method, name_,
                     sent.error().message);
        return sent.error();
    }

    std::unique_lock<std::mutex> lock(slot->mutex);
    if (!ctx.wait(slot->cv, lock, [&slot] { return slot->result.has_value(); })) {
        lock.unlock();
        forget();
        auto err = ctx.err();
        if (err.code == ErrorCode::Success) {
            err = Error{ErrorCode::Timeout, "context deadline exceeded"};
        }
        spdlog::debug("HostSession: call {} ({}) to '{}' abandoned: {}", method, requestId,
                      name_, err.message);
        return err;
    }
    return std::move(*slot->result);
}

bool HostSession::deliver(const std::string& requestId, Result<Bytes> result) {
    std::shared_ptr<PendingCall> slot;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        auto it = pending_.find(requestId);
        if (it == pending_.end()) {
            return false;
        }
        slot = std::move(it->second);
        pending_.erase(it);
    }
    slot->deliver(std::move(result));
    return true;
}

void HostSession::route(const Envelope& env) {
    if (const auto* resp = env.asResponse()) {
        if (!deliver(resp->requestId, Bytes(resp->payload))) {
            spdlog::debug("HostSession: dropping response for unknown request {} from '{}'",
                          resp->requestId, name_);
        }
        return;
    }

    if (const auto* err = env.asError()) {
        if (!err->requestId.empty() && deliver(err->requestId, protocol::errorFromWire(*err))) {
            return;
        }
        spdlog::warn("HostSession: plugin '{}' reported error {}: {}", name_, err->code,
                     err->message);
        return;
    }

    spdlog::warn("HostSession: ignoring unexpected {} from '{}'", protocol::envelopeKind(env),
                 name_);
}

void HostSession::sweep(const Error& error) {
    std::unordered_map<std::string, std::shared_ptr<PendingCall>> orphaned;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        closed_ = true;
        orphaned.swap(pending_);
    }
    for (auto& [requestId, slot] : orphaned) {
        slot->deliver(error);
    }
    if (!orphaned.empty()) {
        spdlog::debug("HostSession: failed {} pending calls for '{}'", orphaned.size(), name_);
    }
}

Result<void> HostSession::listen(const Context& ctx, ActivityHook onActivity) {
    Error ended;
    while (true) {
        auto env = stream_->recv(ctx);
        if (!env) {
            ended = env.error();
            break;
        }
        if (onActivity) {
            onActivity();
        }
        route(env.value());
    }

    sweep(Error{ErrorCode::StreamClosed, "stream closed"});

    if (ended.code == ErrorCode::StreamClosed || ctx.done()) {
        spdlog::debug("HostSession: receive loop for '{}' ended: {}", name_, ended.message);
    } else {
        spdlog::warn("HostSession: receive loop for '{}' failed: {}", name_, ended.message);
    }
    return ended;
}

} // namespace opf::host
