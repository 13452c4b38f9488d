#pragma once

#include <opf/stream/stream.h>

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

namespace opf::stream {

namespace detail {

// One direction of an in-process pair.
template <typename Message> struct Pipe {
    // writerDone: sender half-closed. closed: receiver closed its end.
    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<Message> queue;
    bool writerDone = false;
    bool closed = false;
};

} // namespace detail

/**
 * Queue-backed endpoint of an in-process stream pair. Sends never block.
 */
template <typename Message> class InProcessStream final : public IMessageStream<Message> {
public:
    using PipePtr = std::shared_ptr<detail::Pipe<Message>>;

    InProcessStream(PipePtr inbound, PipePtr outbound)
        : inbound_(std::move(inbound)), outbound_(std::move(outbound)) {}

    ~InProcessStream() override { close(); }

    Result<void> send(const Message& msg) override {
        {
            std::lock_guard<std::mutex> lock(outbound_->mutex);
            if (outbound_->closed || outbound_->writerDone) {
                return Error{ErrorCode::StreamClosed, "stream closed"};
            }
            outbound_->queue.push_back(msg);
        }
        outbound_->cv.notify_all();
        return Result<void>();
    }

    Result<Message> recv(const Context& ctx) override {
        std::unique_lock<std::mutex> lock(inbound_->mutex);
        const bool ready = ctx.wait(inbound_->cv, lock, [this] {
            return inbound_->closed || inbound_->writerDone || !inbound_->queue.empty();
        });
        if (!ready) {
            return ctx.err();
        }
        if (inbound_->closed) {
            return Error{ErrorCode::StreamClosed, "stream closed"};
        }
        if (inbound_->queue.empty()) {
            return Error{ErrorCode::StreamClosed, "end of stream"};
        }
        Message msg = std::move(inbound_->queue.front());
        inbound_->queue.pop_front();
        return msg;
    }

    Result<void> closeSend() override {
        {
            std::lock_guard<std::mutex> lock(outbound_->mutex);
            outbound_->writerDone = true;
        }
        outbound_->cv.notify_all();
        return Result<void>();
    }

    // Local reads and peer writes fail at once; the peer still drains what was
    // already sent before seeing end of stream.
    void close() override {
        {
            std::lock_guard<std::mutex> lock(inbound_->mutex);
            inbound_->closed = true;
            inbound_->queue.clear();
        }
        inbound_->cv.notify_all();
        closeSend();
    }

private:
    PipePtr inbound_;
    PipePtr outbound_;
};

/**
 * Create two connected endpoints: what one sends the other receives.
 */
template <typename Message>
std::pair<std::shared_ptr<InProcessStream<Message>>, std::shared_ptr<InProcessStream<Message>>>
makeInProcessPair() {
    auto aToB = std::make_shared<detail::Pipe<Message>>();
    auto bToA = std::make_shared<detail::Pipe<Message>>();
    return {std::make_shared<InProcessStream<Message>>(bToA, aToB),
            std::make_shared<InProcessStream<Message>>(aToB, bToA)};
}

} // namespace opf::stream
