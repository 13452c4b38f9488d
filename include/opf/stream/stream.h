#pragma once

#include <opf/core/context.h>
#include <opf/core/types.h>
#include <opf/protocol/envelope.h>

namespace opf::stream {

/**
 * Ordered, bidirectional, message-oriented stream.
 *
 * send() may be called from several threads only if the caller serializes it;
 * HostSession and PluginDispatcher both do. recv() is called from a single
 * receive loop.
 */
template <typename Message> class IMessageStream {
public:
    virtual ~IMessageStream() = default;

    virtual Result<void> send(const Message& msg) = 0;

    /**
     * Block until a message arrives, the peer ends its send side (StreamClosed),
     * the transport fails, or ctx is done (OperationCancelled / Timeout).
     */
    virtual Result<Message> recv(const Context& ctx) = 0;

    // Half close: the peer's recv() sees StreamClosed once queued messages are read.
    // Transports without half-close return NotSupported.
    virtual Result<void> closeSend() = 0;

    // Close both directions and unblock any pending recv().
    virtual void close() = 0;
};

using IEnvelopeStream = IMessageStream<protocol::Envelope>;

template <typename Carrier> using ICarrierStream = IMessageStream<Carrier>;

} // namespace opf::stream
