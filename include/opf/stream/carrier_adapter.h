#pragma once

#include <opf/protocol/envelope_codec.h>
#include <opf/stream/stream.h>

#include <functional>
#include <memory>
#include <utility>

namespace opf::stream {

/**
 * Carries envelope bytes inside a domain-specific message type.
 *
 * Lets a plugin keep its own service schema (any message with a bytes field)
 * while speaking the envelope protocol underneath:
 *
 * @code
 * CarrierStreamAdapter<MyMessage> adapter(
 *     carrier,
 *     [](Bytes b) { MyMessage m; m.set_data(std::string(b.begin(), b.end())); return m; },
 *     [](const MyMessage& m) { return Bytes(m.data().begin(), m.data().end()); });
 * @endcode
 */
template <typename Carrier> class CarrierStreamAdapter final : public IEnvelopeStream {
public:
    using WrapFn = std::function<Carrier(Bytes)>;
    using UnwrapFn = std::function<Bytes(const Carrier&)>;

    CarrierStreamAdapter(std::shared_ptr<ICarrierStream<Carrier>> carrier, WrapFn wrap,
                         UnwrapFn unwrap)
        : carrier_(std::move(carrier)), wrap_(std::move(wrap)), unwrap_(std::move(unwrap)) {}

    Result<void> send(const protocol::Envelope& env) override {
        auto bytes = protocol::EnvelopeCodec::encode(env);
        if (!bytes) {
            return bytes.error();
        }
        return carrier_->send(wrap_(std::move(bytes).value()));
    }

    Result<protocol::Envelope> recv(const Context& ctx) override {
        auto msg = carrier_->recv(ctx);
        if (!msg) {
            return msg.error();
        }
        const Bytes bytes = unwrap_(msg.value());
        auto env = protocol::EnvelopeCodec::decode(bytes);
        if (!env) {
            return Error{ErrorCode::InvalidData, "failed to decode envelope from carrier: " +
                                                     env.error().message};
        }
        return env;
    }

    Result<void> closeSend() override { return carrier_->closeSend(); }

    void close() override { carrier_->close(); }

private:
    std::shared_ptr<ICarrierStream<Carrier>> carrier_;
    WrapFn wrap_;
    UnwrapFn unwrap_;
};

} // namespace opf::stream
