#include <opf/protocol/envelope_codec.h>

#include <opf/v1/envelope.pb.h>

#include <spdlog/spdlog.h>

namespace opf::protocol {

namespace pb = opf::v1;

namespace {

std::string toString(const Bytes& bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

Bytes toBytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

void buildEnvelope(const Envelope& env, pb::Envelope& out) {
    std::visit(
        [&out](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, RegisterMessage>) {
                auto* reg = out.mutable_register_();
                reg->set_name(payload.name);
                reg->set_version(payload.version);
            } else if constexpr (std::is_same_v<T, RpcCall>) {
                auto* call = out.mutable_rpc_call();
                call->set_request_id(payload.requestId);
                call->set_method(payload.method);
                call->set_payload(toString(payload.payload));
            } else if constexpr (std::is_same_v<T, RpcResponse>) {
                auto* resp = out.mutable_rpc_response();
                resp->set_request_id(payload.requestId);
                resp->set_payload(toString(payload.payload));
            } else if constexpr (std::is_same_v<T, ErrorMessage>) {
                auto* err = out.mutable_error();
                err->set_code(payload.code);
                err->set_message(payload.message);
                err->set_request_id(payload.requestId);
            }
        },
        env.payload);
}

template <typename Message> Result<void> serializeInto(const Message& msg, Bytes& buffer) {
    const auto size = msg.ByteSizeLong();
    const auto base = buffer.size();
    buffer.resize(base + static_cast<std::size_t>(size));
    if (size > 0 && !msg.SerializeToArray(buffer.data() + base, static_cast<int>(size))) {
        buffer.resize(base);
        return Error{ErrorCode::SerializationError, "Failed to serialize protobuf message"};
    }
    return Result<void>();
}

} // namespace

Result<Bytes> EnvelopeCodec::encode(const Envelope& env) {
    Bytes out;
    auto r = encodeInto(env, out);
    if (!r)
        return r.error();
    return out;
}

Result<void> EnvelopeCodec::encodeInto(const Envelope& env, Bytes& buffer) {
    pb::Envelope msg;
    buildEnvelope(env, msg);
    return serializeInto(msg, buffer);
}

Result<Envelope> EnvelopeCodec::decode(std::span<const uint8_t> bytes) {
    pb::Envelope msg;
    if (!msg.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Error{ErrorCode::InvalidData, "Failed to parse protobuf Envelope"};
    }

    switch (msg.payload_case()) {
        case pb::Envelope::kRegister:
            return Envelope{RegisterMessage{msg.register_().name(), msg.register_().version()}};
        case pb::Envelope::kRpcCall: {
            const auto& c = msg.rpc_call();
            return Envelope{RpcCall{c.request_id(), c.method(), toBytes(c.payload())}};
        }
        case pb::Envelope::kRpcResponse: {
            const auto& r = msg.rpc_response();
            return Envelope{RpcResponse{r.request_id(), toBytes(r.payload())}};
        }
        case pb::Envelope::kError: {
            const auto& e = msg.error();
            return Envelope{ErrorMessage{e.code(), e.message(), e.request_id()}};
        }
        case pb::Envelope::PAYLOAD_NOT_SET:
            break;
    }
    spdlog::debug("EnvelopeCodec: envelope without payload ({} bytes)", bytes.size());
    return Error{ErrorCode::InvalidData, "Envelope has no payload"};
}

Result<Bytes> EnvelopeCodec::encodeHandshake(const Metadata& metadata) {
    pb::Handshake msg;
    auto* fields = msg.mutable_metadata();
    for (const auto& [key, value] : metadata) {
        (*fields)[key] = value;
    }
    Bytes out;
    auto r = serializeInto(msg, out);
    if (!r)
        return r.error();
    return out;
}

Result<Metadata> EnvelopeCodec::decodeHandshake(std::span<const uint8_t> bytes) {
    pb::Handshake msg;
    if (!msg.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Error{ErrorCode::InvalidData, "Failed to parse protobuf Handshake"};
    }
    Metadata out;
    for (const auto& [key, value] : msg.metadata()) {
        out.emplace(key, value);
    }
    return out;
}

} // namespace opf::protocol
