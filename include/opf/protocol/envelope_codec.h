#pragma once

#include <opf/core/types.h>
#include <opf/protocol/envelope.h>

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace opf::protocol {

using Metadata = std::map<std::string, std::string>;

// EnvelopeCodec encodes/decodes Envelope values using the protobuf schema in
// proto/opf/v1/envelope.proto. Framing is the transport's concern.
class EnvelopeCodec {
public:
    static Result<Bytes> encode(const Envelope& env);

    // Append serialized bytes to buffer starting at buffer.size(), so callers can
    // reserve room for a frame header in front.
    static Result<void> encodeInto(const Envelope& env, Bytes& buffer);

    // Fails with InvalidData when the bytes are not an Envelope or no payload case is set.
    static Result<Envelope> decode(std::span<const uint8_t> bytes);

    static Result<Bytes> encodeHandshake(const Metadata& metadata);
    static Result<Metadata> decodeHandshake(std::span<const uint8_t> bytes);
};

} // namespace opf::protocol
