#include <opf/transport/message_framing.h>

#include <array>
#include <cstring>
#include <string>

namespace opf::transport {

using protocol::EnvelopeCodec;

// ============================================================================
// CRC32 Calculation with Constexpr Table
// ============================================================================

namespace {

// Uses the CRC-32 polynomial 0xEDB88320 (reversed 0x04C11DB7)
constexpr std::array<uint32_t, 256> generate_crc32_table() noexcept {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ ((crc & 1) ? 0xEDB88320 : 0);
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto CRC32_TABLE = generate_crc32_table();

uint32_t calculate_crc32_impl(const uint8_t* data, size_t size) noexcept {
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < size; ++i) {
        crc = CRC32_TABLE[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return ~crc;
}

// Reserve the header, let encode append the payload, then fill the header in.
template <typename Encode>
Result<void> append_frame_bytes(std::vector<uint8_t>& buffer, std::size_t max_message_size,
                                bool handshake, Encode&& encode) {
    const auto base = buffer.size();
    buffer.resize(base + sizeof(MessageFramer::FrameHeader));
    const auto payload_offset = buffer.size();

    auto payload_result = encode(buffer);
    if (!payload_result) {
        buffer.resize(base);
        return payload_result.error();
    }

    const std::size_t payload_size = buffer.size() - payload_offset;
    if (payload_size > max_message_size) {
        buffer.resize(base);
        return Error{ErrorCode::InvalidData, "Message size " + std::to_string(payload_size) +
                                                 " exceeds maximum " +
                                                 std::to_string(max_message_size)};
    }

    MessageFramer::FrameHeader header;
    header.payload_size = static_cast<uint32_t>(payload_size);
    header.checksum = calculate_crc32_impl(buffer.data() + payload_offset, payload_size);
    header.set_handshake(handshake);
    header.to_network();

    std::memcpy(buffer.data() + base, &header, sizeof(header));

    return Result<void>();
}

} // namespace

uint32_t MessageFramer::calculate_crc32(std::span<const uint8_t> data) noexcept {
    return calculate_crc32_impl(data.data(), data.size());
}

// ============================================================================
// MessageFramer Implementation
// ============================================================================

Result<void> MessageFramer::frame_envelope_into(const protocol::Envelope& env,
                                                std::vector<uint8_t>& buffer) {
    return append_frame_bytes(buffer, max_message_size_, /*handshake=*/false,
                              [&env](std::vector<uint8_t>& out) {
                                  return EnvelopeCodec::encodeInto(env, out);
                              });
}

Result<std::vector<uint8_t>> MessageFramer::frame_envelope(const protocol::Envelope& env) {
    std::vector<uint8_t> frame;
    auto res = frame_envelope_into(env, frame);
    if (!res)
        return res.error();
    return frame;
}

Result<std::vector<uint8_t>> MessageFramer::frame_handshake(const protocol::Metadata& metadata) {
    std::vector<uint8_t> frame;
    auto res = append_frame_bytes(frame, max_message_size_, /*handshake=*/true,
                                  [&metadata](std::vector<uint8_t>& out) -> Result<void> {
                                      auto bytes = EnvelopeCodec::encodeHandshake(metadata);
                                      if (!bytes)
                                          return bytes.error();
                                      out.insert(out.end(), bytes.value().begin(),
                                                 bytes.value().end());
                                      return Result<void>();
                                  });
    if (!res)
        return res.error();
    return frame;
}

Result<MessageFramer::FrameHeader>
MessageFramer::parse_header(std::span<const uint8_t> data) const {
    if (data.size() < HEADER_SIZE) {
        return Error{ErrorCode::InvalidData, "Insufficient data for frame header"};
    }

    FrameHeader header;
    std::memcpy(&header, data.data(), sizeof(header));
    header.from_network();

    if (!header.is_valid()) {
        return Error{ErrorCode::InvalidData, "Invalid frame magic or version"};
    }

    if (header.payload_size > max_message_size_) {
        return Error{ErrorCode::InvalidData, "Message size " + std::to_string(header.payload_size) +
                                                 " exceeds maximum " +
                                                 std::to_string(max_message_size_)};
    }

    return header;
}

Result<void> MessageFramer::verify_payload(const FrameHeader& header,
                                           std::span<const uint8_t> payload) const {
    if (payload.size() != header.payload_size) {
        return Error{ErrorCode::InvalidData, "Frame size mismatch"};
    }
    uint32_t calculated_crc = calculate_crc32(payload);
    if (calculated_crc != header.checksum) {
        return Error{ErrorCode::InvalidData, "Checksum mismatch: expected " +
                                                 std::to_string(header.checksum) + ", got " +
                                                 std::to_string(calculated_crc)};
    }
    return Result<void>();
}

Result<protocol::Envelope> MessageFramer::parse_envelope(const FrameHeader& header,
                                                         std::span<const uint8_t> payload) const {
    if (header.is_handshake()) {
        return Error{ErrorCode::ProtocolViolation, "unexpected handshake frame"};
    }
    auto ok = verify_payload(header, payload);
    if (!ok)
        return ok.error();
    return EnvelopeCodec::decode(payload);
}

Result<protocol::Metadata> MessageFramer::parse_handshake(const FrameHeader& header,
                                                          std::span<const uint8_t> payload) const {
    if (!header.is_handshake()) {
        return Error{ErrorCode::ProtocolViolation, "expected handshake frame"};
    }
    auto ok = verify_payload(header, payload);
    if (!ok)
        return ok.error();
    return EnvelopeCodec::decodeHandshake(payload);
}

} // namespace opf::transport
