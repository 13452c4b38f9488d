#pragma once

#include <opf/core/types.h>
#include <opf/protocol/envelope.h>
#include <opf/protocol/envelope_codec.h>

#include <bit>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <type_traits>
#include <vector>

namespace opf::transport {

// Message framing for the socket transport
class MessageFramer {
public:
    static constexpr uint32_t MAGIC = 0x4F504631; // "OPF1" in hex
    static constexpr uint32_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 20; // 5 * sizeof(uint32_t)

    struct FrameHeader {
        uint32_t magic = MAGIC;
        uint32_t version = VERSION;
        uint32_t payload_size = 0;
        uint32_t checksum = 0; // CRC32 of payload
        uint32_t flags = 0;

        // Connection preamble carrying a Handshake instead of an Envelope
        static constexpr uint32_t FLAG_HANDSHAKE = 0x00000001;

        void set_handshake(bool on = true) noexcept {
            flags = on ? (flags | FLAG_HANDSHAKE) : (flags & ~FLAG_HANDSHAKE);
        }

        bool is_handshake() const noexcept { return (flags & FLAG_HANDSHAKE) != 0; }

        // Byte swapping is its own inverse, so one helper serves both directions.
        void to_network() noexcept { swap_if_little(); }
        void from_network() noexcept { swap_if_little(); }

        [[nodiscard]] bool is_valid() const noexcept {
            return magic == MAGIC && version == VERSION;
        }

    private:
        void swap_if_little() noexcept {
            if constexpr (std::endian::native == std::endian::little) {
                for (uint32_t* field : {&magic, &version, &payload_size, &checksum, &flags}) {
                    *field = __builtin_bswap32(*field);
                }
            }
        }
    };

    static_assert(HEADER_SIZE == sizeof(FrameHeader),
                  "HEADER_SIZE constant must match actual struct size");
    static_assert(std::is_trivially_copyable_v<FrameHeader>,
                  "FrameHeader must be trivially copyable for memcpy");

    explicit MessageFramer(size_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE)
        : max_message_size_(max_message_size) {}

    // Append a complete frame to buffer, preserving existing contents.
    Result<void> frame_envelope_into(const protocol::Envelope& env, std::vector<uint8_t>& buffer);
    Result<std::vector<uint8_t>> frame_envelope(const protocol::Envelope& env);
    Result<std::vector<uint8_t>> frame_handshake(const protocol::Metadata& metadata);

    // Decode and validate a header: magic, version and payload_size <= max message size.
    [[nodiscard]] Result<FrameHeader> parse_header(std::span<const uint8_t> data) const;

    // Verify the payload checksum against header, then decode.
    Result<protocol::Envelope> parse_envelope(const FrameHeader& header,
                                              std::span<const uint8_t> payload) const;
    Result<protocol::Metadata> parse_handshake(const FrameHeader& header,
                                               std::span<const uint8_t> payload) const;

    size_t max_message_size() const noexcept { return max_message_size_; }

    [[nodiscard]] static uint32_t calculate_crc32(std::span<const uint8_t> data) noexcept;

private:
    Result<void> verify_payload(const FrameHeader& header,
                                std::span<const uint8_t> payload) const;

    size_t max_message_size_;
};

} // namespace opf::transport
