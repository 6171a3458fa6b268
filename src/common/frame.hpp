#pragma once

#include "error.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace tw {

constexpr uint16_t FRAME_MAGIC = 0xFEED;
constexpr uint8_t PROTOCOL_VERSION = 1;

constexpr size_t FRAME_HEADER_SIZE = 16;
constexpr size_t FRAME_TRAILER_SIZE = 4;                                   // CRC32C
constexpr size_t MIN_FRAME_SIZE = 18;
constexpr size_t MAX_FRAME_SIZE = 16 * 1024 * 1024;
constexpr size_t MAX_BODY_SIZE = MAX_FRAME_SIZE - FRAME_HEADER_SIZE - FRAME_TRAILER_SIZE;

// Byte offsets inside the header
constexpr size_t OFFSET_MAGIC = 0;
constexpr size_t OFFSET_VERSION = 2;
constexpr size_t OFFSET_FLAGS = 3;
constexpr size_t OFFSET_MSG_TYPE = 4;
constexpr size_t OFFSET_SEQ = 6;
constexpr size_t OFFSET_LEN = 10;
constexpr size_t OFFSET_RESERVED = 14;

namespace FrameFlags {
constexpr uint8_t PresenceBitmap = 0x01;
constexpr uint8_t Compressed = 0x02;     // reserved, no codec behind it
constexpr uint8_t Encrypted = 0x04;      // reserved, no codec behind it
constexpr uint8_t ReservedMask = 0xF8;
} // namespace FrameFlags

// Wire layout (little-endian, 16 bytes):
//   magic u16 | ver u8 | flags u8 | msg_type u16 | seq u32 | len u32 | reserved u16 (zero)
struct FrameHeader {
    uint16_t magic = FRAME_MAGIC;
    uint8_t  ver = PROTOCOL_VERSION;
    uint8_t  flags = 0;
    uint16_t msg_type = 0;
    uint32_t seq = 0;        // opaque to the codec
    uint32_t len = 0;        // body bytes, excludes header and trailer

    FrameHeader() = default;
    FrameHeader(uint16_t msg_type, uint32_t seq, uint32_t len)
        : msg_type(msg_type), seq(seq), len(len) {}

    void set_flag(uint8_t flag) { flags |= flag; }
    void clear_flag(uint8_t flag) { flags &= static_cast<uint8_t>(~flag); }
    bool has_flag(uint8_t flag) const { return (flags & flag) != 0; }

    // Checked in order: magic, version, reserved flags, total size bounds.
    ErrorCode validate() const;

    ErrorCode encode(std::span<uint8_t> buf) const;

    // Parses and validates; needs at least FRAME_HEADER_SIZE bytes.
    static Expected<FrameHeader> decode(std::span<const uint8_t> buf);

    size_t total_size() const { return FRAME_HEADER_SIZE + static_cast<size_t>(len) + FRAME_TRAILER_SIZE; }

    bool operator==(const FrameHeader&) const = default;
};

// Raw len field, no validation of the rest of the header.
uint32_t peek_body_len(std::span<const uint8_t> buf);

} // namespace tw
