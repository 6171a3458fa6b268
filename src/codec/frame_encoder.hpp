#pragma once

#include "common/error.hpp"
#include "common/frame.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace tw {

// Sequential frame writer over a caller-owned buffer.
//
//   Idle --begin()--> WritingBody --finish_crc32c()--> Finished
//   reset() or a new begin() returns to the start of the buffer.
//
// The buffer is borrowed exclusively for the lifetime of one frame; nothing is
// allocated. Writes before begin() and a second finish_crc32c() are rejected
// with DecodeInvariant.
class FrameEncoder {
public:
    explicit FrameEncoder(std::span<uint8_t> buf) : buf_(buf) {}

    ErrorCode begin(const FrameHeader& header);

    ErrorCode put_u8(uint8_t value);
    ErrorCode put_u16(uint16_t value);
    ErrorCode put_u32(uint32_t value);
    ErrorCode put_u64(uint64_t value);
    ErrorCode put_i32(int32_t value) { return put_u32(static_cast<uint32_t>(value)); }
    ErrorCode put_i64(int64_t value) { return put_u64(static_cast<uint64_t>(value)); }

    // Always the 16-bit form
    ErrorCode put_bitmap(uint16_t bits) { return put_u16(bits); }

    // Varint length prefix followed by the raw bytes
    ErrorCode put_varbytes(std::span<const uint8_t> bytes);
    ErrorCode put_bytes(std::span<const uint8_t> bytes);
    ErrorCode put_varint_u32(uint32_t value);
    ErrorCode put_varint_u64(uint64_t value);

    // Back-patches len, appends the CRC32C of header+body, returns the frame size.
    Expected<size_t> finish_crc32c();

    void reset();

    size_t position() const { return pos_; }
    size_t remaining() const { return buf_.size() - pos_; }

    // Bytes written so far for the current frame
    std::span<const uint8_t> as_span() const { return {buf_.data() + header_start_, pos_ - header_start_}; }

private:
    enum class State : uint8_t { Idle, WritingBody, Finished };

    ErrorCode reserve(size_t n) const;
    std::span<uint8_t> tail() { return buf_.subspan(pos_); }

    std::span<uint8_t> buf_;
    size_t pos_ = 0;
    size_t header_start_ = 0;
    size_t body_start_ = 0;
    State state_ = State::Idle;
};

} // namespace tw
