#pragma once

#include "common/error.hpp"
#include "common/frame.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace tw {

// Read position over a frame body. Spans it returns point into the decoded
// buffer and are only valid while that buffer is alive and unmodified.
class BodyCursor {
public:
    BodyCursor() = default;
    explicit BodyCursor(std::span<const uint8_t> body) : buf_(body) {}

    size_t remaining() const { return buf_.size() - pos_; }
    bool is_at_end() const { return pos_ >= buf_.size(); }
    size_t position() const { return pos_; }
    std::span<const uint8_t> data() const { return buf_; }

    ErrorCode skip(size_t n);

    Expected<uint8_t> get_u8();
    Expected<uint16_t> get_u16();
    Expected<uint32_t> get_u32();
    Expected<uint64_t> get_u64();
    Expected<int32_t> get_i32();
    Expected<int64_t> get_i64();
    Expected<uint16_t> get_bitmap() { return get_u16(); }

    Expected<std::span<const uint8_t>> get_varbytes();
    Expected<std::span<const uint8_t>> get_bytes(size_t n);
    Expected<uint32_t> get_varint_u32();
    Expected<uint64_t> get_varint_u64();

    // Does not advance
    Expected<std::span<const uint8_t>> peek_bytes(size_t n) const;

private:
    std::span<const uint8_t> buf_;
    size_t pos_ = 0;
};

// Zero-copy view over one encoded frame. Holds only a read-only borrow, so
// any number of decoders may share the same buffer across threads.
class FrameDecoder {
public:
    explicit FrameDecoder(std::span<const uint8_t> buf) : buf_(buf) {}

    // Parse and validate, no CRC check.
    Expected<FrameHeader> header() const;

    // CrcMismatch whenever the trailer disagrees, even if the header parsed.
    // When the trailer matches, the header's own validation result is returned.
    // A header that fails validation is still checksummed using its raw len
    // field, provided that length is plausible; otherwise the header error is
    // returned without touching the CRC.
    ErrorCode verify_crc32c() const;

    Expected<BodyCursor> body() const;

    // Exact header+body+trailer span
    Expected<std::span<const uint8_t>> frame_buffer() const;

private:
    std::span<const uint8_t> buf_;
};

} // namespace tw
