#include "frame_decoder.hpp"
#include "common/crc32c.hpp"
#include "common/varint.hpp"
#include <boost/endian/conversion.hpp>

namespace tw {

namespace endian = boost::endian;

ErrorCode BodyCursor::skip(size_t n) {
    if (n > remaining()) {
        return ErrorCode::UnexpectedEof;
    }
    pos_ += n;
    return ErrorCode::Ok;
}

Expected<uint8_t> BodyCursor::get_u8() {
    if (remaining() < 1) {
        return ErrorCode::UnexpectedEof;
    }
    return buf_[pos_++];
}

Expected<uint16_t> BodyCursor::get_u16() {
    if (remaining() < 2) {
        return ErrorCode::UnexpectedEof;
    }
    uint16_t value = endian::load_little_u16(buf_.data() + pos_);
    pos_ += 2;
    return value;
}

Expected<uint32_t> BodyCursor::get_u32() {
    if (remaining() < 4) {
        return ErrorCode::UnexpectedEof;
    }
    uint32_t value = endian::load_little_u32(buf_.data() + pos_);
    pos_ += 4;
    return value;
}

Expected<uint64_t> BodyCursor::get_u64() {
    if (remaining() < 8) {
        return ErrorCode::UnexpectedEof;
    }
    uint64_t value = endian::load_little_u64(buf_.data() + pos_);
    pos_ += 8;
    return value;
}

Expected<int32_t> BodyCursor::get_i32() {
    auto value = get_u32();
    if (!value) return value.error();
    return static_cast<int32_t>(*value);
}

Expected<int64_t> BodyCursor::get_i64() {
    auto value = get_u64();
    if (!value) return value.error();
    return static_cast<int64_t>(*value);
}

Expected<std::span<const uint8_t>> BodyCursor::get_varbytes() {
    auto len = varint::decode_u32(buf_.subspan(pos_));
    if (!len) return len.error();

    // Length prefix is only consumed together with its payload.
    const size_t start = pos_ + len->consumed;
    if (len->value > buf_.size() - start) {
        return ErrorCode::UnexpectedEof;
    }
    pos_ = start + len->value;
    return buf_.subspan(start, len->value);
}

Expected<std::span<const uint8_t>> BodyCursor::get_bytes(size_t n) {
    if (n > remaining()) {
        return ErrorCode::UnexpectedEof;
    }
    auto bytes = buf_.subspan(pos_, n);
    pos_ += n;
    return bytes;
}

Expected<uint32_t> BodyCursor::get_varint_u32() {
    auto decoded = varint::decode_u32(buf_.subspan(pos_));
    if (!decoded) return decoded.error();
    pos_ += decoded->consumed;
    return decoded->value;
}

Expected<uint64_t> BodyCursor::get_varint_u64() {
    auto decoded = varint::decode_u64(buf_.subspan(pos_));
    if (!decoded) return decoded.error();
    pos_ += decoded->consumed;
    return decoded->value;
}

Expected<std::span<const uint8_t>> BodyCursor::peek_bytes(size_t n) const {
    if (n > remaining()) {
        return ErrorCode::UnexpectedEof;
    }
    return buf_.subspan(pos_, n);
}

Expected<FrameHeader> FrameDecoder::header() const {
    return FrameHeader::decode(buf_);
}

ErrorCode FrameDecoder::verify_crc32c() const {
    const auto header_result = header();

    size_t total_size = 0;
    if (header_result) {
        total_size = header_result->total_size();
    } else {
        if (buf_.size() < FRAME_HEADER_SIZE) {
            return ErrorCode::UnexpectedEof;
        }
        const size_t raw_len = peek_body_len(buf_);
        if (raw_len > MAX_BODY_SIZE) {
            return header_result.error();
        }
        total_size = FRAME_HEADER_SIZE + raw_len + FRAME_TRAILER_SIZE;
    }

    if (buf_.size() < total_size) {
        return ErrorCode::UnexpectedEof;
    }

    const size_t crc_offset = total_size - FRAME_TRAILER_SIZE;
    const uint32_t stored = endian::load_little_u32(buf_.data() + crc_offset);
    if (!tw::verify_crc32c(buf_.first(crc_offset), stored)) {
        return ErrorCode::CrcMismatch;
    }

    return header_result ? ErrorCode::Ok : header_result.error();
}

Expected<BodyCursor> FrameDecoder::body() const {
    auto hdr = header();
    if (!hdr) return hdr.error();

    const size_t body_end = FRAME_HEADER_SIZE + hdr->len;
    if (buf_.size() < body_end) {
        return ErrorCode::UnexpectedEof;
    }
    return BodyCursor(buf_.subspan(FRAME_HEADER_SIZE, hdr->len));
}

Expected<std::span<const uint8_t>> FrameDecoder::frame_buffer() const {
    auto hdr = header();
    if (!hdr) return hdr.error();

    const size_t total = hdr->total_size();
    if (buf_.size() < total) {
        return ErrorCode::UnexpectedEof;
    }
    return buf_.first(total);
}

} // namespace tw
