#include "frame_encoder.hpp"
#include "common/crc32c.hpp"
#include "common/varint.hpp"
#include <boost/endian/conversion.hpp>
#include <cstring>

namespace tw {

namespace endian = boost::endian;

ErrorCode FrameEncoder::begin(const FrameHeader& header) {
    if (buf_.size() < FRAME_HEADER_SIZE) {
        return ErrorCode::ShortBuffer;
    }

    // A new frame always starts at the front of the buffer.
    pos_ = 0;
    header_start_ = 0;

    FrameHeader placeholder = header;
    placeholder.len = 0;
    ErrorCode rc = placeholder.encode(buf_.first(FRAME_HEADER_SIZE));
    if (!ok(rc)) {
        state_ = State::Idle;
        return rc;
    }

    pos_ = FRAME_HEADER_SIZE;
    body_start_ = pos_;
    state_ = State::WritingBody;
    return ErrorCode::Ok;
}

ErrorCode FrameEncoder::reserve(size_t n) const {
    if (state_ != State::WritingBody) {
        return ErrorCode::DecodeInvariant;
    }
    if (n > buf_.size() - pos_) {
        return ErrorCode::ShortBuffer;
    }
    return ErrorCode::Ok;
}

ErrorCode FrameEncoder::put_u8(uint8_t value) {
    ErrorCode rc = reserve(1);
    if (!ok(rc)) return rc;
    buf_[pos_++] = value;
    return ErrorCode::Ok;
}

ErrorCode FrameEncoder::put_u16(uint16_t value) {
    ErrorCode rc = reserve(2);
    if (!ok(rc)) return rc;
    endian::store_little_u16(buf_.data() + pos_, value);
    pos_ += 2;
    return ErrorCode::Ok;
}

ErrorCode FrameEncoder::put_u32(uint32_t value) {
    ErrorCode rc = reserve(4);
    if (!ok(rc)) return rc;
    endian::store_little_u32(buf_.data() + pos_, value);
    pos_ += 4;
    return ErrorCode::Ok;
}

ErrorCode FrameEncoder::put_u64(uint64_t value) {
    ErrorCode rc = reserve(8);
    if (!ok(rc)) return rc;
    endian::store_little_u64(buf_.data() + pos_, value);
    pos_ += 8;
    return ErrorCode::Ok;
}

ErrorCode FrameEncoder::put_varbytes(std::span<const uint8_t> bytes) {
    if (bytes.size() > MAX_BODY_SIZE) {
        return ErrorCode::Overflow;
    }
    const uint32_t len = static_cast<uint32_t>(bytes.size());

    // Check prefix and payload together so a failed call writes nothing.
    ErrorCode rc = reserve(varint::encoded_size(len) + bytes.size());
    if (!ok(rc)) return rc;

    auto written = varint::encode_u32(len, tail());
    if (!written) return written.error();
    pos_ += *written;

    if (!bytes.empty()) {
        std::memcpy(buf_.data() + pos_, bytes.data(), bytes.size());
        pos_ += bytes.size();
    }
    return ErrorCode::Ok;
}

ErrorCode FrameEncoder::put_bytes(std::span<const uint8_t> bytes) {
    ErrorCode rc = reserve(bytes.size());
    if (!ok(rc)) return rc;
    if (!bytes.empty()) {
        std::memcpy(buf_.data() + pos_, bytes.data(), bytes.size());
        pos_ += bytes.size();
    }
    return ErrorCode::Ok;
}

ErrorCode FrameEncoder::put_varint_u32(uint32_t value) {
    ErrorCode rc = reserve(0);
    if (!ok(rc)) return rc;
    auto written = varint::encode_u32(value, tail());
    if (!written) return written.error();
    pos_ += *written;
    return ErrorCode::Ok;
}

ErrorCode FrameEncoder::put_varint_u64(uint64_t value) {
    ErrorCode rc = reserve(0);
    if (!ok(rc)) return rc;
    auto written = varint::encode_u64(value, tail());
    if (!written) return written.error();
    pos_ += *written;
    return ErrorCode::Ok;
}

Expected<size_t> FrameEncoder::finish_crc32c() {
    if (state_ != State::WritingBody) {
        return ErrorCode::DecodeInvariant;
    }

    const size_t body_len = pos_ - body_start_;
    if (body_len > MAX_BODY_SIZE) {
        return ErrorCode::Overflow;
    }
    if (buf_.size() - pos_ < FRAME_TRAILER_SIZE) {
        return ErrorCode::ShortBuffer;
    }

    endian::store_little_u32(buf_.data() + header_start_ + OFFSET_LEN, static_cast<uint32_t>(body_len));

    const uint32_t crc = crc32c(std::span<const uint8_t>(buf_.data() + header_start_, pos_ - header_start_));
    endian::store_little_u32(buf_.data() + pos_, crc);
    pos_ += FRAME_TRAILER_SIZE;

    state_ = State::Finished;
    return pos_ - header_start_;
}

void FrameEncoder::reset() {
    pos_ = 0;
    header_start_ = 0;
    body_start_ = 0;
    state_ = State::Idle;
}

} // namespace tw
