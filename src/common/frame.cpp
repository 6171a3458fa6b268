#include "frame.hpp"
#include <boost/endian/conversion.hpp>
#include <limits>

namespace tw {

namespace endian = boost::endian;

ErrorCode FrameHeader::validate() const {
    if (magic != FRAME_MAGIC) {
        return ErrorCode::InvalidMagic;
    }
    if (ver != PROTOCOL_VERSION) {
        return ErrorCode::UnsupportedVersion;
    }
    if (flags & FrameFlags::ReservedMask) {
        return ErrorCode::FlagConflict;
    }

    const size_t body_len = len;
    if (body_len > std::numeric_limits<size_t>::max() - FRAME_HEADER_SIZE - FRAME_TRAILER_SIZE) {
        return ErrorCode::Overflow;
    }
    const size_t total = body_len + FRAME_HEADER_SIZE + FRAME_TRAILER_SIZE;
    if (total < MIN_FRAME_SIZE || total > MAX_FRAME_SIZE) {
        return ErrorCode::Overflow;
    }
    return ErrorCode::Ok;
}

ErrorCode FrameHeader::encode(std::span<uint8_t> buf) const {
    if (buf.size() < FRAME_HEADER_SIZE) {
        return ErrorCode::ShortBuffer;
    }

    uint8_t* p = buf.data();
    endian::store_little_u16(p + OFFSET_MAGIC, magic);
    p[OFFSET_VERSION] = ver;
    p[OFFSET_FLAGS] = flags;
    endian::store_little_u16(p + OFFSET_MSG_TYPE, msg_type);
    endian::store_little_u32(p + OFFSET_SEQ, seq);
    endian::store_little_u32(p + OFFSET_LEN, len);
    p[OFFSET_RESERVED] = 0;
    p[OFFSET_RESERVED + 1] = 0;
    return ErrorCode::Ok;
}

Expected<FrameHeader> FrameHeader::decode(std::span<const uint8_t> buf) {
    if (buf.size() < FRAME_HEADER_SIZE) {
        return ErrorCode::UnexpectedEof;
    }

    const uint8_t* p = buf.data();
    FrameHeader header;
    header.magic = endian::load_little_u16(p + OFFSET_MAGIC);
    header.ver = p[OFFSET_VERSION];
    header.flags = p[OFFSET_FLAGS];
    header.msg_type = endian::load_little_u16(p + OFFSET_MSG_TYPE);
    header.seq = endian::load_little_u32(p + OFFSET_SEQ);
    header.len = endian::load_little_u32(p + OFFSET_LEN);
    // reserved bytes are not inspected on read

    ErrorCode rc = header.validate();
    if (!ok(rc)) {
        return rc;
    }
    return header;
}

uint32_t peek_body_len(std::span<const uint8_t> buf) {
    if (buf.size() < OFFSET_LEN + 4) {
        return 0;
    }
    return endian::load_little_u32(buf.data() + OFFSET_LEN);
}

} // namespace tw
