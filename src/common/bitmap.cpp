#include "bitmap.hpp"
#include <boost/endian/conversion.hpp>

namespace tw {

ErrorCode PresenceBitmap::set(size_t idx) {
    if (idx >= bitmap_max_fields(width_)) {
        return ErrorCode::Overflow;
    }
    bits_ |= static_cast<uint16_t>(1u << idx);
    return ErrorCode::Ok;
}

ErrorCode PresenceBitmap::clear(size_t idx) {
    if (idx >= bitmap_max_fields(width_)) {
        return ErrorCode::Overflow;
    }
    bits_ &= static_cast<uint16_t>(~(1u << idx));
    return ErrorCode::Ok;
}

Expected<size_t> PresenceBitmap::encode(std::span<uint8_t> buf) const {
    const size_t need = bitmap_bytes(width_);
    if (buf.size() < need) {
        return ErrorCode::ShortBuffer;
    }
    if (width_ == BitmapWidth::U8) {
        buf[0] = static_cast<uint8_t>(bits_);
    } else {
        boost::endian::store_little_u16(buf.data(), bits_);
    }
    return need;
}

Expected<PresenceBitmap::Decoded> PresenceBitmap::decode(std::span<const uint8_t> buf, BitmapWidth width) {
    const size_t need = bitmap_bytes(width);
    if (buf.size() < need) {
        return ErrorCode::UnexpectedEof;
    }
    const uint16_t bits = width == BitmapWidth::U8 ? buf[0] : boost::endian::load_little_u16(buf.data());
    return Decoded{from_bits(bits, width), need};
}

BitmapBuilder& BitmapBuilder::with_field(size_t idx) {
    ErrorCode rc = bitmap_.set(idx);
    if (!ok(rc) && ok(error_)) {
        error_ = rc;
    }
    return *this;
}

Expected<PresenceBitmap> BitmapBuilder::build() const {
    if (!ok(error_)) {
        return error_;
    }
    return bitmap_;
}

} // namespace tw
