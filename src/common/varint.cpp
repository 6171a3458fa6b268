#include "varint.hpp"

namespace tw::varint {

namespace {

template <typename T>
Expected<size_t> encode(T value, std::span<uint8_t> buf) {
    size_t pos = 0;
    for (;;) {
        if (pos >= buf.size()) {
            return ErrorCode::ShortBuffer;
        }
        if (value < 0x80) {
            buf[pos] = static_cast<uint8_t>(value);
            return pos + 1;
        }
        buf[pos] = static_cast<uint8_t>(value) | 0x80;
        value >>= 7;
        ++pos;
    }
}

template <typename T>
Expected<Decoded<T>> decode(std::span<const uint8_t> buf) {
    constexpr unsigned width = sizeof(T) * 8;
    T result = 0;
    unsigned shift = 0;
    size_t pos = 0;

    for (;;) {
        if (pos >= buf.size()) {
            return ErrorCode::UnexpectedEof;
        }
        if (shift >= width) {
            return ErrorCode::Overflow;
        }

        const uint8_t byte = buf[pos++];
        result |= static_cast<T>(byte & 0x7F) << shift;

        if ((byte & 0x80) == 0) {
            return Decoded<T>{result, pos};
        }
        shift += 7;
    }
}

} // namespace

Expected<size_t> encode_u32(uint32_t value, std::span<uint8_t> buf) {
    return encode(value, buf);
}

Expected<size_t> encode_u64(uint64_t value, std::span<uint8_t> buf) {
    return encode(value, buf);
}

Expected<Decoded<uint32_t>> decode_u32(std::span<const uint8_t> buf) {
    return decode<uint32_t>(buf);
}

Expected<Decoded<uint64_t>> decode_u64(std::span<const uint8_t> buf) {
    return decode<uint64_t>(buf);
}

} // namespace tw::varint
