#pragma once

#include "error.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace tw::varint {

constexpr size_t MAX_U32_SIZE = 5;
constexpr size_t MAX_U64_SIZE = 10;

template <typename T>
struct Decoded {
    T value;
    size_t consumed;
};

// LEB128: 7 data bits per byte, least significant group first, 0x80 marks continuation.
Expected<size_t> encode_u32(uint32_t value, std::span<uint8_t> buf);
Expected<size_t> encode_u64(uint64_t value, std::span<uint8_t> buf);

Expected<Decoded<uint32_t>> decode_u32(std::span<const uint8_t> buf);
Expected<Decoded<uint64_t>> decode_u64(std::span<const uint8_t> buf);

// Minimal encoded length of a value
constexpr size_t encoded_size(uint64_t value) {
    size_t n = 1;
    while (value >= 0x80) {
        value >>= 7;
        ++n;
    }
    return n;
}

} // namespace tw::varint
