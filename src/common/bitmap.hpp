#pragma once

#include "error.hpp"
#include <bit>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>

namespace tw {

enum class BitmapWidth : uint8_t { U8, U16 };

constexpr size_t bitmap_bytes(BitmapWidth width) {
    return width == BitmapWidth::U8 ? 1 : 2;
}

constexpr size_t bitmap_max_fields(BitmapWidth width) {
    return width == BitmapWidth::U8 ? 8 : 16;
}

// Optional-field presence flags, field index -> present.
class PresenceBitmap {
public:
    class SetBits;

    constexpr explicit PresenceBitmap(BitmapWidth width = BitmapWidth::U16) : width_(width) {}

    // Bits above the width are dropped.
    static constexpr PresenceBitmap from_bits(uint16_t bits, BitmapWidth width) {
        PresenceBitmap bitmap(width);
        bitmap.bits_ = width == BitmapWidth::U8 ? static_cast<uint16_t>(bits & 0xFF) : bits;
        return bitmap;
    }

    constexpr uint16_t bits() const { return bits_; }
    constexpr BitmapWidth width() const { return width_; }

    ErrorCode set(size_t idx);
    ErrorCode clear(size_t idx);

    constexpr bool is_set(size_t idx) const {
        if (idx >= bitmap_max_fields(width_)) {
            return false;
        }
        return ((bits_ >> idx) & 1u) != 0;
    }

    size_t count_set() const { return static_cast<size_t>(std::popcount(bits_)); }
    bool is_empty() const { return bits_ == 0; }

    // Raw little-endian bytes, 1 or 2 depending on width
    Expected<size_t> encode(std::span<uint8_t> buf) const;

    struct Decoded;
    static Expected<Decoded> decode(std::span<const uint8_t> buf, BitmapWidth width);

    SetBits iter_set() const;

    bool operator==(const PresenceBitmap&) const = default;

private:
    uint16_t bits_ = 0;
    BitmapWidth width_;
};

struct PresenceBitmap::Decoded {
    PresenceBitmap bitmap;
    size_t consumed;
};

// Ascending indices of set bits.
class PresenceBitmap::SetBits {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = size_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const size_t*;
        using reference = size_t;

        iterator() = default;
        explicit iterator(uint16_t remaining) : remaining_(remaining) {}

        size_t operator*() const { return static_cast<size_t>(std::countr_zero(remaining_)); }

        iterator& operator++() {
            remaining_ &= static_cast<uint16_t>(remaining_ - 1);
            return *this;
        }

        iterator operator++(int) {
            iterator tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const iterator&) const = default;

    private:
        uint16_t remaining_ = 0;
    };

    explicit SetBits(uint16_t bits) : bits_(bits) {}

    iterator begin() const { return iterator(bits_); }
    iterator end() const { return iterator(0); }

private:
    uint16_t bits_;
};

inline PresenceBitmap::SetBits PresenceBitmap::iter_set() const {
    return SetBits(bits_);
}

class BitmapBuilder {
public:
    explicit BitmapBuilder(BitmapWidth width = BitmapWidth::U16) : bitmap_(width) {}

    BitmapBuilder& with_field(size_t idx);

    // Overflow if any with_field() index was out of range
    Expected<PresenceBitmap> build() const;

private:
    PresenceBitmap bitmap_;
    ErrorCode error_ = ErrorCode::Ok;
};

} // namespace tw
