#include <doctest/doctest.h>
#include "common/bitmap.hpp"

#include <array>
#include <vector>

using namespace tw;

TEST_CASE("PresenceBitmap - Set Clear And Query") {
    PresenceBitmap bitmap;
    CHECK(bitmap.is_empty());
    CHECK(bitmap.width() == BitmapWidth::U16);

    CHECK(bitmap.set(0) == ErrorCode::Ok);
    CHECK(bitmap.set(5) == ErrorCode::Ok);
    CHECK(bitmap.set(15) == ErrorCode::Ok);
    CHECK(bitmap.is_set(0));
    CHECK(bitmap.is_set(5));
    CHECK(bitmap.is_set(15));
    CHECK_FALSE(bitmap.is_set(1));
    CHECK(bitmap.count_set() == 3);
    CHECK(bitmap.bits() == 0x8021);

    CHECK(bitmap.clear(5) == ErrorCode::Ok);
    CHECK_FALSE(bitmap.is_set(5));
    CHECK(bitmap.count_set() == 2);
}

TEST_CASE("PresenceBitmap - Out Of Range Index") {
    PresenceBitmap wide(BitmapWidth::U16);
    CHECK(wide.set(16) == ErrorCode::Overflow);
    CHECK(wide.clear(16) == ErrorCode::Overflow);
    CHECK_FALSE(wide.is_set(16));
    CHECK_FALSE(wide.is_set(1000));
    CHECK(wide.is_empty());

    PresenceBitmap narrow(BitmapWidth::U8);
    CHECK(narrow.set(7) == ErrorCode::Ok);
    CHECK(narrow.set(8) == ErrorCode::Overflow);
    CHECK_FALSE(narrow.is_set(8));
}

TEST_CASE("PresenceBitmap - Iterates Set Bits In Order") {
    const auto bitmap = PresenceBitmap::from_bits(0b1010'0000'0001'0110, BitmapWidth::U16);

    std::vector<size_t> indices;
    for (size_t idx : bitmap.iter_set()) {
        indices.push_back(idx);
    }
    CHECK(indices == std::vector<size_t>{1, 2, 4, 13, 15});

    PresenceBitmap empty;
    CHECK(empty.iter_set().begin() == empty.iter_set().end());
}

TEST_CASE("PresenceBitmap - Encode Is Little Endian") {
    const auto bitmap = PresenceBitmap::from_bits(0x0102, BitmapWidth::U16);
    std::array<uint8_t, 2> buf{};
    auto n = bitmap.encode(buf);
    REQUIRE(n.has_value());
    CHECK(*n == 2);
    CHECK(buf[0] == 0x02);
    CHECK(buf[1] == 0x01);

    std::array<uint8_t, 1> small{};
    CHECK(bitmap.encode(small).error() == ErrorCode::ShortBuffer);

    const auto narrow = PresenceBitmap::from_bits(0x00A5, BitmapWidth::U8);
    auto n8 = narrow.encode(small);
    REQUIRE(n8.has_value());
    CHECK(*n8 == 1);
    CHECK(small[0] == 0xA5);
}

TEST_CASE("PresenceBitmap - Decode") {
    const std::array<uint8_t, 3> buf = {0x03, 0x80, 0xEE};
    auto wide = PresenceBitmap::decode(buf, BitmapWidth::U16);
    REQUIRE(wide.has_value());
    CHECK(wide->consumed == 2);
    CHECK(wide->bitmap.bits() == 0x8003);

    auto narrow = PresenceBitmap::decode(buf, BitmapWidth::U8);
    REQUIRE(narrow.has_value());
    CHECK(narrow->consumed == 1);
    CHECK(narrow->bitmap.bits() == 0x03);

    const std::array<uint8_t, 1> short_buf = {0x01};
    CHECK(PresenceBitmap::decode(short_buf, BitmapWidth::U16).error() == ErrorCode::UnexpectedEof);
    CHECK(PresenceBitmap::decode(std::span<const uint8_t>(), BitmapWidth::U8).error() == ErrorCode::UnexpectedEof);
}

TEST_CASE("PresenceBitmap - Narrow Width Masks Upper Bits") {
    const auto bitmap = PresenceBitmap::from_bits(0xFF01, BitmapWidth::U8);
    CHECK(bitmap.bits() == 0x01);
    CHECK(bitmap.count_set() == 1);
}

TEST_CASE("BitmapBuilder - Builds Or Reports First Error") {
    auto built = BitmapBuilder().with_field(0).with_field(3).build();
    REQUIRE(built.has_value());
    CHECK(built->bits() == 0x0009);

    auto bad = BitmapBuilder(BitmapWidth::U8).with_field(1).with_field(9).with_field(2).build();
    CHECK_FALSE(bad.has_value());
    CHECK(bad.error() == ErrorCode::Overflow);
}

TEST_CASE("PresenceBitmap - Width Helpers") {
    static_assert(bitmap_bytes(BitmapWidth::U8) == 1);
    static_assert(bitmap_bytes(BitmapWidth::U16) == 2);
    static_assert(bitmap_max_fields(BitmapWidth::U8) == 8);
    static_assert(bitmap_max_fields(BitmapWidth::U16) == 16);
    static_assert(PresenceBitmap::from_bits(0x4, BitmapWidth::U16).is_set(2));
    CHECK(PresenceBitmap::from_bits(0x4, BitmapWidth::U16) == PresenceBitmap::from_bits(0x4, BitmapWidth::U16));
    CHECK_FALSE(PresenceBitmap::from_bits(0x4, BitmapWidth::U16) == PresenceBitmap::from_bits(0x4, BitmapWidth::U8));
}
