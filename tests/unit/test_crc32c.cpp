#include <doctest/doctest.h>
#include "common/crc32c.hpp"
#include "messages/msg_types.hpp"

#include <cstdint>
#include <random>
#include <vector>

using namespace tw;

TEST_CASE("CRC32C - Known Vectors") {
    CHECK(crc32c(as_bytes("123456789")) == 0xE3069283u);
    CHECK(crc32c(std::span<const uint8_t>()) == 0u);
    CHECK(crc32c(as_bytes("The quick brown fox jumps over the lazy dog")) == 0x22620404u);

    // 32 zero bytes, RFC 3720 appendix B.4
    const std::vector<uint8_t> zeros(32, 0x00);
    CHECK(crc32c(zeros) == 0x8A9136AAu);

    const std::vector<uint8_t> ones(32, 0xFF);
    CHECK(crc32c(ones) == 0x62A8AB43u);
}

TEST_CASE("CRC32C - Software Path Matches Known Vectors") {
    CHECK(crc32c_sw(as_bytes("123456789")) == 0xE3069283u);
    CHECK(crc32c_sw(std::span<const uint8_t>()) == 0u);
}

TEST_CASE("CRC32C - Verify") {
    const auto data = as_bytes("123456789");
    CHECK(verify_crc32c(data, 0xE3069283u));
    CHECK_FALSE(verify_crc32c(data, 0xE3069282u));
}

TEST_CASE("CRC32C - Hardware Path Matches Table Path") {
    if (!hardware_crc_available()) {
        CHECK_FALSE(crc32c_hw(as_bytes("123456789")).has_value());
        MESSAGE("no hardware CRC32C on this CPU, cross-check skipped");
        return;
    }

    std::mt19937 rng(0xC0FFEE);
    std::vector<uint8_t> data(4096 + 64);
    for (auto& b : data) {
        b = static_cast<uint8_t>(rng());
    }

    // Every length up to a few words, at every alignment within a word,
    // exercises both the 8-byte loop and the byte tail.
    for (size_t offset = 0; offset < 8; ++offset) {
        for (size_t len = 0; len <= 64; ++len) {
            CAPTURE(offset);
            CAPTURE(len);
            std::span<const uint8_t> slice(data.data() + offset, len);
            auto hw = crc32c_hw(slice);
            REQUIRE(hw.has_value());
            CHECK(*hw == crc32c_sw(slice));
        }
    }

    for (size_t len : {255u, 1000u, 4096u}) {
        std::span<const uint8_t> slice(data.data() + 3, len);
        CHECK(*crc32c_hw(slice) == crc32c_sw(slice));
    }
}

TEST_CASE("CRC32C - Engine Selection Gives Identical Results") {
    const auto data = as_bytes("The quick brown fox jumps over the lazy dog");
    const uint32_t expected = crc32c_sw(data);
    CHECK(crc32c(data, CrcEngine::Auto) == expected);
    CHECK(crc32c(data, CrcEngine::Software) == expected);
    CHECK(crc32c(data, CrcEngine::Hardware) == expected);
}

TEST_CASE("CRC32C - Engine Names") {
    CHECK(engine_name(CrcEngine::Auto) == "auto");
    CHECK(engine_name(CrcEngine::Software) == "software");
    CHECK(engine_name(CrcEngine::Hardware) == "hardware");

    CHECK(parse_engine("software") == CrcEngine::Software);
    CHECK(parse_engine("hardware") == CrcEngine::Hardware);
    CHECK(parse_engine("auto") == CrcEngine::Auto);
    CHECK_FALSE(parse_engine("sse42").has_value());
}
