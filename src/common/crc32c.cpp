#include "crc32c.hpp"
#include <array>
#include <cstring>

#if defined(__x86_64__)
#include <immintrin.h>
#elif defined(__aarch64__) && defined(__linux__)
#include <arm_acle.h>
#include <asm/hwcap.h>
#include <sys/auxv.h>
#endif

namespace tw {

namespace {

constexpr std::array<uint32_t, 256> make_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; i++) {
        uint32_t crc = i;
        for (uint32_t j = 0; j < 8; j++) {
            if (crc & 1) {
                crc = (crc >> 1) ^ CRC32C_POLYNOMIAL;
            } else {
                crc = crc >> 1;
            }
        }
        table[i] = crc;
    }
    return table;
}

constexpr std::array<uint32_t, 256> crc32c_table = make_table();

static_assert(crc32c_table[1] == 0xF26B8303, "CRC32C table generated with wrong polynomial");

#if defined(__x86_64__)

bool cpu_has_crc() {
    return __builtin_cpu_supports("sse4.2");
}

__attribute__((target("sse4.2")))
uint32_t crc32c_hw_impl(const uint8_t* data, size_t length) {
    uint64_t crc = 0xFFFFFFFFu;
    while (length >= 8) {
        uint64_t word;
        std::memcpy(&word, data, sizeof(word));
        crc = _mm_crc32_u64(crc, word);
        data += 8;
        length -= 8;
    }
    uint32_t crc32 = static_cast<uint32_t>(crc);
    while (length > 0) {
        crc32 = _mm_crc32_u8(crc32, *data);
        ++data;
        --length;
    }
    return ~crc32;
}

#elif defined(__aarch64__) && defined(__linux__)

bool cpu_has_crc() {
    return (getauxval(AT_HWCAP) & HWCAP_CRC32) != 0;
}

__attribute__((target("+crc")))
uint32_t crc32c_hw_impl(const uint8_t* data, size_t length) {
    uint32_t crc = 0xFFFFFFFFu;
    while (length >= 8) {
        uint64_t word;
        std::memcpy(&word, data, sizeof(word));
        crc = __crc32cd(crc, word);
        data += 8;
        length -= 8;
    }
    while (length > 0) {
        crc = __crc32cb(crc, *data);
        ++data;
        --length;
    }
    return ~crc;
}

#else

bool cpu_has_crc() {
    return false;
}

uint32_t crc32c_hw_impl(const uint8_t*, size_t) {
    return 0;
}

#endif

} // namespace

uint32_t crc32c_sw(std::span<const uint8_t> data) {
    uint32_t crc = 0xFFFFFFFF;
    for (uint8_t byte : data) {
        crc = (crc >> 8) ^ crc32c_table[(crc ^ byte) & 0xFF];
    }
    return ~crc;
}

std::optional<uint32_t> crc32c_hw(std::span<const uint8_t> data) {
    if (!cpu_has_crc()) {
        return std::nullopt;
    }
    return crc32c_hw_impl(data.data(), data.size());
}

bool hardware_crc_available() {
    return cpu_has_crc();
}

uint32_t crc32c(std::span<const uint8_t> data) {
    return crc32c(data, CrcEngine::Auto);
}

uint32_t crc32c(std::span<const uint8_t> data, CrcEngine engine) {
    if (engine != CrcEngine::Software && cpu_has_crc()) {
        return crc32c_hw_impl(data.data(), data.size());
    }
    return crc32c_sw(data);
}

bool verify_crc32c(std::span<const uint8_t> data, uint32_t expected) {
    return crc32c(data) == expected;
}

std::string_view engine_name(CrcEngine engine) {
    switch (engine) {
        case CrcEngine::Auto: return "auto";
        case CrcEngine::Software: return "software";
        case CrcEngine::Hardware: return "hardware";
    }
    return "unknown";
}

std::optional<CrcEngine> parse_engine(std::string_view name) {
    if (name == "auto") return CrcEngine::Auto;
    if (name == "software") return CrcEngine::Software;
    if (name == "hardware") return CrcEngine::Hardware;
    return std::nullopt;
}

} // namespace tw
