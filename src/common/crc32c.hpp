#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace tw {

// Castagnoli polynomial, reflected form
constexpr uint32_t CRC32C_POLYNOMIAL = 0x82F63B78;

enum class CrcEngine : uint8_t { Auto, Software, Hardware };

// Hardware path when the running CPU has it, table path otherwise.
uint32_t crc32c(std::span<const uint8_t> data);
uint32_t crc32c(std::span<const uint8_t> data, CrcEngine engine);

bool verify_crc32c(std::span<const uint8_t> data, uint32_t expected);

uint32_t crc32c_sw(std::span<const uint8_t> data);
std::optional<uint32_t> crc32c_hw(std::span<const uint8_t> data);

bool hardware_crc_available();

std::string_view engine_name(CrcEngine engine);
std::optional<CrcEngine> parse_engine(std::string_view name);

} // namespace tw
