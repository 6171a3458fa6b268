#pragma once

#include "common/error.hpp"
#include "common/frame.hpp"
#include "messages/msg_types.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace tw {

// Body: u64 ts_ns, i64 price, u32 qty, [u16 bitmap, varbytes symbol?, varbytes note?]
struct Trade {
    uint64_t ts_ns = 0;
    int64_t  price = 0;      // fixed-point, scale chosen by the caller
    uint32_t qty = 0;
    OptionalBytes symbol;
    OptionalBytes note;

    static constexpr size_t FIELD_SYMBOL = 0;
    static constexpr size_t FIELD_NOTE = 1;
    static constexpr size_t FIXED_SIZE = 8 + 8 + 4;
};

struct DecodedTrade {
    FrameHeader header;
    Trade trade;
};

Expected<size_t> encode_trade(std::span<uint8_t> buf, uint32_t seq, const Trade& trade);

// Returned spans point into buf.
Expected<DecodedTrade> decode_trade(std::span<const uint8_t> buf);

bool operator==(const Trade& a, const Trade& b);

} // namespace tw
