#pragma once

#include "common/error.hpp"
#include "common/frame.hpp"
#include "messages/msg_types.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace tw {

// Body: u64 ts_ns, i64 bid, i64 ask, u8 level, [u16 bitmap, varbytes symbol?]
struct Quote {
    uint64_t ts_ns = 0;
    int64_t  bid = 0;
    int64_t  ask = 0;
    uint8_t  level = 0;      // 0=best
    OptionalBytes symbol;

    static constexpr size_t FIELD_SYMBOL = 0;
    static constexpr size_t FIXED_SIZE = 8 + 8 + 8 + 1;
};

struct DecodedQuote {
    FrameHeader header;
    Quote quote;
};

Expected<size_t> encode_quote(std::span<uint8_t> buf, uint32_t seq, const Quote& quote);
Expected<DecodedQuote> decode_quote(std::span<const uint8_t> buf);

bool operator==(const Quote& a, const Quote& b);

} // namespace tw
