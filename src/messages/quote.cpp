#include "quote.hpp"
#include "codec/frame_decoder.hpp"
#include "codec/frame_encoder.hpp"
#include "common/bitmap.hpp"

namespace tw {

Expected<size_t> encode_quote(std::span<uint8_t> buf, uint32_t seq, const Quote& quote) {
    FrameHeader header(static_cast<uint16_t>(MsgType::Quote), seq, 0);
    if (quote.symbol) {
        header.set_flag(FrameFlags::PresenceBitmap);
    }

    FrameEncoder encoder(buf);
    TW_TRY(encoder.begin(header));

    TW_TRY(encoder.put_u64(quote.ts_ns));
    TW_TRY(encoder.put_i64(quote.bid));
    TW_TRY(encoder.put_i64(quote.ask));
    TW_TRY(encoder.put_u8(quote.level));

    if (quote.symbol) {
        auto present = BitmapBuilder(BitmapWidth::U16).with_field(Quote::FIELD_SYMBOL).build();
        if (!present) return present.error();
        TW_TRY(encoder.put_bitmap(present->bits()));
        TW_TRY(encoder.put_varbytes(*quote.symbol));
    }

    return encoder.finish_crc32c();
}

Expected<DecodedQuote> decode_quote(std::span<const uint8_t> buf) {
    FrameDecoder decoder(buf);
    auto header = decoder.header();
    if (!header) return header.error();

    if (header->msg_type != static_cast<uint16_t>(MsgType::Quote)) {
        return ErrorCode::UnsupportedMsgType;
    }
    TW_TRY(decoder.verify_crc32c());

    auto body = decoder.body();
    if (!body) return body.error();

    auto ts_ns = body->get_u64();
    if (!ts_ns) return ts_ns.error();
    auto bid = body->get_i64();
    if (!bid) return bid.error();
    auto ask = body->get_i64();
    if (!ask) return ask.error();
    auto level = body->get_u8();
    if (!level) return level.error();

    DecodedQuote out;
    out.header = *header;
    out.quote.ts_ns = *ts_ns;
    out.quote.bid = *bid;
    out.quote.ask = *ask;
    out.quote.level = *level;

    if (header->has_flag(FrameFlags::PresenceBitmap)) {
        auto bits = body->get_bitmap();
        if (!bits) return bits.error();

        if (PresenceBitmap::from_bits(*bits, BitmapWidth::U16).is_set(Quote::FIELD_SYMBOL)) {
            auto symbol = body->get_varbytes();
            if (!symbol) return symbol.error();
            out.quote.symbol = *symbol;
        }
    }

    return out;
}

bool operator==(const Quote& a, const Quote& b) {
    return a.ts_ns == b.ts_ns && a.bid == b.bid && a.ask == b.ask && a.level == b.level &&
           same_bytes(a.symbol, b.symbol);
}

} // namespace tw
