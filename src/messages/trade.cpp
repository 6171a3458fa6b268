#include "trade.hpp"
#include "codec/frame_decoder.hpp"
#include "codec/frame_encoder.hpp"
#include "common/bitmap.hpp"

namespace tw {

Expected<size_t> encode_trade(std::span<uint8_t> buf, uint32_t seq, const Trade& trade) {
    PresenceBitmap present(BitmapWidth::U16);
    if (trade.symbol) TW_TRY(present.set(Trade::FIELD_SYMBOL));
    if (trade.note) TW_TRY(present.set(Trade::FIELD_NOTE));

    FrameHeader header(static_cast<uint16_t>(MsgType::Trade), seq, 0);
    if (!present.is_empty()) {
        header.set_flag(FrameFlags::PresenceBitmap);
    }

    FrameEncoder encoder(buf);
    TW_TRY(encoder.begin(header));

    TW_TRY(encoder.put_u64(trade.ts_ns));
    TW_TRY(encoder.put_i64(trade.price));
    TW_TRY(encoder.put_u32(trade.qty));

    if (!present.is_empty()) {
        TW_TRY(encoder.put_bitmap(present.bits()));
        if (trade.symbol) TW_TRY(encoder.put_varbytes(*trade.symbol));
        if (trade.note) TW_TRY(encoder.put_varbytes(*trade.note));
    }

    return encoder.finish_crc32c();
}

Expected<DecodedTrade> decode_trade(std::span<const uint8_t> buf) {
    FrameDecoder decoder(buf);
    auto header = decoder.header();
    if (!header) return header.error();

    if (header->msg_type != static_cast<uint16_t>(MsgType::Trade)) {
        return ErrorCode::UnsupportedMsgType;
    }
    TW_TRY(decoder.verify_crc32c());

    auto body = decoder.body();
    if (!body) return body.error();

    DecodedTrade out;
    out.header = *header;

    auto ts_ns = body->get_u64();
    if (!ts_ns) return ts_ns.error();
    auto price = body->get_i64();
    if (!price) return price.error();
    auto qty = body->get_u32();
    if (!qty) return qty.error();

    out.trade.ts_ns = *ts_ns;
    out.trade.price = *price;
    out.trade.qty = *qty;

    if (header->has_flag(FrameFlags::PresenceBitmap)) {
        auto bits = body->get_bitmap();
        if (!bits) return bits.error();
        const auto present = PresenceBitmap::from_bits(*bits, BitmapWidth::U16);

        if (present.is_set(Trade::FIELD_SYMBOL)) {
            auto symbol = body->get_varbytes();
            if (!symbol) return symbol.error();
            out.trade.symbol = *symbol;
        }
        if (present.is_set(Trade::FIELD_NOTE)) {
            auto note = body->get_varbytes();
            if (!note) return note.error();
            out.trade.note = *note;
        }
    }

    return out;
}

bool operator==(const Trade& a, const Trade& b) {
    return a.ts_ns == b.ts_ns && a.price == b.price && a.qty == b.qty &&
           same_bytes(a.symbol, b.symbol) && same_bytes(a.note, b.note);
}

} // namespace tw
