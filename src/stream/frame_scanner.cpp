#include "frame_scanner.hpp"
#include "codec/frame_decoder.hpp"
#include <boost/endian/conversion.hpp>
#include <spdlog/spdlog.h>

namespace tw {

Expected<FrameView> FrameScanner::next() {
    if (!has_more()) {
        return ErrorCode::UnexpectedEof;
    }

    const auto remaining = buf_.subspan(offset_);
    FrameDecoder decoder(remaining);

    ErrorCode rc = decoder.verify_crc32c();
    if (rc == ErrorCode::UnexpectedEof) {
        return rc;
    }
    if (!ok(rc)) {
        stats_.frames_rejected++;
        return rc;
    }

    // verify_crc32c() succeeding implies the header and frame span are valid.
    auto header = decoder.header();
    auto bytes = decoder.frame_buffer();
    if (!header || !bytes) {
        stats_.frames_rejected++;
        return ErrorCode::DecodeInvariant;
    }

    FrameView view;
    view.header = *header;
    view.offset = offset_;
    view.bytes = *bytes;
    view.body = bytes->subspan(FRAME_HEADER_SIZE, header->len);

    offset_ += bytes->size();
    stats_.frames_accepted++;
    return view;
}

size_t FrameScanner::resync() {
    const size_t start = offset_;
    size_t pos = offset_ + 1;

    while (pos + 1 < buf_.size()) {
        if (boost::endian::load_little_u16(buf_.data() + pos) == FRAME_MAGIC) {
            break;
        }
        ++pos;
    }
    if (pos + 1 >= buf_.size()) {
        pos = buf_.size();
    }

    offset_ = pos;
    const size_t skipped = offset_ - start;
    stats_.bytes_skipped += skipped;
    spdlog::debug("Frame scanner resync skipped {} bytes at offset {}", skipped, start);
    return skipped;
}

} // namespace tw
