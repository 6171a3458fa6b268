#pragma once

#include "common/error.hpp"
#include "common/frame.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace tw {

struct FrameView {
    FrameHeader header;
    size_t offset = 0;                  // position in the scanned buffer
    std::span<const uint8_t> bytes;     // header + body + trailer
    std::span<const uint8_t> body;
};

// Walks a buffer holding back-to-back frames, as a capture or recording
// file would. Each frame is header-validated and CRC-checked before it is
// returned. After an error the scanner stays put until resync() is called.
class FrameScanner {
public:
    explicit FrameScanner(std::span<const uint8_t> buf) : buf_(buf) {}

    // UnexpectedEof when only a partial frame (or nothing) is left.
    Expected<FrameView> next();

    // Moves past the current position to the next magic number. Returns the
    // bytes skipped; lands at the end of the buffer when no magic follows.
    size_t resync();

    bool has_more() const { return offset_ < buf_.size(); }
    size_t offset() const { return offset_; }

    struct Stats {
        uint64_t frames_accepted = 0;
        uint64_t frames_rejected = 0;
        uint64_t bytes_skipped = 0;
    };

    const Stats& get_stats() const { return stats_; }

private:
    std::span<const uint8_t> buf_;
    size_t offset_ = 0;
    Stats stats_;
};

} // namespace tw
