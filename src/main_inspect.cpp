#include "common/config.hpp"
#include "common/crc32c.hpp"
#include "common/metrics.hpp"
#include "messages/quote.hpp"
#include "messages/trade.hpp"
#include "stream/frame_scanner.hpp"

#include <boost/endian/conversion.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <vector>

namespace tw {

class FrameInspector {
public:
    explicit FrameInspector(const Config& config) : config_(config) {}

    // Returns true when every frame in the buffer was accepted.
    bool run(std::span<const uint8_t> capture) {
        FrameScanner scanner(capture);
        auto& metrics = MetricsCollector::instance();
        uint64_t inspected = 0;
        bool clean = true;

        while (scanner.has_more()) {
            if (config_.inspect.max_frames != 0 && inspected >= config_.inspect.max_frames) {
                spdlog::info("Reached max_frames={}, stopping", config_.inspect.max_frames);
                break;
            }

            const size_t offset = scanner.offset();
            auto frame = [&] {
                TW_MEASURE_LATENCY("scan_frame_ns");
                return scanner.next();
            }();
            ++inspected;

            if (!frame) {
                clean = false;
                metrics.record_error(frame.error());
                if (frame.error() == ErrorCode::UnexpectedEof) {
                    spdlog::warn("Truncated frame at offset {} ({} bytes left)", offset, capture.size() - offset);
                } else {
                    spdlog::warn("Rejected frame at offset {}: {}", offset, describe(frame.error()));
                }
                if (config_.inspect.stop_on_error) {
                    break;
                }
                scanner.resync();
                continue;
            }

            metrics.increment_counter("frames_ok_total");
            metrics.increment_counter("frame_bytes_total", frame->bytes.size());
            log_frame(*frame);

            if (config_.crc.engine != CrcEngine::Auto && !check_pinned_engine(*frame)) {
                clean = false;
            }

            if (config_.inspect.decode_messages && !decode_message(*frame)) {
                clean = false;
                if (config_.inspect.stop_on_error) {
                    break;
                }
            }
        }

        const auto& stats = scanner.get_stats();
        spdlog::info("Scanned {} bytes: {} frames accepted, {} rejected, {} bytes skipped",
                     capture.size(), stats.frames_accepted, stats.frames_rejected, stats.bytes_skipped);
        return clean;
    }

private:
    void log_frame(const FrameView& frame) const {
        spdlog::info("@{} msg_type={} seq={} len={} flags=0x{:02x}",
                     frame.offset, frame.header.msg_type, frame.header.seq, frame.header.len, frame.header.flags);
    }

    // Recomputes the trailer with the configured engine; a disagreement means
    // the hardware and table paths diverged on this input.
    bool check_pinned_engine(const FrameView& frame) const {
        const auto covered = frame.bytes.first(frame.bytes.size() - FRAME_TRAILER_SIZE);
        const uint32_t expected = boost::endian::load_little_u32(covered.data() + covered.size());
        const uint32_t pinned = crc32c(covered, config_.crc.engine);
        if (pinned != expected) {
            MetricsCollector::instance().increment_counter("crc_engine_disagreement_total");
            spdlog::error("CRC engine {} disagrees at offset {}: {:08x} != {:08x}",
                          engine_name(config_.crc.engine), frame.offset, pinned, expected);
            return false;
        }
        return true;
    }

    bool decode_message(const FrameView& frame) const {
        auto& metrics = MetricsCollector::instance();

        switch (static_cast<MsgType>(frame.header.msg_type)) {
            case MsgType::Trade: {
                auto decoded = decode_trade(frame.bytes);
                if (!decoded) {
                    metrics.increment_counter("messages_malformed_total");
                    metrics.record_error(decoded.error());
                    spdlog::warn("Trade seq={} failed to decode: {}", frame.header.seq, describe(decoded.error()));
                    return false;
                }
                const auto& t = decoded->trade;
                spdlog::info("  trade ts_ns={} price={} qty={} symbol={} note={}",
                             t.ts_ns, t.price, t.qty,
                             t.symbol ? as_string_view(*t.symbol) : "-",
                             t.note ? as_string_view(*t.note) : "-");
                metrics.increment_counter("trades_total");
                return true;
            }
            case MsgType::Quote: {
                auto decoded = decode_quote(frame.bytes);
                if (!decoded) {
                    metrics.increment_counter("messages_malformed_total");
                    metrics.record_error(decoded.error());
                    spdlog::warn("Quote seq={} failed to decode: {}", frame.header.seq, describe(decoded.error()));
                    return false;
                }
                const auto& q = decoded->quote;
                spdlog::info("  quote ts_ns={} bid={} ask={} level={} symbol={}",
                             q.ts_ns, q.bid, q.ask, q.level,
                             q.symbol ? as_string_view(*q.symbol) : "-");
                metrics.increment_counter("quotes_total");
                return true;
            }
        }

        metrics.increment_counter("messages_unknown_type_total");
        spdlog::debug("  no schema for msg_type={}", frame.header.msg_type);
        return true;
    }

    Config config_;
};

} // namespace tw

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <capture-file> [config.json]\n";
        return 2;
    }

    tw::Config config = argc > 2 ? tw::Config::load_from_file(argv[2]) : tw::Config::default_config();
    tw::apply_logging(config.logging);

    if (config.crc.engine == tw::CrcEngine::Hardware && !tw::hardware_crc_available()) {
        spdlog::warn("Hardware CRC32C requested but not available on this CPU, using software");
    }
    spdlog::info("CRC32C engine: {} (hardware available: {})",
                 tw::engine_name(config.crc.engine), tw::hardware_crc_available());

    std::ifstream file(argv[1], std::ios::binary);
    if (!file.is_open()) {
        spdlog::error("Cannot open capture file {}", argv[1]);
        return 2;
    }
    std::vector<uint8_t> capture((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        spdlog::error("Failed reading capture file {}", argv[1]);
        return 2;
    }

    tw::FrameInspector inspector(config);
    const bool clean = inspector.run(capture);

    switch (config.inspect.metrics_format) {
        case tw::MetricsFormat::Json:
            std::cout << tw::MetricsCollector::instance().get_json_metrics() << "\n";
            break;
        case tw::MetricsFormat::Prometheus:
            std::cout << tw::MetricsCollector::instance().get_prometheus_metrics();
            break;
        case tw::MetricsFormat::None:
            break;
    }

    return clean ? 0 : 1;
}
