#include <doctest/doctest.h>
#include "common/metrics.hpp"

#include <nlohmann/json.hpp>

using namespace tw;

TEST_CASE("LatencyHistogram - Percentiles") {
    LatencyHistogram histogram({100, 200, 500, 1000});

    CHECK(histogram.get_percentiles().count == 0);
    CHECK(histogram.get_percentiles().p50 == 0);

    for (int i = 0; i < 90; ++i) {
        histogram.record(80);
    }
    for (int i = 0; i < 9; ++i) {
        histogram.record(400);
    }
    histogram.record(5000);

    auto p = histogram.get_percentiles();
    CHECK(p.count == 100);
    CHECK(p.max == 5000);
    CHECK(p.p50 == 100);
    CHECK(p.p95 == 500);
    CHECK(p.p99 == 500);
    CHECK(p.p999 == 500);

    histogram.reset();
    CHECK(histogram.get_percentiles().count == 0);
}

TEST_CASE("LatencyHistogram - Bucket Bound Capped By Max") {
    LatencyHistogram histogram({1000});
    histogram.record(10);
    histogram.record(20);
    auto p = histogram.get_percentiles();
    CHECK(p.p50 == 20);
    CHECK(p.max == 20);
}

TEST_CASE("MetricsCollector - Counters And Export") {
    auto& metrics = MetricsCollector::instance();
    metrics.reset();

    metrics.increment_counter("frames_ok_total");
    metrics.increment_counter("frames_ok_total", 4);
    metrics.record_latency("scan_frame_ns", 75);
    CHECK(metrics.get_counter("frames_ok_total") == 5);
    CHECK(metrics.get_counter("never_touched") == 0);
    CHECK(metrics.get_latency_percentiles("scan_frame_ns").count == 1);
    CHECK(metrics.get_latency_percentiles("unknown").count == 0);

    auto json = nlohmann::json::parse(metrics.get_json_metrics());
    CHECK(json["counters"]["frames_ok_total"] == 5);
    CHECK(json["histograms"]["scan_frame_ns"]["count"] == 1);
    CHECK(json["histograms"]["scan_frame_ns"]["max"] == 75);

    const std::string prom = metrics.get_prometheus_metrics();
    CHECK(prom.find("# TYPE frames_ok_total counter\nframes_ok_total 5\n") != std::string::npos);
    CHECK(prom.find("scan_frame_ns{quantile=\"0.5\"} 75") != std::string::npos);
    CHECK(prom.find("scan_frame_ns_count 1") != std::string::npos);

    metrics.reset();
    CHECK(metrics.get_counter("frames_ok_total") == 0);
}

TEST_CASE("MetricsCollector - Error Kinds") {
    auto& metrics = MetricsCollector::instance();
    metrics.reset();

    metrics.record_error(ErrorCode::CrcMismatch);
    metrics.record_error(ErrorCode::CrcMismatch);
    metrics.record_error(ErrorCode::UnexpectedEof);
    CHECK(metrics.get_error_count(ErrorCode::CrcMismatch) == 2);
    CHECK(metrics.get_error_count(ErrorCode::UnexpectedEof) == 1);
    CHECK(metrics.get_error_count(ErrorCode::InvalidMagic) == 0);

    auto json = nlohmann::json::parse(metrics.get_json_metrics());
    CHECK(json["errors"]["crc_mismatch"] == 2);
    CHECK(json["errors"]["unexpected_eof"] == 1);
    CHECK_FALSE(json["errors"].contains("invalid_magic"));

    const std::string prom = metrics.get_prometheus_metrics();
    CHECK(prom.find("codec_errors_total{kind=\"crc_mismatch\"} 2") != std::string::npos);
    CHECK(prom.find("codec_errors_total{kind=\"invalid_magic\"} 0") != std::string::npos);

    metrics.reset();
    CHECK(metrics.get_error_count(ErrorCode::CrcMismatch) == 0);
}

TEST_CASE("LatencyTimer - Records On Scope Exit") {
    auto& metrics = MetricsCollector::instance();
    metrics.reset();

    {
        TW_MEASURE_LATENCY("timed_block_ns");
    }
    CHECK(metrics.get_latency_percentiles("timed_block_ns").count == 1);

    {
        LatencyTimer timer("cancelled_block_ns");
        timer.cancel();
    }
    CHECK(metrics.get_latency_percentiles("cancelled_block_ns").count == 0);

    metrics.reset();
}
