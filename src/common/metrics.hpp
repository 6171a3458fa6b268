#pragma once

#include "error.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tw {

// Fixed-bucket latency distribution. Each bucket counts samples at or below
// its bound; one trailing slot takes everything past the last bound.
class LatencyHistogram {
public:
    explicit LatencyHistogram(std::vector<uint64_t> bounds_ns);

    void record(uint64_t latency_ns);

    struct Percentiles {
        uint64_t p50 = 0;
        uint64_t p95 = 0;
        uint64_t p99 = 0;
        uint64_t p999 = 0;
        uint64_t max = 0;
        uint64_t count = 0;
    };

    // Reported values are bucket bounds, never above the largest sample seen.
    Percentiles get_percentiles() const;
    void reset();

private:
    uint64_t value_at_rank(const std::vector<uint64_t>& cumulative, uint64_t rank, uint64_t max_seen) const;

    std::vector<uint64_t> bounds_;
    std::unique_ptr<std::atomic<uint64_t>[]> slots_;
    std::atomic<uint64_t> total_{0};
    std::atomic<uint64_t> max_{0};
};

// Process-wide counters and latency histograms for tools built on the codec.
// The encode/decode path never touches it.
class MetricsCollector {
public:
    static MetricsCollector& instance();

    void increment_counter(const std::string& name, uint64_t delta = 1);
    uint64_t get_counter(const std::string& name) const;

    // One counter per error kind, exported as codec_errors_total{kind="..."}
    void record_error(ErrorCode code);
    uint64_t get_error_count(ErrorCode code) const;

    void record_latency(const std::string& name, uint64_t latency_ns);
    LatencyHistogram::Percentiles get_latency_percentiles(const std::string& name) const;

    std::string get_prometheus_metrics() const;
    std::string get_json_metrics() const;

    void reset();

private:
    MetricsCollector();

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> counters_;
    std::map<std::string, std::unique_ptr<LatencyHistogram>> histograms_;
    std::array<std::atomic<uint64_t>, ERROR_CODE_COUNT> errors_;

    // Per-frame work sits in the tens of nanoseconds to low microseconds.
    const std::vector<uint64_t> frame_buckets_ns_ = {
        50, 100, 250, 500, 1000, 5000, 25000, 100000
    };
};

class LatencyTimer {
public:
    explicit LatencyTimer(std::string metric_name);
    ~LatencyTimer();

    LatencyTimer(const LatencyTimer&) = delete;
    LatencyTimer& operator=(const LatencyTimer&) = delete;

    void cancel() { cancelled_ = true; }

private:
    std::string metric_name_;
    std::chrono::steady_clock::time_point start_;
    bool cancelled_ = false;
};

#define TW_MEASURE_LATENCY(name) ::tw::LatencyTimer tw_latency_timer_(name)

} // namespace tw
