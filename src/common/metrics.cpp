#include "metrics.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

namespace tw {

namespace {

nlohmann::json percentiles_to_json(const LatencyHistogram::Percentiles& p) {
    return {
        {"p50", p.p50},
        {"p95", p.p95},
        {"p99", p.p99},
        {"p999", p.p999},
        {"max", p.max},
        {"count", p.count}
    };
}

void write_summary(std::ostream& out, const std::string& name, const LatencyHistogram::Percentiles& p) {
    out << "# TYPE " << name << " summary\n";
    const std::pair<const char*, uint64_t> quantiles[] = {
        {"0.5", p.p50}, {"0.95", p.p95}, {"0.99", p.p99}, {"0.999", p.p999}
    };
    for (const auto& [label, value] : quantiles) {
        out << name << "{quantile=\"" << label << "\"} " << value << "\n";
    }
    out << name << "_max " << p.max << "\n";
    out << name << "_count " << p.count << "\n";
}

} // namespace

LatencyHistogram::LatencyHistogram(std::vector<uint64_t> bounds_ns)
    : bounds_(std::move(bounds_ns)) {
    std::sort(bounds_.begin(), bounds_.end());
    slots_ = std::make_unique<std::atomic<uint64_t>[]>(bounds_.size() + 1);
    reset();
}

void LatencyHistogram::record(uint64_t latency_ns) {
    const auto slot = std::lower_bound(bounds_.begin(), bounds_.end(), latency_ns) - bounds_.begin();
    slots_[static_cast<size_t>(slot)].fetch_add(1, std::memory_order_relaxed);
    total_.fetch_add(1, std::memory_order_relaxed);

    uint64_t seen = max_.load(std::memory_order_relaxed);
    while (latency_ns > seen && !max_.compare_exchange_weak(seen, latency_ns, std::memory_order_relaxed)) {
    }
}

uint64_t LatencyHistogram::value_at_rank(const std::vector<uint64_t>& cumulative, uint64_t rank,
                                         uint64_t max_seen) const {
    const auto it = std::lower_bound(cumulative.begin(), cumulative.end(), rank);
    const auto slot = static_cast<size_t>(it - cumulative.begin());
    if (slot >= bounds_.size()) {
        return max_seen;
    }
    return std::min(bounds_[slot], max_seen);
}

LatencyHistogram::Percentiles LatencyHistogram::get_percentiles() const {
    Percentiles out;
    out.count = total_.load(std::memory_order_relaxed);
    if (out.count == 0) {
        return out;
    }
    out.max = max_.load(std::memory_order_relaxed);

    std::vector<uint64_t> cumulative(bounds_.size() + 1);
    uint64_t running = 0;
    for (size_t i = 0; i < cumulative.size(); ++i) {
        running += slots_[i].load(std::memory_order_relaxed);
        cumulative[i] = running;
    }

    // Rank of the p-th percentile sample, at least the first one
    auto rank = [&](uint64_t per_mille) {
        return std::max<uint64_t>(out.count * per_mille / 1000, 1);
    };
    out.p50 = value_at_rank(cumulative, rank(500), out.max);
    out.p95 = value_at_rank(cumulative, rank(950), out.max);
    out.p99 = value_at_rank(cumulative, rank(990), out.max);
    out.p999 = value_at_rank(cumulative, rank(999), out.max);
    return out;
}

void LatencyHistogram::reset() {
    for (size_t i = 0; i <= bounds_.size(); ++i) {
        slots_[i].store(0, std::memory_order_relaxed);
    }
    total_.store(0, std::memory_order_relaxed);
    max_.store(0, std::memory_order_relaxed);
}

MetricsCollector::MetricsCollector() {
    for (auto& count : errors_) {
        count.store(0);
    }
}

MetricsCollector& MetricsCollector::instance() {
    static MetricsCollector instance;
    return instance;
}

void MetricsCollector::increment_counter(const std::string& name, uint64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[name] += delta;
}

uint64_t MetricsCollector::get_counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

void MetricsCollector::record_error(ErrorCode code) {
    const auto idx = static_cast<size_t>(code);
    if (idx < errors_.size()) {
        errors_[idx].fetch_add(1, std::memory_order_relaxed);
    }
}

uint64_t MetricsCollector::get_error_count(ErrorCode code) const {
    const auto idx = static_cast<size_t>(code);
    return idx < errors_.size() ? errors_[idx].load(std::memory_order_relaxed) : 0;
}

void MetricsCollector::record_latency(const std::string& name, uint64_t latency_ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histograms_[name];
    if (!histogram) {
        histogram = std::make_unique<LatencyHistogram>(frame_buckets_ns_);
    }
    histogram->record(latency_ns);
}

LatencyHistogram::Percentiles MetricsCollector::get_latency_percentiles(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(name);
    return it == histograms_.end() ? LatencyHistogram::Percentiles{} : it->second->get_percentiles();
}

std::string MetricsCollector::get_json_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json out;
    out["counters"] = counters_;

    auto& errors = out["errors"] = nlohmann::json::object();
    for (size_t i = 1; i < errors_.size(); ++i) {
        const uint64_t count = errors_[i].load(std::memory_order_relaxed);
        if (count != 0) {
            errors[error_name(static_cast<ErrorCode>(i))] = count;
        }
    }

    auto& histograms = out["histograms"] = nlohmann::json::object();
    for (const auto& [name, histogram] : histograms_) {
        histograms[name] = percentiles_to_json(histogram->get_percentiles());
    }

    return out.dump();
}

std::string MetricsCollector::get_prometheus_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream out;
    for (const auto& [name, value] : counters_) {
        out << "# TYPE " << name << " counter\n" << name << " " << value << "\n";
    }

    out << "# TYPE codec_errors_total counter\n";
    for (size_t i = 1; i < errors_.size(); ++i) {
        out << "codec_errors_total{kind=\"" << error_name(static_cast<ErrorCode>(i)) << "\"} "
            << errors_[i].load(std::memory_order_relaxed) << "\n";
    }

    for (const auto& [name, histogram] : histograms_) {
        write_summary(out, name, histogram->get_percentiles());
    }
    return out.str();
}

void MetricsCollector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    histograms_.clear();
    for (auto& count : errors_) {
        count.store(0, std::memory_order_relaxed);
    }
}

LatencyTimer::LatencyTimer(std::string metric_name)
    : metric_name_(std::move(metric_name)), start_(std::chrono::steady_clock::now()) {
}

LatencyTimer::~LatencyTimer() {
    if (cancelled_) {
        return;
    }
    const auto elapsed = std::chrono::steady_clock::now() - start_;
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
    MetricsCollector::instance().record_latency(metric_name_, static_cast<uint64_t>(ns));
}

} // namespace tw
