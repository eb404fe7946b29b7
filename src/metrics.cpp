#include "voice_gateway/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace voice_gateway {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.05, 0.1, 0.2, 0.3, 0.5, 0.75, 1.0, 1.5,
                         2.0, 3.0, 5.0, 10.0, 30.0};
}

void Metrics::increment(const std::string& event, const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_[{event, label}];
}

void Metrics::add_active_sessions(int delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_sessions_ += delta;
    if (active_sessions_ < 0) {
        active_sessions_ = 0;
    }
}

void Metrics::observe_latency(const std::string& stage, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = latencies_[stage];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    series.count += 1;
    series.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            series.buckets[i] += 1;
        }
    }
    series.buckets.back() += 1;
}

uint64_t Metrics::count(const std::string& event, const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find({event, label});
    return it == counters_.end() ? 0 : it->second;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP voice_gateway_active_sessions Call sessions currently running\n";
    out << "# TYPE voice_gateway_active_sessions gauge\n";
    out << "voice_gateway_active_sessions " << active_sessions_ << "\n";

    out << "# HELP voice_gateway_events_total Pipeline events by kind\n";
    out << "# TYPE voice_gateway_events_total counter\n";
    for (const auto& item : counters_) {
        out << "voice_gateway_events_total{event=\"" << item.first.first << "\"";
        if (!item.first.second.empty()) {
            out << ",label=\"" << item.first.second << "\"";
        }
        out << "} " << item.second << "\n";
    }

    out << "# HELP voice_gateway_stage_latency_seconds Latency of pipeline stages\n";
    out << "# TYPE voice_gateway_stage_latency_seconds histogram\n";
    for (const auto& item : latencies_) {
        const auto& stage = item.first;
        const auto& series = item.second;
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "voice_gateway_stage_latency_seconds_bucket{stage=\"" << stage
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "voice_gateway_stage_latency_seconds_bucket{stage=\"" << stage
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "voice_gateway_stage_latency_seconds_count{stage=\"" << stage << "\"} "
            << series.count << "\n";
        out << "voice_gateway_stage_latency_seconds_sum{stage=\"" << stage << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}
