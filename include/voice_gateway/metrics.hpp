#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voice_gateway {

class Metrics {
public:
    static Metrics& instance();

    // Counts a pipeline event, e.g. ("barge_in", "") or ("session_ended", "disconnected").
    void increment(const std::string& event, const std::string& label = "");
    void add_active_sessions(int delta);
    void observe_latency(const std::string& stage, double seconds);

    uint64_t count(const std::string& event, const std::string& label = "") const;
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, uint64_t> counters_;
    std::map<std::string, HistogramSeries> latencies_;
    std::vector<double> histogram_bounds_;
    int64_t active_sessions_ = 0;
};

}
