#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <vector>

#include "voice_gateway/vad/detector.hpp"

namespace voice_gateway {
namespace vad {

struct SpeechSegment {
    std::vector<int16_t> samples;
    // Speech interval on the stream clock; samples also carry the padding around it.
    double start_sec = 0.0;
    double end_sec = 0.0;
};

struct SegmenterOptions {
    float threshold = 0.5f;
    int min_speech_ms = 200;
    int silence_ms = 700;
    int min_utterance_ms = 300;
    int speech_pad_ms = 200;
    int max_utterance_ms = 30000;
    int speech_prob_window = 3;
};

// Turns a PCM stream into speech segments. Buffering starts at speech onset and
// a segment is finalized after silence_ms of non-speech; spans shorter than
// min_utterance_ms are dropped. Callbacks run on the caller's thread.
class VadSegmenter {
public:
    using SpeechStartCallback = std::function<void(double start_sec)>;
    using SegmentCallback = std::function<void(SpeechSegment segment)>;

    VadSegmenter(std::shared_ptr<SpeechDetector> detector, SegmenterOptions options);

    void set_on_speech_start(SpeechStartCallback cb);
    void set_on_segment(SegmentCallback cb);

    void process_samples(const std::vector<int16_t>& samples);

    // Finalizes the buffered span immediately if it is long enough to keep;
    // otherwise buffering continues. Returns true when a segment was emitted.
    bool finalize_now();

    // End of stream: emits whatever speech is buffered.
    void finalize();

    bool in_speech() const { return in_speech_; }
    int sampling_rate() const { return sampling_rate_; }
    double current_time_sec() const;

private:
    void process_window(const std::vector<int16_t>& window);
    float smoothed_probability(const std::vector<int16_t>& window);
    void on_speech_window(const std::vector<int16_t>& window);
    void on_silence_window(const std::vector<int16_t>& window);
    void push_preroll(const std::vector<int16_t>& window);
    bool emit(int64_t end_sample, size_t trailing_silence);
    void reset_utterance();

    std::shared_ptr<SpeechDetector> detector_;
    SegmenterOptions options_;
    int sampling_rate_;
    size_t window_samples_;
    int64_t min_speech_samples_;
    int64_t silence_samples_;
    int64_t min_utterance_samples_;
    size_t pad_samples_;
    int64_t max_utterance_samples_;

    std::vector<int16_t> pending_;
    std::deque<int16_t> preroll_;
    std::deque<float> prob_history_;
    std::vector<int16_t> utterance_;

    int64_t current_sample_ = 0;
    bool candidate_ = false;
    bool in_speech_ = false;
    int64_t speech_start_sample_ = 0;
    int64_t speech_samples_ = 0;
    size_t trailing_silence_ = 0;

    SpeechStartCallback on_speech_start_;
    SegmentCallback on_segment_;
};

}
}
