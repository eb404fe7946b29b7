#include "voice_gateway/vad/segmenter.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "voice_gateway/logging.hpp"

namespace voice_gateway::vad {

namespace {

int64_t to_samples(int rate, int ms) {
    return static_cast<int64_t>(rate) * ms / 1000;
}

}

VadSegmenter::VadSegmenter(std::shared_ptr<SpeechDetector> detector, SegmenterOptions options)
    : detector_(std::move(detector)),
      options_(options) {
    if (!detector_) {
        throw std::invalid_argument("VadSegmenter requires a speech detector");
    }
    sampling_rate_ = detector_->sampling_rate();
    window_samples_ = detector_->window_samples();
    min_speech_samples_ = to_samples(sampling_rate_, options_.min_speech_ms);
    silence_samples_ = to_samples(sampling_rate_, options_.silence_ms);
    min_utterance_samples_ = to_samples(sampling_rate_, options_.min_utterance_ms);
    pad_samples_ = static_cast<size_t>(to_samples(sampling_rate_, options_.speech_pad_ms));
    max_utterance_samples_ = to_samples(sampling_rate_, options_.max_utterance_ms);
    options_.speech_prob_window = std::max(1, options_.speech_prob_window);
}

void VadSegmenter::set_on_speech_start(SpeechStartCallback cb) {
    on_speech_start_ = std::move(cb);
}

void VadSegmenter::set_on_segment(SegmentCallback cb) {
    on_segment_ = std::move(cb);
}

void VadSegmenter::process_samples(const std::vector<int16_t>& samples) {
    pending_.insert(pending_.end(), samples.begin(), samples.end());
    size_t offset = 0;
    while (pending_.size() - offset >= window_samples_) {
        std::vector<int16_t> window(pending_.begin() + static_cast<std::ptrdiff_t>(offset),
                                    pending_.begin() + static_cast<std::ptrdiff_t>(offset + window_samples_));
        offset += window_samples_;
        process_window(window);
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
}

bool VadSegmenter::finalize_now() {
    if (!candidate_ && !in_speech_) {
        return false;
    }
    const int64_t end_sample = current_sample_ - static_cast<int64_t>(trailing_silence_);
    if (end_sample - speech_start_sample_ < min_utterance_samples_) {
        return false;
    }
    return emit(end_sample, trailing_silence_);
}

void VadSegmenter::finalize() {
    if (in_speech_) {
        emit(current_sample_ - static_cast<int64_t>(trailing_silence_), trailing_silence_);
    }
    reset_utterance();
    pending_.clear();
}

double VadSegmenter::current_time_sec() const {
    return static_cast<double>(current_sample_) / static_cast<double>(sampling_rate_);
}

void VadSegmenter::process_window(const std::vector<int16_t>& window) {
    const bool speech = smoothed_probability(window) > options_.threshold;
    current_sample_ += static_cast<int64_t>(window.size());
    if (speech) {
        on_speech_window(window);
    } else {
        on_silence_window(window);
    }
}

float VadSegmenter::smoothed_probability(const std::vector<int16_t>& window) {
    const float prob = detector_->speech_probability(window);
    prob_history_.push_back(prob);
    if (prob_history_.size() > static_cast<size_t>(options_.speech_prob_window)) {
        prob_history_.pop_front();
    }
    if (prob_history_.size() <= 1) {
        return prob;
    }
    // Later windows weigh more so onsets and offsets are not smeared out.
    float weighted_sum = 0.0f;
    float weight_total = 0.0f;
    int weight = 1;
    for (const auto value : prob_history_) {
        weighted_sum += value * static_cast<float>(weight);
        weight_total += static_cast<float>(weight);
        ++weight;
    }
    return weighted_sum / weight_total;
}

void VadSegmenter::on_speech_window(const std::vector<int16_t>& window) {
    if (!candidate_ && !in_speech_) {
        candidate_ = true;
        speech_start_sample_ = current_sample_ - static_cast<int64_t>(window.size());
        speech_samples_ = 0;
        utterance_.assign(preroll_.begin(), preroll_.end());
        preroll_.clear();
    }
    utterance_.insert(utterance_.end(), window.begin(), window.end());
    speech_samples_ += static_cast<int64_t>(window.size());
    trailing_silence_ = 0;

    if (candidate_ && speech_samples_ >= min_speech_samples_) {
        candidate_ = false;
        in_speech_ = true;
        const double start_sec =
            static_cast<double>(speech_start_sample_) / static_cast<double>(sampling_rate_);
        if (on_speech_start_) {
            on_speech_start_(start_sec);
        }
    }
    if (in_speech_ && current_sample_ - speech_start_sample_ >= max_utterance_samples_) {
        logging::debug("Utterance reached maximum length",
                       {kv("max_ms", options_.max_utterance_ms)});
        emit(current_sample_, 0);
    }
}

void VadSegmenter::on_silence_window(const std::vector<int16_t>& window) {
    if (candidate_) {
        // Onset not confirmed: the blip becomes pre-roll for the next attempt.
        candidate_ = false;
        const std::vector<int16_t> discarded = std::move(utterance_);
        utterance_.clear();
        push_preroll(discarded);
        push_preroll(window);
        return;
    }
    if (!in_speech_) {
        push_preroll(window);
        return;
    }
    utterance_.insert(utterance_.end(), window.begin(), window.end());
    trailing_silence_ += window.size();
    if (static_cast<int64_t>(trailing_silence_) >= silence_samples_) {
        emit(current_sample_ - static_cast<int64_t>(trailing_silence_), trailing_silence_);
    }
}

void VadSegmenter::push_preroll(const std::vector<int16_t>& window) {
    preroll_.insert(preroll_.end(), window.begin(), window.end());
    while (preroll_.size() > pad_samples_) {
        preroll_.pop_front();
    }
}

bool VadSegmenter::emit(int64_t end_sample, size_t trailing_silence) {
    const int64_t speech_length = end_sample - speech_start_sample_;
    if (speech_length < min_utterance_samples_) {
        logging::debug("Discarding short utterance",
                       {kv("duration_ms", speech_length * 1000 / sampling_rate_)});
        // Trailing silence stays as pre-roll for the next onset.
        const size_t keep = std::min(trailing_silence, utterance_.size());
        std::vector<int16_t> tail(utterance_.end() - static_cast<std::ptrdiff_t>(keep), utterance_.end());
        reset_utterance();
        push_preroll(tail);
        return false;
    }

    const size_t excess = trailing_silence > pad_samples_ ? trailing_silence - pad_samples_ : 0;
    const size_t trimmed = std::min(excess, utterance_.size());
    SpeechSegment segment;
    segment.samples.assign(utterance_.begin(),
                           utterance_.end() - static_cast<std::ptrdiff_t>(trimmed));
    segment.start_sec = static_cast<double>(speech_start_sample_) / static_cast<double>(sampling_rate_);
    segment.end_sec = static_cast<double>(end_sample) / static_cast<double>(sampling_rate_);

    const size_t keep = std::min(trailing_silence, utterance_.size());
    std::vector<int16_t> tail(utterance_.end() - static_cast<std::ptrdiff_t>(keep), utterance_.end());
    reset_utterance();
    push_preroll(tail);

    if (on_segment_) {
        on_segment_(std::move(segment));
    }
    return true;
}

void VadSegmenter::reset_utterance() {
    utterance_.clear();
    candidate_ = false;
    in_speech_ = false;
    speech_samples_ = 0;
    trailing_silence_ = 0;
}

}
