#include "voice_gateway/stt/stt_streamer.hpp"

#include <chrono>
#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/metrics.hpp"
#include "voice_gateway/utils/text.hpp"

namespace voice_gateway::stt {

SpeechToTextStreamer::SpeechToTextStreamer(std::string session_id,
                                           std::unique_ptr<vad::VadSegmenter> segmenter,
                                           std::shared_ptr<Recognizer> recognizer,
                                           SttOptions options)
    : session_id_(std::move(session_id)),
      log_({kv("session_id", session_id_)}),
      segmenter_(std::move(segmenter)),
      recognizer_(std::move(recognizer)),
      audio_(options.audio_queue_frames),
      pending_(options.recognition_queue_segments),
      segments_(options.output_queue_segments) {
    segmenter_->set_on_speech_start([this](double start_sec) {
        log_.debug("Speech started", {kv("at_sec", start_sec)});
        if (on_speech_start_) {
            on_speech_start_(start_sec);
        }
    });
    // Called with segmenter_mutex_ held; the VAD thread hands segments on.
    segmenter_->set_on_segment([this](vad::SpeechSegment segment) {
        finalized_.push_back(std::move(segment));
    });
}

SpeechToTextStreamer::~SpeechToTextStreamer() {
    close();
}

void SpeechToTextStreamer::set_on_speech_start(SpeechStartHandler handler) {
    on_speech_start_ = std::move(handler);
}

void SpeechToTextStreamer::start() {
    if (started_.exchange(true)) {
        return;
    }
    vad_thread_ = std::thread([this]() { vad_loop(); });
    recognition_thread_ = std::thread([this]() { recognition_loop(); });
}

void SpeechToTextStreamer::push_audio(audio::AudioFrame frame) {
    if (audio_.try_push(std::move(frame)) == pipeline::PushResult::DroppedOldest &&
        !overflow_logged_.exchange(true)) {
        log_.warn("STT audio queue overflow, dropping oldest frames");
    }
}

void SpeechToTextStreamer::interrupt() {
    std::lock_guard<std::mutex> lock(segmenter_mutex_);
    if (segmenter_->finalize_now()) {
        log_.info("Utterance finalized on interrupt");
    }
}

void SpeechToTextStreamer::close() {
    if (closed_.exchange(true)) {
        return;
    }
    audio_.close();
    if (vad_thread_.joinable()) {
        vad_thread_.join();
    } else {
        pending_.close();
    }
    if (recognition_thread_.joinable()) {
        recognition_thread_.join();
    }
    segments_.close();
}

void SpeechToTextStreamer::vad_loop() {
    const int rate = segmenter_->sampling_rate();
    const auto idle_poll = std::chrono::milliseconds(20);
    while (true) {
        auto frame = audio_.pop_for(idle_poll);
        if (frame) {
            if (frame->sample_rate != rate) {
                if (!resampler_ || resampler_->from_rate() != frame->sample_rate) {
                    resampler_.emplace(frame->sample_rate, rate);
                }
                frame->samples = resampler_->process(frame->samples);
            }
            std::lock_guard<std::mutex> lock(segmenter_mutex_);
            segmenter_->process_samples(frame->samples);
        } else if (audio_.closed()) {
            break;
        }
        hand_off_segments();
    }
    {
        std::lock_guard<std::mutex> lock(segmenter_mutex_);
        segmenter_->finalize();
    }
    hand_off_segments();
    pending_.close();
}

// Blocks on a full recognition queue, never while holding segmenter_mutex_.
void SpeechToTextStreamer::hand_off_segments() {
    std::vector<vad::SpeechSegment> ready;
    {
        std::lock_guard<std::mutex> lock(segmenter_mutex_);
        ready.swap(finalized_);
    }
    for (auto& segment : ready) {
        if (!pending_.push(std::move(segment))) {
            log_.warn("Speech segment dropped, recognizer closed");
        }
    }
}

void SpeechToTextStreamer::recognition_loop() {
    while (auto segment = pending_.pop()) {
        recognize(std::move(*segment));
    }
}

void SpeechToTextStreamer::recognize(vad::SpeechSegment segment) {
    TranscriptSegment transcript;
    transcript.id = session_id_ + "-" + std::to_string(++next_segment_);
    transcript.start_sec = segment.start_sec;
    transcript.end_sec = segment.end_sec;

    const auto started = std::chrono::steady_clock::now();
    try {
        auto result = recognizer_->transcribe(segment.samples, segmenter_->sampling_rate());
        transcript.text = utils::is_silence_marker(result.text) ? "" : utils::trim(result.text);
        transcript.confidence = result.confidence;
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
        Metrics::instance().observe_latency("transcribe", elapsed.count());
    } catch (const std::exception& ex) {
        transcript.text.clear();
        transcript.confidence = 0.0f;
        transcript.degraded = true;
        Metrics::instance().increment("recognition_error");
        log_.warn("Degraded recognition", {kv("segment_id", transcript.id), kv("error", ex.what())});
    }
    log_.info("Transcript segment",
              {kv("segment_id", transcript.id),
               kv("start_sec", transcript.start_sec),
               kv("end_sec", transcript.end_sec),
               kv("text", transcript.text)});
    if (segments_.try_push(std::move(transcript)) == pipeline::PushResult::DroppedOldest) {
        log_.warn("Transcript queue full, oldest segment dropped");
    }
}

}
