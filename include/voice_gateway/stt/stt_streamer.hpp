#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "voice_gateway/audio/codec.hpp"
#include "voice_gateway/audio/frame.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/pipeline/bounded_queue.hpp"
#include "voice_gateway/stt/recognizer.hpp"
#include "voice_gateway/vad/segmenter.hpp"

namespace voice_gateway {
namespace stt {

struct TranscriptSegment {
    std::string id;
    double start_sec = 0.0;
    double end_sec = 0.0;
    std::string text;
    float confidence = 0.0f;
    // Set when the recognizer failed; text is empty.
    bool degraded = false;
};

struct SttOptions {
    size_t audio_queue_frames = 500;
    size_t recognition_queue_segments = 16;
    size_t output_queue_segments = 16;
};

// Frames go in through push_audio(); finalized segments come out of segments() in
// finalization order. VAD and recognition each run on their own thread so frame
// intake never waits for the recognizer.
class SpeechToTextStreamer {
public:
    using SpeechStartHandler = std::function<void(double start_sec)>;

    SpeechToTextStreamer(std::string session_id,
                         std::unique_ptr<vad::VadSegmenter> segmenter,
                         std::shared_ptr<Recognizer> recognizer,
                         SttOptions options = {});
    ~SpeechToTextStreamer();

    // Runs on the VAD thread.
    void set_on_speech_start(SpeechStartHandler handler);

    void start();
    void push_audio(audio::AudioFrame frame);

    // Barge-in: finalize the buffered utterance now if it is long enough. Never
    // waits on the recognizer; the VAD thread queues the segment.
    void interrupt();

    // Flushes buffered speech, waits for pending recognition and closes segments().
    void close();

    pipeline::BoundedQueue<TranscriptSegment>& segments() { return segments_; }

private:
    void vad_loop();
    void hand_off_segments();
    void recognition_loop();
    void recognize(vad::SpeechSegment segment);

    std::string session_id_;
    logging::Context log_;
    std::unique_ptr<vad::VadSegmenter> segmenter_;
    std::shared_ptr<Recognizer> recognizer_;

    pipeline::BoundedQueue<audio::AudioFrame> audio_;
    pipeline::BoundedQueue<vad::SpeechSegment> pending_;
    pipeline::BoundedQueue<TranscriptSegment> segments_;
    std::optional<audio::Resampler> resampler_;

    std::mutex segmenter_mutex_;
    std::vector<vad::SpeechSegment> finalized_;
    SpeechStartHandler on_speech_start_;
    uint64_t next_segment_ = 0;
    std::atomic<bool> started_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> overflow_logged_{false};
    std::thread vad_thread_;
    std::thread recognition_thread_;
};

}
}
