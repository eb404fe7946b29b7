#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "voice_gateway/audio/frame.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/pipeline/bounded_queue.hpp"
#include "voice_gateway/transport/media_transport.hpp"
#include "voice_gateway/tts/synthesizer.hpp"

namespace voice_gateway {
namespace tts {

enum class UtteranceEvent {
    Started,
    Finished,
    Cancelled
};

const char* to_string(UtteranceEvent event);

struct TtsOptions {
    int frame_ms = 20;
    bool realtime_pacing = true;
    // How far ahead of real time frames may be sent.
    std::chrono::milliseconds pacing_lead{200};
    std::optional<std::filesystem::path> fallback_audio;
    size_t request_queue_capacity = 16;
};

// Turns text into paced outbound frames on a worker thread. Utterances play in
// the order speak() was called. cancel() stops the current utterance and drops
// the queued ones; no frame of a cancelled utterance is sent after it returns.
class TextToSpeechStreamer {
public:
    using EventHandler = std::function<void(uint64_t utterance_id, UtteranceEvent event)>;

    TextToSpeechStreamer(std::string session_id,
                         std::shared_ptr<Synthesizer> synthesizer,
                         std::shared_ptr<transport::MediaTransport> transport,
                         TtsOptions options = {});
    ~TextToSpeechStreamer();

    // Runs on the synthesis thread.
    void set_on_event(EventHandler handler);

    void start();

    // Returns the utterance id, or 0 when nothing would be spoken.
    uint64_t speak(const std::string& text);

    void cancel();
    void close();

    bool speaking() const { return outstanding_.load() > 0; }

private:
    struct Request {
        uint64_t id = 0;
        uint64_t generation = 0;
        std::string text;
        std::chrono::steady_clock::time_point queued_at;
    };

    class Playback;

    void worker_loop();
    void play(const Request& request);
    bool stale(uint64_t generation) const;
    void emit(uint64_t id, UtteranceEvent event);

    std::string session_id_;
    logging::Context log_;
    std::shared_ptr<Synthesizer> synthesizer_;
    std::shared_ptr<transport::MediaTransport> transport_;
    TtsOptions options_;
    int output_rate_;
    size_t frame_samples_;
    std::vector<int16_t> fallback_;

    pipeline::BoundedQueue<Request> requests_;
    std::atomic<uint64_t> generation_{0};
    std::atomic<uint64_t> next_id_{0};
    std::atomic<int> outstanding_{0};
    std::atomic<bool> closed_{false};
    uint64_t next_sequence_ = 0;

    mutable std::mutex pacing_mutex_;
    std::condition_variable pacing_cv_;

    EventHandler on_event_;
    std::thread worker_;
};

}
}
