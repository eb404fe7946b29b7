#include "voice_gateway/tts/tts_streamer.hpp"

#include <utility>

#include "voice_gateway/audio/codec.hpp"
#include "voice_gateway/audio/wav.hpp"
#include "voice_gateway/metrics.hpp"
#include "voice_gateway/utils/text.hpp"

namespace voice_gateway::tts {

const char* to_string(UtteranceEvent event) {
    switch (event) {
        case UtteranceEvent::Started: return "started";
        case UtteranceEvent::Finished: return "finished";
        case UtteranceEvent::Cancelled: return "cancelled";
    }
    return "unknown";
}

// Cuts one utterance's PCM into frames and sends them at real time plus the lead.
class TextToSpeechStreamer::Playback {
public:
    Playback(TextToSpeechStreamer& owner, const Request& request)
        : owner_(owner), request_(request) {}

    bool feed(const std::vector<int16_t>& samples) {
        buffer_.insert(buffer_.end(), samples.begin(), samples.end());
        size_t offset = 0;
        while (buffer_.size() - offset >= owner_.frame_samples_) {
            std::vector<int16_t> frame(buffer_.begin() + offset,
                                       buffer_.begin() + offset + owner_.frame_samples_);
            offset += owner_.frame_samples_;
            if (!send(std::move(frame))) {
                buffer_.clear();
                return false;
            }
        }
        buffer_.erase(buffer_.begin(), buffer_.begin() + offset);
        return true;
    }

    // Pads and sends the trailing partial frame.
    bool flush() {
        if (buffer_.empty()) {
            return !owner_.stale(request_.generation);
        }
        buffer_.resize(owner_.frame_samples_, 0);
        std::vector<int16_t> frame;
        frame.swap(buffer_);
        return send(std::move(frame));
    }

    // Waits until the far end has had time to play everything sent.
    bool wait_played_out() {
        if (!owner_.options_.realtime_pacing || frames_ == 0) {
            return !owner_.stale(request_.generation);
        }
        return wait_until(start_ + frame_duration() * static_cast<int64_t>(frames_));
    }

    uint64_t frames() const { return frames_; }

private:
    std::chrono::steady_clock::duration frame_duration() const {
        return std::chrono::milliseconds(owner_.options_.frame_ms);
    }

    bool wait_until(std::chrono::steady_clock::time_point target) {
        std::unique_lock<std::mutex> lock(owner_.pacing_mutex_);
        const auto generation = request_.generation;
        owner_.pacing_cv_.wait_until(lock, target, [this, generation]() {
            return owner_.stale(generation);
        });
        return !owner_.stale(generation);
    }

    bool send(std::vector<int16_t> samples) {
        if (owner_.options_.realtime_pacing && frames_ > 0) {
            const auto target = start_ + frame_duration() * static_cast<int64_t>(frames_) -
                                owner_.options_.pacing_lead;
            if (!wait_until(target)) {
                return false;
            }
        }
        audio::AudioFrame frame;
        frame.sequence = owner_.next_sequence_++;
        frame.direction = audio::Direction::Outbound;
        frame.sample_rate = owner_.output_rate_;
        frame.samples = std::move(samples);
        {
            std::lock_guard<std::mutex> lock(owner_.pacing_mutex_);
            if (owner_.stale(request_.generation)) {
                return false;
            }
            owner_.transport_->send(std::move(frame));
        }
        if (frames_ == 0) {
            start_ = std::chrono::steady_clock::now();
            const std::chrono::duration<double> first_audio = start_ - request_.queued_at;
            Metrics::instance().observe_latency("time_to_first_audio", first_audio.count());
            owner_.emit(request_.id, UtteranceEvent::Started);
        }
        ++frames_;
        return true;
    }

    TextToSpeechStreamer& owner_;
    const Request& request_;
    std::vector<int16_t> buffer_;
    std::chrono::steady_clock::time_point start_;
    uint64_t frames_ = 0;
};

TextToSpeechStreamer::TextToSpeechStreamer(std::string session_id,
                                           std::shared_ptr<Synthesizer> synthesizer,
                                           std::shared_ptr<transport::MediaTransport> transport,
                                           TtsOptions options)
    : session_id_(std::move(session_id)),
      log_({kv("session_id", session_id_)}),
      synthesizer_(std::move(synthesizer)),
      transport_(std::move(transport)),
      options_(std::move(options)),
      output_rate_(transport_->outbound_sample_rate()),
      frame_samples_(audio::samples_per_frame(output_rate_, options_.frame_ms)),
      requests_(options_.request_queue_capacity) {
    if (options_.fallback_audio) {
        try {
            auto wav = audio::read_wav(*options_.fallback_audio);
            if (wav.sample_rate != output_rate_) {
                audio::Resampler resampler(wav.sample_rate, output_rate_);
                fallback_ = resampler.process(wav.samples);
            } else {
                fallback_ = std::move(wav.samples);
            }
        } catch (const std::exception& ex) {
            log_.warn("Fallback audio unavailable",
                      {kv("path", options_.fallback_audio->string()), kv("error", ex.what())});
        }
    }
}

TextToSpeechStreamer::~TextToSpeechStreamer() {
    close();
}

void TextToSpeechStreamer::set_on_event(EventHandler handler) {
    on_event_ = std::move(handler);
}

void TextToSpeechStreamer::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread([this]() { worker_loop(); });
}

uint64_t TextToSpeechStreamer::speak(const std::string& text) {
    if (closed_.load() || utils::trim(text).empty()) {
        return 0;
    }
    Request request;
    const uint64_t id = ++next_id_;
    request.id = id;
    request.generation = generation_.load();
    request.text = text;
    request.queued_at = std::chrono::steady_clock::now();
    ++outstanding_;
    const auto result = requests_.try_push(std::move(request));
    if (result == pipeline::PushResult::Closed) {
        --outstanding_;
        return 0;
    }
    if (result == pipeline::PushResult::DroppedOldest) {
        --outstanding_;
        log_.warn("TTS request queue full, oldest utterance dropped");
    }
    return id;
}

void TextToSpeechStreamer::cancel() {
    {
        std::lock_guard<std::mutex> lock(pacing_mutex_);
        ++generation_;
    }
    pacing_cv_.notify_all();
    transport_->clear();
    log_.debug("TTS cancelled");
}

void TextToSpeechStreamer::close() {
    if (closed_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(pacing_mutex_);
        ++generation_;
    }
    pacing_cv_.notify_all();
    requests_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TextToSpeechStreamer::worker_loop() {
    while (auto request = requests_.pop()) {
        try {
            play(*request);
        } catch (const std::exception& ex) {
            log_.error("TTS playback failed", {kv("utterance", request->id), kv("error", ex.what())});
            emit(request->id, UtteranceEvent::Finished);
        }
        --outstanding_;
    }
}

void TextToSpeechStreamer::play(const Request& request) {
    if (stale(request.generation)) {
        emit(request.id, UtteranceEvent::Cancelled);
        return;
    }
    const auto text = utils::strip_markdown(utils::remove_emojis(request.text));
    const auto sentences = utils::split_sentences(text);

    Playback playback(*this, request);
    std::optional<audio::Resampler> resampler;
    if (synthesizer_->sample_rate() != output_rate_) {
        resampler.emplace(synthesizer_->sample_rate(), output_rate_);
    }
    const auto handler = [&](const std::vector<int16_t>& chunk) {
        if (resampler) {
            return playback.feed(resampler->process(chunk));
        }
        return playback.feed(chunk);
    };

    bool failed = false;
    for (const auto& sentence : sentences) {
        if (stale(request.generation)) {
            break;
        }
        try {
            if (!synthesizer_->synthesize(sentence, handler)) {
                break;
            }
        } catch (const std::exception& ex) {
            failed = true;
            Metrics::instance().increment("synthesis_error");
            log_.warn("Synthesis failed", {kv("utterance", request.id), kv("error", ex.what())});
            break;
        }
    }
    if (failed && !fallback_.empty() && !stale(request.generation)) {
        log_.info("Playing fallback audio", {kv("utterance", request.id)});
        playback.feed(fallback_);
    }

    const bool completed = playback.flush() && playback.wait_played_out();
    log_.debug("Utterance done",
               {kv("utterance", request.id), kv("frames", playback.frames()), kv("completed", completed)});
    emit(request.id, completed ? UtteranceEvent::Finished : UtteranceEvent::Cancelled);
}

bool TextToSpeechStreamer::stale(uint64_t generation) const {
    return closed_.load() || generation != generation_.load();
}

void TextToSpeechStreamer::emit(uint64_t id, UtteranceEvent event) {
    if (closed_.load() || !on_event_) {
        return;
    }
    on_event_(id, event);
}

}
