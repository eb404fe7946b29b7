#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "voice_gateway/stt/stt_streamer.hpp"
#include "voice_gateway/vad/energy_detector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace voice_gateway;
using testing::FakeRecognizer;
using testing::silence;
using testing::sine;
using testing::wait_until;

namespace {

std::unique_ptr<vad::VadSegmenter> energy_segmenter() {
    return std::make_unique<vad::VadSegmenter>(std::make_shared<vad::EnergyDetector>(500.0, 16000, 20),
                                               vad::SegmenterOptions{});
}

void push(stt::SpeechToTextStreamer& streamer, const std::vector<int16_t>& samples, int rate) {
    const size_t chunk = static_cast<size_t>(rate) / 50;
    for (size_t offset = 0; offset < samples.size(); offset += chunk) {
        audio::AudioFrame frame;
        frame.sample_rate = rate;
        const auto end = std::min(samples.size(), offset + chunk);
        frame.samples.assign(samples.begin() + static_cast<long>(offset),
                             samples.begin() + static_cast<long>(end));
        streamer.push_audio(std::move(frame));
    }
}

std::vector<stt::TranscriptSegment> drain(stt::SpeechToTextStreamer& streamer) {
    std::vector<stt::TranscriptSegment> out;
    while (auto segment = streamer.segments().pop()) {
        out.push_back(std::move(*segment));
    }
    return out;
}

}

TEST_CASE("utterances come out as ordered transcript segments") {
    auto recognizer = std::make_shared<FakeRecognizer>(std::vector<std::string>{"I need a meeting", "tomorrow works"});
    stt::SpeechToTextStreamer streamer("s1", energy_segmenter(), recognizer);
    streamer.start();
    push(streamer, silence(16000, 200), 16000);
    push(streamer, sine(16000, 1000, 8000.0), 16000);
    push(streamer, silence(16000, 800), 16000);
    push(streamer, sine(16000, 700, 8000.0), 16000);
    push(streamer, silence(16000, 800), 16000);
    streamer.close();

    const auto segments = drain(streamer);
    REQUIRE(segments.size() == 2);
    REQUIRE(segments[0].id == "s1-1");
    REQUIRE(segments[0].text == "I need a meeting");
    REQUIRE(segments[1].id == "s1-2");
    REQUIRE(segments[1].text == "tomorrow works");
    REQUIRE(segments[0].end_sec < segments[1].start_sec);
    REQUIRE_FALSE(segments[0].degraded);
}

TEST_CASE("a recognizer failure yields a degraded empty segment") {
    auto recognizer = std::make_shared<FakeRecognizer>();
    recognizer->fail = true;
    stt::SpeechToTextStreamer streamer("s2", energy_segmenter(), recognizer);
    streamer.start();
    push(streamer, sine(16000, 800, 8000.0), 16000);
    push(streamer, silence(16000, 800), 16000);
    streamer.close();

    const auto segments = drain(streamer);
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].degraded);
    REQUIRE(segments[0].text.empty());
}

TEST_CASE("silence annotations from the recognizer become empty text") {
    auto recognizer = std::make_shared<FakeRecognizer>(std::vector<std::string>{" [BLANK_AUDIO] "});
    stt::SpeechToTextStreamer streamer("s3", energy_segmenter(), recognizer);
    streamer.start();
    push(streamer, sine(16000, 800, 8000.0), 16000);
    streamer.close();

    const auto segments = drain(streamer);
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].text.empty());
    REQUIRE_FALSE(segments[0].degraded);
}

TEST_CASE("telephone-rate audio is resampled for the segmenter") {
    auto recognizer = std::make_shared<FakeRecognizer>();
    stt::SpeechToTextStreamer streamer("s4", energy_segmenter(), recognizer);
    streamer.start();
    push(streamer, sine(8000, 1000, 8000.0), 8000);
    push(streamer, silence(8000, 800), 8000);
    streamer.close();

    REQUIRE(drain(streamer).size() == 1);
    const auto durations = recognizer->durations();
    REQUIRE(durations.size() == 1);
    REQUIRE(durations[0] > 0.9);
    REQUIRE(durations[0] < 1.5);
}

TEST_CASE("interrupt finalizes the buffered utterance") {
    auto recognizer = std::make_shared<FakeRecognizer>(std::vector<std::string>{"wait"});
    stt::SpeechToTextStreamer streamer("s5", energy_segmenter(), recognizer);
    std::atomic<int> starts{0};
    streamer.set_on_speech_start([&starts](double) { ++starts; });
    streamer.start();
    push(streamer, sine(16000, 800, 8000.0), 16000);

    REQUIRE(wait_until([&starts]() { return starts.load() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    streamer.interrupt();
    REQUIRE(wait_until([&recognizer]() { return recognizer->calls() == 1; }));
    streamer.close();

    const auto segments = drain(streamer);
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0].text == "wait");
}

namespace {

// Holds every transcription until released.
class GatedRecognizer : public stt::Recognizer {
public:
    stt::RecognitionResult transcribe(const std::vector<int16_t>&, int) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++calls_;
        open_cv_.wait(lock, [this]() { return open_; });
        stt::RecognitionResult result;
        result.text = "part " + std::to_string(calls_);
        result.confidence = 0.9f;
        return result;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        open_cv_.notify_all();
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable open_cv_;
    bool open_ = false;
    int calls_ = 0;
};

}

TEST_CASE("interrupt does not wait for a backed-up recognizer") {
    auto recognizer = std::make_shared<GatedRecognizer>();
    stt::SttOptions options;
    options.recognition_queue_segments = 1;
    stt::SpeechToTextStreamer streamer("s6", energy_segmenter(), recognizer, options);
    streamer.start();
    for (int i = 0; i < 3; ++i) {
        push(streamer, sine(16000, 400, 8000.0), 16000);
        push(streamer, silence(16000, 800), 16000);
    }

    REQUIRE(wait_until([&recognizer]() { return recognizer->calls() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    std::atomic<bool> returned{false};
    std::thread barge_in([&]() {
        streamer.interrupt();
        returned = true;
    });
    const bool prompt = wait_until([&returned]() { return returned.load(); }, std::chrono::milliseconds(500));
    recognizer->release();
    barge_in.join();
    REQUIRE(prompt);

    streamer.close();
    const auto segments = drain(streamer);
    REQUIRE(segments.size() == 3);
    REQUIRE(segments[0].text == "part 1");
    REQUIRE(segments[2].text == "part 3");
}
