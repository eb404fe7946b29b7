#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "voice_gateway/audio/wav.hpp"
#include "voice_gateway/tts/tts_streamer.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

using namespace voice_gateway;
using namespace voice_gateway::tts;
using testing::FakeSynthesizer;
using testing::FakeTransport;
using testing::wait_until;

namespace {

struct Events {
    std::mutex mutex;
    std::vector<std::pair<uint64_t, UtteranceEvent>> items;

    void attach(TextToSpeechStreamer& streamer) {
        streamer.set_on_event([this](uint64_t id, UtteranceEvent event) {
            std::lock_guard<std::mutex> lock(mutex);
            items.emplace_back(id, event);
        });
    }

    bool has(uint64_t id, UtteranceEvent event) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& item : items) {
            if (item.first == id && item.second == event) {
                return true;
            }
        }
        return false;
    }

    std::vector<std::pair<uint64_t, UtteranceEvent>> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return items;
    }
};

TtsOptions unpaced() {
    TtsOptions options;
    options.realtime_pacing = false;
    return options;
}

}

TEST_CASE("an utterance is sent as whole frames at the transport rate") {
    auto transport = std::make_shared<FakeTransport>();
    auto synthesizer = std::make_shared<FakeSynthesizer>(8000, 80);
    TextToSpeechStreamer streamer("s1", synthesizer, transport, unpaced());
    Events events;
    events.attach(streamer);
    streamer.start();

    const auto id = streamer.speak("Hello there.");
    REQUIRE(id != 0);
    REQUIRE(wait_until([&]() { return events.has(id, UtteranceEvent::Finished); }));
    REQUIRE(events.snapshot().front() == std::make_pair(id, UtteranceEvent::Started));

    const auto frames = transport->sent();
    REQUIRE(frames.size() == 6);
    for (size_t i = 0; i < frames.size(); ++i) {
        REQUIRE(frames[i].samples.size() == 160);
        REQUIRE(frames[i].sample_rate == 8000);
        REQUIRE(frames[i].direction == audio::Direction::Outbound);
        if (i > 0) {
            REQUIRE(frames[i].sequence == frames[i - 1].sequence + 1);
        }
    }
    REQUIRE_FALSE(streamer.speaking());
}

TEST_CASE("the last partial frame is padded with silence") {
    auto transport = std::make_shared<FakeTransport>();
    TextToSpeechStreamer streamer("s1", std::make_shared<FakeSynthesizer>(8000, 80), transport, unpaced());
    Events events;
    events.attach(streamer);
    streamer.start();

    const auto id = streamer.speak("Hi.");
    REQUIRE(wait_until([&]() { return events.has(id, UtteranceEvent::Finished); }));
    const auto frames = transport->sent();
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[1].samples.size() == 160);
    REQUIRE(frames[1].samples[79] == 1000);
    REQUIRE(frames[1].samples[80] == 0);
}

TEST_CASE("synthesizer audio is resampled to the transport rate") {
    auto transport = std::make_shared<FakeTransport>();
    TextToSpeechStreamer streamer("s1", std::make_shared<FakeSynthesizer>(16000, 160), transport, unpaced());
    Events events;
    events.attach(streamer);
    streamer.start();

    const auto id = streamer.speak("Hello there.");
    REQUIRE(wait_until([&]() { return events.has(id, UtteranceEvent::Finished); }));
    const auto frames = transport->sent();
    REQUIRE(frames.size() >= 5);
    REQUIRE(frames.size() <= 7);
    for (const auto& frame : frames) {
        REQUIRE(frame.sample_rate == 8000);
        REQUIRE(frame.samples.size() == 160);
    }
}

TEST_CASE("markdown is not read aloud") {
    auto transport = std::make_shared<FakeTransport>();
    auto synthesizer = std::make_shared<FakeSynthesizer>();
    TextToSpeechStreamer streamer("s1", synthesizer, transport, unpaced());
    Events events;
    events.attach(streamer);
    streamer.start();

    const auto id = streamer.speak("**Sure!** Here you go.");
    REQUIRE(wait_until([&]() { return events.has(id, UtteranceEvent::Finished); }));
    REQUIRE(synthesizer->texts() == std::vector<std::string>{"Sure! Here you go."});
}

TEST_CASE("utterances play in the order they were queued") {
    auto transport = std::make_shared<FakeTransport>();
    TextToSpeechStreamer streamer("s1", std::make_shared<FakeSynthesizer>(), transport, unpaced());
    Events events;
    events.attach(streamer);
    streamer.start();

    const auto first = streamer.speak("First sentence here.");
    const auto second = streamer.speak("Second sentence here.");
    REQUIRE(second == first + 1);
    REQUIRE(wait_until([&]() { return events.has(second, UtteranceEvent::Finished); }));
    const auto items = events.snapshot();
    REQUIRE(items.size() == 4);
    REQUIRE(items[0] == std::make_pair(first, UtteranceEvent::Started));
    REQUIRE(items[1] == std::make_pair(first, UtteranceEvent::Finished));
    REQUIRE(items[2] == std::make_pair(second, UtteranceEvent::Started));
    REQUIRE(items[3] == std::make_pair(second, UtteranceEvent::Finished));
}

TEST_CASE("realtime pacing holds the utterance open until it has played") {
    auto transport = std::make_shared<FakeTransport>();
    TtsOptions options;
    options.pacing_lead = std::chrono::milliseconds(100);
    // 25 characters at 80 samples each: 2000 samples, 250 ms at 8 kHz.
    TextToSpeechStreamer streamer("s1", std::make_shared<FakeSynthesizer>(8000, 80), transport, options);
    Events events;
    events.attach(streamer);
    streamer.start();

    const auto started = std::chrono::steady_clock::now();
    const auto id = streamer.speak("Twenty five characters...");
    REQUIRE(wait_until([&]() { return events.has(id, UtteranceEvent::Finished); }));
    REQUIRE(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(230));
    REQUIRE(transport->sent_frames() == 13);
}

TEST_CASE("cancel stops the current utterance and drops queued ones") {
    auto transport = std::make_shared<FakeTransport>();
    TtsOptions options;
    options.pacing_lead = std::chrono::milliseconds(0);
    TextToSpeechStreamer streamer("s1", std::make_shared<FakeSynthesizer>(8000, 80), transport, options);
    Events events;
    events.attach(streamer);
    streamer.start();

    const auto long_one = streamer.speak(std::string(200, 'a') + ".");
    const auto queued = streamer.speak("Never heard.");
    REQUIRE(wait_until([&]() { return events.has(long_one, UtteranceEvent::Started); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    streamer.cancel();
    const auto sent_at_cancel = transport->sent_frames();
    REQUIRE(transport->clears_ == 1);

    REQUIRE(wait_until([&]() { return events.has(queued, UtteranceEvent::Cancelled); }));
    REQUIRE(events.has(long_one, UtteranceEvent::Cancelled));
    REQUIRE_FALSE(events.has(long_one, UtteranceEvent::Finished));
    REQUIRE_FALSE(events.has(queued, UtteranceEvent::Started));
    REQUIRE(transport->sent_frames() == sent_at_cancel);
    REQUIRE(sent_at_cancel < 100);

    const auto after = streamer.speak("Back again.");
    REQUIRE(wait_until([&]() { return events.has(after, UtteranceEvent::Finished); }));
}

TEST_CASE("a synthesis failure plays the fallback clip") {
    const auto path = std::filesystem::temp_directory_path() / "voice_gateway_fallback_test.wav";
    {
        std::ofstream out(path, std::ios::binary);
        out << audio::encode_wav(std::vector<int16_t>(480, 500), 8000);
    }
    auto transport = std::make_shared<FakeTransport>();
    auto synthesizer = std::make_shared<FakeSynthesizer>();
    synthesizer->fail = true;
    auto options = unpaced();
    options.fallback_audio = path;
    TextToSpeechStreamer streamer("s1", synthesizer, transport, options);
    Events events;
    events.attach(streamer);
    streamer.start();

    const auto id = streamer.speak("This will fail.");
    REQUIRE(wait_until([&]() { return events.has(id, UtteranceEvent::Finished); }));
    const auto frames = transport->sent();
    REQUIRE(frames.size() == 3);
    REQUIRE(frames[0].samples.front() == 500);
    std::filesystem::remove(path);
}

TEST_CASE("a synthesis failure without fallback still finishes the utterance") {
    auto transport = std::make_shared<FakeTransport>();
    auto synthesizer = std::make_shared<FakeSynthesizer>();
    synthesizer->fail = true;
    TextToSpeechStreamer streamer("s1", synthesizer, transport, unpaced());
    Events events;
    events.attach(streamer);
    streamer.start();

    const auto id = streamer.speak("This will fail.");
    REQUIRE(wait_until([&]() { return events.has(id, UtteranceEvent::Finished); }));
    REQUIRE(transport->sent_frames() == 0);
    REQUIRE_FALSE(events.has(id, UtteranceEvent::Started));
}

TEST_CASE("nothing is spoken for blank text or after close") {
    auto transport = std::make_shared<FakeTransport>();
    TextToSpeechStreamer streamer("s1", std::make_shared<FakeSynthesizer>(), transport, unpaced());
    streamer.start();
    REQUIRE(streamer.speak("   ") == 0);
    streamer.close();
    REQUIRE(streamer.speak("Hello.") == 0);
}
