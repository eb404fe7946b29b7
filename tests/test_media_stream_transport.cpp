#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "voice_gateway/audio/codec.hpp"
#include "voice_gateway/transport/media_stream_transport.hpp"

#include <websocketpp/base64/base64.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace voice_gateway;
using testing::FakeTelephony;
using testing::wait_until;

namespace {

struct Wire {
    std::mutex mutex;
    std::vector<nlohmann::json> messages;
    int closes = 0;

    std::vector<nlohmann::json> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return messages;
    }

    size_t count(const std::string& event) {
        size_t n = 0;
        for (const auto& message : snapshot()) {
            if (message.value("event", "") == event) {
                ++n;
            }
        }
        return n;
    }
};

std::string start_event() {
    nlohmann::json message = {
        {"event", "start"},
        {"sequenceNumber", "1"},
        {"start",
         {{"streamSid", "MZ100"},
          {"callSid", "CA200"},
          {"customParameters", {{"From", "+15551230000"}, {"To", "+15559870000"}, {"campaign", "spring"}}}}}};
    return message.dump();
}

std::string media_event(uint64_t chunk, int16_t level) {
    const auto payload = audio::encode_ulaw(std::vector<int16_t>(160, level));
    nlohmann::json message = {
        {"event", "media"},
        {"sequenceNumber", std::to_string(chunk + 1)},
        {"media",
         {{"track", "inbound"},
          {"chunk", std::to_string(chunk)},
          {"timestamp", std::to_string(chunk * 20)},
          {"payload", websocketpp::base64_encode(payload)}}}};
    return message.dump();
}

std::shared_ptr<transport::MediaStreamTransport> make_transport(Wire& wire,
                                                                std::shared_ptr<FakeTelephony> telephony) {
    transport::MediaStreamOptions options;
    return std::make_shared<transport::MediaStreamTransport>(
        "conn-1",
        [&wire](const std::string& text) {
            std::lock_guard<std::mutex> lock(wire.mutex);
            wire.messages.push_back(nlohmann::json::parse(text));
            return true;
        },
        [&wire]() {
            std::lock_guard<std::mutex> lock(wire.mutex);
            ++wire.closes;
        },
        std::move(telephony), options);
}

}

TEST_CASE("start event fills in the call info and fires the start handler") {
    Wire wire;
    auto transport = make_transport(wire, nullptr);
    bool started = false;
    transport->set_on_start([&started]() { started = true; });

    transport->handle_message(R"({"event":"connected","protocol":"Call","version":"1.0.0"})");
    transport->handle_message(start_event());

    REQUIRE(started);
    const auto info = transport->info();
    REQUIRE(info.stream_id == "MZ100");
    REQUIRE(info.call_id == "CA200");
    REQUIRE(info.caller == "+15551230000");
    REQUIRE(info.callee == "+15559870000");
    REQUIRE(info.parameters.at("campaign") == "spring");
    transport->close();
}

TEST_CASE("inbound media is decoded and upsampled") {
    Wire wire;
    auto transport = make_transport(wire, nullptr);
    transport->handle_message(start_event());
    for (uint64_t chunk = 1; chunk <= 3; ++chunk) {
        transport->handle_message(media_event(chunk, 1000));
    }
    transport->handle_message(R"({"event":"stop","stop":{"callSid":"CA200"}})");

    size_t frames = 0;
    while (auto frame = transport->receive()) {
        REQUIRE(frame->sample_rate == 16000);
        REQUIRE_FALSE(frame->samples.empty());
        REQUIRE(frame->samples.back() == 988);
        ++frames;
    }
    REQUIRE(frames == 3);
    transport->close();
}

TEST_CASE("outbound frames are sent as mu-law media messages") {
    Wire wire;
    auto transport = make_transport(wire, nullptr);
    transport->handle_message(start_event());

    audio::AudioFrame frame;
    frame.direction = audio::Direction::Outbound;
    frame.sample_rate = 8000;
    frame.samples.assign(160, 0);
    transport->send(frame);

    REQUIRE(wait_until([&wire]() { return wire.count("media") == 1; }));
    const auto messages = wire.snapshot();
    const auto& media = messages.back();
    REQUIRE(media["streamSid"] == "MZ100");
    const auto payload = websocketpp::base64_decode(media["media"]["payload"].get<std::string>());
    REQUIRE(payload == std::string(160, '\xFF'));
    transport->close();
    REQUIRE(wire.closes == 1);
}

TEST_CASE("clear asks the far end to flush playback") {
    Wire wire;
    auto transport = make_transport(wire, nullptr);
    transport->handle_message(start_event());
    transport->clear();
    REQUIRE(wire.count("clear") == 1);
    REQUIRE(wire.snapshot().back()["streamSid"] == "MZ100");
    transport->close();
}

TEST_CASE("malformed and unknown messages are ignored") {
    Wire wire;
    auto transport = make_transport(wire, nullptr);
    transport->handle_message("{not json");
    transport->handle_message(R"({"event":"dtmf","dtmf":{"digit":"1"}})");
    transport->handle_message(R"({"event":"media","media":{}})");
    REQUIRE(transport->is_open());
    transport->close();
}

TEST_CASE("hangup goes through the telephony client") {
    Wire wire;
    auto telephony = std::make_shared<FakeTelephony>();
    auto transport = make_transport(wire, telephony);
    transport->handle_message(start_event());
    transport->hangup();
    REQUIRE(telephony->hangups == std::vector<std::string>{"CA200"});
    transport->transfer("+15550009999");
    REQUIRE(telephony->transfers.size() == 1);
    REQUIRE(telephony->transfers[0].second == "+15550009999");
    transport->close();
}

TEST_CASE("transfer without a telephony client fails") {
    Wire wire;
    auto transport = make_transport(wire, nullptr);
    transport->handle_message(start_event());
    REQUIRE_THROWS_AS(transport->transfer("+15550009999"), TransportError);
    transport->hangup();
    REQUIRE_FALSE(transport->is_open());
}

TEST_CASE("closing the socket ends the inbound stream") {
    Wire wire;
    auto transport = make_transport(wire, nullptr);
    transport->handle_message(start_event());
    transport->handle_message(media_event(1, 500));
    transport->handle_close();
    REQUIRE(transport->receive().has_value());
    REQUIRE_FALSE(transport->receive().has_value());
    REQUIRE_FALSE(transport->is_open());
    transport->close();
}
