#include <catch2/catch_test_macros.hpp>

#include "voice_gateway/transport/jitter_buffer.hpp"

#include <cstdint>
#include <vector>

using voice_gateway::audio::AudioFrame;
using voice_gateway::transport::JitterBuffer;

namespace {

AudioFrame frame(uint64_t sequence) {
    AudioFrame result;
    result.sequence = sequence;
    result.sample_rate = 8000;
    result.samples.assign(160, static_cast<int16_t>(sequence * 10));
    return result;
}

void append(std::vector<AudioFrame>& out, std::vector<AudioFrame> ready) {
    for (auto& item : ready) {
        out.push_back(std::move(item));
    }
}

}

TEST_CASE("in-order frames pass straight through") {
    JitterBuffer buffer(2, 50, 160, 8000);
    REQUIRE(buffer.push(frame(1)).size() == 1);
    REQUIRE(buffer.push(frame(2)).size() == 1);
}

TEST_CASE("a lost frame is replaced by silence once the buffer is deep enough") {
    JitterBuffer buffer(2, 50, 160, 8000);
    std::vector<AudioFrame> out;
    for (uint64_t sequence : {1, 2, 4, 5, 6}) {
        append(out, buffer.push(frame(sequence)));
    }
    REQUIRE(out.size() == 6);
    for (size_t i = 0; i < out.size(); ++i) {
        REQUIRE(out[i].sequence == i + 1);
    }
    REQUIRE(out[2].samples == std::vector<int16_t>(160, 0));
    REQUIRE(out[3].samples.front() == 40);
    REQUIRE(buffer.filled_frames() == 1);
}

TEST_CASE("a reordered frame is released in sequence") {
    JitterBuffer buffer(3, 50, 160, 8000);
    std::vector<AudioFrame> out;
    for (uint64_t sequence : {1, 3, 2, 4}) {
        append(out, buffer.push(frame(sequence)));
    }
    REQUIRE(out.size() == 4);
    REQUIRE(out[1].sequence == 2);
    REQUIRE(out[2].sequence == 3);
    REQUIRE(buffer.filled_frames() == 0);
}

TEST_CASE("late and duplicate frames are dropped") {
    JitterBuffer buffer(2, 50, 160, 8000);
    buffer.push(frame(5));
    REQUIRE(buffer.push(frame(4)).empty());
    REQUIRE(buffer.push(frame(5)).empty());
    REQUIRE(buffer.late_frames() == 2);
}

TEST_CASE("long gaps are filled up to the limit") {
    JitterBuffer buffer(0, 3, 160, 8000);
    buffer.push(frame(1));
    const auto ready = buffer.push(frame(10));
    REQUIRE(ready.size() == 4);
    REQUIRE(ready.back().sequence == 10);
    REQUIRE(buffer.filled_frames() == 3);
    REQUIRE(buffer.skipped_frames() == 5);
}

TEST_CASE("flush releases held frames") {
    JitterBuffer buffer(4, 50, 160, 8000);
    buffer.push(frame(1));
    buffer.push(frame(3));
    const auto rest = buffer.flush();
    REQUIRE(rest.size() == 2);
    REQUIRE(rest[0].sequence == 2);
    REQUIRE(rest[1].sequence == 3);
}
