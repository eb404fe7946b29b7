#include <catch2/catch_test_macros.hpp>

#include "voice_gateway/audio/codec.hpp"
#include "voice_gateway/audio/wav.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using namespace voice_gateway::audio;

TEST_CASE("linear_to_ulaw matches G.711 reference values") {
    REQUIRE(linear_to_ulaw(0) == 0xFF);
    REQUIRE(linear_to_ulaw(1000) == 0xCE);
    REQUIRE(linear_to_ulaw(-1000) == 0x4E);
    REQUIRE(linear_to_ulaw(32767) == 0x80);
    REQUIRE(linear_to_ulaw(-32768) == 0x00);
}

TEST_CASE("ulaw_to_linear matches G.711 reference values") {
    REQUIRE(ulaw_to_linear(0x00) == -32124);
    REQUIRE(ulaw_to_linear(0x80) == 32124);
    REQUIRE(ulaw_to_linear(0xFF) == 0);
    REQUIRE(ulaw_to_linear(0x7F) == 0);
    REQUIRE(ulaw_to_linear(0xCE) == 988);
}

TEST_CASE("decode_ulaw produces one sample per payload byte") {
    const std::string payload("\xFF\xCE\x4E", 3);
    const auto samples = decode_ulaw(payload);
    REQUIRE(samples == std::vector<int16_t>{0, 988, -988});
    REQUIRE(encode_ulaw(samples) == payload);
}

TEST_CASE("rms of a constant signal is its magnitude") {
    REQUIRE(rms({}) == 0.0);
    REQUIRE(rms(std::vector<int16_t>(160, -500)) == 500.0);
}

TEST_CASE("Resampler doubles the rate across chunk boundaries") {
    Resampler resampler(8000, 16000);
    const std::vector<int16_t> chunk(160, 1200);
    const auto first = resampler.process(chunk);
    const auto second = resampler.process(chunk);
    REQUIRE(first.size() == 318);
    REQUIRE(second.size() == 320);
    for (auto sample : second) {
        REQUIRE(sample == 1200);
    }
}

TEST_CASE("Resampler passes audio through when rates match") {
    Resampler resampler(16000, 16000);
    const std::vector<int16_t> chunk{1, 2, 3};
    REQUIRE(resampler.process(chunk) == chunk);
}

TEST_CASE("Resampler rejects non-positive rates") {
    REQUIRE_THROWS_AS(Resampler(0, 8000), std::invalid_argument);
}

TEST_CASE("parse_wav reads what encode_wav writes") {
    const std::vector<int16_t> samples{0, 100, -100, 32767};
    const auto wav = parse_wav(encode_wav(samples, 8000));
    REQUIRE(wav.sample_rate == 8000);
    REQUIRE(wav.samples == samples);
}

TEST_CASE("parse_wav rejects data without a RIFF header") {
    REQUIRE_THROWS(parse_wav("not a wav file"));
}
