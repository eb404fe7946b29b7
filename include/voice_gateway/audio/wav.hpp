#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace voice_gateway {
namespace audio {

struct WavData {
    int sample_rate = 0;
    std::vector<int16_t> samples;
};

std::string encode_wav(const std::vector<int16_t>& samples, int sample_rate);

// Reads 16-bit PCM WAV; multi-channel input is mixed down to mono.
WavData parse_wav(const std::string& bytes);
WavData read_wav(const std::filesystem::path& path);

}
}
