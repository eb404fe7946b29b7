#include "voice_gateway/audio/wav.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace voice_gateway::audio {

namespace {

uint16_t read_u16(const std::string& bytes, size_t offset) {
    return static_cast<uint16_t>(static_cast<uint8_t>(bytes[offset]) |
                                 (static_cast<uint8_t>(bytes[offset + 1]) << 8));
}

uint32_t read_u32(const std::string& bytes, size_t offset) {
    return static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(bytes[offset + 3])) << 24);
}

}

std::string encode_wav(const std::vector<int16_t>& samples, int sample_rate) {
    const uint16_t channels = 1;
    const uint16_t bits_per_sample = 16;
    const uint16_t block_align = channels * (bits_per_sample / 8);
    const uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * block_align;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    const uint32_t chunk_size = 36 + data_size;

    std::string result;
    result.reserve(44 + data_size);
    auto append_u16 = [&result](uint16_t value) {
        result.push_back(static_cast<char>(value & 0xFF));
        result.push_back(static_cast<char>((value >> 8) & 0xFF));
    };
    auto append_u32 = [&result](uint32_t value) {
        result.push_back(static_cast<char>(value & 0xFF));
        result.push_back(static_cast<char>((value >> 8) & 0xFF));
        result.push_back(static_cast<char>((value >> 16) & 0xFF));
        result.push_back(static_cast<char>((value >> 24) & 0xFF));
    };

    result.append("RIFF", 4);
    append_u32(chunk_size);
    result.append("WAVE", 4);
    result.append("fmt ", 4);
    append_u32(16);
    append_u16(1);
    append_u16(channels);
    append_u32(static_cast<uint32_t>(sample_rate));
    append_u32(byte_rate);
    append_u16(block_align);
    append_u16(bits_per_sample);
    result.append("data", 4);
    append_u32(data_size);
    for (auto sample : samples) {
        append_u16(static_cast<uint16_t>(sample));
    }
    return result;
}

WavData parse_wav(const std::string& bytes) {
    if (bytes.size() < 12 || bytes.compare(0, 4, "RIFF") != 0 ||
        bytes.compare(8, 4, "WAVE") != 0) {
        throw std::runtime_error("Not a RIFF/WAVE file");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint16_t bits_per_sample = 0;
    uint32_t sample_rate = 0;
    size_t data_offset = 0;
    size_t data_size = 0;

    size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        const auto chunk_id = bytes.substr(offset, 4);
        const auto chunk_size = static_cast<size_t>(read_u32(bytes, offset + 4));
        const auto body = offset + 8;
        if (chunk_id == "fmt ") {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                throw std::runtime_error("Truncated WAV fmt chunk");
            }
            format = read_u16(bytes, body);
            channels = read_u16(bytes, body + 2);
            sample_rate = read_u32(bytes, body + 4);
            bits_per_sample = read_u16(bytes, body + 14);
        } else if (chunk_id == "data") {
            data_offset = body;
            data_size = std::min(chunk_size, bytes.size() - body);
            break;
        }
        offset = body + chunk_size + (chunk_size % 2);
    }

    if (format != 1 || bits_per_sample != 16) {
        throw std::runtime_error("Only 16-bit PCM WAV is supported");
    }
    if (channels == 0 || sample_rate == 0 || data_offset == 0) {
        throw std::runtime_error("WAV file has no audio data");
    }

    WavData wav;
    wav.sample_rate = static_cast<int>(sample_rate);
    const size_t frame_bytes = static_cast<size_t>(channels) * 2;
    const size_t frames = data_size / frame_bytes;
    wav.samples.reserve(frames);
    for (size_t i = 0; i < frames; ++i) {
        int sum = 0;
        for (size_t ch = 0; ch < channels; ++ch) {
            sum += static_cast<int16_t>(read_u16(bytes, data_offset + i * frame_bytes + ch * 2));
        }
        wav.samples.push_back(static_cast<int16_t>(sum / static_cast<int>(channels)));
    }
    return wav;
}

WavData read_wav(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw std::runtime_error("Cannot open WAV file: " + path.string());
    }
    const std::string bytes((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());
    return parse_wav(bytes);
}

}
